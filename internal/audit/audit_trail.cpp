#include "audit_trail.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <stack>
#include <type_traits>

#include "internal/audit/trace_state.hpp"
#include "internal/audit/transformation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace flightrec::audit {

using flightrec::storage::Namespace;

namespace {

constexpr const char* kSessionAuditVersion = "1.0";

std::string TraceFileName(const std::string& trace_id) {
  return "trace-" + trace_id + ".json";
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool IsCompleted(const flightrec::v1::Trace& trace) {
  return IsTerminal(trace.status());
}

} // namespace

AuditTrailBuilder::AuditTrailBuilder(session::SessionContext session, recorder::Redactor redactor)
    : session_(std::move(session)), redactor_(std::move(redactor)) {
  if (!session_.store) {
    throw std::invalid_argument("audit trail requires a record store");
  }

  session_audit_.set_session_id(session_.session_id);
  *session_audit_.mutable_start_time() = util::ToProto(session_.start_time);
  session_audit_.set_version(kSessionAuditVersion);

  std::lock_guard lock(mutex_);
  PersistSessionAuditLocked();
}

std::string AuditTrailBuilder::StartLayerTrace(const std::string& layer, const std::string& operation,
                                               const google::protobuf::Value& input_data, const std::string& parent_trace_id) {
  flightrec::v1::Trace trace;
  trace.set_trace_id(util::NewId());
  trace.set_session_id(session_.session_id);
  trace.set_layer(layer);
  trace.set_operation(operation);
  *trace.mutable_timestamp() = util::ToProto(util::NowMillis());
  trace.set_parent_trace_id(parent_trace_id);
  *trace.mutable_input_data() = redactor_.Sanitize(input_data);
  trace.set_status(flightrec::v1::TRACE_STATUS_STARTED);

  auto* meta = trace.mutable_metadata();
  meta->set_input_data_size(util::JsonSize(trace.input_data()));
  meta->set_start_time_ms(util::ToUnixMillis(trace.timestamp()));

  flightrec::v1::LayerSequenceEntry entry;
  entry.set_layer(layer);
  entry.set_operation(operation);
  entry.set_trace_id(trace.trace_id());
  *entry.mutable_timestamp() = trace.timestamp();
  entry.set_parent_trace_id(parent_trace_id);

  std::lock_guard lock(mutex_);

  if (!parent_trace_id.empty()) {
    auto parent = traces_.find(parent_trace_id);
    if (parent != traces_.end()) {
      parent->second.add_children(trace.trace_id());
      PersistTraceLocked(parent->second);
    } else {
      FLIGHTREC_LOG_WARN("parent trace unknown; child recorded as orphan",
                         {observability::StringField("trace_id", trace.trace_id()),
                          observability::StringField("parent_trace_id", parent_trace_id)});
    }
  }

  PersistTraceLocked(trace);
  layer_sequence_.push_back(std::move(entry));

  const auto id = trace.trace_id();
  traces_.emplace(id, std::move(trace));
  return id;
}

/*
  started → terminal, exactly once.

  Start and end timestamps are whole milliseconds, so the stored
  duration is exactly end - start.
*/
flightrec::v1::Trace AuditTrailBuilder::CompleteLayerTrace(const std::string& trace_id, const google::protobuf::Value& output_data,
                                                           flightrec::v1::TraceStatus status, const google::protobuf::Struct& metrics) {
  if (!IsTerminal(status)) {
    throw std::invalid_argument("trace must complete with success, error or warning");
  }

  std::lock_guard lock(mutex_);

  auto it = traces_.find(trace_id);
  if (it == traces_.end()) {
    throw util::TraceNotFound(trace_id);
  }
  auto& trace = it->second;

  if (!CanTransition(trace.status(), status)) {
    throw util::InvalidState("trace " + trace_id + " already completed");
  }

  const auto end = util::NowMillis();

  *trace.mutable_output_data() = redactor_.Sanitize(output_data);
  trace.set_status(status);
  *trace.mutable_end_time() = util::ToProto(end);

  auto* meta = trace.mutable_metadata();
  meta->set_output_data_size(util::JsonSize(trace.output_data()));
  meta->set_end_time_ms(util::ToUnixMillis(end));
  meta->set_duration_ms(util::ToUnixMillis(end) - util::ToUnixMillis(trace.timestamp()));
  *meta->mutable_metrics() = redactor_.Sanitize(metrics);

  PersistTraceLocked(trace);

  if (!util::ValuesEqual(trace.input_data(), trace.output_data())) {
    RecordTransformationLocked(trace_id, trace.input_data(), trace.output_data(), trace.layer());
  }

  return trace;
}

std::string AuditTrailBuilder::RecordTransformation(const std::string& trace_id, const google::protobuf::Value& input_data,
                                                    const google::protobuf::Value& output_data, const std::string& layer) {
  std::lock_guard lock(mutex_);
  return RecordTransformationLocked(trace_id, redactor_.Sanitize(input_data), redactor_.Sanitize(output_data), layer);
}

std::string AuditTrailBuilder::RecordTransformationLocked(const std::string& trace_id, const google::protobuf::Value& input_data,
                                                          const google::protobuf::Value& output_data, const std::string& layer) {
  flightrec::v1::TransformationRecord record;
  record.set_transformation_id(util::NewId());
  record.set_trace_id(trace_id);
  record.set_session_id(session_.session_id);
  *record.mutable_timestamp() = util::ToProto(util::NowMillis());
  record.set_layer(layer);
  *record.mutable_input_data()     = input_data;
  *record.mutable_output_data()    = output_data;
  *record.mutable_transformation() = AnalyzeTransformation(input_data, output_data);
  record.set_input_size(util::JsonSize(input_data));
  record.set_output_size(util::JsonSize(output_data));

  session_.store->WriteRecord(Namespace::kTransformations, "transform-" + record.transformation_id(), record);

  session_audit_.set_transformation_count(session_audit_.transformation_count() + 1);
  auto& index_entry = (*session_audit_.mutable_traceability_index())[record.transformation_id()];
  index_entry.set_trace_id(trace_id);
  index_entry.set_layer(layer);
  *index_entry.mutable_timestamp() = record.timestamp();
  PersistSessionAuditLocked();

  const auto id = record.transformation_id();
  transformation_ids_.insert(id);
  transformations_.push_back(std::move(record));
  return id;
}

flightrec::v1::Lineage AuditTrailBuilder::BuildDataLineage(const std::string& trace_id) {
  observability::SpanScope span("audit.build_lineage");
  span.SetAttribute("trace_id", trace_id);

  flightrec::v1::Lineage lineage;
  {
    std::lock_guard lock(mutex_);
    lineage = BuildLineageLocked(trace_id);
  }

  const auto suffix = util::NewId().substr(0, 8);
  session_.store->WriteRecord(Namespace::kLineage, "lineage-" + trace_id + "-" + suffix, lineage);

  span.SetAttribute("data_flow", static_cast<std::int64_t>(lineage.data_flow_size()));
  return lineage;
}

/*
  Pre-order walk over children with an explicit stack.

  The visited set makes the walk terminate on cyclic data and keeps
  every trace in the result exactly once. Child ids with no trace in
  the arena are skipped.
*/
std::vector<std::string> AuditTrailBuilder::WalkSubtreeLocked(const std::string& root_id) const {
  std::vector<std::string>        order;
  std::unordered_set<std::string> visited;
  std::stack<std::string>         pending;

  pending.push(root_id);
  while (!pending.empty()) {
    const auto id = pending.top();
    pending.pop();

    if (!visited.insert(id).second) {
      continue;
    }
    auto it = traces_.find(id);
    if (it == traces_.end()) {
      continue;
    }
    order.push_back(id);

    const auto& children = it->second.children();
    for (auto child = children.rbegin(); child != children.rend(); ++child) {
      if (!visited.count(*child)) {
        pending.push(*child);
      }
    }
  }
  return order;
}

flightrec::v1::Lineage AuditTrailBuilder::BuildLineageLocked(const std::string& trace_id) const {
  const auto& root = FindTraceLocked(trace_id);

  flightrec::v1::Lineage lineage;
  lineage.set_root_trace_id(trace_id);
  lineage.set_session_id(root.session_id());
  *lineage.mutable_build_time() = util::ToProto(util::NowMillis());

  const auto                      subtree = WalkSubtreeLocked(trace_id);
  std::unordered_set<std::string> members(subtree.begin(), subtree.end());
  std::set<std::string>           layers;
  int64_t                         total_duration = 0;

  for (const auto& id : subtree) {
    const auto& trace = traces_.at(id);

    auto* flow = lineage.add_data_flow();
    flow->set_trace_id(id);
    flow->set_layer(trace.layer());
    flow->set_operation(trace.operation());
    *flow->mutable_timestamp() = trace.timestamp();
    flow->set_status(trace.status());

    layers.insert(trace.layer());
    if (IsCompleted(trace)) {
      total_duration += trace.metadata().duration_ms();
    }
  }

  for (const auto& record : transformations_) {
    if (members.count(record.trace_id())) {
      *lineage.add_transformations() = record;
    }
  }
  for (const auto& entry : layer_sequence_) {
    if (members.count(entry.trace_id())) {
      *lineage.add_layer_sequence() = entry;
    }
  }

  auto* meta = lineage.mutable_metadata();
  meta->set_total_layers(layers.size());
  meta->set_total_transformations(static_cast<uint64_t>(lineage.transformations_size()));
  meta->set_total_duration(total_duration);
  return lineage;
}

std::vector<AuditQueryResult> AuditTrailBuilder::QueryAuditTrail(const AuditQuery& query) {
  std::vector<flightrec::v1::Trace> matches;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, trace] : traces_) {
      if (query.layer && trace.layer() != *query.layer) {
        continue;
      }
      if (query.operation && trace.operation() != *query.operation) {
        continue;
      }
      if (query.status && trace.status() != *query.status) {
        continue;
      }
      const auto ts = util::FromProto(trace.timestamp());
      if (query.start_time && ts < *query.start_time) {
        continue;
      }
      if (query.end_time && ts > *query.end_time) {
        continue;
      }
      matches.push_back(trace);
    }
  }

  auto key_less = [&](const flightrec::v1::Trace& a, const flightrec::v1::Trace& b) {
    if (query.sort_by == AuditQuery::SortBy::kDuration) {
      return a.metadata().duration_ms() < b.metadata().duration_ms();
    }
    return util::Before(a.timestamp(), b.timestamp());
  };
  std::stable_sort(matches.begin(), matches.end(), [&](const auto& a, const auto& b) {
    return query.descending ? key_less(b, a) : key_less(a, b);
  });

  std::vector<AuditQueryResult> results;
  results.reserve(matches.size());
  for (auto& trace : matches) {
    AuditQueryResult result;
    if (query.include_lineage) {
      result.lineage = BuildDataLineage(trace.trace_id());
    }
    result.trace = std::move(trace);
    results.push_back(std::move(result));
  }
  return results;
}

flightrec::v1::AuditSummary AuditTrailBuilder::GetAuditSummary() {
  flightrec::v1::AuditSummary summary;
  summary.set_session_id(session_.session_id);

  {
    std::lock_guard lock(mutex_);

    summary.set_total_traces(traces_.size());
    for (const auto& entry : layer_sequence_) {
      *summary.add_layer_sequence() = entry;
    }

    // Ordered by layer name so the summary file is stable.
    std::map<std::string, flightrec::v1::LayerStats>   layer_stats;
    std::map<std::string, std::set<std::string>>       flow_children;
    std::map<std::string, std::set<std::string>>       flow_parents;
    std::map<std::string, flightrec::v1::LayerFlow>    flow;
    auto*                                              perf = summary.mutable_performance_stats();
    uint64_t                                           completed = 0;

    for (const auto& entry : layer_sequence_) {
      auto it = traces_.find(entry.trace_id());
      if (it == traces_.end()) {
        continue;
      }
      const auto& trace = it->second;

      auto& stats = layer_stats[trace.layer()];
      stats.set_total_operations(stats.total_operations() + 1);
      if (trace.status() == flightrec::v1::TRACE_STATUS_SUCCESS) {
        stats.set_success_count(stats.success_count() + 1);
      } else if (trace.status() == flightrec::v1::TRACE_STATUS_ERROR) {
        stats.set_error_count(stats.error_count() + 1);
      }
      if (IsCompleted(trace)) {
        stats.set_total_duration(stats.total_duration() + trace.metadata().duration_ms());
        perf->set_total_duration(perf->total_duration() + trace.metadata().duration_ms());
        ++completed;
      }

      auto* op = flow[trace.layer()].add_operations();
      op->set_trace_id(trace.trace_id());
      op->set_operation(trace.operation());
      *op->mutable_timestamp() = trace.timestamp();

      for (const auto& child_id : trace.children()) {
        auto child = traces_.find(child_id);
        if (child != traces_.end()) {
          flow_children[trace.layer()].insert(child->second.layer());
        }
      }
      auto parent = traces_.find(trace.parent_trace_id());
      if (parent != traces_.end()) {
        flow_parents[trace.layer()].insert(parent->second.layer());
      }
    }

    for (auto& [layer, stats] : layer_stats) {
      if (stats.total_operations() > 0) {
        stats.set_average_duration(static_cast<double>(stats.total_duration()) / static_cast<double>(stats.total_operations()));
      }
      (*summary.mutable_layer_stats())[layer] = stats;
    }

    for (auto& [layer, entry] : flow) {
      const auto& children = flow_children[layer];
      const auto& parents  = flow_parents[layer];
      entry.mutable_children()->Assign(children.begin(), children.end());
      entry.mutable_parents()->Assign(parents.begin(), parents.end());
      (*summary.mutable_data_flow_map())[layer] = entry;
    }

    perf->set_total_operations(completed);
    perf->set_average_duration(completed > 0 ? static_cast<double>(perf->total_duration()) / static_cast<double>(completed) : 0.0);
    perf->set_sessions_tracked(1);

    auto*   tstats     = summary.mutable_transformation_stats();
    int64_t total_size = 0;
    for (const auto& record : transformations_) {
      auto& by_layer = (*tstats->mutable_by_layer())[record.layer()];
      by_layer += 1;
      auto& by_type = (*tstats->mutable_by_type())[record.transformation().type()];
      by_type += 1;
      total_size += record.output_size();
    }
    tstats->set_total_transformations(transformations_.size());
    if (!transformations_.empty()) {
      tstats->set_average_transformation_size(static_cast<double>(total_size) / static_cast<double>(transformations_.size()));
    }
  }

  *summary.mutable_generated_at() = util::ToProto(util::NowMillis());
  session_.store->PutRecord(Namespace::kAudit, "audit-summary-" + session_.session_id + ".json", summary);
  return summary;
}

flightrec::v1::Trace AuditTrailBuilder::GetTrace(const std::string& trace_id) const {
  std::lock_guard lock(mutex_);
  return FindTraceLocked(trace_id);
}

/*
  Hydration:
      traces/          → arena + layer sequence (by start time)
      transformations/ → transformation list (by record time)

  Files belonging to other sessions are ignored. A trace id already in
  the arena is replaced by its persisted form.
*/
std::size_t AuditTrailBuilder::Hydrate(const std::string& session_id) {
  observability::LogContext log_context({observability::StringField("session_id", session_id)});

  std::vector<flightrec::v1::Trace>                loaded;
  std::vector<flightrec::v1::TransformationRecord> loaded_transformations;

  auto read_all = [&](Namespace ns, const std::string& prefix, auto* out) {
    for (const auto& path : session_.store->ListRecords(ns, [&](const std::string& name) { return StartsWith(name, prefix); })) {
      using Record = typename std::remove_pointer_t<decltype(out)>::value_type;
      try {
        auto record = session_.store->Read<Record>(path);
        if (record.session_id() == session_id) {
          out->push_back(std::move(record));
        }
      } catch (const util::Corrupt& e) {
        FLIGHTREC_LOG_WARN("skipping corrupt audit record", {observability::StringField("path", path), observability::StringField("error", e.what())});
      } catch (const util::NotFound&) {
        FLIGHTREC_LOG_WARN("audit record vanished during scan", {observability::StringField("path", path)});
      }
    }
  };

  read_all(Namespace::kTraces, "trace-", &loaded);
  read_all(Namespace::kTransformations, "transform-", &loaded_transformations);

  std::stable_sort(loaded.begin(), loaded.end(), [](const auto& a, const auto& b) { return util::Before(a.timestamp(), b.timestamp()); });
  std::stable_sort(loaded_transformations.begin(), loaded_transformations.end(),
                   [](const auto& a, const auto& b) { return util::Before(a.timestamp(), b.timestamp()); });

  std::lock_guard lock(mutex_);

  for (auto& trace : loaded) {
    const auto id      = trace.trace_id();
    const bool is_new  = traces_.find(id) == traces_.end();
    if (is_new) {
      flightrec::v1::LayerSequenceEntry entry;
      entry.set_layer(trace.layer());
      entry.set_operation(trace.operation());
      entry.set_trace_id(id);
      *entry.mutable_timestamp() = trace.timestamp();
      entry.set_parent_trace_id(trace.parent_trace_id());
      layer_sequence_.push_back(std::move(entry));
    }
    traces_[id] = std::move(trace);
  }

  for (auto& record : loaded_transformations) {
    if (transformation_ids_.insert(record.transformation_id()).second) {
      transformations_.push_back(std::move(record));
    }
  }

  FLIGHTREC_LOG_INFO("audit trail hydrated", {observability::IntField("traces", static_cast<std::int64_t>(loaded.size())),
                                              observability::IntField("transformations", static_cast<std::int64_t>(loaded_transformations.size()))});
  return loaded.size();
}

const flightrec::v1::Trace& AuditTrailBuilder::FindTraceLocked(const std::string& trace_id) const {
  auto it = traces_.find(trace_id);
  if (it == traces_.end()) {
    throw util::TraceNotFound(trace_id);
  }
  return it->second;
}

void AuditTrailBuilder::PersistTraceLocked(const flightrec::v1::Trace& trace) {
  session_.store->PutRecord(Namespace::kTraces, TraceFileName(trace.trace_id()), trace);
}

void AuditTrailBuilder::PersistSessionAuditLocked() {
  session_audit_.clear_layer_sequence();
  for (const auto& entry : layer_sequence_) {
    *session_audit_.add_layer_sequence() = entry;
  }
  session_.store->PutRecord(Namespace::kAudit, "session-" + session_.session_id + ".json", session_audit_);
}

} // namespace flightrec::audit
