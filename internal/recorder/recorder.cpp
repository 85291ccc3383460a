#include "recorder.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace flightrec::recorder {

using flightrec::storage::Namespace;
using flightrec::storage::common::SafeFileComponent;

namespace {

constexpr const char* kSessionFileVersion = "1.0";

int64_t TimevalMillis(const timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + static_cast<int64_t>(tv.tv_usec) / 1000;
}

flightrec::v1::ResourceUsage SnapshotResourceUsage() {
  flightrec::v1::ResourceUsage usage;
  usage.set_pid(static_cast<int32_t>(::getpid()));

  rusage ru{};
  if (::getrusage(RUSAGE_SELF, &ru) != 0) {
    FLIGHTREC_LOG_WARN("getrusage failed; resource usage left empty");
    return usage;
  }
  // ru_maxrss is reported in kilobytes on Linux
  usage.set_max_rss_kb(static_cast<int64_t>(ru.ru_maxrss));
  usage.set_user_cpu_ms(TimevalMillis(ru.ru_utime));
  usage.set_system_cpu_ms(TimevalMillis(ru.ru_stime));
  return usage;
}

// Longest prefix of at most max_bytes that does not end inside a UTF-8
// sequence.
std::string Utf8Prefix(const std::string& s, std::size_t max_bytes) {
  if (s.size() <= max_bytes) {
    return s;
  }
  auto cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return s.substr(0, cut);
}

std::string SessionFileName(const std::string& session_id) {
  return "session-" + session_id + ".json";
}

} // namespace

std::string_view ToString(IoOperation op) {
  switch (op) {
    case IoOperation::kInput:
      return "input";
    case IoOperation::kOutput:
      return "output";
    case IoOperation::kError:
      return "error";
  }
  return "unknown";
}

RecorderOptions RecorderOptions::FromConfig(const flightrec::config::RecorderConfig& config) {
  RecorderOptions options;
  if (!config.redaction_marker().empty()) {
    options.redaction_marker = config.redaction_marker();
  }
  options.extra_sensitive_terms.assign(config.extra_sensitive_terms().begin(), config.extra_sensitive_terms().end());
  options.max_payload_bytes = config.max_payload_bytes();
  return options;
}

Recorder::Recorder(session::SessionContext session, RecorderOptions options)
    : session_(std::move(session)),
      options_(std::move(options)),
      redactor_(options_.redaction_marker, options_.extra_sensitive_terms) {
  if (!session_.store) {
    throw std::invalid_argument("recorder requires a record store");
  }
  PersistSessionRecord(util::TimePoint{}, 0);

  FLIGHTREC_LOG_DEBUG("recorder session opened", {observability::StringField("session_id", session_.session_id),
                                                  observability::StringField("root", session_.store->Root().string())});
}

/*
  Layer I/O capture:

      sanitize → size → budget → write → ledger

  The ledger entry is appended only after the file is durable, so a
  scenario can never reference a record that failed to write.
*/
std::string Recorder::RecordLayerIO(const std::string& layer, IoOperation operation, const google::protobuf::Value& data,
                                    const google::protobuf::Struct& metadata) {
  const auto record_id = util::NewId();
  const auto now       = util::NowMillis();

  flightrec::v1::LayerIoRecord record;
  record.set_record_id(record_id);
  record.set_session_id(session_.session_id);
  *record.mutable_timestamp() = util::ToProto(now);
  record.set_layer(layer);
  record.set_operation(std::string(ToString(operation)));

  auto sanitized = redactor_.Sanitize(data);

  auto* meta = record.mutable_metadata();
  *meta      = redactor_.Sanitize(metadata);
  (*meta->mutable_fields())["dataSize"].set_number_value(static_cast<double>(util::JsonSize(sanitized)));

  *record.mutable_data() = ApplyPayloadBudget(std::move(sanitized), meta);

  const auto hint = "layer-" + SafeFileComponent(layer) + "-" + record.operation() + "-" + record_id;
  const auto path = session_.store->WriteRecord(Namespace::kLayers, hint, record);

  flightrec::v1::AuditIndexEntry entry;
  entry.set_record_id(record_id);
  entry.set_layer(layer);
  entry.set_operation(record.operation());
  *entry.mutable_timestamp() = record.timestamp();
  entry.set_file_path(path);
  AppendLedger(std::move(entry));

  return record_id;
}

std::string Recorder::RecordAuditTrail(const std::string& from_layer, const std::string& to_layer, const std::string& data_id,
                                       const google::protobuf::Value& transformed_data) {
  const auto audit_id = util::NewId();

  flightrec::v1::AuditTrailRecord record;
  record.set_audit_id(audit_id);
  record.set_session_id(session_.session_id);
  *record.mutable_timestamp() = util::ToProto(util::NowMillis());
  record.set_from_layer(from_layer);
  record.set_to_layer(to_layer);
  record.set_data_id(data_id);

  google::protobuf::Struct budget_meta;
  *record.mutable_data() = ApplyPayloadBudget(redactor_.Sanitize(transformed_data), &budget_meta);

  const auto path = session_.store->WriteRecord(Namespace::kAudit, "audit-" + audit_id, record);

  flightrec::v1::AuditIndexEntry entry;
  entry.set_record_id(audit_id);
  entry.set_layer(from_layer + "->" + to_layer);
  entry.set_operation("audit");
  *entry.mutable_timestamp() = record.timestamp();
  entry.set_file_path(path);
  AppendLedger(std::move(entry));

  return audit_id;
}

flightrec::v1::PerformanceRecord Recorder::RecordPerformanceMetrics(const std::string& layer, const std::string& operation,
                                                                    util::TimePoint start_time, util::TimePoint end_time,
                                                                    const google::protobuf::Struct& metrics) {
  if (end_time < start_time) {
    throw std::invalid_argument("performance sample ends before it starts");
  }

  flightrec::v1::PerformanceRecord record;
  record.set_record_id(util::NewId());
  record.set_session_id(session_.session_id);
  record.set_layer(layer);
  record.set_operation(operation);
  *record.mutable_start_time() = util::ToProto(start_time);
  *record.mutable_end_time()   = util::ToProto(end_time);
  record.set_duration_ms(std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count());
  *record.mutable_resource_usage() = SnapshotResourceUsage();
  *record.mutable_metrics()        = redactor_.Sanitize(metrics);

  session_.store->WriteRecord(Namespace::kPerformance, "perf-" + SafeFileComponent(layer) + "-" + record.record_id(), record);
  return record;
}

std::string Recorder::CreateReplayScenario(const std::string& name, const std::vector<std::string>& record_ids) {
  flightrec::v1::ReplayScenario scenario;
  scenario.set_scenario_id(util::NewId());
  scenario.set_scenario_name(name);
  scenario.set_session_id(session_.session_id);
  *scenario.mutable_created_at() = util::ToProto(util::NowMillis());

  {
    std::lock_guard lock(ledger_mutex_);
    for (const auto& id : record_ids) {
      auto it = ledger_index_.find(id);
      if (it == ledger_index_.end()) {
        throw util::RecordNotFound(id);
      }
      *scenario.add_records() = ledger_[it->second];
    }
  }

  const auto path = session_.store->WriteRecord(Namespace::kReplay, "scenario-" + SafeFileComponent(name) + "-" + scenario.scenario_id(), scenario);

  FLIGHTREC_LOG_INFO("replay scenario created", {observability::StringField("session_id", session_.session_id),
                                                 observability::StringField("scenario", name),
                                                 observability::IntField("records", scenario.records_size())});
  return path;
}

flightrec::v1::SessionSummary Recorder::GetSessionSummary() {
  flightrec::v1::SessionSummary summary;
  summary.set_session_id(session_.session_id);
  *summary.mutable_start_time() = util::ToProto(session_.start_time);

  const auto end_time         = util::NowMillis();
  *summary.mutable_end_time() = util::ToProto(end_time);

  {
    std::lock_guard lock(ledger_mutex_);
    for (const auto& entry : ledger_) {
      *summary.add_audit_trail() = entry;
    }
  }
  summary.set_total_records(static_cast<uint64_t>(summary.audit_trail_size()));

  PersistSessionRecord(end_time, summary.total_records());
  return summary;
}

/*
  Oversized payloads keep a JSON preview of the already-redacted
  data, never the raw input.
*/
google::protobuf::Value Recorder::ApplyPayloadBudget(google::protobuf::Value data, google::protobuf::Struct* metadata) const {
  if (options_.max_payload_bytes == 0) {
    return data;
  }

  const auto json = util::ValueToJson(data);
  if (json.size() <= options_.max_payload_bytes) {
    return data;
  }

  google::protobuf::Value truncated;
  auto*                   fields = truncated.mutable_struct_value()->mutable_fields();
  (*fields)["truncated"].set_bool_value(true);
  (*fields)["originalSize"].set_number_value(static_cast<double>(json.size()));
  (*fields)["preview"].set_string_value(Utf8Prefix(json, options_.max_payload_bytes));

  (*metadata->mutable_fields())["truncated"].set_bool_value(true);
  return truncated;
}

void Recorder::AppendLedger(flightrec::v1::AuditIndexEntry entry) {
  std::lock_guard lock(ledger_mutex_);
  ledger_index_[entry.record_id()] = ledger_.size();
  ledger_.push_back(std::move(entry));
}

void Recorder::PersistSessionRecord(util::TimePoint end_time, uint64_t record_count) {
  flightrec::v1::SessionRecord record;
  record.set_session_id(session_.session_id);
  *record.mutable_start_time() = util::ToProto(session_.start_time);
  if (end_time != util::TimePoint{}) {
    *record.mutable_end_time() = util::ToProto(end_time);
  }
  record.set_root_path(session_.store->Root().string());
  record.set_record_count(record_count);
  record.set_version(kSessionFileVersion);

  session_.store->PutRecord(Namespace::kSessions, SessionFileName(session_.session_id), record);
}

} // namespace flightrec::recorder
