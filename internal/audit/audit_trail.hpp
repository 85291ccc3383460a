#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "flightrec/v1/audit.pb.h"
#include "internal/recorder/redaction.hpp"
#include "internal/session/session_context.hpp"
#include "internal/util/time.hpp"

namespace flightrec::audit {

struct AuditQuery {
  enum class SortBy {
    kTimestamp,
    kDuration,
  };

  std::optional<std::string>              layer;
  std::optional<std::string>              operation;
  std::optional<flightrec::v1::TraceStatus> status;
  std::optional<util::TimePoint>          start_time;
  std::optional<util::TimePoint>          end_time;
  bool                                    include_lineage{false};
  SortBy                                  sort_by{SortBy::kTimestamp};
  bool                                    descending{false};
};

struct AuditQueryResult {
  flightrec::v1::Trace                 trace;
  std::optional<flightrec::v1::Lineage> lineage;
};

/*
  Per-session causal trace tree.

  Traces live in an arena keyed by trace id; parent/child links are ids,
  never pointers, so a malformed tree (including a cycle loaded from
  disk) cannot corrupt memory. Every walk over children carries a
  visited set.

  Thread safety:
    all state is guarded by one mutex; different traces may be
    recorded concurrently.
*/
class AuditTrailBuilder {
 public:
  explicit AuditTrailBuilder(session::SessionContext session, recorder::Redactor redactor = recorder::Redactor());

  const std::string& SessionId() const {
    return session_.session_id;
  }

  std::string StartLayerTrace(const std::string& layer, const std::string& operation, const google::protobuf::Value& input_data,
                              const std::string& parent_trace_id = {});

  // Throws util::TraceNotFound for unknown ids and util::InvalidState when
  // the trace was already completed.
  flightrec::v1::Trace CompleteLayerTrace(const std::string& trace_id, const google::protobuf::Value& output_data,
                                          flightrec::v1::TraceStatus status, const google::protobuf::Struct& metrics = {});

  std::string RecordTransformation(const std::string& trace_id, const google::protobuf::Value& input_data,
                                   const google::protobuf::Value& output_data, const std::string& layer);

  flightrec::v1::Lineage BuildDataLineage(const std::string& trace_id);

  std::vector<AuditQueryResult> QueryAuditTrail(const AuditQuery& query);

  flightrec::v1::AuditSummary GetAuditSummary();

  flightrec::v1::Trace GetTrace(const std::string& trace_id) const;

  // Loads the persisted traces and transformations of `session_id` into
  // the arena. Unreadable files are logged and skipped. Returns the
  // number of traces loaded.
  std::size_t Hydrate(const std::string& session_id);

 private:
  const flightrec::v1::Trace&       FindTraceLocked(const std::string& trace_id) const;
  flightrec::v1::Lineage            BuildLineageLocked(const std::string& trace_id) const;
  std::vector<std::string>          WalkSubtreeLocked(const std::string& root_id) const;
  std::string                       RecordTransformationLocked(const std::string& trace_id, const google::protobuf::Value& input_data,
                                                               const google::protobuf::Value& output_data, const std::string& layer);
  void                              PersistTraceLocked(const flightrec::v1::Trace& trace);
  void                              PersistSessionAuditLocked();

  session::SessionContext session_;
  recorder::Redactor      redactor_;

  mutable std::mutex                                    mutex_;
  std::unordered_map<std::string, flightrec::v1::Trace> traces_;
  std::vector<flightrec::v1::LayerSequenceEntry>        layer_sequence_;
  std::vector<flightrec::v1::TransformationRecord>      transformations_;
  std::unordered_set<std::string>                       transformation_ids_;
  flightrec::v1::SessionAudit                           session_audit_;
};

} // namespace flightrec::audit
