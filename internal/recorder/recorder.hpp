#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "config/config.pb.h"
#include "flightrec/v1/records.pb.h"
#include "internal/recorder/redaction.hpp"
#include "internal/session/session_context.hpp"
#include "internal/util/time.hpp"

namespace flightrec::recorder {

enum class IoOperation {
  kInput,
  kOutput,
  kError,
};

std::string_view ToString(IoOperation op);

struct RecorderOptions {
  std::string              redaction_marker{"[REDACTED]"};
  std::vector<std::string> extra_sensitive_terms;
  // 0 disables the payload budget
  uint64_t                 max_payload_bytes{0};

  static RecorderOptions FromConfig(const flightrec::config::RecorderConfig& config);
};

/*
  Captures layer I/O, cross-layer hand-offs and performance samples for
  one session, and builds replay scenarios out of what it captured.

  Every payload passes through the Redactor before it is written.
  Storage failures surface as util::StorageIO; nothing is retried here.
*/
class Recorder {
 public:
  explicit Recorder(session::SessionContext session, RecorderOptions options = {});

  const std::string& SessionId() const {
    return session_.session_id;
  }

  std::string RecordLayerIO(const std::string& layer, IoOperation operation, const google::protobuf::Value& data,
                            const google::protobuf::Struct& metadata = {});

  std::string RecordAuditTrail(const std::string& from_layer, const std::string& to_layer, const std::string& data_id,
                               const google::protobuf::Value& transformed_data);

  flightrec::v1::PerformanceRecord RecordPerformanceMetrics(const std::string& layer, const std::string& operation, util::TimePoint start_time,
                                                            util::TimePoint end_time, const google::protobuf::Struct& metrics = {});

  // Throws util::RecordNotFound for ids that are not in this session's ledger.
  std::string CreateReplayScenario(const std::string& name, const std::vector<std::string>& record_ids);

  flightrec::v1::SessionSummary GetSessionSummary();

 private:
  google::protobuf::Value ApplyPayloadBudget(google::protobuf::Value data, google::protobuf::Struct* metadata) const;
  void                    AppendLedger(flightrec::v1::AuditIndexEntry entry);
  void                    PersistSessionRecord(util::TimePoint end_time, uint64_t record_count);

  session::SessionContext session_;
  RecorderOptions         options_;
  Redactor                redactor_;

  mutable std::mutex                           ledger_mutex_;
  std::vector<flightrec::v1::AuditIndexEntry>  ledger_;
  std::unordered_map<std::string, std::size_t> ledger_index_;
};

} // namespace flightrec::recorder
