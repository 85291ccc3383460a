#include "operation_debugger.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace flightrec::session {

namespace {

google::protobuf::Struct MethodMetadata(const std::string& method) {
  google::protobuf::Struct meta;
  (*meta.mutable_fields())["method"].set_string_value(method);
  return meta;
}

} // namespace

OperationDebugger::OperationDebugger(std::shared_ptr<recorder::Recorder> recorder, std::shared_ptr<audit::AuditTrailBuilder> audit)
    : recorder_(std::move(recorder)), audit_(std::move(audit)) {
  if (!recorder_ || !audit_) {
    throw std::invalid_argument("operation debugger requires a recorder and an audit trail");
  }
  if (recorder_->SessionId() != audit_->SessionId()) {
    throw std::invalid_argument("recorder and audit trail belong to different sessions");
  }
}

google::protobuf::Value OperationDebugger::Track(const std::string& layer, const std::string& method, const google::protobuf::Value& input,
                                                 const Operation& fn, const std::string& parent_trace_id) {
  const auto start = util::NowMillis();

  recorder_->RecordLayerIO(layer, recorder::IoOperation::kInput, input, MethodMetadata(method));
  const auto trace_id = audit_->StartLayerTrace(layer, method, input, parent_trace_id);

  observability::LogContext log_context({observability::StringField("session_id", recorder_->SessionId()),
                                         observability::StringField("trace_id", trace_id)});

  google::protobuf::Value output;
  try {
    output = fn(input, trace_id);
  } catch (const std::exception& e) {
    auto meta = MethodMetadata(method);
    (*meta.mutable_fields())["error"].set_string_value(e.what());

    google::protobuf::Value error;
    (*error.mutable_struct_value()->mutable_fields())["message"].set_string_value(e.what());

    recorder_->RecordLayerIO(layer, recorder::IoOperation::kError, error, meta);
    audit_->CompleteLayerTrace(trace_id, error, flightrec::v1::TRACE_STATUS_ERROR);
    recorder_->RecordPerformanceMetrics(layer, method, start, util::NowMillis());

    FLIGHTREC_LOG_WARN("tracked operation failed", {observability::StringField("layer", layer), observability::StringField("method", method),
                                                    observability::StringField("error", e.what())});
    throw;
  }

  recorder_->RecordLayerIO(layer, recorder::IoOperation::kOutput, output, MethodMetadata(method));
  audit_->CompleteLayerTrace(trace_id, output, flightrec::v1::TRACE_STATUS_SUCCESS);
  recorder_->RecordPerformanceMetrics(layer, method, start, util::NowMillis());
  return output;
}

} // namespace flightrec::session
