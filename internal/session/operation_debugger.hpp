#pragma once

#include <functional>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/audit/audit_trail.hpp"
#include "internal/recorder/recorder.hpp"

namespace flightrec::session {

/*
  Wraps one layer call with full capture:

      record input → start trace → fn(input, trace_id)
          ok:    record output → complete(success)
          throw: record error  → complete(error) → rethrow
      → performance sample

  Recorder and audit trail must belong to the same session. The trace
  id is handed to fn so nested calls can name their parent; the
  debugger keeps no per-call state and may be shared across threads.
*/
class OperationDebugger {
 public:
  using Operation = std::function<google::protobuf::Value(const google::protobuf::Value& input, const std::string& trace_id)>;

  OperationDebugger(std::shared_ptr<recorder::Recorder> recorder, std::shared_ptr<audit::AuditTrailBuilder> audit);

  google::protobuf::Value Track(const std::string& layer, const std::string& method, const google::protobuf::Value& input,
                                const Operation& fn, const std::string& parent_trace_id = {});

 private:
  std::shared_ptr<recorder::Recorder>       recorder_;
  std::shared_ptr<audit::AuditTrailBuilder> audit_;
};

} // namespace flightrec::session
