#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "flightrec/v1/replay.pb.h"

namespace flightrec::replay {

/*
  Finds tool invocations and tool results inside recorded payloads.

  Detection is by container field name (tool_calls, toolCalls, ... and
  tool_results, toolResults, ...). The names are heuristics and can be
  replaced from configuration.

  A call without an id gets "tool-<recordId>-<n>", n counting calls found
  in that record, so the same payload always yields the same ids.
*/
class ToolCallMatcher {
 public:
  static const std::vector<std::string>& DefaultToolCallFields();
  static const std::vector<std::string>& DefaultToolResultFields();

  // Empty lists select the defaults.
  explicit ToolCallMatcher(std::vector<std::string> tool_call_fields = {}, std::vector<std::string> tool_result_fields = {});

  std::vector<flightrec::v1::ToolCall> FindToolCalls(const google::protobuf::Value& data, const std::string& record_id) const;

  // Result elements of the result containers; top level only unless `recursive`.
  std::vector<google::protobuf::Value> FindToolResults(const google::protobuf::Value& data, bool recursive) const;

  // "tool_call_id", else "id", of a result element; empty when neither is a string.
  static std::string ResultCallId(const google::protobuf::Value& result);
  static std::string ResultName(const google::protobuf::Value& result);

  const std::vector<std::string>& ToolCallFields() const {
    return tool_call_fields_;
  }

  const std::vector<std::string>& ToolResultFields() const {
    return tool_result_fields_;
  }

 private:
  void CollectCalls(const google::protobuf::Value& node, const std::string& record_id, std::vector<flightrec::v1::ToolCall>* out) const;
  void CollectResults(const google::protobuf::Value& node, bool recursive, std::vector<google::protobuf::Value>* out) const;

  std::vector<std::string> tool_call_fields_;
  std::vector<std::string> tool_result_fields_;
};

} // namespace flightrec::replay
