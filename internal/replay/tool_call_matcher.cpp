#include "tool_call_matcher.hpp"

#include <algorithm>

#include "internal/util/json.hpp"

namespace flightrec::replay {

namespace {

std::string StringField(const google::protobuf::Value& value, const std::string& key) {
  const auto* field = util::FindField(value, key);
  if (field == nullptr || field->kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return field->string_value();
}

// Struct map order is unspecified; walk keys sorted so generated ids are stable.
std::vector<std::string> SortedKeys(const google::protobuf::Struct& s) {
  std::vector<std::string> keys;
  keys.reserve(s.fields().size());
  for (const auto& [key, value] : s.fields()) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

bool IsPresent(const google::protobuf::Value* v) {
  return v != nullptr && v->kind_case() != google::protobuf::Value::KIND_NOT_SET && v->kind_case() != google::protobuf::Value::kNullValue;
}

} // namespace

const std::vector<std::string>& ToolCallMatcher::DefaultToolCallFields() {
  static const std::vector<std::string> kFields = {"tool_calls", "toolCalls", "tools", "function_calls"};
  return kFields;
}

const std::vector<std::string>& ToolCallMatcher::DefaultToolResultFields() {
  static const std::vector<std::string> kFields = {"tool_results", "toolResults", "results", "tool_call_results"};
  return kFields;
}

ToolCallMatcher::ToolCallMatcher(std::vector<std::string> tool_call_fields, std::vector<std::string> tool_result_fields)
    : tool_call_fields_(tool_call_fields.empty() ? DefaultToolCallFields() : std::move(tool_call_fields)),
      tool_result_fields_(tool_result_fields.empty() ? DefaultToolResultFields() : std::move(tool_result_fields)) {
}

std::vector<flightrec::v1::ToolCall> ToolCallMatcher::FindToolCalls(const google::protobuf::Value& data, const std::string& record_id) const {
  std::vector<flightrec::v1::ToolCall> calls;
  CollectCalls(data, record_id, &calls);
  return calls;
}

/*
  At every object: inspect the call containers, then descend into every
  child. Arrays are descended element by element.
*/
void ToolCallMatcher::CollectCalls(const google::protobuf::Value& node, const std::string& record_id,
                                   std::vector<flightrec::v1::ToolCall>* out) const {
  if (node.kind_case() == google::protobuf::Value::kListValue) {
    for (const auto& element : node.list_value().values()) {
      CollectCalls(element, record_id, out);
    }
    return;
  }
  if (node.kind_case() != google::protobuf::Value::kStructValue) {
    return;
  }

  for (const auto& field : tool_call_fields_) {
    const auto* container = util::FindField(node, field);
    if (container == nullptr || container->kind_case() != google::protobuf::Value::kListValue) {
      continue;
    }
    for (const auto& call : container->list_value().values()) {
      const auto* function = util::FindField(call, "function");

      auto name = StringField(call, "name");
      if (name.empty() && function != nullptr) {
        name = StringField(*function, "name");
      }
      if (name.empty()) {
        continue;
      }

      flightrec::v1::ToolCall tool_call;
      auto                    id = StringField(call, "id");
      tool_call.set_id(id.empty() ? "tool-" + record_id + "-" + std::to_string(out->size()) : id);
      tool_call.set_name(name);

      const google::protobuf::Value* args = util::FindField(call, "args");
      if (!IsPresent(args) && function != nullptr) {
        args = util::FindField(*function, "arguments");
      }
      if (!IsPresent(args)) {
        args = util::FindField(call, "parameters");
      }
      if (IsPresent(args)) {
        *tool_call.mutable_args() = *args;
      } else {
        tool_call.mutable_args()->mutable_struct_value();
      }

      auto type = StringField(call, "type");
      tool_call.set_type(type.empty() ? "function" : type);
      out->push_back(std::move(tool_call));
    }
  }

  for (const auto& key : SortedKeys(node.struct_value())) {
    CollectCalls(node.struct_value().fields().at(key), record_id, out);
  }
}

std::vector<google::protobuf::Value> ToolCallMatcher::FindToolResults(const google::protobuf::Value& data, bool recursive) const {
  std::vector<google::protobuf::Value> results;
  CollectResults(data, recursive, &results);
  return results;
}

void ToolCallMatcher::CollectResults(const google::protobuf::Value& node, bool recursive, std::vector<google::protobuf::Value>* out) const {
  if (node.kind_case() == google::protobuf::Value::kListValue) {
    if (!recursive) {
      return;
    }
    for (const auto& element : node.list_value().values()) {
      CollectResults(element, recursive, out);
    }
    return;
  }
  if (node.kind_case() != google::protobuf::Value::kStructValue) {
    return;
  }

  for (const auto& field : tool_result_fields_) {
    const auto* container = util::FindField(node, field);
    if (container == nullptr || container->kind_case() != google::protobuf::Value::kListValue) {
      continue;
    }
    for (const auto& result : container->list_value().values()) {
      out->push_back(result);
    }
  }

  if (!recursive) {
    return;
  }
  for (const auto& key : SortedKeys(node.struct_value())) {
    CollectResults(node.struct_value().fields().at(key), recursive, out);
  }
}

std::string ToolCallMatcher::ResultCallId(const google::protobuf::Value& result) {
  auto id = StringField(result, "tool_call_id");
  return id.empty() ? StringField(result, "id") : id;
}

std::string ToolCallMatcher::ResultName(const google::protobuf::Value& result) {
  return StringField(result, "name");
}

} // namespace flightrec::replay
