#include "transformation.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

#include "internal/util/json.hpp"

namespace flightrec::audit {

namespace {

bool IsAbsent(const google::protobuf::Value& v) {
  return v.kind_case() == google::protobuf::Value::KIND_NOT_SET || v.kind_case() == google::protobuf::Value::kNullValue;
}

// Objects and arrays share one category so that object ↔ array is reported
// as a structure change rather than a type conversion.
std::string_view Category(const google::protobuf::Value& v) {
  switch (v.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return "number";
    case google::protobuf::Value::kStringValue:
      return "string";
    case google::protobuf::Value::kBoolValue:
      return "boolean";
    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue:
      return "object";
    default:
      return "null";
  }
}

} // namespace

std::string ClassifyTransformation(const google::protobuf::Value& input, const google::protobuf::Value& output) {
  if (IsAbsent(input)) {
    return "creation";
  }
  if (IsAbsent(output)) {
    return "deletion";
  }
  if (Category(input) != Category(output)) {
    return "type-conversion";
  }
  const bool in_list  = input.kind_case() == google::protobuf::Value::kListValue;
  const bool out_list = output.kind_case() == google::protobuf::Value::kListValue;
  if (in_list != out_list) {
    return "structure-change";
  }
  return "modification";
}

flightrec::v1::TransformationAnalysis AnalyzeTransformation(const google::protobuf::Value& input, const google::protobuf::Value& output) {
  flightrec::v1::TransformationAnalysis analysis;
  analysis.set_type(ClassifyTransformation(input, output));

  if (input.kind_case() != google::protobuf::Value::kStructValue || output.kind_case() != google::protobuf::Value::kStructValue) {
    return analysis;
  }

  const auto& in_fields  = input.struct_value().fields();
  const auto& out_fields = output.struct_value().fields();

  // Map iteration order is unspecified; sort for stable output.
  std::vector<std::string> added, removed, modified;
  for (const auto& [key, value] : out_fields) {
    auto it = in_fields.find(key);
    if (it == in_fields.end()) {
      added.push_back(key);
    } else if (!util::ValuesEqual(it->second, value)) {
      modified.push_back(key);
    }
  }
  for (const auto& [key, value] : in_fields) {
    if (out_fields.find(key) == out_fields.end()) {
      removed.push_back(key);
    }
  }

  std::sort(added.begin(), added.end());
  std::sort(removed.begin(), removed.end());
  std::sort(modified.begin(), modified.end());

  analysis.mutable_fields_added()->Assign(added.begin(), added.end());
  analysis.mutable_fields_removed()->Assign(removed.begin(), removed.end());
  analysis.mutable_fields_modified()->Assign(modified.begin(), modified.end());
  return analysis;
}

} // namespace flightrec::audit
