#include "json.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flightrec::util {

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw Corrupt("Invalid " + message->GetTypeName() + " JSON: " + std::string(status.message()));
  }
}

std::string ValueToJson(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    return "null";
  }
  return ToJson(value, /*pretty=*/false);
}

int64_t JsonSize(const google::protobuf::Value& value) {
  return static_cast<int64_t>(ValueToJson(value).size());
}

bool ValuesEqual(const google::protobuf::Value& a, const google::protobuf::Value& b) {
  const bool a_null = a.kind_case() == google::protobuf::Value::KIND_NOT_SET || a.kind_case() == google::protobuf::Value::kNullValue;
  const bool b_null = b.kind_case() == google::protobuf::Value::KIND_NOT_SET || b.kind_case() == google::protobuf::Value::kNullValue;
  if (a_null || b_null) {
    return a_null == b_null;
  }
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

bool IsEmptyValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::KIND_NOT_SET:
    case google::protobuf::Value::kNullValue:
      return true;
    case google::protobuf::Value::kStringValue:
      return value.string_value().empty();
    case google::protobuf::Value::kStructValue:
      return value.struct_value().fields().empty();
    case google::protobuf::Value::kListValue:
      return value.list_value().values().empty();
    default:
      return false;
  }
}

google::protobuf::Value NullValue() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

google::protobuf::Value StringValue(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value NumberValue(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

google::protobuf::Value BoolValue(bool b) {
  google::protobuf::Value v;
  v.set_bool_value(b);
  return v;
}

const google::protobuf::Value* FindField(const google::protobuf::Value& value, const std::string& key) {
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? nullptr : &it->second;
}

} // namespace flightrec::util
