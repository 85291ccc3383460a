#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace flightrec::util {

/*
  JSON helpers over protobuf's json_util.

  Every persisted record is a protobuf message rendered as JSON text;
  payloads are google.protobuf.Value trees.
*/

std::string ToJson(const google::protobuf::Message& message, bool pretty = true);

// Throws util::Corrupt when the text is not valid JSON for the message type.
void FromJson(const std::string& json, google::protobuf::Message* message);

// Compact JSON text of a payload; an unset value renders as null.
std::string ValueToJson(const google::protobuf::Value& value);
int64_t     JsonSize(const google::protobuf::Value& value);

bool ValuesEqual(const google::protobuf::Value& a, const google::protobuf::Value& b);

// Null, unset, and empty string/object/list count as empty.
bool IsEmptyValue(const google::protobuf::Value& value);

google::protobuf::Value NullValue();
google::protobuf::Value StringValue(const std::string& s);
google::protobuf::Value NumberValue(double d);
google::protobuf::Value BoolValue(bool b);

// Field lookup on a struct-valued Value; nullptr when absent or not a struct.
const google::protobuf::Value* FindField(const google::protobuf::Value& value, const std::string& key);

} // namespace flightrec::util
