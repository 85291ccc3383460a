#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace flightrec::recorder {

/*
  Redacts sensitive fields from payload trees before they are stored.

  A field is sensitive when its name, compared case-insensitively,
  contains password, secret, token, auth, credential, bearer, apikey,
  api_key or api-key (or a configured extra term), ends in "key" or
  "keys", or carries "key" as a "_" or "-" separated word.
  Its value, whatever its shape, is replaced by the marker. The walk
  covers every nesting depth and every list element.
*/
class Redactor {
 public:
  explicit Redactor(std::string marker = "[REDACTED]", std::vector<std::string> extra_terms = {});

  bool IsSensitiveField(std::string_view field_name) const;

  google::protobuf::Value  Sanitize(const google::protobuf::Value& value) const;
  google::protobuf::Struct Sanitize(const google::protobuf::Struct& fields) const;

  const std::string& Marker() const {
    return marker_;
  }

 private:
  void SanitizeInto(const google::protobuf::Value& in, google::protobuf::Value* out) const;
  void SanitizeInto(const google::protobuf::Struct& in, google::protobuf::Struct* out) const;

  std::string              marker_;
  std::vector<std::string> terms_;
};

} // namespace flightrec::recorder
