#include "redaction.hpp"

#include <algorithm>
#include <cctype>

namespace flightrec::recorder {

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Redactor::Redactor(std::string marker, std::vector<std::string> extra_terms)
    : marker_(std::move(marker)),
      terms_{"password", "secret", "token", "auth", "credential", "bearer", "apikey", "api_key", "api-key"} {
  for (auto& term : extra_terms) {
    if (!term.empty()) {
      terms_.push_back(Lower(term));
    }
  }
}

bool Redactor::IsSensitiveField(std::string_view field_name) const {
  const auto name = Lower(field_name);
  if (EndsWith(name, "key") || EndsWith(name, "keys") || name.find("key_") != std::string::npos || name.find("_key") != std::string::npos ||
      name.find("key-") != std::string::npos || name.find("-key") != std::string::npos) {
    return true;
  }
  return std::any_of(terms_.begin(), terms_.end(), [&](const std::string& term) { return name.find(term) != std::string::npos; });
}

google::protobuf::Value Redactor::Sanitize(const google::protobuf::Value& value) const {
  google::protobuf::Value out;
  SanitizeInto(value, &out);
  return out;
}

google::protobuf::Struct Redactor::Sanitize(const google::protobuf::Struct& fields) const {
  google::protobuf::Struct out;
  SanitizeInto(fields, &out);
  return out;
}

void Redactor::SanitizeInto(const google::protobuf::Value& in, google::protobuf::Value* out) const {
  switch (in.kind_case()) {
    case google::protobuf::Value::kStructValue:
      SanitizeInto(in.struct_value(), out->mutable_struct_value());
      return;
    case google::protobuf::Value::kListValue: {
      auto* list = out->mutable_list_value();
      for (const auto& element : in.list_value().values()) {
        SanitizeInto(element, list->add_values());
      }
      return;
    }
    case google::protobuf::Value::KIND_NOT_SET:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    default:
      *out = in;
      return;
  }
}

void Redactor::SanitizeInto(const google::protobuf::Struct& in, google::protobuf::Struct* out) const {
  auto* fields = out->mutable_fields();
  for (const auto& [key, value] : in.fields()) {
    if (IsSensitiveField(key)) {
      (*fields)[key].set_string_value(marker_);
    } else {
      SanitizeInto(value, &(*fields)[key]);
    }
  }
}

} // namespace flightrec::recorder
