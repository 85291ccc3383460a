#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace flightrec::storage::common {

inline void ValidateFileName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("record file name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("record file name contains invalid character: " + name);
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("record file name must not be a relative path component");
  }
}

// Replaces characters that cannot appear in a file name, for hints built
// from caller-supplied names (scenario names, layer names).
inline std::string SafeFileComponent(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    out.push_back((c == '/' || c == '\\' || c == '\0' || c == ':') ? '_' : c);
  }
  if (out.empty() || out == "." || out == "..") {
    return "_";
  }
  return out;
}

inline std::filesystem::path RecordPath(const std::filesystem::path& dir, const std::string& file_name) {
  ValidateFileName(file_name);
  return dir / file_name;
}

inline bool HasJsonExtension(const std::string& file_name) {
  static const std::string kExt = ".json";
  return file_name.size() > kExt.size() && file_name.compare(file_name.size() - kExt.size(), kExt.size(), kExt) == 0;
}

} // namespace flightrec::storage::common
