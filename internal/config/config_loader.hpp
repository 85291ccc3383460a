#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace flightrec::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  // Config with every default filled in; also applied to loaded files.
  static RuntimeConfig Defaults();
};

// storage.root_path, else $XDG_DATA_HOME/flightrec/database,
// else $HOME/.flightrec/database, else ./flightrec-database.
std::filesystem::path ResolveStorageRoot(const RuntimeConfig& config);

} // namespace flightrec::config
