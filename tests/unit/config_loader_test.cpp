#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "flightrec_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(storage:
  root_path: "/var/lib/flightrec"
logging:
  level: debug
recorder:
  redaction_marker: "***"
  extra_sensitive_terms: [cookie, session]
  max_payload_bytes: 4096
replay:
  preserve_timestamp: false
  replay_from_step: 2
  only_replay_layers: [router, provider]
  speed: 4
  tool_call_fields: [calls]
)");

  auto config = flightrec::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root_path() == "/var/lib/flightrec");
  assert(config.logging().level() == "debug");
  assert(config.recorder().redaction_marker() == "***");
  assert(config.recorder().extra_sensitive_terms_size() == 2);
  assert(config.recorder().max_payload_bytes() == 4096);

  assert(config.replay().has_preserve_timestamp() && !config.replay().preserve_timestamp());
  assert(config.replay().replay_from_step() == 2);
  assert(config.replay().only_replay_layers_size() == 2);
  assert(config.replay().speed() == 4.0);
  assert(config.replay().tool_call_fields_size() == 1 && config.replay().tool_call_fields(0) == "calls");
  // untouched list keeps its defaults
  assert(config.replay().tool_result_fields_size() == 4);

  assert(flightrec::config::ResolveStorageRoot(config) == std::filesystem::path("/var/lib/flightrec"));
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(storage:
  root_path: "C:\\flightrec\\\"quoted\"\\db"
recorder:
  redaction_marker: "true"
  extra_sensitive_terms: ["42"]
)");

  auto config = flightrec::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().root_path() == "C:\\flightrec\\\"quoted\"\\db");
  assert(config.recorder().redaction_marker() == "true");
  assert(config.recorder().extra_sensitive_terms(0) == "42");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(storage:
  root_path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)flightrec::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)flightrec::config::ConfigLoader::LoadFromYaml("/nonexistent/flightrec.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentUsesDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = flightrec::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.recorder().redaction_marker() == "[REDACTED]");
  assert(config.replay().preserve_timestamp());
  assert(config.replay().speed() == 1.0);
  assert(config.replay().tool_call_fields_size() == 4);
  assert(config.logging().level() == "info");

  const auto defaults = flightrec::config::ConfigLoader::Defaults();
  assert(defaults.replay().tool_result_fields(0) == "tool_results");
}

void TestStorageRootFallbacks() {
  const auto config = flightrec::config::ConfigLoader::Defaults();

  setenv("XDG_DATA_HOME", "/data/xdg", 1);
  assert(flightrec::config::ResolveStorageRoot(config) == std::filesystem::path("/data/xdg/flightrec/database"));

  unsetenv("XDG_DATA_HOME");
  setenv("HOME", "/home/tester", 1);
  assert(flightrec::config::ResolveStorageRoot(config) == std::filesystem::path("/home/tester/.flightrec/database"));

  unsetenv("HOME");
  assert(flightrec::config::ResolveStorageRoot(config) == std::filesystem::current_path() / "flightrec-database");
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEmptyDocumentUsesDefaults();
  TestStorageRootFallbacks();

  std::cout << "flightrec_unit_config_loader: pass\n";
  return 0;
}
