#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/json.hpp"

namespace {

void PrintUsage() {
  std::cerr << "Usage: flightrec-replay --config <config.yaml> <sessionId>\n"
               "       flightrec-replay --config <config.yaml> --lineage <sessionId> <traceId>"
            << std::endl;
}

void Shutdown() {
  flightrec::observability::ShutdownLogging();
  flightrec::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  const bool lineage_mode = !args.empty() && args[0] == "--lineage";
  if (config_path.empty() || (lineage_mode && args.size() != 3) || (!lineage_mode && args.size() != 1)) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = flightrec::config::ConfigLoader::LoadFromYaml(config_path);

    flightrec::observability::InitializeTracing(config);
    flightrec::observability::InitializeLogging(config);

    auto app = flightrec::factory::Build(config);

    if (lineage_mode) {
      const auto& session_id = args[1];
      const auto& trace_id   = args[2];

      // A fresh session reads the recorded one without rewriting its files.
      flightrec::audit::AuditTrailBuilder audit(flightrec::session::OpenSession(app.store));
      audit.Hydrate(session_id);
      std::cout << flightrec::util::ToJson(audit.BuildDataLineage(trace_id)) << std::endl;
    } else {
      const auto result = app.replay_engine->StartDynamicReplay(args[0]);
      std::cout << flightrec::util::ToJson(result) << std::endl;
    }

    Shutdown();
  } catch (const std::exception& e) {
    FLIGHTREC_LOG_ERROR("Fatal error", {flightrec::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
