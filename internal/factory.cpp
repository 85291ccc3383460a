#include "factory.hpp"

#include <stdexcept>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

namespace flightrec::factory {

namespace {

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& fields) {
  return {fields.begin(), fields.end()};
}

recorder::Redactor BuildRedactor(const flightrec::config::RecorderConfig& config) {
  const auto options = recorder::RecorderOptions::FromConfig(config);
  return recorder::Redactor(options.redaction_marker, options.extra_sensitive_terms);
}

} // namespace

Application Build(const flightrec::config::RuntimeConfig& config) {
  Application app;
  app.config = config;

  const auto root = flightrec::config::ResolveStorageRoot(config);
  app.store       = std::make_shared<storage::RecordStore>(root);
  app.store->EnsureNamespaces();

  replay::ToolCallMatcher matcher(ToVector(config.replay().tool_call_fields()), ToVector(config.replay().tool_result_fields()));
  app.replay_engine = std::make_shared<replay::DynamicReplayEngine>(app.store, replay::ReplayOptions::FromConfig(config.replay()), std::move(matcher));

  FLIGHTREC_LOG_INFO("flightrec runtime built", {observability::StringField("root", app.store->Root().string())});
  return app;
}

RecordingSession OpenRecordingSession(const Application& app) {
  if (!app.store) {
    throw std::invalid_argument("application has no record store");
  }

  RecordingSession recording;
  recording.context  = session::OpenSession(app.store);
  recording.recorder = std::make_shared<recorder::Recorder>(recording.context, recorder::RecorderOptions::FromConfig(app.config.recorder()));
  recording.audit    = std::make_shared<audit::AuditTrailBuilder>(recording.context, BuildRedactor(app.config.recorder()));
  recording.debugger = std::make_shared<session::OperationDebugger>(recording.recorder, recording.audit);
  return recording;
}

} // namespace flightrec::factory
