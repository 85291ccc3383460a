#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/audit/audit_trail.hpp"
#include "internal/recorder/recorder.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/session/operation_debugger.hpp"
#include "internal/storage/record_store.hpp"

namespace flightrec::factory {

/*
  One recording session: recorder and audit trail sharing a session id,
  plus the debugger that drives both.
*/
struct RecordingSession {
  session::SessionContext                      context;
  std::shared_ptr<recorder::Recorder>          recorder;
  std::shared_ptr<audit::AuditTrailBuilder>    audit;
  std::shared_ptr<session::OperationDebugger>  debugger;
};

/*
  Long-lived objects built from the runtime config.
*/
struct Application {
  flightrec::config::RuntimeConfig            config;
  std::shared_ptr<storage::RecordStore>       store;
  std::shared_ptr<replay::DynamicReplayEngine> replay_engine;
};

/*
  Composition root: the only place that turns config sections into
  concrete components.
*/
Application Build(const flightrec::config::RuntimeConfig& config);

RecordingSession OpenRecordingSession(const Application& app);

} // namespace flightrec::factory
