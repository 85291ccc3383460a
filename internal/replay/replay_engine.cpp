#include "replay_engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flightrec::replay {

using flightrec::storage::Namespace;

namespace {

constexpr const char* kRecordedResultSource = "recorded-database";
constexpr const char* kRecordedDataSource   = "database-recorded";

// NaN keeps the normal speed; everything else is clamped.
double ClampSpeed(double speed) {
  if (std::isnan(speed)) {
    return 1.0;
  }
  return std::clamp(speed, kMinReplaySpeed, kMaxReplaySpeed);
}

double Progress(uint32_t step, uint32_t total) {
  return total == 0 ? 0.0 : static_cast<double>(step) / static_cast<double>(total) * 100.0;
}

} // namespace

ReplayOptions ReplayOptions::FromConfig(const flightrec::config::ReplayConfig& config) {
  ReplayOptions options;
  if (config.has_preserve_timestamp()) {
    options.preserve_timestamp = config.preserve_timestamp();
  }
  options.replay_from_step = config.replay_from_step();
  options.only_replay_layers.assign(config.only_replay_layers().begin(), config.only_replay_layers().end());
  // unset (0) means normal speed
  options.speed = config.speed() == 0.0 ? 1.0 : ClampSpeed(config.speed());
  return options;
}

DynamicReplayEngine::DynamicReplayEngine(storage::RecordStorePtr store, ReplayOptions defaults, ToolCallMatcher matcher)
    : store_(std::move(store)),
      defaults_(std::move(defaults)),
      matcher_(std::move(matcher)),
      loader_(store_, matcher_),
      options_(defaults_),
      speed_(ClampSpeed(defaults_.speed)) {
}

flightrec::v1::ReplayResult DynamicReplayEngine::StartDynamicReplay(const std::string& session_id, std::optional<ReplayOptions> options) {
  observability::SpanScope span("replay.run");
  span.SetAttribute("session_id", session_id);

  ReplayEvent started;
  {
    std::lock_guard lock(mutex_);
    if (IsActive(state_)) {
      throw util::InvalidState("replay " + replay_id_ + " is already " + std::string(ToString(state_)));
    }
    TransitionLocked(ReplayState::kRunning);

    options_      = options.value_or(defaults_);
    speed_        = ClampSpeed(options_.speed);
    replay_id_    = util::NewId();
    session_id_   = session_id;
    current_step_ = 0;
    layer_records_.clear();
    tool_call_results_.clear();
    timeline_.clear();

    started = MakeEventLocked(ReplayEventType::kReplayStarted);
  }

  observability::LogContext log_context({observability::StringField("session_id", session_id),
                                         observability::StringField("replay_id", started.replay_id)});
  span.SetAttribute("replay_id", started.replay_id);

  FLIGHTREC_LOG_INFO("replay started");
  events_.Emit(started);

  try {
    auto scenario = loader_.LoadSessionData(session_id);
    if (!scenario) {
      throw util::SessionNotFound(session_id);
    }
    BuildDataMappings(*scenario);
    return ExecuteReplayLoop();
  } catch (const std::exception& e) {
    ReplayEvent failed;
    {
      std::lock_guard lock(mutex_);
      state_       = ReplayState::kError;
      failed       = MakeEventLocked(ReplayEventType::kReplayError);
      failed.error = e.what();
    }
    span.RecordException(e.what());
    FLIGHTREC_LOG_ERROR("replay failed", {observability::StringField("error", e.what())});
    events_.Emit(failed);
    throw;
  }
}

/*
  One pass over the scenario:
    - index every loadable record under "<layer>-<operation>"
    - register tool calls and look up their recorded results
    - append one timeline entry per record

  The timeline is then sorted by timestamp; discovery order never
  leaks into replay order.
*/
void DynamicReplayEngine::BuildDataMappings(const flightrec::v1::ReplayScenario& scenario) {
  std::map<std::string, std::vector<flightrec::v1::Interaction>> layer_records;
  std::unordered_map<std::string, flightrec::v1::ToolCallMapping> tool_calls;
  std::vector<flightrec::v1::Interaction>                         timeline;

  for (const auto& record : scenario.records()) {
    auto detail = loader_.LoadRecordDetail(record);
    if (!detail) {
      continue;
    }

    layer_records[record.layer() + "-" + record.operation()].push_back(*detail);

    for (const auto& call : matcher_.FindToolCalls(detail->data(), record.record_id())) {
      flightrec::v1::ToolCallMapping mapping;
      *mapping.mutable_tool_call() = call;
      mapping.set_record_id(record.record_id());
      *mapping.mutable_timestamp() = detail->timestamp();

      if (auto result = loader_.FindToolCallResult(call.id(), call.name())) {
        *mapping.mutable_result() = std::move(*result);
        mapping.set_has_real_result(true);
      } else {
        FLIGHTREC_LOG_WARN("tool call has no recorded result", {observability::StringField("tool_call_id", call.id()),
                                                                observability::StringField("tool_name", call.name()),
                                                                observability::StringField("record_id", record.record_id())});
      }
      tool_calls[call.id()] = std::move(mapping);
    }

    // Results carried by the same record complete calls registered so far.
    for (const auto& result : matcher_.FindToolResults(detail->data(), /*recursive=*/false)) {
      auto it = tool_calls.find(ToolCallMatcher::ResultCallId(result));
      if (it == tool_calls.end()) {
        continue;
      }
      auto* found = it->second.mutable_result();
      *found->mutable_result() = result;
      found->set_source_file(std::filesystem::path(record.file_path()).filename().string());
      *found->mutable_timestamp() = detail->timestamp();
      it->second.set_has_real_result(true);
    }

    timeline.push_back(std::move(*detail));
  }

  std::stable_sort(timeline.begin(), timeline.end(), [](const auto& a, const auto& b) { return util::Before(a.timestamp(), b.timestamp()); });

  std::lock_guard lock(mutex_);
  layer_records_     = std::move(layer_records);
  tool_call_results_ = std::move(tool_calls);
  timeline_          = std::move(timeline);
}

flightrec::v1::ReplayResult DynamicReplayEngine::ExecuteReplayLoop() {
  const auto started_at = std::chrono::steady_clock::now();
  const auto total      = static_cast<uint32_t>(timeline_.size());

  flightrec::v1::ReplayResult result;
  ReplayOptions               options;
  {
    std::lock_guard lock(mutex_);
    result.set_replay_id(replay_id_);
    result.set_session_id(session_id_);
    options = options_;
  }
  *result.mutable_start_time() = util::ToProto(util::NowMillis());
  result.set_total_interactions(total);
  result.set_dynamic_data_loaded(static_cast<uint32_t>(layer_records_.size()));

  const std::unordered_set<std::string> only_layers(options.only_replay_layers.begin(), options.only_replay_layers.end());
  uint32_t                              with_data = 0;

  for (uint32_t i = options.replay_from_step; i < total; ++i) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return state_ != ReplayState::kPaused; });
      if (state_ != ReplayState::kRunning) {
        break;
      }
      current_step_ = i + 1;
    }

    const auto& interaction = timeline_[i];
    if (!only_layers.empty() && only_layers.count(interaction.layer()) == 0) {
      continue;
    }

    try {
      auto executed = ExecuteInteraction(interaction);

      result.set_completed_interactions(result.completed_interactions() + 1);
      result.set_tool_calls_replayed(result.tool_calls_replayed() + executed.tool_calls_replayed());
      if (executed.has_real_data()) {
        ++with_data;
      }

      ReplayEvent event;
      {
        std::lock_guard lock(mutex_);
        event = MakeEventLocked(ReplayEventType::kInteractionReplayed);
      }
      event.interaction = executed;
      *result.add_execution_details() = std::move(executed);
      events_.Emit(event);
    } catch (const std::exception& e) {
      FLIGHTREC_LOG_ERROR("interaction replay failed", {observability::StringField("record_id", interaction.record_id()),
                                                        observability::IntField("step", static_cast<std::int64_t>(i + 1)),
                                                        observability::StringField("error", e.what())});
      auto* error = result.add_errors();
      error->set_step(i + 1);
      error->set_record_id(interaction.record_id());
      error->set_error(e.what());
      *error->mutable_timestamp() = util::ToProto(util::NowMillis());
    }

    if (options.preserve_timestamp && i + 1 < total) {
      WaitForGap(interaction, timeline_[i + 1]);
    }
  }

  const auto completed = result.completed_interactions();
  result.set_data_coverage_rate(completed == 0 ? 0.0 : static_cast<double>(with_data) / static_cast<double>(completed) * 100.0);
  *result.mutable_end_time() = util::ToProto(util::NowMillis());
  result.set_total_duration_ms(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());

  ReplayEvent finished;
  bool        stopped = false;
  {
    std::lock_guard lock(mutex_);
    stopped = state_ == ReplayState::kStopped;
    if (!stopped) {
      TransitionLocked(ReplayState::kCompleted);
    }
    result.set_final_state(std::string(ToString(state_)));
    finished = MakeEventLocked(ReplayEventType::kReplayCompleted);
  }

  SaveResult(result);

  FLIGHTREC_LOG_INFO("replay finished", {observability::StringField("replay_id", result.replay_id()),
                                         observability::StringField("state", result.final_state()),
                                         observability::IntField("completed", static_cast<std::int64_t>(completed)),
                                         observability::DoubleField("coverage", result.data_coverage_rate())});

  if (!stopped) {
    finished.result = result;
    events_.Emit(finished);
  }
  return result;
}

/*
  Tool calls are answered only from their recorded results; a call
  without one is listed as missing and not replayed.
*/
flightrec::v1::InteractionResult DynamicReplayEngine::ExecuteInteraction(const flightrec::v1::Interaction& interaction) const {
  flightrec::v1::InteractionResult executed;
  executed.set_record_id(interaction.record_id());
  executed.set_layer(interaction.layer());
  executed.set_operation(interaction.operation());
  *executed.mutable_timestamp() = interaction.timestamp();
  executed.set_has_real_data(!util::IsEmptyValue(interaction.data()));

  for (const auto& call : matcher_.FindToolCalls(interaction.data(), interaction.record_id())) {
    auto it = tool_call_results_.find(call.id());
    if (it == tool_call_results_.end() || !it->second.has_real_result()) {
      FLIGHTREC_LOG_WARN("tool call not replayed; no recorded result", {observability::StringField("tool_call_id", call.id()),
                                                                        observability::StringField("tool_name", call.name())});
      executed.add_missing_tool_calls(call.id());
      continue;
    }

    auto* replayed = executed.add_tool_calls();
    replayed->set_tool_call_id(call.id());
    replayed->set_tool_name(call.name());
    replayed->set_result_source(kRecordedResultSource);
    *replayed->mutable_result() = it->second.result().result();
    executed.set_tool_calls_replayed(executed.tool_calls_replayed() + 1);
  }

  auto* original = executed.mutable_original_data();
  original->set_size(util::JsonSize(interaction.data()));
  original->set_has_metadata(!interaction.metadata().fields().empty());
  original->set_data_source(kRecordedDataSource);
  return executed;
}

void DynamicReplayEngine::WaitForGap(const flightrec::v1::Interaction& current, const flightrec::v1::Interaction& next) {
  const auto gap_ms = util::ToUnixMillis(next.timestamp()) - util::ToUnixMillis(current.timestamp());
  if (gap_ms <= 0) {
    return;
  }

  std::unique_lock lock(mutex_);
  const auto       delay = std::chrono::duration<double, std::milli>(static_cast<double>(gap_ms) / speed_);
  cv_.wait_for(lock, delay, [this] { return state_ == ReplayState::kStopped; });
}

void DynamicReplayEngine::SaveResult(const flightrec::v1::ReplayResult& result) const {
  try {
    const auto path = store_->WriteRecord(Namespace::kReplay, "dynamic-replay-" + result.replay_id(), result);
    FLIGHTREC_LOG_DEBUG("replay result saved", {observability::StringField("path", path)});
  } catch (const util::StorageIO& e) {
    FLIGHTREC_LOG_ERROR("failed to save replay result", {observability::StringField("replay_id", result.replay_id()),
                                                         observability::StringField("error", e.what())});
  }
}

void DynamicReplayEngine::Pause() {
  ReplayEvent event;
  {
    std::lock_guard lock(mutex_);
    TransitionLocked(ReplayState::kPaused);
    event = MakeEventLocked(ReplayEventType::kReplayPaused);
  }
  events_.Emit(event);
}

void DynamicReplayEngine::Resume() {
  ReplayEvent event;
  {
    std::lock_guard lock(mutex_);
    if (state_ != ReplayState::kPaused) {
      throw util::InvalidState("cannot resume a replay that is " + std::string(ToString(state_)));
    }
    TransitionLocked(ReplayState::kRunning);
    event = MakeEventLocked(ReplayEventType::kReplayResumed);
  }
  cv_.notify_all();
  events_.Emit(event);
}

void DynamicReplayEngine::Stop() {
  ReplayEvent event;
  {
    std::lock_guard lock(mutex_);
    TransitionLocked(ReplayState::kStopped);
    event = MakeEventLocked(ReplayEventType::kReplayStopped);
  }
  cv_.notify_all();
  events_.Emit(event);
}

double DynamicReplayEngine::SetSpeed(double speed) {
  ReplayEvent event;
  {
    std::lock_guard lock(mutex_);
    speed_ = ClampSpeed(speed);
    event  = MakeEventLocked(ReplayEventType::kSpeedChanged);
  }
  events_.Emit(event);
  return event.speed;
}

ReplayStatus DynamicReplayEngine::GetReplayStatus() const {
  std::lock_guard lock(mutex_);

  ReplayStatus status;
  status.state              = state_;
  status.replay_id          = replay_id_;
  status.session_id         = session_id_;
  status.current_step       = current_step_;
  status.total_steps        = static_cast<uint32_t>(timeline_.size());
  status.progress           = Progress(current_step_, status.total_steps);
  status.speed              = speed_;
  status.layer_records      = layer_records_.size();
  status.tool_call_mappings = tool_call_results_.size();
  status.timeline_size      = timeline_.size();
  status.options            = options_;
  return status;
}

void DynamicReplayEngine::TransitionLocked(ReplayState to) {
  if (!CanTransition(state_, to)) {
    throw util::InvalidState("replay cannot move from " + std::string(ToString(state_)) + " to " + std::string(ToString(to)));
  }
  state_ = to;
}

ReplayEvent DynamicReplayEngine::MakeEventLocked(ReplayEventType type) const {
  ReplayEvent event;
  event.type        = type;
  event.replay_id   = replay_id_;
  event.session_id  = session_id_;
  event.step        = current_step_;
  event.total_steps = static_cast<uint32_t>(timeline_.size());
  event.progress    = Progress(current_step_, event.total_steps);
  event.speed       = speed_;
  return event;
}

} // namespace flightrec::replay
