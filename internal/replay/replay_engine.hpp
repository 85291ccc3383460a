#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "flightrec/v1/replay.pb.h"
#include "internal/replay/data_loader.hpp"
#include "internal/replay/replay_events.hpp"
#include "internal/replay/replay_state.hpp"
#include "internal/replay/tool_call_matcher.hpp"
#include "internal/storage/record_store.hpp"

namespace flightrec::replay {

constexpr double kMinReplaySpeed = 0.1;
constexpr double kMaxReplaySpeed = 10.0;

struct ReplayOptions {
  bool                     preserve_timestamp{true};
  uint32_t                 replay_from_step{0};
  // empty replays every layer
  std::vector<std::string> only_replay_layers;
  double                   speed{1.0};

  static ReplayOptions FromConfig(const flightrec::config::ReplayConfig& config);
};

struct ReplayStatus {
  ReplayState   state{ReplayState::kIdle};
  std::string   replay_id;
  std::string   session_id;
  uint32_t      current_step{0};
  uint32_t      total_steps{0};
  double        progress{0.0};
  double        speed{1.0};
  std::size_t   layer_records{0};
  std::size_t   tool_call_mappings{0};
  std::size_t   timeline_size{0};
  ReplayOptions options;
};

/*
  Replays a recorded session strictly from the record store.

  Flow:
      scenario → record details → layer index + tool-call mappings
               → timeline (sorted by timestamp) → replay loop

  StartDynamicReplay runs the loop on the calling thread. Pause, Resume,
  Stop and SetSpeed are meant to be called from other threads (or from
  listeners); they take effect between steps. Timestamp-preserving
  delays wake up immediately on Stop.
*/
class DynamicReplayEngine {
 public:
  explicit DynamicReplayEngine(storage::RecordStorePtr store, ReplayOptions defaults = {}, ToolCallMatcher matcher = ToolCallMatcher());

  DynamicReplayEngine(const DynamicReplayEngine&)            = delete;
  DynamicReplayEngine& operator=(const DynamicReplayEngine&) = delete;

  // Throws util::SessionNotFound when no scenario exists for the session
  // and util::InvalidState when a replay is already active.
  flightrec::v1::ReplayResult StartDynamicReplay(const std::string& session_id, std::optional<ReplayOptions> options = std::nullopt);

  void   Pause();
  void   Resume();
  void   Stop();
  double SetSpeed(double speed);

  ReplayStatus GetReplayStatus() const;

  ListenerId Subscribe(ReplayEventType type, ReplayListener listener) {
    return events_.Subscribe(type, std::move(listener));
  }

  bool Unsubscribe(ListenerId id) {
    return events_.Unsubscribe(id);
  }

 private:
  void                                   BuildDataMappings(const flightrec::v1::ReplayScenario& scenario);
  flightrec::v1::ReplayResult            ExecuteReplayLoop();
  flightrec::v1::InteractionResult       ExecuteInteraction(const flightrec::v1::Interaction& interaction) const;
  void                                   WaitForGap(const flightrec::v1::Interaction& current, const flightrec::v1::Interaction& next);
  void                                   SaveResult(const flightrec::v1::ReplayResult& result) const;
  void                                   TransitionLocked(ReplayState to);
  ReplayEvent                            MakeEventLocked(ReplayEventType type) const;

  storage::RecordStorePtr store_;
  ReplayOptions           defaults_;
  ToolCallMatcher         matcher_;
  DatabaseDataLoader      loader_;
  ReplayEventBus          events_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  ReplayState   state_{ReplayState::kIdle};
  ReplayOptions options_;
  double        speed_{1.0};
  std::string   replay_id_;
  std::string   session_id_;
  uint32_t      current_step_{0};

  // Written only while building mappings, read-only during the loop.
  std::map<std::string, std::vector<flightrec::v1::Interaction>> layer_records_;
  std::unordered_map<std::string, flightrec::v1::ToolCallMapping> tool_call_results_;
  std::vector<flightrec::v1::Interaction>                         timeline_;
};

} // namespace flightrec::replay
