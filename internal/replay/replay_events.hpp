#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "flightrec/v1/replay.pb.h"

namespace flightrec::replay {

enum class ReplayEventType {
  kReplayStarted,
  kInteractionReplayed,
  kReplayPaused,
  kReplayResumed,
  kReplayStopped,
  kReplayCompleted,
  kReplayError,
  kSpeedChanged,
};

std::string_view ToString(ReplayEventType type);

struct ReplayEvent {
  ReplayEventType type{ReplayEventType::kReplayStarted};
  std::string     replay_id;
  std::string     session_id;
  uint32_t        step{0};
  uint32_t        total_steps{0};
  double          progress{0.0};
  double          speed{1.0};
  std::string     error;

  std::optional<flightrec::v1::InteractionResult> interaction;
  std::optional<flightrec::v1::ReplayResult>      result;
};

using ReplayListener = std::function<void(const ReplayEvent&)>;
using ListenerId     = uint64_t;

/*
  Typed listener registry.

  Emit runs listeners synchronously on the calling thread, in
  subscription order, outside the registry lock, so a listener may call
  back into the engine or unsubscribe itself.
*/
class ReplayEventBus {
 public:
  ListenerId Subscribe(ReplayEventType type, ReplayListener listener);
  bool       Unsubscribe(ListenerId id);

  void Emit(const ReplayEvent& event) const;

 private:
  struct Entry {
    ReplayEventType type;
    ReplayListener  listener;
  };

  mutable std::mutex          mutex_;
  ListenerId                  next_id_{1};
  std::map<ListenerId, Entry> listeners_;
};

} // namespace flightrec::replay
