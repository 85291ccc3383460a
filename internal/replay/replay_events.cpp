#include "replay_events.hpp"

#include <exception>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace flightrec::replay {

std::string_view ToString(ReplayEventType type) {
  switch (type) {
    case ReplayEventType::kReplayStarted:
      return "replayStarted";
    case ReplayEventType::kInteractionReplayed:
      return "interactionReplayed";
    case ReplayEventType::kReplayPaused:
      return "replayPaused";
    case ReplayEventType::kReplayResumed:
      return "replayResumed";
    case ReplayEventType::kReplayStopped:
      return "replayStopped";
    case ReplayEventType::kReplayCompleted:
      return "replayCompleted";
    case ReplayEventType::kReplayError:
      return "replayError";
    case ReplayEventType::kSpeedChanged:
      return "speedChanged";
  }
  return "unknown";
}

ListenerId ReplayEventBus::Subscribe(ReplayEventType type, ReplayListener listener) {
  if (!listener) {
    throw std::invalid_argument("replay listener must be callable");
  }
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  listeners_.emplace(id, Entry{type, std::move(listener)});
  return id;
}

bool ReplayEventBus::Unsubscribe(ListenerId id) {
  std::lock_guard lock(mutex_);
  return listeners_.erase(id) > 0;
}

void ReplayEventBus::Emit(const ReplayEvent& event) const {
  std::vector<ReplayListener> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : listeners_) {
      if (entry.type == event.type) {
        targets.push_back(entry.listener);
      }
    }
  }

  // A failing listener must not break the replay loop or starve the others.
  for (const auto& listener : targets) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      FLIGHTREC_LOG_ERROR("replay listener failed", {observability::StringField("event", ToString(event.type)),
                                                     observability::StringField("error", e.what())});
    }
  }
}

} // namespace flightrec::replay
