#pragma once

#include <cstdint>
#include <string_view>

namespace flightrec::replay {

enum class ReplayState : std::uint8_t {
  kIdle      = 0,
  kRunning   = 1,
  kPaused    = 2,
  kCompleted = 3,
  kError     = 4,
  kStopped   = 5,
};

constexpr bool IsTerminal(ReplayState state) {
  return state == ReplayState::kCompleted || state == ReplayState::kError || state == ReplayState::kStopped;
}

constexpr bool IsActive(ReplayState state) {
  return state == ReplayState::kRunning || state == ReplayState::kPaused;
}

/*
  idle → running → {completed, error, stopped}, running ⇄ paused.
  A pause that lands after the last step still completes: the timeline
  is exhausted, there is nothing left to resume. A finished engine may
  start the next replay.
*/
constexpr bool CanTransition(ReplayState from, ReplayState to) {
  switch (to) {
    case ReplayState::kRunning:
      return from == ReplayState::kIdle || from == ReplayState::kPaused || IsTerminal(from);
    case ReplayState::kPaused:
      return from == ReplayState::kRunning;
    case ReplayState::kCompleted:
      return IsActive(from);
    case ReplayState::kError:
    case ReplayState::kStopped:
      return IsActive(from);
    case ReplayState::kIdle:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(ReplayState state) {
  switch (state) {
    case ReplayState::kIdle:
      return "idle";
    case ReplayState::kRunning:
      return "running";
    case ReplayState::kPaused:
      return "paused";
    case ReplayState::kCompleted:
      return "completed";
    case ReplayState::kError:
      return "error";
    case ReplayState::kStopped:
      return "stopped";
  }
  return "unknown";
}

} // namespace flightrec::replay
