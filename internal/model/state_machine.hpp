#pragma once

#include <cstdint>
#include <string_view>

namespace trajectory::model {

enum class RunState : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kCompleted = 2,
  kFailed    = 3,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kCompleted || state == RunState::kFailed;
}

constexpr bool CanTransition(RunState from, RunState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (from == RunState::kPending) {
    return to == RunState::kRunning;
  }

  return IsTerminal(to);
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kPending:
      return "pending";
    case RunState::kRunning:
      return "running";
    case RunState::kCompleted:
      return "completed";
    case RunState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace trajectory::model
