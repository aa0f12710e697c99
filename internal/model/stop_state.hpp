#pragma once

#include <cstdint>

namespace stackctl::model {

/*
  Stop sequence states.

    Running -> Signaling -> Settling -> Verified
                                     -> PartiallyStopped

  PartiallyStopped is not terminal for the operator (re-run is the
  retry), but it is terminal for a single invocation.
*/
enum class StopState : std::uint8_t {
  kRunning          = 0,
  kSignaling        = 1,
  kSettling         = 2,
  kVerified         = 3,
  kPartiallyStopped = 4,
};

constexpr bool IsTerminal(StopState state) {
  return state == StopState::kVerified || state == StopState::kPartiallyStopped;
}

constexpr bool CanTransition(StopState from, StopState to) {
  switch (from) {
    case StopState::kRunning:
      return to == StopState::kSignaling;
    case StopState::kSignaling:
      return to == StopState::kSettling;
    case StopState::kSettling:
      return to == StopState::kVerified || to == StopState::kPartiallyStopped;
    default:
      return false;
  }
}

constexpr const char* StopStateName(StopState state) {
  switch (state) {
    case StopState::kRunning:
      return "running";
    case StopState::kSignaling:
      return "signaling";
    case StopState::kSettling:
      return "settling";
    case StopState::kVerified:
      return "verified";
    case StopState::kPartiallyStopped:
      return "partially_stopped";
  }
  return "unknown";
}

} // namespace stackctl::model
