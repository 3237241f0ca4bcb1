/**
 * @file run_state.cpp
 * @brief RunState names
 */

#include "control/run_state.hpp"

namespace control {

const char *to_string(RunState state) {
  switch (state) {
  case RunState::Idle:
    return "Idle";
  case RunState::Connecting:
    return "Connecting";
  case RunState::SyncingTime:
    return "SyncingTime";
  case RunState::DiscoveringSensors:
    return "DiscoveringSensors";
  case RunState::WarmingUp:
    return "WarmingUp";
  case RunState::Reporting:
    return "Reporting";
  case RunState::Succeeded:
    return "Succeeded";
  case RunState::Failed:
    return "Failed";
  case RunState::Aborted:
    return "Aborted";
  case RunState::Resting:
    return "Resting";
  case RunState::Resetting:
    return "Resetting";
  }
  return "Unknown";
}

} // namespace control
