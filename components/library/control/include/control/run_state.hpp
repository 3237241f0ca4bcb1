/**
 * @file run_state.hpp
 * @brief Pipeline states and the outcome of one pass
 */

#pragma once

#include <report/reporter.hpp>

#include <esp_err.h>

#include <cstdint>

namespace control {

enum class RunState : uint8_t {
  Idle,
  Connecting,
  SyncingTime,
  DiscoveringSensors,
  WarmingUp,
  Reporting,
  Succeeded,
  Failed,
  Aborted,
  Resting,
  Resetting,
};

[[nodiscard]] const char *to_string(RunState state);

/// Result of one run_once(), consumed by the rest/reset epilogue
struct RunOutcome {
  RunState state{RunState::Idle};
  RunState failed_stage{RunState::Idle}; ///< Stage that stopped the pass
  esp_err_t error{ESP_OK};
  report::SensorResults per_sensor;

  /// Pipeline completed and every sensor stored its record
  [[nodiscard]] bool success() const { return state == RunState::Succeeded; }
  [[nodiscard]] bool aborted() const { return state == RunState::Aborted; }
};

/// Process-style exit code of a manual pass: 0 on success, 1 otherwise
[[nodiscard]] constexpr int exit_code(const RunOutcome &outcome) {
  return outcome.success() ? 0 : 1;
}

} // namespace control
