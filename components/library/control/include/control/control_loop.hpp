/**
 * @file control_loop.hpp
 * @brief One wake cycle: connect, sync, discover, warm up, report, rest
 *
 *   Idle -> Connecting -> SyncingTime -> DiscoveringSensors -> WarmingUp
 *        -> Reporting -> {Succeeded, Failed} -> Resting -> Resetting
 *
 * Any stage error skips the remaining stages. Connectivity and time sync
 * retry internally, so they only fail on configuration errors or abort.
 * The hardware reset at the end of Resting is the only way out.
 */

#pragma once

#include "run_state.hpp"

#include <core/config.hpp>
#include <core/device_context.hpp>
#include <core/io.hpp>
#include <network/connectivity.hpp>
#include <network/time_sync.hpp>
#include <report/reporter.hpp>
#include <sensor/excitation.hpp>
#include <sensor/registry.hpp>

#include <chrono>

namespace control {

/// Stages of the pipeline, owned by the application
struct Pipeline {
  core::IConfigSource &config;
  network::ConnectivityManager &connectivity;
  network::TimeSync &time_sync;
  sensor::ExcitationOutputs &excitation;
  sensor::SensorRegistry &registry;
  report::Reporter &reporter;
};

namespace rest_defaults {
inline constexpr std::chrono::milliseconds AFTER_SUCCESS =
    std::chrono::minutes(40);
inline constexpr std::chrono::milliseconds AFTER_FAILURE =
    std::chrono::minutes(10);
} // namespace rest_defaults

struct RestPolicy {
  std::chrono::milliseconds after_success{rest_defaults::AFTER_SUCCESS};
  std::chrono::milliseconds after_failure{rest_defaults::AFTER_FAILURE};
};

class ControlLoop {
public:
  ControlLoop(const Pipeline &pipeline, core::DeviceContext &ctx,
              core::IReset &reset, const RestPolicy &rest = {});

  ControlLoop(const ControlLoop &) = delete;
  ControlLoop &operator=(const ControlLoop &) = delete;
  ControlLoop(ControlLoop &&) = delete;
  ControlLoop &operator=(ControlLoop &&) = delete;

  /// Run the pipeline once without resting or resetting
  [[nodiscard]] RunOutcome run_once();

  /// Heartbeat after success, alarm bursts otherwise
  void rest(const RunOutcome &outcome);

  /// run_once(), rest(), then restart the device. Only returns when the
  /// reset handle does (tests).
  RunOutcome run_cycle();

  [[nodiscard]] RunState state() const { return state_; }

private:
  void run_pipeline(RunOutcome &outcome);
  void enter(RunState state);
  void fail(RunOutcome &outcome, esp_err_t err);
  [[nodiscard]] bool abort_pending(RunOutcome &outcome);

  Pipeline pipeline_;
  core::DeviceContext &ctx_;
  core::IReset &reset_;
  RestPolicy rest_;
  RunState state_{RunState::Idle};
};

} // namespace control
