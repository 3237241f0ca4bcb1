/**
 * @file control_loop.cpp
 * @brief Pipeline orchestration and the rest/reset epilogue
 */

#include "control/control_loop.hpp"

#include <sensor/warm_up.hpp>

#include <esp_log.h>

#include <exception>
#include <string>
#include <utility>

namespace control {

namespace {
constexpr const char *TAG = "control";

[[nodiscard]] long long whole_minutes(std::chrono::milliseconds duration) {
  return static_cast<long long>(
      std::chrono::duration_cast<std::chrono::minutes>(duration).count());
}
} // namespace

ControlLoop::ControlLoop(const Pipeline &pipeline, core::DeviceContext &ctx,
                         core::IReset &reset, const RestPolicy &rest)
    : pipeline_(pipeline), ctx_(ctx), reset_(reset), rest_(rest) {}

RunOutcome ControlLoop::run_once() {
  RunOutcome outcome;
  state_ = RunState::Idle;

  try {
    run_pipeline(outcome);
  } catch (const std::exception &e) {
    ESP_LOGE(TAG, "Unexpected error in %s: %s", to_string(state_), e.what());
    fail(outcome, ESP_FAIL);
  } catch (...) {
    ESP_LOGE(TAG, "Unexpected non-standard error in %s", to_string(state_));
    fail(outcome, ESP_FAIL);
  }

  state_ = outcome.state;
  if (outcome.success()) {
    ESP_LOGI(TAG, "Run succeeded, %zu sensor(s) reported",
             outcome.per_sensor.size());
  } else if (!outcome.aborted()) {
    ESP_LOGE(TAG, "Run failed in %s: %s", to_string(outcome.failed_stage),
             esp_err_to_name(outcome.error));
  }
  return outcome;
}

void ControlLoop::run_pipeline(RunOutcome &outcome) {
  auto &config = pipeline_.config;

  enter(RunState::Idle);
  auto extra_hots = config.get(core::config_keys::EXTRA_HOTS);
  if (auto status = pipeline_.excitation.enable(extra_hots.value_or(""));
      !status) {
    fail(outcome, status.error());
    return;
  }

  if (abort_pending(outcome)) {
    return;
  }
  enter(RunState::Connecting);
  auto wifi = config.get(core::config_keys::WIFI);
  if (!wifi) {
    ESP_LOGE(TAG, "WIFI is not configured");
    fail(outcome, ESP_ERR_INVALID_ARG);
    return;
  }
  if (auto status = pipeline_.connectivity.ensure_connected(*wifi); !status) {
    fail(outcome, status.error());
    return;
  }

  if (abort_pending(outcome)) {
    return;
  }
  enter(RunState::SyncingTime);
  if (auto status = pipeline_.time_sync.sync(); !status) {
    fail(outcome, status.error());
    return;
  }

  if (abort_pending(outcome)) {
    return;
  }
  enter(RunState::DiscoveringSensors);
  auto sensors_setting = config.get(core::config_keys::SENSORS);
  if (!sensors_setting) {
    ESP_LOGE(TAG, "SENSORS is not configured");
    fail(outcome, ESP_ERR_INVALID_ARG);
    return;
  }
  auto sensors = pipeline_.registry.discover(*sensors_setting);
  if (!sensors) {
    fail(outcome, sensors.error());
    return;
  }

  if (abort_pending(outcome)) {
    return;
  }
  enter(RunState::WarmingUp);
  sensor::warm_up(*sensors, ctx_);

  if (abort_pending(outcome)) {
    return;
  }
  enter(RunState::Reporting);
  auto token_url = config.get(core::config_keys::TOKEN_URL);
  auto results = pipeline_.reporter.report_all(*sensors, token_url.value_or(""));
  if (!results) {
    fail(outcome, results.error());
    return;
  }

  outcome.per_sensor = std::move(*results);
  if (report::all_stored(outcome.per_sensor)) {
    outcome.state = RunState::Succeeded;
  } else {
    // Every sensor was attempted; any miss fails the run
    outcome.state = RunState::Failed;
    outcome.failed_stage = RunState::Reporting;
    outcome.error = ESP_FAIL;
  }
}

void ControlLoop::enter(RunState state) {
  ESP_LOGI(TAG, "%s -> %s", to_string(state_), to_string(state));
  state_ = state;
  ctx_.pacer.feed();
}

void ControlLoop::fail(RunOutcome &outcome, esp_err_t err) {
  outcome.failed_stage = state_;
  outcome.error = err;
  if (err == ESP_ERR_NOT_FINISHED) {
    ESP_LOGW(TAG, "Run aborted during %s", to_string(state_));
    outcome.state = RunState::Aborted;
  } else {
    outcome.state = RunState::Failed;
  }
}

bool ControlLoop::abort_pending(RunOutcome &outcome) {
  if (!ctx_.abort.requested()) {
    return false;
  }
  fail(outcome, ESP_ERR_NOT_FINISHED);
  return true;
}

void ControlLoop::rest(const RunOutcome &outcome) {
  state_ = RunState::Resting;
  if (outcome.success()) {
    ESP_LOGI(TAG, "Resting %lld min after success",
             whole_minutes(rest_.after_success));
    ctx_.status.heartbeat(rest_.after_success);
  } else {
    ESP_LOGW(TAG, "Resting %lld min after %s",
             whole_minutes(rest_.after_failure), to_string(outcome.state));
    ctx_.status.alarm(rest_.after_failure);
  }
}

RunOutcome ControlLoop::run_cycle() {
  auto outcome = run_once();
  rest(outcome);

  state_ = RunState::Resetting;
  ESP_LOGI(TAG, "Cycle finished, resetting");
  reset_.restart();
  return outcome;
}

} // namespace control
