/**
 * @file retry.hpp
 * @brief Fixed-interval retry policy for blocking convergence loops
 *
 * Production loops retry forever (max_attempts = 0) and are bounded only
 * by the watchdog being fed between attempts. Tests bound them by setting
 * max_attempts.
 */

#pragma once

#include "abort.hpp"
#include "pacer.hpp"
#include "result.hpp"

#include <esp_log.h>

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <type_traits>

namespace core {

/// Retry policy configuration
struct RetryPolicy {
  uint32_t max_attempts{0};                  // 0 = retry forever
  std::chrono::milliseconds interval{2000};  // Wait between attempts

  [[nodiscard]] bool exhausted(uint32_t attempts) const {
    return max_attempts != 0 && attempts >= max_attempts;
  }
};

/// Run attempt() until it succeeds, the policy is exhausted, or an abort
/// is requested.
///
/// @return the successful result, Err(ESP_ERR_TIMEOUT) when exhausted,
///         Err(ESP_ERR_NOT_FINISHED) when aborted
template <typename Fn>
[[nodiscard]] auto retry(const RetryPolicy &policy, Pacer &pacer,
                         const AbortSignal &abort, Fn &&attempt)
    -> std::invoke_result_t<Fn &> {
  constexpr const char *TAG = "retry";
  uint32_t attempts = 0;

  while (true) {
    if (abort.requested()) {
      ESP_LOGW(TAG, "Abort requested after %" PRIu32 " attempt(s)", attempts);
      return Err(ESP_ERR_NOT_FINISHED);
    }

    auto result = attempt();
    if (result.ok()) {
      return result;
    }

    ++attempts;
    if (result.error() == ESP_ERR_NOT_FINISHED || abort.requested()) {
      ESP_LOGW(TAG, "Abort requested after %" PRIu32 " attempt(s)", attempts);
      return Err(ESP_ERR_NOT_FINISHED);
    }
    if (policy.exhausted(attempts)) {
      ESP_LOGE(TAG, "Giving up after %" PRIu32 " attempt(s)", attempts);
      return Err(ESP_ERR_TIMEOUT);
    }

    ESP_LOGW(TAG, "Attempt %" PRIu32 " failed (%s), retrying in %lldms",
             attempts, esp_err_to_name(result.error()),
             static_cast<long long>(policy.interval.count()));
    pacer.wait(policy.interval);
  }
}

} // namespace core
