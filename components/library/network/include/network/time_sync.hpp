/**
 * @file time_sync.hpp
 * @brief Set the wall clock from an authoritative time source
 */

#pragma once

#include "time_source.hpp"

#include <core/device_context.hpp>
#include <core/result.hpp>
#include <core/retry.hpp>

#include <chrono>

namespace network {

namespace time_sync_defaults {
/// Fixed local offset from UTC; no daylight saving correction
inline constexpr std::chrono::seconds UTC_OFFSET = std::chrono::hours(-5);
} // namespace time_sync_defaults

struct TimeSyncConfig {
  std::chrono::seconds utc_offset{time_sync_defaults::UTC_OFFSET};
  /// Retry forever by default, paced only by the source's own timeout
  core::RetryPolicy retry{.max_attempts = 0,
                          .interval = std::chrono::milliseconds{0}};
};

class TimeSync {
public:
  TimeSync(ITimeSource &source, core::DeviceContext &ctx,
           const TimeSyncConfig &config = {});

  TimeSync(const TimeSync &) = delete;
  TimeSync &operator=(const TimeSync &) = delete;
  TimeSync(TimeSync &&) = delete;
  TimeSync &operator=(TimeSync &&) = delete;

  /// Block until the clock is set. Each attempt is preceded by the
  /// syncing-time signal. Fails only on abort (ESP_ERR_NOT_FINISHED) or
  /// when a bounded policy is exhausted (ESP_ERR_TIMEOUT).
  [[nodiscard]] core::Status sync();

private:
  ITimeSource &source_;
  core::DeviceContext &ctx_;
  TimeSyncConfig config_;
};

} // namespace network
