/**
 * @file time_sync.cpp
 * @brief Clock synchronization loop
 */

#include <network/time_sync.hpp>

#include <esp_log.h>

namespace network {

namespace {
constexpr const char *TAG = "time_sync";
} // namespace

TimeSync::TimeSync(ITimeSource &source, core::DeviceContext &ctx,
                   const TimeSyncConfig &config)
    : source_(source), ctx_(ctx), config_(config) {}

core::Status TimeSync::sync() {
  auto local = core::retry(
      config_.retry, ctx_.pacer, ctx_.abort, [this]() -> core::Result<int64_t> {
        ctx_.status.signal(core::StatusSignal::SyncingTime);

        auto utc = source_.fetch_unix_time();
        ctx_.pacer.feed();
        if (!utc) {
          ESP_LOGW(TAG, "Error getting time from %s, will try again: %s",
                   source_.name(), esp_err_to_name(utc.error()));
          return core::Err(utc.error());
        }
        return static_cast<int64_t>(*utc + config_.utc_offset.count());
      });

  if (!local) {
    return core::Err(local.error());
  }

  ctx_.clock.set(*local);
  auto stamp = ctx_.clock.stamp();
  ESP_LOGI(TAG, "Clock set from %s: %s (UTC%+lld h)", source_.name(),
           stamp.data(),
           static_cast<long long>(config_.utc_offset.count() / 3600));
  return core::Ok();
}

} // namespace network
