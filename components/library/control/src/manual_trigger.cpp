/**
 * @file manual_trigger.cpp
 * @brief Post-boot manual mode window
 */

#include "control/manual_trigger.hpp"

#include <esp_log.h>

#include <algorithm>

namespace control {

namespace {
constexpr const char *TAG = "manual";
} // namespace

bool await_manual_request(core::DeviceContext &ctx,
                          std::chrono::milliseconds window,
                          std::chrono::milliseconds poll) {
  // A press before the window opens is a leftover, not a request
  ctx.abort.clear();
  ESP_LOGI(TAG, "Press BOOT within %lld ms for a manual pass",
           static_cast<long long>(window.count()));

  std::chrono::milliseconds waited{0};
  while (waited < window) {
    auto step = std::min(poll, window - waited);
    ctx.pacer.wait(step);
    waited += step;
    if (ctx.abort.requested()) {
      ctx.abort.clear();
      ESP_LOGI(TAG, "Manual pass requested");
      return true;
    }
  }
  return false;
}

} // namespace control
