/**
 * @file watchdog.cpp
 * @brief Task watchdog subscription
 */

#include <core/watchdog.hpp>

#include <esp_log.h>

namespace core {

namespace {
constexpr const char *TAG = "watchdog";
} // namespace

TaskWatchdog::TaskWatchdog(std::chrono::milliseconds timeout) {
  esp_task_wdt_config_t config{
      .timeout_ms = static_cast<uint32_t>(timeout.count()),
      .idle_core_mask = 0,
      .trigger_panic = true,
  };

  // The TWDT may already run from sdkconfig; reconfigure in that case
  esp_err_t err = esp_task_wdt_init(&config);
  if (err == ESP_ERR_INVALID_STATE) {
    err = esp_task_wdt_reconfigure(&config);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Watchdog init failed: %s", esp_err_to_name(err));
    return;
  }

  err = esp_task_wdt_add(nullptr);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Watchdog subscribe failed: %s", esp_err_to_name(err));
    return;
  }

  subscribed_ = true;
  ESP_LOGI(TAG, "Task watchdog armed (%lld ms)",
           static_cast<long long>(timeout.count()));
}

TaskWatchdog::~TaskWatchdog() {
  if (subscribed_) {
    esp_task_wdt_delete(nullptr);
  }
}

void TaskWatchdog::feed() {
  if (subscribed_) {
    esp_task_wdt_reset();
  }
}

} // namespace core
