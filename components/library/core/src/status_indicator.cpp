/**
 * @file status_indicator.cpp
 * @brief LED blink patterns
 */

#include <core/status.hpp>

#include <esp_log.h>

namespace core {

namespace {
constexpr const char *TAG = "status";
} // namespace

const char *to_string(StatusSignal signal) {
  switch (signal) {
  case StatusSignal::Boot:
    return "boot";
  case StatusSignal::ConnectingWifi:
    return "connecting-wifi";
  case StatusSignal::SyncingTime:
    return "syncing-time";
  case StatusSignal::Reporting:
    return "reporting";
  case StatusSignal::ReportComplete:
    return "report-complete";
  }
  return "unknown";
}

void StatusIndicator::signal(StatusSignal signal) {
  ESP_LOGD(TAG, "Signal %s", to_string(signal));
  if (signal == StatusSignal::Boot) {
    burst(blink_timing::BOOT_TOGGLES, blink_timing::BOOT_TOGGLE);
    off();
    return;
  }
  blink(blink_count(signal));
}

void StatusIndicator::blink(uint8_t count) {
  off();
  burst(static_cast<uint8_t>(count * 2), blink_timing::BLINK_TOGGLE);
  off();
  pacer_.wait(blink_timing::BLINK_PAUSE);
}

void StatusIndicator::burst(uint8_t toggles,
                            std::chrono::milliseconds interval) {
  for (uint8_t i = 0; i < toggles; ++i) {
    pacer_.wait(interval);
    led_.toggle();
  }
}

void StatusIndicator::heartbeat(std::chrono::milliseconds total,
                                std::chrono::milliseconds period) {
  off();
  for (auto elapsed = std::chrono::milliseconds{0}; elapsed < total;
       elapsed += period) {
    led_.toggle();
    pacer_.wait(period);
  }
  off();
}

void StatusIndicator::alarm(std::chrono::milliseconds total) {
  constexpr auto burst_length =
      blink_timing::ALARM_TOGGLE * blink_timing::ALARM_TOGGLES +
      blink_timing::ALARM_PAUSE;

  off();
  for (auto elapsed = std::chrono::milliseconds{0}; elapsed < total;
       elapsed += burst_length) {
    for (uint8_t i = 0; i < blink_timing::ALARM_TOGGLES; ++i) {
      led_.toggle();
      pacer_.wait(blink_timing::ALARM_TOGGLE);
    }
    pacer_.wait(blink_timing::ALARM_PAUSE);
  }
  off();
}

} // namespace core
