/**
 * @file restart.cpp
 * @brief Reset reason and system restart
 */

#include <power/restart.hpp>

#include <esp_log.h>
#include <esp_system.h>

namespace power {

namespace {
constexpr const char *TAG = "power";
} // namespace

ResetReason get_reset_reason() {
  switch (esp_reset_reason()) {
  case ESP_RST_POWERON:
    return ResetReason::PowerOn;
  case ESP_RST_SW:
    return ResetReason::Software;
  case ESP_RST_TASK_WDT:
  case ESP_RST_INT_WDT:
  case ESP_RST_WDT:
    return ResetReason::Watchdog;
  case ESP_RST_PANIC:
    return ResetReason::Panic;
  case ESP_RST_BROWNOUT:
    return ResetReason::Brownout;
  case ESP_RST_EXT:
    return ResetReason::External;
  default:
    return ResetReason::Other;
  }
}

const char *to_string(ResetReason reason) {
  switch (reason) {
  case ResetReason::PowerOn:
    return "power-on";
  case ResetReason::Software:
    return "software";
  case ResetReason::Watchdog:
    return "watchdog";
  case ResetReason::Panic:
    return "panic";
  case ResetReason::Brownout:
    return "brownout";
  case ResetReason::External:
    return "external";
  default:
    return "other";
  }
}

void SystemRestart::restart() {
  ESP_LOGW(TAG, "Restarting");
  esp_restart();
}

} // namespace power
