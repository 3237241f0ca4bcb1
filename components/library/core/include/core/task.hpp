/**
 * @file task.hpp
 * @brief FreeRTOS task delays
 */

#pragma once

#include "io.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <chrono>
#include <cstdint>

namespace core {

/// Delay current task
template <typename Rep, typename Period>
void delay(std::chrono::duration<Rep, Period> duration) {
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  vTaskDelay(pdMS_TO_TICKS(static_cast<uint32_t>(ms)));
}

/// IDelay over vTaskDelay
class TaskDelay final : public IDelay {
public:
  void delay(std::chrono::milliseconds duration) override {
    core::delay(duration);
  }
};

/// Get free stack space of current task
[[nodiscard]] inline uint32_t stack_high_water_mark() {
  return uxTaskGetStackHighWaterMark(nullptr);
}

} // namespace core
