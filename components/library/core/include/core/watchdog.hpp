/**
 * @file watchdog.hpp
 * @brief Task watchdog subscription for the calling task
 */

#pragma once

#include "io.hpp"
#include "result.hpp"

#include <esp_task_wdt.h>

#include <chrono>

namespace core {

/// Subscribes the constructing task to the task watchdog (RAII).
/// Must be fed from the same task.
class TaskWatchdog final : public IWatchdog {
public:
  explicit TaskWatchdog(std::chrono::milliseconds timeout);
  ~TaskWatchdog() override;

  TaskWatchdog(const TaskWatchdog &) = delete;
  TaskWatchdog &operator=(const TaskWatchdog &) = delete;
  TaskWatchdog(TaskWatchdog &&) = delete;
  TaskWatchdog &operator=(TaskWatchdog &&) = delete;

  [[nodiscard]] bool valid() const { return subscribed_; }

  void feed() override;

private:
  bool subscribed_{false};
};

} // namespace core
