/**
 * @file pacer.hpp
 * @brief Watchdog-aware blocking waits
 *
 * Every sleep in the control path goes through a Pacer so the task
 * watchdog is fed at least once per slice, however long the wait.
 */

#pragma once

#include "io.hpp"

#include <chrono>

namespace core {

namespace pacer_defaults {
/// Longest single delay between two watchdog feeds
inline constexpr std::chrono::milliseconds MAX_SLICE{1000};

/// Task watchdog period. Any call that blocks outside wait() must finish
/// within it; such calls assert their own timeouts against it.
inline constexpr std::chrono::milliseconds WATCHDOG_TIMEOUT{120000};
} // namespace pacer_defaults

class Pacer {
public:
  Pacer(IDelay &delay, IWatchdog &watchdog,
        std::chrono::milliseconds max_slice = pacer_defaults::MAX_SLICE);

  Pacer(const Pacer &) = delete;
  Pacer &operator=(const Pacer &) = delete;
  Pacer(Pacer &&) = delete;
  Pacer &operator=(Pacer &&) = delete;

  /// Block for the given duration, feeding the watchdog per slice
  void wait(std::chrono::milliseconds duration);

  /// Feed the watchdog without waiting
  void feed() { watchdog_.feed(); }

  [[nodiscard]] std::chrono::milliseconds max_slice() const {
    return max_slice_;
  }

private:
  IDelay &delay_;
  IWatchdog &watchdog_;
  std::chrono::milliseconds max_slice_;
};

} // namespace core
