/**
 * @file io.hpp
 * @brief Minimal hardware seams used by the control path
 *
 * Device code implements these over GPIO, FreeRTOS and the task watchdog;
 * host tests substitute fakes.
 */

#pragma once

#include <chrono>

namespace core {

/// Single binary output line (status LED, excitation pin)
class IOutputLine {
public:
  virtual ~IOutputLine() = default;

  virtual void set(bool level) = 0;
  [[nodiscard]] virtual bool get() const = 0;

  void toggle() { set(!get()); }
};

/// Blocking delay of the calling task
class IDelay {
public:
  virtual ~IDelay() = default;

  virtual void delay(std::chrono::milliseconds duration) = 0;
};

/// Hardware watchdog that must be fed at a bounded interval
class IWatchdog {
public:
  virtual ~IWatchdog() = default;

  virtual void feed() = 0;
};

/// Unconditional system reset
class IReset {
public:
  virtual ~IReset() = default;

  virtual void restart() = 0;
};

} // namespace core
