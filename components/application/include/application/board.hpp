/**
 * @file board.hpp
 * @brief Board hardware abstraction
 *
 * Owns the status LED, the BOOT button and the excitation outputs of
 * this specific board. Application-specific, not a reusable library
 * component.
 */

#pragma once

#include <core/abort.hpp>
#include <core/gpio.hpp>
#include <core/io.hpp>
#include <sensor/probe.hpp>

#include <esp_attr.h>

#include <memory>
#include <vector>

namespace application {

/// Board hardware configuration
struct BoardConfig {
  gpio_num_t status_led = GPIO_NUM_NC;
  bool led_active_low = false;
  gpio_num_t boot_button = GPIO_NUM_NC; ///< Active low, pulled up
};

/// Status LED, hiding its polarity
class StatusLed final : public core::IOutputLine {
public:
  StatusLed(gpio_num_t pin, bool active_low)
      : pin_(pin, active_low), active_low_(active_low) {}

  [[nodiscard]] bool valid() const { return pin_.valid(); }

  void set(bool lit) override { pin_.set(lit != active_low_); }
  [[nodiscard]] bool get() const override {
    return pin_.get() != active_low_;
  }

private:
  core::OutputPin pin_;
  bool active_low_;
};

/// Pins driven high for auxiliary excitation; held until reset
class ExcitationDriver final : public sensor::IPinDriver {
public:
  [[nodiscard]] core::Status drive_high(sensor::PinId pin) override;

private:
  std::vector<std::unique_ptr<core::OutputPin>> pins_;
};

/// Board hardware abstraction - owns all peripherals
class Board {
public:
  explicit Board(const BoardConfig &config);

  Board(const Board &) = delete;
  Board &operator=(const Board &) = delete;
  Board(Board &&) = delete;
  Board &operator=(Board &&) = delete;

  /// LED usable; the button is optional
  [[nodiscard]] bool valid() const { return led_.valid(); }

  [[nodiscard]] core::IOutputLine &led() { return led_; }

  /// Raised by a BOOT button press; also selects manual mode after boot
  [[nodiscard]] core::AbortSignal &abort() { return abort_; }

  [[nodiscard]] ExcitationDriver &excitation() { return excitation_; }

private:
  static void IRAM_ATTR on_button(void *arg);

  core::AbortSignal abort_;
  StatusLed led_;
  core::InterruptPin button_;
  ExcitationDriver excitation_;
};

} // namespace application
