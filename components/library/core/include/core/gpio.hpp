/**
 * @file gpio.hpp
 * @brief Type-safe RAII GPIO wrapper
 */

#pragma once

#include "io.hpp"
#include "result.hpp"

#include <driver/gpio.h>

#include <cstdint>

namespace core {

/// GPIO pull mode
enum class Pull : uint8_t {
  None,
  Up,
  Down,
};

namespace detail {
[[nodiscard]] inline gpio_config_t make_config(gpio_num_t pin, gpio_mode_t mode,
                                               Pull pull,
                                               gpio_int_type_t trigger) {
  return {
      .pin_bit_mask = 1ULL << pin,
      .mode = mode,
      .pull_up_en =
          pull == Pull::Up ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE,
      .pull_down_en =
          pull == Pull::Down ? GPIO_PULLDOWN_ENABLE : GPIO_PULLDOWN_DISABLE,
      .intr_type = trigger,
  };
}
} // namespace detail

/// GPIO output pin (RAII)
class OutputPin final : public IOutputLine {
public:
  explicit OutputPin(gpio_num_t pin, bool initial_level = false)
      : pin_(pin), level_(initial_level) {
    // Input enabled as well so get() reads back the driven level
    auto cfg = detail::make_config(pin, GPIO_MODE_INPUT_OUTPUT, Pull::None,
                                   GPIO_INTR_DISABLE);
    err_ = gpio_config(&cfg);
    if (err_ == ESP_OK) {
      gpio_set_level(pin_, initial_level ? 1 : 0);
    }
  }

  ~OutputPin() override { gpio_reset_pin(pin_); }

  OutputPin(const OutputPin &) = delete;
  OutputPin &operator=(const OutputPin &) = delete;
  OutputPin(OutputPin &&) = delete;
  OutputPin &operator=(OutputPin &&) = delete;

  [[nodiscard]] bool valid() const { return err_ == ESP_OK; }
  [[nodiscard]] esp_err_t error() const { return err_; }

  void set(bool level) override {
    level_ = level;
    gpio_set_level(pin_, level ? 1 : 0);
  }

  [[nodiscard]] bool get() const override { return level_; }

private:
  gpio_num_t pin_;
  bool level_;
  esp_err_t err_{ESP_FAIL};
};

/// GPIO input with interrupt support
class InterruptPin {
public:
  using Callback = void (*)(void *arg);

  InterruptPin(gpio_num_t pin, gpio_int_type_t trigger, Callback callback,
               void *arg = nullptr, Pull pull = Pull::None)
      : pin_(pin) {
    auto cfg = detail::make_config(pin, GPIO_MODE_INPUT, pull, trigger);
    err_ = gpio_config(&cfg);
    if (err_ != ESP_OK) {
      return;
    }

    // ISR service is shared by every pin
    err_ = gpio_install_isr_service(0);
    if (err_ == ESP_ERR_INVALID_STATE) {
      err_ = ESP_OK; // Already installed
    }
    if (err_ != ESP_OK) {
      return;
    }

    err_ = gpio_isr_handler_add(pin_, callback, arg);
    attached_ = err_ == ESP_OK;
  }

  ~InterruptPin() {
    if (attached_) {
      gpio_isr_handler_remove(pin_);
    }
    gpio_reset_pin(pin_);
  }

  InterruptPin(const InterruptPin &) = delete;
  InterruptPin &operator=(const InterruptPin &) = delete;
  InterruptPin(InterruptPin &&) = delete;
  InterruptPin &operator=(InterruptPin &&) = delete;

  [[nodiscard]] bool valid() const { return err_ == ESP_OK; }
  [[nodiscard]] esp_err_t error() const { return err_; }

private:
  gpio_num_t pin_;
  esp_err_t err_{ESP_FAIL};
  bool attached_{false};
};

} // namespace core
