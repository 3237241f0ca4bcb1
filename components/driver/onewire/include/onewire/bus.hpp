/**
 * @file bus.hpp
 * @brief Bit-banged 1-Wire master on a single GPIO
 *
 * The line is open-drain with the internal pull-up enabled; an external
 * 4.7k pull-up is still expected on long runs. Each time slot runs inside
 * a critical section so interrupts cannot stretch it.
 */

#pragma once

#include "interface.hpp"

#include <driver/gpio.h>
#include <freertos/FreeRTOS.h>

namespace driver::onewire {

class GpioBus final : public IBus {
public:
  explicit GpioBus(gpio_num_t pin);
  ~GpioBus() override;

  GpioBus(const GpioBus &) = delete;
  GpioBus &operator=(const GpioBus &) = delete;
  GpioBus(GpioBus &&) = delete;
  GpioBus &operator=(GpioBus &&) = delete;

  [[nodiscard]] bool valid() const { return err_ == ESP_OK; }
  [[nodiscard]] esp_err_t error() const { return err_; }

  [[nodiscard]] bool reset() override;
  void write_bit(bool bit) override;
  [[nodiscard]] bool read_bit() override;

private:
  void drive_low() { gpio_set_level(pin_, 0); }
  void release() { gpio_set_level(pin_, 1); }
  [[nodiscard]] bool sample() const { return gpio_get_level(pin_) != 0; }

  gpio_num_t pin_;
  esp_err_t err_{ESP_OK};
  portMUX_TYPE lock_ = portMUX_INITIALIZER_UNLOCKED;
};

} // namespace driver::onewire
