/**
 * @file bus.cpp
 * @brief 1-Wire slot timing (standard speed)
 */

#include "onewire/bus.hpp"

#include <core/gpio.hpp>

#include <esp_log.h>
#include <esp_rom_sys.h>

namespace driver::onewire {

namespace {
constexpr const char *TAG = "ow_bus";

// Standard speed timings in microseconds
constexpr uint32_t RESET_LOW_US = 480;
constexpr uint32_t PRESENCE_WAIT_US = 70;
constexpr uint32_t RESET_RECOVERY_US = 410;
constexpr uint32_t WRITE_1_LOW_US = 6;
constexpr uint32_t WRITE_1_RELEASE_US = 64;
constexpr uint32_t WRITE_0_LOW_US = 60;
constexpr uint32_t WRITE_0_RELEASE_US = 10;
constexpr uint32_t READ_LOW_US = 6;
constexpr uint32_t READ_SAMPLE_US = 9;
constexpr uint32_t READ_RECOVERY_US = 55;
} // namespace

GpioBus::GpioBus(gpio_num_t pin) : pin_(pin) {
  auto cfg = core::detail::make_config(pin, GPIO_MODE_INPUT_OUTPUT_OD,
                                       core::Pull::Up, GPIO_INTR_DISABLE);
  err_ = gpio_config(&cfg);
  if (err_ != ESP_OK) {
    ESP_LOGE(TAG, "GPIO%d config failed: %s", static_cast<int>(pin),
             esp_err_to_name(err_));
    return;
  }
  release();
}

GpioBus::~GpioBus() {
  if (valid()) {
    gpio_reset_pin(pin_);
  }
}

bool GpioBus::reset() {
  if (!valid()) {
    return false;
  }

  portENTER_CRITICAL(&lock_);
  drive_low();
  esp_rom_delay_us(RESET_LOW_US);
  release();
  esp_rom_delay_us(PRESENCE_WAIT_US);
  bool presence = !sample();
  esp_rom_delay_us(RESET_RECOVERY_US);
  portEXIT_CRITICAL(&lock_);

  return presence;
}

void GpioBus::write_bit(bool bit) {
  portENTER_CRITICAL(&lock_);
  drive_low();
  if (bit) {
    esp_rom_delay_us(WRITE_1_LOW_US);
    release();
    esp_rom_delay_us(WRITE_1_RELEASE_US);
  } else {
    esp_rom_delay_us(WRITE_0_LOW_US);
    release();
    esp_rom_delay_us(WRITE_0_RELEASE_US);
  }
  portEXIT_CRITICAL(&lock_);
}

bool GpioBus::read_bit() {
  portENTER_CRITICAL(&lock_);
  drive_low();
  esp_rom_delay_us(READ_LOW_US);
  release();
  esp_rom_delay_us(READ_SAMPLE_US);
  bool bit = sample();
  esp_rom_delay_us(READ_RECOVERY_US);
  portEXIT_CRITICAL(&lock_);

  return bit;
}

} // namespace driver::onewire
