/**
 * @file ds18x20.cpp
 * @brief DS18x20 conversion and scratchpad decoding
 */

#include "onewire/ds18x20.hpp"

#include <core/crc.hpp>

#include <esp_log.h>

#include <algorithm>
#include <array>

namespace driver::onewire {

namespace {
constexpr const char *TAG = "ds18x20";

// Scratchpad layout
constexpr size_t TEMP_LSB = 0;
constexpr size_t TEMP_MSB = 1;
constexpr size_t COUNT_REMAIN = 6;
constexpr size_t COUNT_PER_C = 7;

} // namespace

core::Result<float> decode_scratchpad(uint8_t family_code,
                                      std::span<const uint8_t> scratchpad) {
  if (scratchpad.size() != SCRATCHPAD_SIZE) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }
  if (std::all_of(scratchpad.begin(), scratchpad.end(),
                  [](uint8_t byte) { return byte == 0; })) {
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }
  if (!core::Crc8::check(scratchpad)) {
    return core::Err(ESP_ERR_INVALID_CRC);
  }

  auto raw = static_cast<int16_t>(
      static_cast<uint16_t>(scratchpad[TEMP_MSB] << 8U) |
      scratchpad[TEMP_LSB]);

  switch (family_code) {
  case family::DS18B20:
  case family::DS1822:
    return static_cast<float>(raw) / 16.0F;

  case family::DS18S20: {
    // 0.5 degree register, refined with the count registers
    uint8_t per_c = scratchpad[COUNT_PER_C];
    if (per_c == 0) {
      return static_cast<float>(raw) / 2.0F;
    }
    auto whole = static_cast<float>(raw >> 1);
    auto remain = static_cast<float>(scratchpad[COUNT_REMAIN]);
    return whole - 0.25F + (static_cast<float>(per_c) - remain) /
                               static_cast<float>(per_c);
  }

  default:
    break;
  }
  return core::Err(ESP_ERR_NOT_SUPPORTED);
}

core::Result<float> Ds18x20::read_celsius() {
  if (!bus_->reset()) {
    ESP_LOGW(TAG, "%s: no presence before conversion",
             rom_.to_string().c_str());
    return core::Err(ESP_ERR_NOT_FOUND);
  }
  bus_->select(rom_);
  bus_->write_byte(function_cmd::CONVERT_T);

  pacer_.wait(CONVERSION_TIME);

  if (!bus_->reset()) {
    ESP_LOGW(TAG, "%s: no presence before read", rom_.to_string().c_str());
    return core::Err(ESP_ERR_NOT_FOUND);
  }
  bus_->select(rom_);
  bus_->write_byte(function_cmd::READ_SCRATCHPAD);

  std::array<uint8_t, SCRATCHPAD_SIZE> scratchpad{};
  for (auto &byte : scratchpad) {
    byte = bus_->read_byte();
  }

  auto celsius = decode_scratchpad(rom_.family_code(), scratchpad);
  if (!celsius) {
    ESP_LOGW(TAG, "%s: scratchpad rejected: %s", rom_.to_string().c_str(),
             esp_err_to_name(celsius.error()));
  }
  return celsius;
}

} // namespace driver::onewire
