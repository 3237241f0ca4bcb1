/**
 * @file ds18x20.hpp
 * @brief DS18B20 / DS18S20 / DS1822 temperature probe
 */

#pragma once

#include "interface.hpp"
#include "types.hpp"

#include <core/pacer.hpp>
#include <core/result.hpp>
#include <sensor/probe.hpp>

#include <chrono>
#include <memory>
#include <span>

namespace driver::onewire {

/// Worst-case 12-bit conversion time
inline constexpr std::chrono::milliseconds CONVERSION_TIME{750};

/// Decode a 9-byte scratchpad into degrees Celsius.
///
/// @return ESP_ERR_INVALID_SIZE for a short scratchpad,
///         ESP_ERR_INVALID_RESPONSE for an all-zero read (line held low),
///         ESP_ERR_INVALID_CRC on checksum mismatch,
///         ESP_ERR_NOT_SUPPORTED for a non-thermometer family
[[nodiscard]] core::Result<float>
decode_scratchpad(uint8_t family_code, std::span<const uint8_t> scratchpad);

/// One thermometer on its own bus. Owns the bus.
class Ds18x20 final : public sensor::ITemperatureProbe {
public:
  Ds18x20(std::unique_ptr<IBus> bus, const RomCode &rom, core::Pacer &pacer)
      : bus_(std::move(bus)), rom_(rom), pacer_(pacer) {}

  Ds18x20(const Ds18x20 &) = delete;
  Ds18x20 &operator=(const Ds18x20 &) = delete;
  Ds18x20(Ds18x20 &&) = delete;
  Ds18x20 &operator=(Ds18x20 &&) = delete;

  /// Start a conversion, wait for it, read the scratchpad.
  /// ESP_ERR_NOT_FOUND when the device stops answering resets.
  [[nodiscard]] core::Result<float> read_celsius() override;

  [[nodiscard]] std::string describe() const override {
    return rom_.to_string();
  }

  [[nodiscard]] const RomCode &rom() const { return rom_; }

private:
  std::unique_ptr<IBus> bus_;
  RomCode rom_;
  core::Pacer &pacer_;
};

} // namespace driver::onewire
