/**
 * @file types.hpp
 * @brief 1-Wire ROM codes, family codes and command bytes
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace driver::onewire {

/// ROM commands
namespace rom_cmd {
inline constexpr uint8_t SEARCH = 0xF0;
inline constexpr uint8_t MATCH = 0x55;
inline constexpr uint8_t SKIP = 0xCC;
} // namespace rom_cmd

/// DS18x20 function commands
namespace function_cmd {
inline constexpr uint8_t CONVERT_T = 0x44;
inline constexpr uint8_t READ_SCRATCHPAD = 0xBE;
} // namespace function_cmd

/// Device family codes (first ROM byte)
namespace family {
inline constexpr uint8_t DS18S20 = 0x10;
inline constexpr uint8_t DS1822 = 0x22;
inline constexpr uint8_t DS18B20 = 0x28;
} // namespace family

inline constexpr size_t ROM_SIZE = 8;
inline constexpr size_t SCRATCHPAD_SIZE = 9;

/// 64-bit ROM code, family byte first, CRC last
struct RomCode {
  std::array<uint8_t, ROM_SIZE> bytes{};

  [[nodiscard]] uint8_t family_code() const { return bytes[0]; }

  /// CRC-8 over the first seven bytes matches the eighth
  [[nodiscard]] bool crc_valid() const;

  [[nodiscard]] bool get_bit(size_t index) const {
    return ((bytes[index / 8] >> (index % 8)) & 0x01U) != 0;
  }

  void set_bit(size_t index, bool value) {
    auto mask = static_cast<uint8_t>(1U << (index % 8));
    if (value) {
      bytes[index / 8] |= mask;
    } else {
      bytes[index / 8] &= static_cast<uint8_t>(~mask);
    }
  }

  /// "28ff641e0f000034" in transmission order
  [[nodiscard]] std::string to_string() const;

  bool operator==(const RomCode &) const = default;
};

/// True for the temperature families this driver decodes
[[nodiscard]] constexpr bool is_thermometer(uint8_t family_code) {
  return family_code == family::DS18S20 || family_code == family::DS1822 ||
         family_code == family::DS18B20;
}

} // namespace driver::onewire
