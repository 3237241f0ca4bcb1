/**
 * @file crc.hpp
 * @brief Dallas/Maxim CRC-8 used by 1-Wire ROM codes and scratchpads
 *
 * Polynomial x^8 + x^5 + x^4 + 1, reflected (0x8C), initial value 0.
 * Computed bitwise so it is usable in constant expressions; a 1-Wire
 * scratchpad is 9 bytes so a table buys nothing.
 *
 * Usage:
 *   Crc8 crc;
 *   crc.update(data);
 *   bool ok = crc.value() == expected;
 *
 * Or single-shot:
 *   uint8_t checksum = Crc8::compute(data);
 */

#pragma once

#include <cstdint>
#include <span>

namespace core {

class Crc8 {
public:
  static constexpr uint8_t POLYNOMIAL = 0x8C;

  constexpr Crc8() = default;

  /// Update CRC with raw bytes
  constexpr void update(std::span<const uint8_t> data) {
    for (uint8_t byte : data) {
      update(byte);
    }
  }

  /// Update CRC with a single byte
  constexpr void update(uint8_t byte) {
    for (int bit = 0; bit < 8; ++bit) {
      bool mix = ((state_ ^ byte) & 0x01U) != 0;
      state_ = static_cast<uint8_t>(state_ >> 1U);
      if (mix) {
        state_ ^= POLYNOMIAL;
      }
      byte = static_cast<uint8_t>(byte >> 1U);
    }
  }

  [[nodiscard]] constexpr uint8_t value() const { return state_; }

  constexpr void reset() { state_ = 0; }

  /// Compute CRC of raw bytes (single-shot)
  [[nodiscard]] static constexpr uint8_t compute(std::span<const uint8_t> data) {
    Crc8 crc;
    crc.update(data);
    return crc.value();
  }

  /// True when the last byte of a block is the CRC of the bytes before it.
  /// Equivalently the CRC over the whole block is zero.
  [[nodiscard]] static constexpr bool
  check(std::span<const uint8_t> block_with_crc) {
    return !block_with_crc.empty() && compute(block_with_crc) == 0;
  }

private:
  uint8_t state_{0};
};

} // namespace core
