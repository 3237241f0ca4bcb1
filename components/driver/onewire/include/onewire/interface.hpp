/**
 * @file interface.hpp
 * @brief Abstract 1-Wire bus
 *
 * Timing-critical slots live in the GPIO implementation; everything built
 * on top (byte transfer, ROM search, DS18x20 transactions) only sees this
 * interface.
 */

#pragma once

#include "types.hpp"

#include <core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace driver::onewire {

class IBus {
public:
  virtual ~IBus() = default;

  /// Reset pulse; true when at least one device answered with presence
  [[nodiscard]] virtual bool reset() = 0;

  virtual void write_bit(bool bit) = 0;
  [[nodiscard]] virtual bool read_bit() = 0;

  /// LSB first
  virtual void write_byte(uint8_t byte) {
    for (int i = 0; i < 8; ++i) {
      write_bit(((byte >> i) & 0x01U) != 0);
    }
  }

  /// LSB first
  [[nodiscard]] virtual uint8_t read_byte() {
    uint8_t byte = 0;
    for (int i = 0; i < 8; ++i) {
      if (read_bit()) {
        byte = static_cast<uint8_t>(byte | (1U << i));
      }
    }
    return byte;
  }

  /// Address one device for the next function command
  void select(const RomCode &rom) {
    write_byte(rom_cmd::MATCH);
    for (uint8_t byte : rom.bytes) {
      write_byte(byte);
    }
  }
};

/// Enumerate device ROM codes with the binary-tree SEARCH ROM algorithm.
///
/// @return the ROMs found (empty when nothing answers the reset),
///         ESP_ERR_INVALID_RESPONSE when devices stop answering mid-search,
///         ESP_ERR_INVALID_CRC for a corrupted ROM code
[[nodiscard]] core::Result<std::vector<RomCode>> search(IBus &bus,
                                                        size_t max_devices);

} // namespace driver::onewire
