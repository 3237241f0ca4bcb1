/**
 * @file search.cpp
 * @brief SEARCH ROM enumeration (Maxim application note 187)
 */

#include "onewire/interface.hpp"

#include <esp_log.h>

namespace driver::onewire {

namespace {
constexpr const char *TAG = "ow_search";
constexpr int NO_DISCREPANCY = -1;
constexpr size_t ROM_BITS = ROM_SIZE * 8;
} // namespace

core::Result<std::vector<RomCode>> search(IBus &bus, size_t max_devices) {
  std::vector<RomCode> found;
  RomCode rom;
  int last_discrepancy = NO_DISCREPANCY;

  while (found.size() < max_devices) {
    if (!bus.reset()) {
      break;
    }
    bus.write_byte(rom_cmd::SEARCH);

    int last_zero = NO_DISCREPANCY;
    for (size_t bit = 0; bit < ROM_BITS; ++bit) {
      bool id_bit = bus.read_bit();
      bool complement = bus.read_bit();

      if (id_bit && complement) {
        ESP_LOGW(TAG, "No device answered at bit %zu", bit);
        return core::Err(ESP_ERR_INVALID_RESPONSE);
      }

      bool direction = id_bit;
      if (id_bit == complement) {
        // Devices disagree at this bit
        auto position = static_cast<int>(bit);
        if (position < last_discrepancy) {
          direction = rom.get_bit(bit);
        } else {
          direction = position == last_discrepancy;
        }
        if (!direction) {
          last_zero = position;
        }
      }

      rom.set_bit(bit, direction);
      bus.write_bit(direction);
    }

    if (!rom.crc_valid()) {
      ESP_LOGW(TAG, "ROM %s failed CRC", rom.to_string().c_str());
      return core::Err(ESP_ERR_INVALID_CRC);
    }
    found.push_back(rom);

    last_discrepancy = last_zero;
    if (last_discrepancy == NO_DISCREPANCY) {
      break;
    }
  }

  return found;
}

} // namespace driver::onewire
