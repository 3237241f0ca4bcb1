/**
 * @file factory.cpp
 * @brief Bus scan and probe construction
 */

#include "onewire/factory.hpp"

#include "onewire/bus.hpp"
#include "onewire/ds18x20.hpp"

#include <esp_log.h>

#include <algorithm>
#include <memory>

namespace driver::onewire {

namespace {
constexpr const char *TAG = "ow_factory";
} // namespace

core::Result<sensor::ProbePtr> BusFactory::probe(sensor::PinId pin) {
  auto bus = std::make_unique<GpioBus>(static_cast<gpio_num_t>(pin));
  if (!bus->valid()) {
    return core::Err(bus->error());
  }

  auto roms = search(*bus, MAX_DEVICES_PER_BUS);
  if (!roms) {
    ESP_LOGW(TAG, "GPIO%d scan failed: %s", pin, esp_err_to_name(roms.error()));
    return core::Err(roms.error());
  }

  auto found = std::find_if(roms->begin(), roms->end(), [](const RomCode &rom) {
    return is_thermometer(rom.family_code());
  });
  if (found == roms->end()) {
    ESP_LOGW(TAG, "GPIO%d: %zu device(s), no thermometer", pin, roms->size());
    return core::Err(ESP_ERR_NOT_FOUND);
  }
  if (roms->size() > 1) {
    ESP_LOGW(TAG, "GPIO%d: %zu devices on the bus, using %s", pin,
             roms->size(), found->to_string().c_str());
  }

  return sensor::ProbePtr{
      std::make_unique<Ds18x20>(std::move(bus), *found, pacer_)};
}

} // namespace driver::onewire
