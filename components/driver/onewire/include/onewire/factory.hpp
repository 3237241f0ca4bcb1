/**
 * @file factory.hpp
 * @brief Probe one GPIO for a DS18x20
 */

#pragma once

#include <core/pacer.hpp>
#include <sensor/probe.hpp>

#include <cstddef>

namespace driver::onewire {

/// ROMs collected per scan; only the first thermometer is used
inline constexpr size_t MAX_DEVICES_PER_BUS = 4;

class BusFactory final : public sensor::IBusFactory {
public:
  explicit BusFactory(core::Pacer &pacer) : pacer_(pacer) {}

  /// @return ESP_ERR_NOT_FOUND when the scan finds no thermometer
  [[nodiscard]] core::Result<sensor::ProbePtr>
  probe(sensor::PinId pin) override;

private:
  core::Pacer &pacer_;
};

} // namespace driver::onewire
