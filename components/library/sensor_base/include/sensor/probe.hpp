/**
 * @file probe.hpp
 * @brief Hardware seams of the sensing stage
 */

#pragma once

#include "pin_map.hpp"

#include <core/result.hpp>

#include <memory>
#include <string>

namespace sensor {

/// One temperature device on a bus
class ITemperatureProbe {
public:
  virtual ~ITemperatureProbe() = default;

  /// Blocking conversion and read, degrees Celsius
  [[nodiscard]] virtual core::Result<float> read_celsius() = 0;

  /// Device identity for logs (ROM code on 1-Wire)
  [[nodiscard]] virtual std::string describe() const = 0;
};

using ProbePtr = std::unique_ptr<ITemperatureProbe>;

/// Builds a bus on a pin and binds to the first device found
class IBusFactory {
public:
  virtual ~IBusFactory() = default;

  /// @return ESP_ERR_NOT_FOUND when the scan finds no device
  [[nodiscard]] virtual core::Result<ProbePtr> probe(PinId pin) = 0;
};

/// Drives auxiliary pins
class IPinDriver {
public:
  virtual ~IPinDriver() = default;

  /// Configure pin as output, high, for the rest of the cycle
  [[nodiscard]] virtual core::Status drive_high(PinId pin) = 0;
};

} // namespace sensor
