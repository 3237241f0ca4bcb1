/**
 * @file registry.hpp
 * @brief All-or-nothing sensor discovery
 */

#pragma once

#include "descriptor.hpp"
#include "pin_map.hpp"
#include "probe.hpp"

#include <core/result.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace sensor {

/// Live device for one configured sensor; lives for one cycle
struct SensorHandle {
  SensorDescriptor descriptor;
  ProbePtr device;

  [[nodiscard]] const std::string &id() const { return descriptor.logical_id; }
};

/// Handles in configured order, ids unique
using SensorSet = std::vector<SensorHandle>;

class SensorRegistry {
public:
  SensorRegistry(const PinMap &pins, IBusFactory &buses)
      : pins_(pins), buses_(buses) {}

  SensorRegistry(const SensorRegistry &) = delete;
  SensorRegistry &operator=(const SensorRegistry &) = delete;
  SensorRegistry(SensorRegistry &&) = delete;
  SensorRegistry &operator=(SensorRegistry &&) = delete;

  /// Resolve and probe every entry. Either all entries yield a handle or
  /// the call fails on the first bad one:
  /// unknown port or empty bus -> ESP_ERR_NOT_FOUND,
  /// duplicate id -> ESP_ERR_INVALID_ARG.
  [[nodiscard]] core::Result<SensorSet>
  discover_from_config(std::span<const SensorDescriptor> config);

  /// Parse the SENSORS setting, then discover_from_config()
  [[nodiscard]] core::Result<SensorSet> discover(std::string_view setting);

private:
  const PinMap &pins_;
  IBusFactory &buses_;
};

} // namespace sensor
