/**
 * @file descriptor.hpp
 * @brief Sensor-to-port configuration entries
 */

#pragma once

#include <core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sensor {

/// Parsed from configuration, immutable afterwards
struct SensorDescriptor {
  std::string logical_id; ///< Unique within a run
  std::string port_name;  ///< Resolved through the PinMap
};

/// Parse "id,port;id,port;..." in configured order.
/// Empty input, malformed entries, empty fields and duplicate ids are
/// ESP_ERR_INVALID_ARG.
[[nodiscard]] core::Result<std::vector<SensorDescriptor>>
parse_sensor_descriptors(std::string_view setting);

} // namespace sensor
