/**
 * @file log.hpp
 * @brief Measurement logging utilities
 */

#pragma once

#include "measurement.hpp"

#include <esp_log.h>

namespace sensor {

/// Log one measurement
inline void log_measurement(const char *tag, const Measurement &m) {
  auto stamp = core::format_stamp(m.timestamp);
  ESP_LOGI(tag, "  %s: %.2f °C at %s", m.sensor_id.c_str(),
           static_cast<double>(m.temperature), stamp.data());
}

/// Log a fresh reading
inline void log_reading(const char *tag, const std::string &sensor_id,
                        float celsius) {
  ESP_LOGI(tag, "Sensor ID %s New Temperature = %.2f", sensor_id.c_str(),
           static_cast<double>(celsius));
}

} // namespace sensor
