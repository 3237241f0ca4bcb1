/**
 * @file measurement.hpp
 * @brief One temperature sample, taken fresh for each report
 */

#pragma once

#include <core/clock.hpp>

#include <string>

namespace sensor {

struct Measurement {
  std::string sensor_id;
  float temperature{0.0F}; ///< Degrees Celsius
  core::CivilTime timestamp{};
};

} // namespace sensor
