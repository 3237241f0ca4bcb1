/**
 * @file warm_up.hpp
 * @brief Discard the first conversion of every sensor
 *
 * DS18x20 parts can return a stale power-on value on their first read.
 */

#pragma once

#include "registry.hpp"

#include <core/device_context.hpp>

#include <chrono>

namespace sensor {

inline constexpr std::chrono::milliseconds WARM_UP_SETTLE{1000};

/// Read each sensor once, wait settle, then log a fresh reading.
/// Read failures are logged and otherwise ignored.
void warm_up(SensorSet &sensors, core::DeviceContext &ctx,
             std::chrono::milliseconds settle = WARM_UP_SETTLE);

} // namespace sensor
