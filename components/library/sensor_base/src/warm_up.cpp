/**
 * @file warm_up.cpp
 * @brief Sensor warm-up pass
 */

#include <sensor/warm_up.hpp>

#include <sensor/log.hpp>

#include <esp_log.h>

namespace sensor {

namespace {
constexpr const char *TAG = "warm_up";
} // namespace

void warm_up(SensorSet &sensors, core::DeviceContext &ctx,
             std::chrono::milliseconds settle) {
  for (auto &sensor : sensors) {
    [[maybe_unused]] auto discarded = sensor.device->read_celsius();
    ctx.pacer.wait(settle);

    auto reading = sensor.device->read_celsius();
    if (reading) {
      log_reading(TAG, sensor.id(), *reading);
    } else {
      ESP_LOGW(TAG, "Sensor ID %s read failed: %s", sensor.id().c_str(),
               esp_err_to_name(reading.error()));
    }
  }
}

} // namespace sensor
