/**
 * @file registry.cpp
 * @brief Sensor discovery
 */

#include <sensor/registry.hpp>

#include <esp_log.h>

#include <algorithm>

namespace sensor {

namespace {
constexpr const char *TAG = "registry";
} // namespace

core::Result<SensorSet>
SensorRegistry::discover_from_config(std::span<const SensorDescriptor> config) {
  ESP_LOGI(TAG, "Discovering %zu sensor(s)", config.size());

  if (config.empty()) {
    ESP_LOGE(TAG, "No sensors configured");
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  SensorSet sensors;
  sensors.reserve(config.size());

  for (const auto &entry : config) {
    bool duplicate =
        std::any_of(sensors.begin(), sensors.end(), [&](const auto &handle) {
          return handle.id() == entry.logical_id;
        });
    if (duplicate) {
      ESP_LOGE(TAG, "Sensor id '%s' configured twice",
               entry.logical_id.c_str());
      return core::Err(ESP_ERR_INVALID_ARG);
    }

    auto pin = pins_.find(entry.port_name);
    if (!pin) {
      ESP_LOGE(TAG, "Could not find port name '%s'! Available names are: %s",
               entry.port_name.c_str(), pins_.names_joined().c_str());
      return core::Err(ESP_ERR_NOT_FOUND);
    }

    auto device = buses_.probe(*pin);
    if (!device) {
      ESP_LOGE(TAG, "Could not construct sensor %s on port %s: %s",
               entry.logical_id.c_str(), entry.port_name.c_str(),
               esp_err_to_name(device.error()));
      return core::Err(device.error());
    }

    ESP_LOGI(TAG, "Constructed sensor %s on port %s (%s)",
             entry.logical_id.c_str(), entry.port_name.c_str(),
             (*device)->describe().c_str());
    sensors.push_back({.descriptor = entry, .device = std::move(*device)});
  }

  ESP_LOGI(TAG, "All %zu sensor(s) found", sensors.size());
  return sensors;
}

core::Result<SensorSet> SensorRegistry::discover(std::string_view setting) {
  auto descriptors = parse_sensor_descriptors(setting);
  if (!descriptors) {
    return core::Err(descriptors.error());
  }
  return discover_from_config(*descriptors);
}

} // namespace sensor
