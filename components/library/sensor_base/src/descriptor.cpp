/**
 * @file descriptor.cpp
 * @brief SENSORS setting parser
 */

#include <sensor/descriptor.hpp>

#include <core/config.hpp>

#include <esp_log.h>

#include <algorithm>

namespace sensor {

namespace {
constexpr const char *TAG = "sensors";
constexpr size_t SENSOR_FIELDS = 2;
} // namespace

core::Result<std::vector<SensorDescriptor>>
parse_sensor_descriptors(std::string_view setting) {
  auto records = core::parse_records(setting, SENSOR_FIELDS);
  if (!records) {
    ESP_LOGE(TAG, "SENSORS must be 'id,port;...'");
    return core::Err(records.error());
  }

  std::vector<SensorDescriptor> descriptors;
  descriptors.reserve(records->size());

  for (auto &record : *records) {
    if (record[0].empty() || record[1].empty()) {
      ESP_LOGE(TAG, "SENSORS entry with an empty id or port");
      return core::Err(ESP_ERR_INVALID_ARG);
    }

    bool duplicate = std::any_of(
        descriptors.begin(), descriptors.end(),
        [&](const SensorDescriptor &d) { return d.logical_id == record[0]; });
    if (duplicate) {
      ESP_LOGE(TAG, "Sensor id '%s' configured twice", record[0].c_str());
      return core::Err(ESP_ERR_INVALID_ARG);
    }

    ESP_LOGI(TAG, "Parsed: ID: %s; port %s", record[0].c_str(),
             record[1].c_str());
    descriptors.push_back({.logical_id = std::move(record[0]),
                           .port_name = std::move(record[1])});
  }
  return descriptors;
}

} // namespace sensor
