/**
 * @file excitation.cpp
 * @brief EXTRA_HOTS handling
 */

#include <sensor/excitation.hpp>

#include <core/config.hpp>

#include <esp_log.h>

#include <vector>

namespace sensor {

namespace {
constexpr const char *TAG = "excitation";
} // namespace

core::Status ExcitationOutputs::enable(std::string_view setting) {
  auto names = core::parse_list(setting);

  std::vector<PinId> resolved;
  resolved.reserve(names.size());
  for (const auto &name : names) {
    auto pin = pins_.find(name);
    if (!pin) {
      ESP_LOGE(TAG, "Unknown extra hot pin '%s'. Available names are: %s",
               name.c_str(), pins_.names_joined().c_str());
      return core::Err(ESP_ERR_NOT_FOUND);
    }
    resolved.push_back(*pin);
  }

  for (size_t i = 0; i < resolved.size(); ++i) {
    if (auto status = driver_.drive_high(resolved[i]); !status) {
      ESP_LOGE(TAG, "Driving %s high failed: %s", names[i].c_str(),
               esp_err_to_name(status.error()));
      return status;
    }
    ESP_LOGI(TAG, "%s driven high", names[i].c_str());
  }
  return core::Ok();
}

} // namespace sensor
