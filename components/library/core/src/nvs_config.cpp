/**
 * @file nvs_config.cpp
 * @brief NVS configuration source
 */

#include <core/nvs_config.hpp>

#include <esp_log.h>
#include <nvs_flash.h>

#include <algorithm>
#include <cstring>

namespace core {

namespace {
constexpr const char *TAG = "nvs_config";
} // namespace

NvsConfigSource::NvsConfigSource(std::span<const ConfigDefault> defaults)
    : defaults_(defaults) {
  esp_err_t err = nvs_open(CONFIG_NAMESPACE, NVS_READONLY, &handle_);
  if (err != ESP_OK) {
    // ESP_ERR_NVS_NOT_FOUND until something has been provisioned
    ESP_LOGW(TAG, "No '%s' namespace (%s), using built-in defaults",
             CONFIG_NAMESPACE, esp_err_to_name(err));
    handle_ = 0;
  }
}

NvsConfigSource::~NvsConfigSource() {
  if (handle_ != 0)
    nvs_close(handle_);
}

Status NvsConfigSource::init_partition() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
      err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(TAG, "NVS partition stale (%s), erasing", esp_err_to_name(err));
    if ((err = nvs_flash_erase()) != ESP_OK)
      return Err(err);
    err = nvs_flash_init();
  }
  return err == ESP_OK ? Ok() : Err(err);
}

std::optional<std::string> NvsConfigSource::get(std::string_view key) const {
  if (auto stored = read(key)) {
    return stored;
  }
  return fallback(key);
}

std::optional<std::string>
NvsConfigSource::read(std::string_view key) const {
  if (handle_ == 0) {
    return std::nullopt;
  }

  auto nvs_key = make_key(key);
  size_t size = 0;
  if (nvs_get_str(handle_, nvs_key.data(), nullptr, &size) != ESP_OK ||
      size <= 1) {
    return std::nullopt;
  }

  std::string value(size, '\0');
  if (auto err = nvs_get_str(handle_, nvs_key.data(), value.data(), &size);
      err != ESP_OK) {
    ESP_LOGW(TAG, "Reading '%s' failed: %s", nvs_key.data(),
             esp_err_to_name(err));
    return std::nullopt;
  }
  value.resize(size - 1); // drop terminator
  return value;
}

std::optional<std::string>
NvsConfigSource::fallback(std::string_view key) const {
  auto it = std::find_if(defaults_.begin(), defaults_.end(),
                         [key](const ConfigDefault &d) { return d.key == key; });
  if (it == defaults_.end() || it->value.empty()) {
    return std::nullopt;
  }
  return std::string(it->value);
}

std::array<char, 16> NvsConfigSource::make_key(std::string_view key) {
  std::array<char, 16> buf{};
  std::memcpy(buf.data(), key.data(), std::min(key.size(), buf.size() - 1));
  return buf;
}

} // namespace core
