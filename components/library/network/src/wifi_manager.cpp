/**
 * @file wifi_manager.cpp
 * @brief WiFi station implementation
 */

#include "network/wifi_manager.hpp"

#include <esp_log.h>
#include <esp_wifi.h>

#include <cstring>

namespace network {

namespace {
constexpr const char *TAG = "wifi_mgr";
} // namespace

WifiManager::~WifiManager() {
  wifi_sub_.reset();
  ip_sub_.reset();
  if (initialized_) {
    esp_wifi_disconnect();
    esp_wifi_stop();
    esp_wifi_deinit();
    if (netif_ != nullptr) {
      esp_netif_destroy_default_wifi(netif_);
    }
  }
  if (events_ != nullptr) {
    vEventGroupDelete(events_);
  }
}

core::Status WifiManager::init(const WifiConfig &config) {
  if (initialized_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  config_ = config;

  events_ = xEventGroupCreate();
  if (events_ == nullptr) {
    return core::Err(ESP_ERR_NO_MEM);
  }

  // Initialize TCP/IP stack (safe to call multiple times)
  if (auto err = esp_netif_init(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  netif_ = esp_netif_create_default_wifi_sta();
  if (netif_ == nullptr) {
    ESP_LOGE(TAG, "Failed to create netif");
    return core::Err(ESP_ERR_NO_MEM);
  }

  wifi_init_config_t wifi_init = WIFI_INIT_CONFIG_DEFAULT();
  if (auto err = esp_wifi_init(&wifi_init); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  // Credentials come from configuration each cycle, never from flash
  esp_wifi_set_storage(WIFI_STORAGE_RAM);

  if (auto err = esp_wifi_set_mode(WIFI_MODE_STA); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_set_mode failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  auto wifi_sub = core::event_loop::subscribe(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                              wifi_event_handler, this);
  if (!wifi_sub) {
    return core::Err(wifi_sub.error());
  }
  wifi_sub_ = std::move(wifi_sub).value();

  auto ip_sub = core::event_loop::subscribe(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                            ip_event_handler, this);
  if (!ip_sub) {
    return core::Err(ip_sub.error());
  }
  ip_sub_ = std::move(ip_sub).value();

  if (auto err = esp_wifi_start(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_start failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  initialized_ = true;
  ESP_LOGI(TAG, "WiFi station initialized");
  return core::Ok();
}

core::Status WifiManager::connect(const WifiCandidate &candidate) {
  if (!initialized_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }
  if (candidate.ssid.empty() || candidate.ssid.size() > kMaxSsidLen ||
      candidate.secret.size() > kMaxPasswordLen) {
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  wifi_config_t wifi_config{};
  std::memcpy(wifi_config.sta.ssid, candidate.ssid.data(),
              candidate.ssid.size());
  std::memcpy(wifi_config.sta.password, candidate.secret.data(),
              candidate.secret.size());

  // Use WPA2/WPA3 if a secret is provided
  if (!candidate.secret.empty()) {
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
  }
  wifi_config.sta.pmf_cfg.capable = true;

  if (auto err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
      err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_set_config failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  xEventGroupClearBits(events_, kConnectedBit | kFailedBit | kLeftBit);
  set_state(ConnectionState::Connecting);

  if (auto err = esp_wifi_connect(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
    set_state(ConnectionState::Disconnected);
    return core::Err(err);
  }

  EventBits_t bits = xEventGroupWaitBits(
      events_, kConnectedBit | kFailedBit, pdTRUE, pdFALSE,
      pdMS_TO_TICKS(static_cast<uint32_t>(config_.connect_timeout.count())));

  if ((bits & kConnectedBit) != 0) {
    return core::Ok();
  }

  set_state(ConnectionState::Disconnected);
  if ((bits & kFailedBit) != 0) {
    // The driver is already idle after reporting the disconnect
    return core::Err(ESP_ERR_WIFI_NOT_CONNECT);
  }

  ESP_LOGW(TAG, "No IP within %lld ms",
           static_cast<long long>(config_.connect_timeout.count()));
  abandon_attempt();
  return core::Err(ESP_ERR_TIMEOUT);
}

void WifiManager::abandon_attempt() {
  attempts_.abandon();
  if (auto err = esp_wifi_disconnect(); err != ESP_OK) {
    ESP_LOGW(TAG, "esp_wifi_disconnect failed: %s", esp_err_to_name(err));
    return;
  }

  // Leave the driver idle and its report consumed before the next candidate
  EventBits_t bits = xEventGroupWaitBits(
      events_, kLeftBit, pdTRUE, pdFALSE,
      pdMS_TO_TICKS(static_cast<uint32_t>(config_.leave_settle.count())));
  if ((bits & kLeftBit) == 0) {
    ESP_LOGD(TAG, "Leave not reported yet, a late one will be ignored");
  }
}

void WifiManager::set_state(ConnectionState new_state) {
  ConnectionState old = state_.exchange(new_state);
  if (old != new_state) {
    ESP_LOGI(TAG, "State: %s -> %s", to_string(old), to_string(new_state));
  }
}

void WifiManager::wifi_event_handler(void *arg, esp_event_base_t /*base*/,
                                     int32_t event_id, void *event_data) {
  auto *self = static_cast<WifiManager *>(arg);

  switch (event_id) {
  case WIFI_EVENT_STA_CONNECTED:
    ESP_LOGI(TAG, "Associated with AP");
    break;

  case WIFI_EVENT_STA_DISCONNECTED: {
    auto *info = static_cast<wifi_event_sta_disconnected_t *>(event_data);
    bool local_leave = info->reason == WIFI_REASON_ASSOC_LEAVE;
    if (!self->attempts_.on_disconnected(local_leave)) {
      ESP_LOGD(TAG, "Abandoned attempt left the AP");
      xEventGroupSetBits(self->events_, kLeftBit);
      break;
    }

    ESP_LOGW(TAG, "Disconnected from AP, reason: %d", info->reason);
    self->set_state(ConnectionState::Disconnected);
    xEventGroupSetBits(self->events_, kFailedBit);
    break;
  }

  default:
    break;
  }
}

void WifiManager::ip_event_handler(void *arg, esp_event_base_t /*base*/,
                                   int32_t event_id, void *event_data) {
  auto *self = static_cast<WifiManager *>(arg);

  if (event_id == IP_EVENT_STA_GOT_IP) {
    auto *info = static_cast<ip_event_got_ip_t *>(event_data);
    ESP_LOGI(TAG, "Got IP: " IPSTR, IP2STR(&info->ip_info.ip));

    self->set_state(ConnectionState::Connected);
    xEventGroupSetBits(self->events_, kConnectedBit);
  }
}

} // namespace network
