/**
 * @file connectivity.cpp
 * @brief Candidate-list association with indefinite retry
 */

#include <network/connectivity.hpp>

#include <core/config.hpp>

#include <esp_log.h>

namespace network {

namespace {
constexpr const char *TAG = "connectivity";
constexpr size_t WIFI_FIELDS = 3;
} // namespace

core::Result<std::vector<WifiCandidate>>
parse_wifi_candidates(std::string_view setting) {
  auto records = core::parse_records(setting, WIFI_FIELDS);
  if (!records) {
    ESP_LOGE(TAG, "WIFI must be 'name,ssid,secret;...'");
    return core::Err(records.error());
  }

  std::vector<WifiCandidate> candidates;
  candidates.reserve(records->size());
  for (auto &record : *records) {
    if (record[1].empty() || record[1].size() > kMaxSsidLen ||
        record[2].size() > kMaxPasswordLen) {
      ESP_LOGE(TAG, "WIFI entry '%s' has an invalid ssid or secret",
               record[0].c_str());
      return core::Err(ESP_ERR_INVALID_ARG);
    }
    candidates.push_back({.name = std::move(record[0]),
                          .ssid = std::move(record[1]),
                          .secret = std::move(record[2])});
  }
  return candidates;
}

ConnectivityManager::ConnectivityManager(IRadio &radio,
                                         core::DeviceContext &ctx,
                                         core::RetryPolicy policy)
    : radio_(radio), ctx_(ctx), policy_(policy) {}

core::Status
ConnectivityManager::ensure_connected(std::string_view wifi_setting) {
  if (radio_.is_connected()) {
    state_ = ConnectionState::Connected;
    return core::Ok();
  }
  state_ = ConnectionState::Disconnected;

  auto candidates = parse_wifi_candidates(wifi_setting);
  if (!candidates) {
    return core::Err(candidates.error());
  }

  auto status = core::retry(policy_, ctx_.pacer, ctx_.abort,
                            [&] { return attempt_pass(*candidates); });

  state_ = status ? ConnectionState::Connected : ConnectionState::Disconnected;
  return status;
}

core::Status ConnectivityManager::attempt_pass(
    const std::vector<WifiCandidate> &candidates) {
  ctx_.status.signal(core::StatusSignal::ConnectingWifi);

  for (const auto &candidate : candidates) {
    if (ctx_.abort.requested()) {
      return core::Err(ESP_ERR_NOT_FINISHED);
    }

    state_ = ConnectionState::Connecting;
    ESP_LOGI(TAG, "Attempting to connect to %s wifi '%s' (secret: %zu chars)",
             candidate.name.c_str(), candidate.ssid.c_str(),
             candidate.secret.size());

    auto status = radio_.connect(candidate);
    ctx_.pacer.feed();

    if (status) {
      ESP_LOGI(TAG, "Connected to %s wifi", candidate.name.c_str());
      return core::Ok();
    }

    ESP_LOGW(TAG, "%s wifi failed: %s", candidate.name.c_str(),
             esp_err_to_name(status.error()));
    state_ = ConnectionState::Disconnected;
  }

  ESP_LOGW(TAG, "Still no IP address after %zu candidate(s)",
           candidates.size());
  return core::Err(ESP_FAIL);
}

} // namespace network
