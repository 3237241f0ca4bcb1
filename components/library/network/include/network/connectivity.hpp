/**
 * @file connectivity.hpp
 * @brief Network attach: walk the candidate list until one associates
 */

#pragma once

#include "radio.hpp"
#include "wifi_types.hpp"

#include <core/device_context.hpp>
#include <core/result.hpp>
#include <core/retry.hpp>

#include <chrono>
#include <string_view>
#include <vector>

namespace network {

/// Parse "name,ssid,secret;name,ssid,secret;..."
/// Empty or malformed lists are ESP_ERR_INVALID_ARG.
[[nodiscard]] core::Result<std::vector<WifiCandidate>>
parse_wifi_candidates(std::string_view setting);

namespace connectivity_defaults {
/// Pause after a full pass where every candidate failed
inline constexpr std::chrono::milliseconds PASS_INTERVAL{2000};
} // namespace connectivity_defaults

class ConnectivityManager {
public:
  /// @param policy Bounds the number of passes; production retries forever
  ConnectivityManager(IRadio &radio, core::DeviceContext &ctx,
                      core::RetryPolicy policy = {
                          .max_attempts = 0,
                          .interval = connectivity_defaults::PASS_INTERVAL,
                      });

  ConnectivityManager(const ConnectivityManager &) = delete;
  ConnectivityManager &operator=(const ConnectivityManager &) = delete;
  ConnectivityManager(ConnectivityManager &&) = delete;
  ConnectivityManager &operator=(ConnectivityManager &&) = delete;

  /// Return once associated. Idempotent: no attempt is made when the radio
  /// is already connected.
  ///
  /// @return ESP_ERR_INVALID_ARG for an empty/malformed candidate list,
  ///         ESP_ERR_NOT_FINISHED on abort, ESP_ERR_TIMEOUT only when the
  ///         policy is bounded
  [[nodiscard]] core::Status ensure_connected(std::string_view wifi_setting);

  [[nodiscard]] ConnectionState state() const { return state_; }

private:
  [[nodiscard]] core::Status
  attempt_pass(const std::vector<WifiCandidate> &candidates);

  IRadio &radio_;
  core::DeviceContext &ctx_;
  core::RetryPolicy policy_;
  ConnectionState state_{ConnectionState::Disconnected};
};

} // namespace network
