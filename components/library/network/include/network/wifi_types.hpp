/**
 * @file wifi_types.hpp
 * @brief WiFi type definitions and constants
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace network {

/// Maximum lengths for WiFi credentials (from ESP-IDF)
inline constexpr size_t kMaxSsidLen = 32;
inline constexpr size_t kMaxPasswordLen = 64;

/// Radio association state
enum class ConnectionState : uint8_t {
  Disconnected,
  Connecting,
  Connected,
};

[[nodiscard]] constexpr const char *to_string(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Connected:
    return "connected";
  }
  return "unknown";
}

/// One configured access point, tried in list order
struct WifiCandidate {
  std::string name;   ///< Human label used in logs
  std::string ssid;   ///< Non-empty, at most kMaxSsidLen
  std::string secret; ///< Empty for open networks; never logged
};

} // namespace network
