/**
 * @file ntp.cpp
 * @brief SNTP response decoding
 */

#include <network/ntp.hpp>

#include <esp_log.h>

namespace network::ntp {

namespace {
constexpr const char *TAG = "ntp";
} // namespace

core::Result<int64_t> parse_unix_time(std::span<const uint8_t> response) {
  if (response.size() < PACKET_SIZE) {
    ESP_LOGW(TAG, "Short response: %zu bytes", response.size());
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  const auto field = response.subspan(TRANSMIT_SECONDS_OFFSET, 4);
  uint32_t seconds = (static_cast<uint32_t>(field[0]) << 24U) |
                     (static_cast<uint32_t>(field[1]) << 16U) |
                     (static_cast<uint32_t>(field[2]) << 8U) |
                     static_cast<uint32_t>(field[3]);

  if (seconds == 0) {
    ESP_LOGW(TAG, "Server sent an empty transmit timestamp");
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  return static_cast<int64_t>(seconds) - NTP_TO_UNIX_SECONDS;
}

} // namespace network::ntp
