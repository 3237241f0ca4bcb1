/**
 * @file ntp.hpp
 * @brief Minimal SNTP client packet codec
 */

#pragma once

#include <core/result.hpp>

#include <array>
#include <cstdint>
#include <span>

namespace network::ntp {

inline constexpr size_t PACKET_SIZE = 48;
/// LI = 0, VN = 4, Mode = 3 (client)
inline constexpr uint8_t CLIENT_REQUEST_HEADER = 0x23;
/// Offset of the transmit timestamp seconds field
inline constexpr size_t TRANSMIT_SECONDS_OFFSET = 40;
/// Seconds from 1900-01-01 (NTP era 0) to 1970-01-01
inline constexpr int64_t NTP_TO_UNIX_SECONDS = 2208988800LL;
inline constexpr uint16_t PORT = 123;

using Packet = std::array<uint8_t, PACKET_SIZE>;

/// Client request: first byte set, everything else zero
[[nodiscard]] constexpr Packet make_request() {
  Packet packet{};
  packet[0] = CLIENT_REQUEST_HEADER;
  return packet;
}

/// Big-endian transmit timestamp seconds converted to Unix seconds.
/// Short packets and a zero timestamp are ESP_ERR_INVALID_RESPONSE.
[[nodiscard]] core::Result<int64_t>
parse_unix_time(std::span<const uint8_t> response);

} // namespace network::ntp
