/**
 * @file http_time.hpp
 * @brief Time from an HTTP JSON time service
 *
 * Expects a body shaped like worldtimeapi.org:
 *   {"datetime": "...", "unixtime": 1744047588, "raw_offset": 0, ...}
 */

#pragma once

#include "time_source.hpp"

#include <transport/transport.hpp>

#include <string>
#include <string_view>

namespace network {

inline constexpr std::string_view DEFAULT_TIME_URL =
    "http://worldtimeapi.org/api/timezone/Etc/UTC";

struct TimeApiReply {
  std::string datetime;
  int64_t unixtime{0};
  int32_t raw_offset{0};
};

/// Extract the reply fields; a missing or non-numeric unixtime is
/// ESP_ERR_INVALID_RESPONSE, the other fields are optional
[[nodiscard]] core::Result<TimeApiReply> parse_time_api(std::string_view json);

class HttpTimeSource final : public ITimeSource {
public:
  HttpTimeSource(transport::ITransport &transport, std::string_view url)
      : transport_(transport), url_(url) {}

  [[nodiscard]] core::Result<int64_t> fetch_unix_time() override;

  [[nodiscard]] const char *name() const override { return "http"; }

private:
  transport::ITransport &transport_;
  std::string url_;
};

} // namespace network
