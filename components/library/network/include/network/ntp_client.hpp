/**
 * @file ntp_client.hpp
 * @brief Single-shot SNTP exchange over a UDP socket
 */

#pragma once

#include "ntp.hpp"
#include "time_source.hpp"

#include <core/pacer.hpp>
#include <transport/transport.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace network {

struct NtpConfig {
  std::string_view server{"0.adafruit.pool.ntp.org"};
  uint16_t port{ntp::PORT};
  std::chrono::milliseconds timeout{5000};
};

static_assert(transport::request_budget::DNS_LIMIT + NtpConfig{}.timeout <
                  core::pacer_defaults::WATCHDOG_TIMEOUT,
              "resolve plus one exchange blocks without feeding the watchdog");

class NtpTimeSource final : public ITimeSource {
public:
  explicit NtpTimeSource(const NtpConfig &config = {});

  [[nodiscard]] core::Result<int64_t> fetch_unix_time() override;

  [[nodiscard]] const char *name() const override { return "ntp"; }

private:
  std::string server_;
  uint16_t port_;
  std::chrono::milliseconds timeout_;
};

} // namespace network
