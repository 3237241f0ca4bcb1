/**
 * @file reporter.hpp
 * @brief Publish one measurement per sensor to the content store
 */

#pragma once

#include "record.hpp"

#include <core/device_context.hpp>
#include <core/result.hpp>
#include <sensor/registry.hpp>
#include <transport/auth.hpp>
#include <transport/transport.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace report {

struct ReporterConfig {
  std::string contents_url; ///< Base of the contents API, no trailing '/'
};

/// Per-sensor outcome, in configured order
struct SensorResult {
  std::string sensor_id;
  bool ok{false};
};

using SensorResults = std::vector<SensorResult>;

/// True when every sensor stored its record
[[nodiscard]] bool all_stored(const SensorResults &results);

class Reporter {
public:
  Reporter(transport::ITransport &transport, core::DeviceContext &ctx,
           ReporterConfig config);

  Reporter(const Reporter &) = delete;
  Reporter &operator=(const Reporter &) = delete;
  Reporter(Reporter &&) = delete;
  Reporter &operator=(Reporter &&) = delete;

  /// GET the token URL and recover the token from the body.
  ///
  /// @return ESP_ERR_INVALID_ARG without a URL, the transport error,
  ///         ESP_ERR_INVALID_RESPONSE for a non-2xx status or empty token
  [[nodiscard]] core::Result<std::string> fetch_token(std::string_view url);

  /// Read and PUT every sensor. A failing sensor is recorded and the
  /// batch continues; only a token failure fails the call.
  [[nodiscard]] core::Result<SensorResults>
  report_all(sensor::SensorSet &sensors, std::string_view token_url);

private:
  [[nodiscard]] core::Status report_one(sensor::SensorHandle &sensor,
                                        const transport::TokenAuth &auth);

  transport::ITransport &transport_;
  core::DeviceContext &ctx_;
  ReporterConfig config_;
};

} // namespace report
