/**
 * @file reporter.cpp
 * @brief Token retrieval and per-sensor PUT
 */

#include "report/reporter.hpp"

#include <sensor/log.hpp>

#include <esp_log.h>

#include <algorithm>
#include <array>
#include <utility>

namespace report {

namespace {
constexpr const char *TAG = "reporter";
} // namespace

bool all_stored(const SensorResults &results) {
  return std::all_of(results.begin(), results.end(),
                     [](const SensorResult &r) { return r.ok; });
}

Reporter::Reporter(transport::ITransport &transport, core::DeviceContext &ctx,
                   ReporterConfig config)
    : transport_(transport), ctx_(ctx), config_(std::move(config)) {
  while (!config_.contents_url.empty() && config_.contents_url.back() == '/') {
    config_.contents_url.pop_back();
  }
}

core::Result<std::string> Reporter::fetch_token(std::string_view url) {
  if (url.empty()) {
    ESP_LOGE(TAG, "No token URL configured");
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  auto response = transport_.send({.method = transport::HttpMethod::Get,
                                   .url = url});
  if (!response) {
    ESP_LOGE(TAG, "Token request failed: %s",
             esp_err_to_name(response.error()));
    return core::Err(response.error());
  }
  if (!response->is_success()) {
    ESP_LOGE(TAG, "Token request returned HTTP %u",
             static_cast<unsigned>(response->status_code()));
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  auto token = recover_token(response->body_str());
  if (token.empty()) {
    ESP_LOGE(TAG, "Token body is empty");
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }
  ESP_LOGI(TAG, "Token retrieved (%zu chars)", token.size());
  return token;
}

core::Result<SensorResults>
Reporter::report_all(sensor::SensorSet &sensors, std::string_view token_url) {
  ctx_.status.signal(core::StatusSignal::Reporting);

  auto token = fetch_token(token_url);
  if (!token) {
    return core::Err(token.error());
  }
  transport::TokenAuth auth(*token);

  SensorResults results;
  results.reserve(sensors.size());
  for (auto &sensor : sensors) {
    auto status = report_one(sensor, auth);
    if (!status) {
      ESP_LOGW(TAG, "Sensor ID %s not reported: %s", sensor.id().c_str(),
               esp_err_to_name(status.error()));
    }
    results.push_back({.sensor_id = sensor.id(), .ok = status.ok()});
    ctx_.pacer.feed();
  }

  ctx_.status.signal(core::StatusSignal::ReportComplete);
  return results;
}

core::Status Reporter::report_one(sensor::SensorHandle &sensor,
                                  const transport::TokenAuth &auth) {
  auto celsius = sensor.device->read_celsius();
  if (!celsius) {
    return core::Err(celsius.error());
  }

  sensor::Measurement measurement{
      .sensor_id = sensor.id(),
      .temperature = *celsius,
      .timestamp = ctx_.clock.now(),
  };
  sensor::log_measurement(TAG, measurement);

  auto stamp = core::format_stamp(measurement.timestamp);
  auto path = object_path(measurement.sensor_id, stamp.data());

  auto content = encode_base64(render_record(measurement));
  if (!content) {
    return core::Err(content.error());
  }
  auto body = put_body(path, *content);

  std::string url = config_.contents_url;
  url.push_back('/');
  url.append(path);

  std::array<transport::Header, 2> headers{{
      {content_store::ACCEPT_HEADER, content_store::ACCEPT},
      auth.header(),
  }};

  auto response = transport_.send({
      .method = transport::HttpMethod::Put,
      .url = url,
      .headers = headers,
      .body = body,
      .content_type = transport::ContentType::Json,
  });
  if (!response) {
    return core::Err(response.error());
  }
  if (!is_stored(response->status_code())) {
    ESP_LOGW(TAG, "PUT %s returned HTTP %u", path.c_str(),
             static_cast<unsigned>(response->status_code()));
    return core::Err(ESP_ERR_INVALID_RESPONSE);
  }

  ESP_LOGI(TAG, "Stored %s", path.c_str());
  return core::Ok();
}

} // namespace report
