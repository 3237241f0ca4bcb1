/**
 * @file http_transport.hpp
 * @brief HTTP/HTTPS transport implementation
 *
 * Implements ITransport with one esp_http_client per request:
 * - TLS verified against the ESP x509 certificate bundle
 * - Absolute URLs (token host, content store and time service differ)
 * - Content-type and extra header handling
 */

#pragma once

#include "transport.hpp"

#include <core/http_client.hpp>

#include <esp_log.h>

#include <chrono>
#include <vector>

namespace transport {

/// HTTP transport configuration
struct HttpTransportConfig {
  /// Per phase; see request_budget
  std::chrono::milliseconds timeout{request_budget::PHASE_TIMEOUT};
  bool skip_cert_verify{false};
};

/// HTTP transport implementation
///
/// @thread_safety NOT thread-safe; the pipeline is single-threaded.
class HttpTransport final : public ITransport {
public:
  explicit HttpTransport(const HttpTransportConfig &config = {})
      : config_(config) {}

  HttpTransport(const HttpTransport &) = delete;
  HttpTransport &operator=(const HttpTransport &) = delete;
  HttpTransport(HttpTransport &&) = delete;
  HttpTransport &operator=(HttpTransport &&) = delete;

  [[nodiscard]] core::Result<Response> send(const Request &request) override {
    core::HttpClient<> client(request.url,
                              core::HttpClientConfig{
                                  .timeout = config_.timeout,
                                  .skip_cert_verify = config_.skip_cert_verify,
                              });
    if (!client.valid()) {
      ESP_LOGE(TAG, "Failed to create HTTP client");
      return core::Err(ESP_FAIL);
    }

    std::vector<core::HttpHeader> headers;
    headers.reserve(request.headers.size() + 1);
    if (const char *mime = content_type_str(request.content_type)) {
      headers.push_back({"Content-Type", mime});
    }
    for (const auto &header : request.headers) {
      headers.push_back({header.name, header.value});
    }

    auto result =
        client.perform(map_method(request.method), headers, request.body);
    if (!result) {
      return core::Err(result.error());
    }

    ESP_LOGD(TAG, "%s -> %d (%zu bytes)",
             request.method == HttpMethod::Put ? "PUT" : "GET",
             result->status_code, result->length);

    return Response(result->body_span(),
                    static_cast<uint16_t>(result->status_code));
  }

private:
  static constexpr const char *TAG = "HttpTransport";

  [[nodiscard]] static core::HttpMethod map_method(HttpMethod method) {
    switch (method) {
    case HttpMethod::Put:
      return core::HttpMethod::Put;
    case HttpMethod::Get:
      break;
    }
    return core::HttpMethod::Get;
  }

  HttpTransportConfig config_;
};

} // namespace transport
