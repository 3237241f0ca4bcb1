/**
 * @file http_client.hpp
 * @brief RAII wrapper for esp_http_client
 *
 * One client per request URL:
 * - Fixed-size response buffer (template parameter)
 * - Automatic resource cleanup
 * - TLS through the ESP x509 certificate bundle
 */

#pragma once

#include "result.hpp"

#include <esp_crt_bundle.h>
#include <esp_http_client.h>
#include <esp_log.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace core {

/// HTTP methods
enum class HttpMethod : uint8_t {
  Get = HTTP_METHOD_GET,
  Post = HTTP_METHOD_POST,
  Put = HTTP_METHOD_PUT,
  Delete = HTTP_METHOD_DELETE,
};

/// Request header (copied by esp_http_client)
struct HttpHeader {
  std::string_view name;
  std::string_view value;
};

/// Default configuration values
namespace http_defaults {
inline constexpr std::chrono::milliseconds TIMEOUT{15000};
inline constexpr int HTTP_BUFFER_SIZE = 2048;
inline constexpr int HTTP_BUFFER_SIZE_TX = 1024;
} // namespace http_defaults

/// HTTP client configuration
struct HttpClientConfig {
  std::chrono::milliseconds timeout{http_defaults::TIMEOUT};
  bool skip_cert_verify{false};
  int buffer_size{http_defaults::HTTP_BUFFER_SIZE};
  int buffer_size_tx{http_defaults::HTTP_BUFFER_SIZE_TX};
};

/// HTTP response view (points into client's internal buffer)
struct HttpResponse {
  const uint8_t *data{nullptr};
  size_t length{0};
  int status_code{0};

  [[nodiscard]] std::string_view body_view() const {
    return {reinterpret_cast<const char *>(data), length};
  }

  [[nodiscard]] std::span<const uint8_t> body_span() const {
    return {data, length};
  }
};

/// Default response buffer size
inline constexpr size_t HTTP_RESPONSE_SIZE = 4096;

/// RAII wrapper for esp_http_client bound to a single URL
///
/// @tparam ResponseSize Response buffer size (compile-time); longer bodies
///                      are truncated
///
/// @thread_safety NOT thread-safe. Use one instance per task.
template <size_t ResponseSize = HTTP_RESPONSE_SIZE> class HttpClient {
public:
  HttpClient(std::string_view url, const HttpClientConfig &config)
      : url_(url) {
    init(config);
  }

  ~HttpClient() {
    if (handle_ != nullptr) {
      esp_http_client_cleanup(handle_);
    }
  }

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;
  HttpClient(HttpClient &&) = delete;
  HttpClient &operator=(HttpClient &&) = delete;

  [[nodiscard]] bool valid() const noexcept { return handle_ != nullptr; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

  /// Perform the request; transport failures are errors, any HTTP status
  /// is a response
  [[nodiscard]] Result<HttpResponse>
  perform(HttpMethod method, std::span<const HttpHeader> headers = {},
          std::string_view body = {}) {
    if (handle_ == nullptr) {
      return Err(ESP_ERR_INVALID_STATE);
    }

    response_len_ = 0;

    esp_err_t err = esp_http_client_set_method(
        handle_, static_cast<esp_http_client_method_t>(method));
    if (err != ESP_OK)
      return Err(err);

    for (const auto &header : headers) {
      // esp_http_client copies both strings
      std::string name(header.name);
      std::string value(header.value);
      err = esp_http_client_set_header(handle_, name.c_str(), value.c_str());
      if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to set header %s: %s", name.c_str(),
                 esp_err_to_name(err));
        return Err(err);
      }
    }

    if (!body.empty()) {
      err = esp_http_client_set_post_field(handle_, body.data(),
                                           static_cast<int>(body.size()));
      if (err != ESP_OK) {
        return Err(err);
      }
    }

    err = esp_http_client_perform(handle_);

    int status = esp_http_client_get_status_code(handle_);
    ESP_LOGD(TAG, "HTTP response: status=%d, body_len=%zu", status,
             response_len_);

    if (err != ESP_OK) {
      ESP_LOGE(TAG, "HTTP request failed: %s (status was %d)",
               esp_err_to_name(err), status);
      return Err(err);
    }

    return HttpResponse{
        .data = response_buffer_.data(),
        .length = response_len_,
        .status_code = status,
    };
  }

private:
  static constexpr const char *TAG = "HttpClient";

  void init(const HttpClientConfig &config) {
    esp_http_client_config_t esp_config{};

    esp_config.url = url_.c_str();
    esp_config.timeout_ms = static_cast<int>(config.timeout.count());
    esp_config.buffer_size = config.buffer_size;
    esp_config.buffer_size_tx = config.buffer_size_tx;
    esp_config.keep_alive_enable = false;

    if (config.skip_cert_verify) {
      esp_config.skip_cert_common_name_check = true;
    } else {
      esp_config.crt_bundle_attach = esp_crt_bundle_attach;
    }

    esp_config.event_handler = http_event_handler;
    esp_config.user_data = this;

    // Authorization is an explicit header, never Basic/Digest
    esp_config.auth_type = HTTP_AUTH_TYPE_NONE;

    handle_ = esp_http_client_init(&esp_config);
    if (handle_ == nullptr) {
      ESP_LOGE(TAG, "esp_http_client_init failed");
    }
  }

  static esp_err_t http_event_handler(esp_http_client_event_t *evt) {
    auto *self = static_cast<HttpClient *>(evt->user_data);
    if (self == nullptr)
      return ESP_OK;

    if (evt->event_id == HTTP_EVENT_ON_DATA && evt->data_len > 0) {
      size_t space = ResponseSize - self->response_len_;
      size_t copy_len = std::min(static_cast<size_t>(evt->data_len), space);

      if (copy_len < static_cast<size_t>(evt->data_len)) {
        ESP_LOGW(TAG, "Response truncated: buffer full");
      }

      std::memcpy(self->response_buffer_.data() + self->response_len_,
                  evt->data, copy_len);
      self->response_len_ += copy_len;
    }

    return ESP_OK;
  }

  std::string url_;
  esp_http_client_handle_t handle_{nullptr};
  std::array<uint8_t, ResponseSize> response_buffer_{};
  size_t response_len_{0};
};

} // namespace core
