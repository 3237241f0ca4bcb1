/**
 * @file transport.hpp
 * @brief Synchronous request/response transport abstraction
 *
 * The HTTP implementation sits on esp_http_client; tests provide their
 * own ITransport.
 */

#pragma once

#include <core/pacer.hpp>
#include <core/result.hpp>

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace transport {

/// Content types for request bodies
enum class ContentType : uint8_t {
  None, // no body
  Json, // application/json
};

/// MIME string, nullptr for ContentType::None
[[nodiscard]] constexpr const char *content_type_str(ContentType type) {
  switch (type) {
  case ContentType::Json:
    return "application/json";
  case ContentType::None:
    break;
  }
  return nullptr;
}

/// Upper bound of one blocking request, which feeds no watchdog.
/// esp_http_client applies its timeout to each phase separately.
namespace request_budget {
inline constexpr std::chrono::milliseconds PHASE_TIMEOUT{10000};
/// TCP connect with TLS handshake, request write, header read, body read
inline constexpr int PHASES = 4;
/// lwIP resolver retries ahead of the connect
inline constexpr std::chrono::milliseconds DNS_LIMIT{20000};

[[nodiscard]] constexpr std::chrono::milliseconds
worst_case(std::chrono::milliseconds phase_timeout = PHASE_TIMEOUT) {
  return DNS_LIMIT + PHASES * phase_timeout;
}
} // namespace request_budget

static_assert(request_budget::worst_case() <
                  core::pacer_defaults::WATCHDOG_TIMEOUT,
              "one request must fit in a watchdog period");

/// HTTP methods
enum class HttpMethod : uint8_t { Get, Put };

/// Request header
struct Header {
  std::string_view name;
  std::string_view value;
};

/// HTTP-like request structure
/// @note Uses non-owning views - caller must ensure data lifetime
struct Request {
  HttpMethod method{HttpMethod::Get};
  std::string_view url;               // Absolute URL
  std::span<const Header> headers{};  // Extra request headers
  std::string_view body{};            // Request body
  ContentType content_type{ContentType::None};
};

/// Response from transport
/// @note Owns the body data
class Response {
public:
  Response() = default;

  Response(std::string_view body, uint16_t status)
      : body_(body.begin(), body.end()), status_code_(status) {}

  Response(std::span<const uint8_t> body, uint16_t status)
      : body_(body.begin(), body.end()), status_code_(status) {}

  /// Get response body as string view
  [[nodiscard]] std::string_view body_str() const {
    return {body_.data(), body_.size()};
  }

  /// Get HTTP status code
  [[nodiscard]] uint16_t status_code() const { return status_code_; }

  /// Check if request was successful (2xx)
  [[nodiscard]] bool is_success() const {
    return status_code_ >= 200 && status_code_ < 300;
  }

  /// Check if response body is empty
  [[nodiscard]] bool empty() const { return body_.empty(); }

private:
  std::vector<char> body_;
  uint16_t status_code_{0};
};

/// Transport interface
///
/// Transport-level failures (DNS, TLS, timeout) are errors; every HTTP
/// status, including 4xx/5xx, is a Response.
class ITransport {
public:
  virtual ~ITransport() = default;

  /// Send a request and receive response (blocking)
  [[nodiscard]] virtual core::Result<Response> send(const Request &request) = 0;
};

} // namespace transport
