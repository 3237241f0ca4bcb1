/**
 * @file auth.hpp
 * @brief Token authentication header for the content store API
 */

#pragma once

#include "transport.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace transport {

/// "Authorization: Token <token>"
///
/// Owns the header value; header() views into it, so the provider must
/// outlive any Request built from it.
class TokenAuth {
public:
  static constexpr std::string_view HEADER_NAME = "Authorization";
  static constexpr std::string_view SCHEME = "Token ";

  TokenAuth() = default;
  explicit TokenAuth(std::string_view token) : value_(SCHEME) {
    value_.append(token);
  }

  [[nodiscard]] bool has_credentials() const {
    return value_.size() > SCHEME.size();
  }

  [[nodiscard]] Header header() const { return {HEADER_NAME, value_}; }

  /// Token length only; the token itself is never logged
  [[nodiscard]] size_t token_length() const {
    return has_credentials() ? value_.size() - SCHEME.size() : 0;
  }

private:
  std::string value_;
};

} // namespace transport
