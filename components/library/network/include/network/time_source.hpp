/**
 * @file time_source.hpp
 * @brief Authoritative time providers
 */

#pragma once

#include <core/result.hpp>

#include <cstdint>

namespace network {

class ITimeSource {
public:
  virtual ~ITimeSource() = default;

  /// One exchange with the time server; UTC seconds since 1970
  [[nodiscard]] virtual core::Result<int64_t> fetch_unix_time() = 0;

  [[nodiscard]] virtual const char *name() const = 0;
};

} // namespace network
