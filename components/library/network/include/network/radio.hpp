/**
 * @file radio.hpp
 * @brief Station radio seam
 */

#pragma once

#include "wifi_types.hpp"

#include <core/result.hpp>

namespace network {

class IRadio {
public:
  virtual ~IRadio() = default;

  /// True when associated and holding an IP address
  [[nodiscard]] virtual bool is_connected() const = 0;

  /// Blocking association attempt; fails after the radio's own timeout
  [[nodiscard]] virtual core::Status connect(const WifiCandidate &candidate) = 0;
};

} // namespace network
