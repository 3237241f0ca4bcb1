/**
 * @file excitation.hpp
 * @brief Auxiliary pins held high to power sensor wiring
 */

#pragma once

#include "pin_map.hpp"
#include "probe.hpp"

#include <core/result.hpp>

#include <string_view>

namespace sensor {

class ExcitationOutputs {
public:
  ExcitationOutputs(const PinMap &pins, IPinDriver &driver)
      : pins_(pins), driver_(driver) {}

  /// Drive every pin named in "pin,pin,..." high. An empty setting drives
  /// nothing. Unknown names are ESP_ERR_NOT_FOUND, checked before any pin
  /// is touched.
  [[nodiscard]] core::Status enable(std::string_view setting);

private:
  const PinMap &pins_;
  IPinDriver &driver_;
};

} // namespace sensor
