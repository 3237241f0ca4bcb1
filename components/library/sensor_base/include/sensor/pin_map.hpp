/**
 * @file pin_map.hpp
 * @brief Explicit name-to-pin table for the board
 */

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sensor {

/// Hardware pin number (gpio_num_t on the device)
using PinId = int;

struct PinEntry {
  std::string_view name;
  PinId pin;
};

class PinMap {
public:
  /// @param entries Board table, must outlive the map
  explicit PinMap(std::span<const PinEntry> entries) : entries_(entries) {}

  /// Exact, case-sensitive lookup
  [[nodiscard]] std::optional<PinId> find(std::string_view name) const;

  /// "A, B, C" for diagnostics
  [[nodiscard]] std::string names_joined() const;

  [[nodiscard]] size_t size() const { return entries_.size(); }

private:
  std::span<const PinEntry> entries_;
};

} // namespace sensor
