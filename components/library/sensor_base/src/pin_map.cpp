/**
 * @file pin_map.cpp
 * @brief Pin name lookup
 */

#include <sensor/pin_map.hpp>

namespace sensor {

std::optional<PinId> PinMap::find(std::string_view name) const {
  for (const auto &entry : entries_) {
    if (entry.name == name) {
      return entry.pin;
    }
  }
  return std::nullopt;
}

std::string PinMap::names_joined() const {
  std::string out;
  for (const auto &entry : entries_) {
    if (!out.empty()) {
      out += ", ";
    }
    out.append(entry.name);
  }
  return out;
}

} // namespace sensor
