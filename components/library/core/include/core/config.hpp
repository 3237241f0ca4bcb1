/**
 * @file config.hpp
 * @brief Runtime configuration keys, source interface and list parsing
 */

#pragma once

#include "result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Configuration keys (also the NVS key names, max 15 chars)
namespace config_keys {
inline constexpr std::string_view WIFI = "WIFI";
inline constexpr std::string_view SENSORS = "SENSORS";
inline constexpr std::string_view EXTRA_HOTS = "EXTRA_HOTS";
inline constexpr std::string_view TOKEN_URL = "TOKEN_URL";
inline constexpr std::string_view CONTENTS_URL = "CONTENTS_URL";
inline constexpr std::string_view TIME_SOURCE = "TIME_SOURCE";
inline constexpr std::string_view TIME_URL = "TIME_URL";
} // namespace config_keys

/// Read-only string configuration
class IConfigSource {
public:
  virtual ~IConfigSource() = default;

  /// Value for key, or nullopt when absent or empty
  [[nodiscard]] virtual std::optional<std::string>
  get(std::string_view key) const = 0;
};

/// Record separator in tuple lists ("a,b;c,d")
inline constexpr char RECORD_SEPARATOR = ';';
/// Field separator within a record, and item separator in flat lists
inline constexpr char FIELD_SEPARATOR = ',';

using Record = std::vector<std::string>;

/// Strip leading and trailing whitespace
[[nodiscard]] std::string_view trim(std::string_view text);

/// Split a list of records, each with exactly field_count trimmed fields.
/// A trailing empty record is ignored; any other empty record, or a record
/// with the wrong field count, is ESP_ERR_INVALID_ARG. Empty input is
/// ESP_ERR_INVALID_ARG.
[[nodiscard]] Result<std::vector<Record>> parse_records(std::string_view text,
                                                        size_t field_count);

/// Split a flat comma list into trimmed, non-empty items
[[nodiscard]] std::vector<std::string> parse_list(std::string_view text);

} // namespace core
