/**
 * @file log_stamp.hpp
 * @brief Wall-clock prefix for every esp_log line
 */

#pragma once

#include "clock.hpp"

namespace core {

/// Shown instead of a time while the clock is unset
inline constexpr const char *UNSET_STAMP = "*******************";

/// Stamp for log lines: the clock's stamp once set, else UNSET_STAMP
[[nodiscard]] Stamp log_stamp(const Clock &clock);

/// Route esp_log output through a "<stamp> : " prefix.
/// The clock must outlive all logging.
void install_log_stamp(const Clock &clock);

} // namespace core
