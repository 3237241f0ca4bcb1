/**
 * @file restart.hpp
 * @brief Reset reason reporting and the end-of-cycle hardware reset
 */

#pragma once

#include <core/io.hpp>

#include <cstdint>

namespace power {

enum class ResetReason : uint8_t {
  PowerOn,
  Software,
  Watchdog,
  Panic,
  Brownout,
  External,
  Other,
};

[[nodiscard]] ResetReason get_reset_reason();

[[nodiscard]] const char *to_string(ResetReason reason);

/// esp_restart(); does not return
class SystemRestart final : public core::IReset {
public:
  [[noreturn]] void restart() override;
};

} // namespace power
