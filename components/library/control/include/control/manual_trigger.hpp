/**
 * @file manual_trigger.hpp
 * @brief Post-boot window in which a button press selects manual mode
 *
 * The button shares the abort signal with the running pipeline. A press
 * during the window after boot selects a single pass without reset; a
 * press later aborts the pass in progress.
 */

#pragma once

#include <core/device_context.hpp>

#include <chrono>

namespace control {

namespace manual_defaults {
inline constexpr std::chrono::milliseconds WINDOW{3000};
/// Abort flag poll period inside the window
inline constexpr std::chrono::milliseconds POLL{100};
} // namespace manual_defaults

/// Wait up to `window` for an abort request. Returns true and clears the
/// request if one arrives; the full window elapses otherwise.
[[nodiscard]] bool
await_manual_request(core::DeviceContext &ctx,
                     std::chrono::milliseconds window = manual_defaults::WINDOW,
                     std::chrono::milliseconds poll = manual_defaults::POLL);

} // namespace control
