/**
 * @file app_config.hpp
 * @brief Board pins, timings and built-in configuration defaults
 *
 * Board: ESP32-C3 Super Mini. Deployment-specific values (WIFI, SENSORS,
 * TOKEN_URL, ...) are provisioned into the NVS "config" namespace; the
 * defaults below only fill keys that are not provisioned.
 */

#pragma once

#include <core/config.hpp>
#include <core/nvs_config.hpp>
#include <core/pacer.hpp>
#include <sensor/pin_map.hpp>

#include <driver/gpio.h>

#include <array>
#include <chrono>
#include <string_view>

namespace app::config {

// =============================================================================
// Board
// =============================================================================

inline constexpr gpio_num_t STATUS_LED_PIN = GPIO_NUM_8;
inline constexpr bool STATUS_LED_ACTIVE_LOW = true;
inline constexpr gpio_num_t BOOT_BUTTON_PIN = GPIO_NUM_9;

/// Pins usable for sensors and EXTRA_HOTS. GPIO8/9 belong to the LED and
/// button, GPIO11-19 to flash and USB.
inline constexpr std::array<sensor::PinEntry, 11> PINS{{
    {"GPIO0", 0},
    {"GPIO1", 1},
    {"GPIO2", 2},
    {"GPIO3", 3},
    {"GPIO4", 4},
    {"GPIO5", 5},
    {"GPIO6", 6},
    {"GPIO7", 7},
    {"GPIO10", 10},
    {"GPIO20", 20},
    {"GPIO21", 21},
}};

// =============================================================================
// Timing
// =============================================================================

/// Longest unfed call is one HTTPS request: DNS (20 s) plus four 10 s
/// phases = 60 s, half the watchdog period. CONFIG_ESP_TASK_WDT_TIMEOUT_S
/// matches so the boot-time default never panics first.
inline constexpr std::chrono::milliseconds WATCHDOG_TIMEOUT =
    core::pacer_defaults::WATCHDOG_TIMEOUT;

/// After the boot signal, a BOOT press within this window selects a
/// single manual pass
inline constexpr std::chrono::milliseconds MANUAL_WINDOW{3000};

/// LED toggle period while idling after a manual pass
inline constexpr std::chrono::milliseconds MANUAL_IDLE_TOGGLE{1000};

// =============================================================================
// Configuration defaults
// =============================================================================

inline constexpr std::string_view DEFAULT_CONTENTS_URL =
    "https://api.github.com/repos/okielife/TempSensors/contents";

inline constexpr std::array<core::ConfigDefault, 7> DEFAULTS{{
    {core::config_keys::WIFI, ""},
    {core::config_keys::SENSORS, ""},
    {core::config_keys::EXTRA_HOTS, ""},
    {core::config_keys::TOKEN_URL, ""},
    {core::config_keys::CONTENTS_URL, DEFAULT_CONTENTS_URL},
    {core::config_keys::TIME_SOURCE, "ntp"},
    {core::config_keys::TIME_URL,
     "http://worldtimeapi.org/api/timezone/Etc/UTC"},
}};

} // namespace app::config
