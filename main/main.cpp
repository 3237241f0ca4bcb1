/**
 * @file main.cpp
 * @brief Application entry point
 *
 * Creates and wires up the board, then starts the application. In cycle
 * mode start() never returns: the cycle ends in a hardware reset.
 */

#include "app_config.hpp"

#include <application/app.hpp>
#include <application/board.hpp>

#include <esp_log.h>

#include <memory>

namespace {
constexpr const char *TAG = "main";
} // namespace

extern "C" void app_main() {
  application::BoardConfig board_config{
      .status_led = app::config::STATUS_LED_PIN,
      .led_active_low = app::config::STATUS_LED_ACTIVE_LOW,
      .boot_button = app::config::BOOT_BUTTON_PIN,
  };

  application::Board board(board_config);
  if (!board.valid()) {
    ESP_LOGE(TAG, "Board initialization failed");
    return;
  }

  // Never destroyed in cycle mode; keep it off the main task stack
  auto app = std::make_unique<application::TemperatureReporter>(board);

  if (auto err = app->start(); !err) {
    ESP_LOGE(TAG, "App failed: %s", esp_err_to_name(err.error()));
  }
}
