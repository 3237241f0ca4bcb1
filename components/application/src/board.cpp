/**
 * @file board.cpp
 * @brief Board hardware initialization
 */

#include <application/board.hpp>

#include <esp_log.h>

namespace application {

namespace {
constexpr const char *TAG = "board";
} // namespace

core::Status ExcitationDriver::drive_high(sensor::PinId pin) {
  auto output = std::make_unique<core::OutputPin>(static_cast<gpio_num_t>(pin),
                                                  true);
  if (!output->valid()) {
    ESP_LOGE(TAG, "GPIO%d as output failed: %s", pin,
             esp_err_to_name(output->error()));
    return core::Err(output->error());
  }
  pins_.push_back(std::move(output));
  return core::Ok();
}

Board::Board(const BoardConfig &config)
    : led_(config.status_led, config.led_active_low),
      button_(config.boot_button, GPIO_INTR_NEGEDGE, on_button, &abort_,
              core::Pull::Up) {
  if (!led_.valid()) {
    ESP_LOGE(TAG, "Status LED on GPIO%d failed",
             static_cast<int>(config.status_led));
    return;
  }
  if (!button_.valid()) {
    ESP_LOGW(TAG, "BOOT button on GPIO%d unavailable, no manual mode",
             static_cast<int>(config.boot_button));
  }

  ESP_LOGI(TAG, "LED=GPIO%d%s, BOOT=GPIO%d",
           static_cast<int>(config.status_led),
           config.led_active_low ? " (active low)" : "",
           static_cast<int>(config.boot_button));
}

void IRAM_ATTR Board::on_button(void *arg) {
  static_cast<core::AbortSignal *>(arg)->request();
}

} // namespace application
