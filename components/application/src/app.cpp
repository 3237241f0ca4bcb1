/**
 * @file app.cpp
 * @brief Temperature reporter application implementation
 */

#include <application/app.hpp>

#include "app_config.hpp"

#include <control/manual_trigger.hpp>
#include <core/log_stamp.hpp>
#include <core/nvs_config.hpp>
#include <core/pacer.hpp>
#include <core/task.hpp>
#include <core/watchdog.hpp>
#include <network/connectivity.hpp>
#include <network/http_time.hpp>
#include <network/ntp_client.hpp>
#include <network/time_sync.hpp>
#include <network/wifi_manager.hpp>
#include <onewire/factory.hpp>
#include <power/restart.hpp>
#include <report/reporter.hpp>
#include <sensor/excitation.hpp>
#include <sensor/pin_map.hpp>
#include <sensor/registry.hpp>
#include <transport/http_transport.hpp>

#include <esp_app_desc.h>
#include <esp_log.h>

#include <string>

namespace application {

void TemperatureReporter::run() {
  core::install_log_stamp(clock_);
  log_boot_info();

  core::TaskWatchdog watchdog(app::config::WATCHDOG_TIMEOUT);
  if (!watchdog.valid()) {
    ESP_LOGW(TAG, "Task watchdog unavailable");
  }
  core::TaskDelay delay;
  core::Pacer pacer(delay, watchdog);
  core::StatusIndicator status(board_.led(), pacer);
  core::DeviceContext ctx{
      .clock = clock_,
      .status = status,
      .pacer = pacer,
      .abort = board_.abort(),
  };
  power::SystemRestart restart;

  status.signal(core::StatusSignal::Boot);

  // BOOT is a strapping pin: held at reset it enters the ROM bootloader,
  // so manual mode is selected by a press after boot instead
  bool manual = control::await_manual_request(ctx, app::config::MANUAL_WINDOW);

  core::NvsConfigSource config(app::config::DEFAULTS);
  if (!config.has_store()) {
    ESP_LOGW(TAG, "No '%s' namespace in NVS, using built-in defaults",
             core::CONFIG_NAMESPACE);
  }

  network::WifiManager wifi;
  if (auto status_wifi = wifi.init(); !status_wifi) {
    ESP_LOGE(TAG, "WiFi init failed: %s",
             esp_err_to_name(status_wifi.error()));
    status.alarm(control::rest_defaults::AFTER_FAILURE);
    restart.restart();
  }

  transport::HttpTransport http;
  auto time_source = make_time_source(config, http);

  network::ConnectivityManager connectivity(wifi, ctx);
  network::TimeSync time_sync(*time_source, ctx);
  sensor::PinMap pins(app::config::PINS);
  driver::onewire::BusFactory buses(pacer);
  sensor::SensorRegistry registry(pins, buses);
  sensor::ExcitationOutputs excitation(pins, board_.excitation());
  report::Reporter reporter(
      http, ctx,
      {.contents_url = config.get(core::config_keys::CONTENTS_URL)
                           .value_or(std::string(
                               app::config::DEFAULT_CONTENTS_URL))});

  control::ControlLoop loop(
      {
          .config = config,
          .connectivity = connectivity,
          .time_sync = time_sync,
          .excitation = excitation,
          .registry = registry,
          .reporter = reporter,
      },
      ctx, restart);

  if (manual) {
    run_manual(loop, status, pacer);
  }
  loop.run_cycle();
}

void TemperatureReporter::log_boot_info() {
  const auto *app_desc = esp_app_get_description();
  auto reason = power::get_reset_reason();
  ESP_LOGI(TAG, "%s v%s | Reset: %s", app_desc->project_name,
           app_desc->version, power::to_string(reason));
}

std::unique_ptr<network::ITimeSource>
TemperatureReporter::make_time_source(const core::IConfigSource &config,
                                      transport::ITransport &transport) {
  auto kind = config.get(core::config_keys::TIME_SOURCE);
  if (kind && *kind == "http") {
    auto url = config.get(core::config_keys::TIME_URL)
                   .value_or(std::string(network::DEFAULT_TIME_URL));
    ESP_LOGI(TAG, "Time from %s", url.c_str());
    return std::make_unique<network::HttpTimeSource>(transport, url);
  }
  return std::make_unique<network::NtpTimeSource>();
}

void TemperatureReporter::run_manual(control::ControlLoop &loop,
                                     core::StatusIndicator &status,
                                     core::Pacer &pacer) {
  ESP_LOGI(TAG, "Manual mode: single pass, no reset");
  auto outcome = loop.run_once();
  ESP_LOGI(TAG, "Pass finished in state %s, exit code %d",
           control::to_string(outcome.state), control::exit_code(outcome));

  while (true) {
    status.toggle();
    pacer.wait(app::config::MANUAL_IDLE_TOGGLE);
  }
}

} // namespace application
