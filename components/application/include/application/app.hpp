/**
 * @file app.hpp
 * @brief Temperature reporter application
 *
 * High-level application logic. Receives the board via constructor and
 * builds one pipeline per boot; every boot is one cycle.
 */

#pragma once

#include "board.hpp"

#include <control/control_loop.hpp>
#include <core/application.hpp>
#include <core/clock.hpp>
#include <core/config.hpp>
#include <core/status.hpp>
#include <network/time_source.hpp>
#include <transport/transport.hpp>

#include <memory>

namespace application {

class TemperatureReporter final : public core::Application {
public:
  /// Construct with dependencies (does not take ownership)
  explicit TemperatureReporter(Board &board) : board_(board) {}

protected:
  void run() override;

private:
  static constexpr const char *TAG = "reporter_app";

  static void log_boot_info();

  /// TIME_SOURCE: "http" selects the JSON time service, anything else NTP
  [[nodiscard]] static std::unique_ptr<network::ITimeSource>
  make_time_source(const core::IConfigSource &config,
                   transport::ITransport &transport);

  /// Single pass without reset, then idle blinking
  [[noreturn]] static void run_manual(control::ControlLoop &loop,
                                      core::StatusIndicator &status,
                                      core::Pacer &pacer);

  Board &board_;
  core::Clock clock_;
};

} // namespace application
