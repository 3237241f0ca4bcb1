/**
 * @file status.hpp
 * @brief LED diagnostic channel
 *
 * Blink counts are a field protocol read by humans:
 *   2 = connecting Wi-Fi, 3 = syncing time, 4 = about to report,
 *   5 = report batch complete.
 * Resting after success is a slow steady toggle, after failure rapid bursts.
 */

#pragma once

#include "io.hpp"
#include "pacer.hpp"

#include <chrono>
#include <cstdint>

namespace core {

/// Named pipeline signals, decoupled from their physical encoding
enum class StatusSignal : uint8_t {
  Boot,
  ConnectingWifi,
  SyncingTime,
  Reporting,
  ReportComplete,
};

/// Number of blinks encoding a signal (0 for the boot burst)
[[nodiscard]] constexpr uint8_t blink_count(StatusSignal signal) noexcept {
  switch (signal) {
  case StatusSignal::ConnectingWifi:
    return 2;
  case StatusSignal::SyncingTime:
    return 3;
  case StatusSignal::Reporting:
    return 4;
  case StatusSignal::ReportComplete:
    return 5;
  case StatusSignal::Boot:
    break;
  }
  return 0;
}

[[nodiscard]] const char *to_string(StatusSignal signal);

/// LED timing
namespace blink_timing {
inline constexpr std::chrono::milliseconds BLINK_TOGGLE{200};
inline constexpr std::chrono::milliseconds BLINK_PAUSE{1000};
inline constexpr std::chrono::milliseconds BOOT_TOGGLE{50};
inline constexpr uint8_t BOOT_TOGGLES = 10;
inline constexpr std::chrono::milliseconds HEARTBEAT_TOGGLE{2000};
inline constexpr std::chrono::milliseconds ALARM_TOGGLE{100};
inline constexpr uint8_t ALARM_TOGGLES = 20;
inline constexpr std::chrono::milliseconds ALARM_PAUSE{1000};
} // namespace blink_timing

class StatusIndicator {
public:
  StatusIndicator(IOutputLine &led, Pacer &pacer) : led_(led), pacer_(pacer) {}

  StatusIndicator(const StatusIndicator &) = delete;
  StatusIndicator &operator=(const StatusIndicator &) = delete;
  StatusIndicator(StatusIndicator &&) = delete;
  StatusIndicator &operator=(StatusIndicator &&) = delete;

  /// Play the pattern for a signal; blocks until done
  void signal(StatusSignal signal);

  /// Slow steady toggle for the given total duration (success rest)
  void heartbeat(std::chrono::milliseconds total,
                 std::chrono::milliseconds period =
                     blink_timing::HEARTBEAT_TOGGLE);

  /// Repeating rapid bursts for the given total duration (failure rest)
  void alarm(std::chrono::milliseconds total);

  void toggle() { led_.toggle(); }
  void off() { led_.set(false); }

private:
  void blink(uint8_t count);
  void burst(uint8_t toggles, std::chrono::milliseconds interval);

  IOutputLine &led_;
  Pacer &pacer_;
};

} // namespace core
