/**
 * @file wifi_manager.hpp
 * @brief Station-mode WiFi radio with blocking association
 */

#pragma once

#include "attempt_tracker.hpp"
#include "radio.hpp"
#include "wifi_types.hpp"

#include <core/event_loop.hpp>
#include <core/pacer.hpp>
#include <core/result.hpp>

#include <esp_event.h>
#include <esp_netif.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

#include <atomic>
#include <chrono>

namespace network {

struct WifiConfig {
  /// Give up on one candidate after this long without an IP
  std::chrono::milliseconds connect_timeout{15000};
  /// Wait for the driver to report our own disconnect of a timed-out
  /// attempt before the next candidate starts
  std::chrono::milliseconds leave_settle{1000};
};

static_assert(WifiConfig{}.connect_timeout + WifiConfig{}.leave_settle <
                  core::pacer_defaults::WATCHDOG_TIMEOUT / 2,
              "an association attempt blocks without feeding the watchdog");

/// WiFi station - one blocking association attempt per connect() call
class WifiManager final : public IRadio {
public:
  WifiManager() = default;
  ~WifiManager() override;

  WifiManager(const WifiManager &) = delete;
  WifiManager &operator=(const WifiManager &) = delete;
  WifiManager(WifiManager &&) = delete;
  WifiManager &operator=(WifiManager &&) = delete;

  /// Bring up netif and the WiFi driver in station mode.
  /// Requires the default event loop.
  [[nodiscard]] core::Status init(const WifiConfig &config = {});

  [[nodiscard]] bool is_connected() const override {
    return state_ == ConnectionState::Connected;
  }

  [[nodiscard]] core::Status connect(const WifiCandidate &candidate) override;

  [[nodiscard]] ConnectionState state() const { return state_.load(); }

private:
  static constexpr EventBits_t kConnectedBit = BIT0;
  static constexpr EventBits_t kFailedBit = BIT1;
  static constexpr EventBits_t kLeftBit = BIT2;

  void set_state(ConnectionState new_state);
  /// Disconnect a timed-out attempt and wait briefly for its report
  void abandon_attempt();

  static void wifi_event_handler(void *arg, esp_event_base_t base,
                                 int32_t event_id, void *event_data);
  static void ip_event_handler(void *arg, esp_event_base_t base,
                               int32_t event_id, void *event_data);

  WifiConfig config_{};
  esp_netif_t *netif_ = nullptr;
  EventGroupHandle_t events_ = nullptr;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  AttemptTracker attempts_;

  core::EventSubscription wifi_sub_;
  core::EventSubscription ip_sub_;

  bool initialized_ = false;
};

} // namespace network
