/**
 * @file fakes.hpp
 * @brief Host doubles for every hardware seam
 */

#pragma once

#include <core/abort.hpp>
#include <core/clock.hpp>
#include <core/config.hpp>
#include <core/device_context.hpp>
#include <core/io.hpp>
#include <core/pacer.hpp>
#include <core/status.hpp>
#include <network/radio.hpp>
#include <network/time_source.hpp>
#include <sensor/probe.hpp>
#include <transport/transport.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace test {

using namespace std::chrono_literals;

/// LED that counts level changes
class FakeLine final : public core::IOutputLine {
public:
  void set(bool level) override {
    if (level != level_) {
      ++transitions;
    }
    level_ = level;
  }
  [[nodiscard]] bool get() const override { return level_; }

  int transitions{0};

private:
  bool level_{false};
};

/// Simulated time: delays advance it, feeds are checked against it
class FakeTime final : public core::IDelay, public core::IWatchdog {
public:
  void delay(std::chrono::milliseconds duration) override {
    now += duration;
    longest_unfed = std::max(longest_unfed, now - last_feed);
    ++delays;
    if (on_delay) {
      on_delay(now);
    }
  }

  void feed() override {
    ++feeds;
    last_feed = now;
  }

  std::chrono::milliseconds now{0};
  std::chrono::milliseconds last_feed{0};
  std::chrono::milliseconds longest_unfed{0};
  int delays{0};
  int feeds{0};
  std::function<void(std::chrono::milliseconds)> on_delay;
};

class FakeReset final : public core::IReset {
public:
  void restart() override { ++restarts; }

  int restarts{0};
};

/// Device singletons wired the way the firmware wires them
struct Harness {
  FakeLine led;
  FakeTime time;
  core::Pacer pacer{time, time};
  core::StatusIndicator status{led, pacer};
  bool clock_frozen{false};
  core::Clock clock{[this] { return clock_frozen ? 0ms : time.now; }};
  core::AbortSignal abort;
  core::DeviceContext ctx{clock, status, pacer, abort};
};

/// Blinks for a signal as LED transitions (two per blink)
[[nodiscard]] inline int transitions_for(core::StatusSignal signal) {
  return 2 * core::blink_count(signal);
}

class MapConfig final : public core::IConfigSource {
public:
  MapConfig() = default;
  MapConfig(std::initializer_list<std::pair<const std::string, std::string>>
                values)
      : values_(values) {}

  void set(const std::string &key, const std::string &value) {
    values_[key] = value;
  }
  void erase(const std::string &key) { values_.erase(key); }

  [[nodiscard]] std::optional<std::string>
  get(std::string_view key) const override {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  }

private:
  std::map<std::string, std::string, std::less<>> values_;
};

class MockRadio : public network::IRadio {
public:
  MOCK_METHOD(bool, is_connected, (), (const, override));
  MOCK_METHOD(core::Status, connect, (const network::WifiCandidate &),
              (override));
};

class MockTimeSource : public network::ITimeSource {
public:
  MOCK_METHOD(core::Result<int64_t>, fetch_unix_time, (), (override));
  [[nodiscard]] const char *name() const override { return "mock"; }
};

/// Observable state of one fake thermometer
struct ProbeState {
  float celsius{21.5F};
  esp_err_t error{ESP_OK};
  int reads{0};
};

class FakeProbe final : public sensor::ITemperatureProbe {
public:
  explicit FakeProbe(std::shared_ptr<ProbeState> state)
      : state_(std::move(state)) {}

  [[nodiscard]] core::Result<float> read_celsius() override {
    ++state_->reads;
    if (state_->error != ESP_OK) {
      return core::Err(state_->error);
    }
    return state_->celsius;
  }

  [[nodiscard]] std::string describe() const override { return "fake"; }

private:
  std::shared_ptr<ProbeState> state_;
};

/// Bus factory with a device map; pins without a device scan empty
class FakeBusFactory final : public sensor::IBusFactory {
public:
  std::shared_ptr<ProbeState> attach(sensor::PinId pin, float celsius = 21.5F) {
    auto state = std::make_shared<ProbeState>();
    state->celsius = celsius;
    devices[pin] = state;
    return state;
  }

  [[nodiscard]] core::Result<sensor::ProbePtr>
  probe(sensor::PinId pin) override {
    probed.push_back(pin);
    auto it = devices.find(pin);
    if (it == devices.end()) {
      return core::Err(ESP_ERR_NOT_FOUND);
    }
    return sensor::ProbePtr{std::make_unique<FakeProbe>(it->second)};
  }

  std::map<sensor::PinId, std::shared_ptr<ProbeState>> devices;
  std::vector<sensor::PinId> probed;
};

class FakePinDriver final : public sensor::IPinDriver {
public:
  [[nodiscard]] core::Status drive_high(sensor::PinId pin) override {
    if (error != ESP_OK) {
      return core::Err(error);
    }
    high.push_back(pin);
    return core::Ok();
  }

  std::vector<sensor::PinId> high;
  esp_err_t error{ESP_OK};
};

/// Owning copy of a request seen by FakeTransport
struct SentRequest {
  transport::HttpMethod method{transport::HttpMethod::Get};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  transport::ContentType content_type{transport::ContentType::None};

  [[nodiscard]] std::string header(std::string_view name) const {
    for (const auto &[key, value] : headers) {
      if (key == name) {
        return value;
      }
    }
    return {};
  }
};

class FakeTransport final : public transport::ITransport {
public:
  using Handler =
      std::function<core::Result<transport::Response>(const SentRequest &)>;

  [[nodiscard]] core::Result<transport::Response>
  send(const transport::Request &request) override {
    SentRequest sent{
        .method = request.method,
        .url = std::string(request.url),
        .headers = {},
        .body = std::string(request.body),
        .content_type = request.content_type,
    };
    for (const auto &header : request.headers) {
      sent.headers.emplace_back(header.name, header.value);
    }
    sent_.push_back(sent);

    if (handler) {
      return handler(sent);
    }
    return transport::Response(std::string_view{}, 200);
  }

  [[nodiscard]] const std::vector<SentRequest> &sent() const { return sent_; }

  [[nodiscard]] size_t count(transport::HttpMethod method) const {
    return static_cast<size_t>(
        std::count_if(sent_.begin(), sent_.end(),
                      [&](const SentRequest &r) { return r.method == method; }));
  }

  Handler handler;

private:
  std::vector<SentRequest> sent_;
};

} // namespace test
