/**
 * @file event_loop.hpp
 * @brief ESP-IDF default event loop with RAII handler registrations
 *
 * Events here come from ESP-IDF itself (Wi-Fi, IP); the firmware never
 * posts its own.
 */

#pragma once

#include "result.hpp"

#include <esp_event.h>

#include <cstdint>
#include <type_traits>

namespace core {

/// Valid event ID types (enum or integral)
template <typename T>
concept EventId = std::is_enum_v<T> || std::is_integral_v<T>;

/// Registered handler, unregistered on destruction
class EventSubscription {
public:
  EventSubscription() = default;

  EventSubscription(esp_event_base_t base, int32_t event_id,
                    esp_event_handler_instance_t instance)
      : base_(base), id_(event_id), instance_(instance) {}

  ~EventSubscription() { reset(); }

  EventSubscription(const EventSubscription &) = delete;
  EventSubscription &operator=(const EventSubscription &) = delete;

  EventSubscription(EventSubscription &&other) noexcept
      : base_(other.base_), id_(other.id_), instance_(other.instance_) {
    other.instance_ = nullptr;
  }

  EventSubscription &operator=(EventSubscription &&other) noexcept {
    if (this != &other) {
      reset();
      base_ = other.base_;
      id_ = other.id_;
      instance_ = other.instance_;
      other.instance_ = nullptr;
    }
    return *this;
  }

  void reset() {
    if (instance_ != nullptr) {
      esp_event_handler_instance_unregister(base_, id_, instance_);
      instance_ = nullptr;
    }
  }

  [[nodiscard]] explicit operator bool() const { return instance_ != nullptr; }

private:
  esp_event_base_t base_ = nullptr;
  int32_t id_ = 0;
  esp_event_handler_instance_t instance_ = nullptr;
};

namespace event_loop {

/// Create the default loop; a loop that already exists is fine
[[nodiscard]] inline Status init() {
  esp_err_t err = esp_event_loop_create_default();
  if (err == ESP_OK || err == ESP_ERR_INVALID_STATE) {
    return Ok();
  }
  return Err(err);
}

/// Register handler on the default loop
template <EventId Evt>
[[nodiscard]] Result<EventSubscription>
subscribe(esp_event_base_t base, Evt event_id, esp_event_handler_t handler,
          void *arg = nullptr) {
  esp_event_handler_instance_t inst = nullptr;
  esp_err_t err = esp_event_handler_instance_register(
      base, static_cast<int32_t>(event_id), handler, arg, &inst);
  if (err != ESP_OK) {
    return Err(err);
  }
  return EventSubscription{base, static_cast<int32_t>(event_id), inst};
}

} // namespace event_loop

} // namespace core
