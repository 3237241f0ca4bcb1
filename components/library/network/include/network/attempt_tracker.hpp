/**
 * @file attempt_tracker.hpp
 * @brief Tells a late disconnect of an abandoned attempt from a real failure
 *
 * Abandoning an association (timeout without an IP) disconnects the
 * driver, which reports it asynchronously on the event loop task. That
 * report can arrive after the next candidate has started. The tracker
 * lets the event handler drop it instead of failing the new attempt.
 */

#pragma once

#include <atomic>

namespace network {

class AttemptTracker {
public:
  /// The current attempt was given up; its own leave event is in flight
  void abandon() { leave_pending_.store(true); }

  /// Called from the event handler for every disconnect event.
  /// @param local_leave The event reports our own disconnect request
  /// @return true if the event fails the attempt in progress
  [[nodiscard]] bool on_disconnected(bool local_leave) {
    if (local_leave && leave_pending_.exchange(false)) {
      return false;
    }
    return true;
  }

  [[nodiscard]] bool leave_pending() const { return leave_pending_.load(); }

private:
  std::atomic<bool> leave_pending_{false};
};

} // namespace network
