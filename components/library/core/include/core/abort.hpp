/**
 * @file abort.hpp
 * @brief External abort request shared between an ISR and the main task
 */

#pragma once

#include <atomic>

namespace core {

/// Abort flag raised from outside the pipeline (button ISR)
class AbortSignal {
public:
  /// Safe to call from ISR context
  void request() noexcept { requested_.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool requested() const noexcept {
    return requested_.load(std::memory_order_relaxed);
  }

  void clear() noexcept { requested_.store(false, std::memory_order_relaxed); }

private:
  std::atomic<bool> requested_{false};
};

} // namespace core
