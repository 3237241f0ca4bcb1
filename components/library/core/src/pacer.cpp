/**
 * @file pacer.cpp
 * @brief Watchdog-aware waits
 */

#include <core/pacer.hpp>

#include <algorithm>

namespace core {

Pacer::Pacer(IDelay &delay, IWatchdog &watchdog,
             std::chrono::milliseconds max_slice)
    : delay_(delay), watchdog_(watchdog),
      max_slice_(max_slice.count() > 0 ? max_slice
                                       : pacer_defaults::MAX_SLICE) {}

void Pacer::wait(std::chrono::milliseconds duration) {
  watchdog_.feed();
  while (duration.count() > 0) {
    auto slice = std::min(duration, max_slice_);
    delay_.delay(slice);
    watchdog_.feed();
    duration -= slice;
  }
}

} // namespace core
