/**
 * @file clock.hpp
 * @brief Wall clock advanced only by time synchronization
 *
 * Holds local civil time (fixed UTC offset already applied). Until the
 * first successful sync the clock reports a sentinel in 1900 so that
 * nothing downstream mistakes it for a real time.
 *
 * The log hook reads the clock from every task that logs while the main
 * task sets it, so the whole state is one atomic offset from the
 * monotonic source.
 */

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>

namespace core {

/// Broken-down civil time
struct CivilTime {
  int year{1900};
  int month{1};
  int day{1};
  int hour{12};
  int minute{0};
  int second{0};

  bool operator==(const CivilTime &) const = default;
};

/// "YYYY-MM-DD-HH-MM-SS" plus terminator
using Stamp = std::array<char, 20>;

/// Sentinel reported before the first sync
inline constexpr CivilTime UNSET_TIME{};

/// Any year before this is treated as "never synchronized"
inline constexpr int MIN_VALID_YEAR = 2000;

/// Convert seconds since 1970-01-01T00:00:00 to civil time
[[nodiscard]] CivilTime to_civil(int64_t epoch_seconds);

/// Format as YYYY-MM-DD-HH-MM-SS
[[nodiscard]] Stamp format_stamp(const CivilTime &time);

class Clock {
public:
  using Monotonic = std::function<std::chrono::milliseconds()>;

  /// Clock advancing with std::chrono::steady_clock
  Clock();

  /// Clock advancing with a caller-provided monotonic source
  explicit Clock(Monotonic monotonic);

  Clock(const Clock &) = delete;
  Clock &operator=(const Clock &) = delete;
  Clock(Clock &&) = delete;
  Clock &operator=(Clock &&) = delete;

  /// Commit a synchronized local time (seconds since 1970)
  void set(int64_t local_seconds);

  /// Return to the unset sentinel
  void reset();

  [[nodiscard]] bool is_set() const;

  /// Current local seconds since 1970, advanced from the last set().
  /// Zero while unset.
  [[nodiscard]] int64_t seconds() const;

  /// Current civil time, or UNSET_TIME before the first sync
  [[nodiscard]] CivilTime now() const;

  [[nodiscard]] Stamp stamp() const { return format_stamp(now()); }

private:
  static constexpr int64_t UNSET_OFFSET = std::numeric_limits<int64_t>::min();

  /// Local ms for one loaded offset
  [[nodiscard]] int64_t local_ms(int64_t offset) const;

  Monotonic monotonic_;
  /// Local ms minus monotonic ms, UNSET_OFFSET before a plausible set()
  std::atomic<int64_t> offset_ms_{UNSET_OFFSET};
};

} // namespace core
