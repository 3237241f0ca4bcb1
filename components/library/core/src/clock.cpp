/**
 * @file clock.cpp
 * @brief Wall clock and civil time formatting
 */

#include <core/clock.hpp>

#include <cstdio>
#include <utility>

namespace core {

CivilTime to_civil(int64_t epoch_seconds) {
  using namespace std::chrono;

  const sys_seconds point{seconds{epoch_seconds}};
  const auto day_point = floor<days>(point);
  const year_month_day date{day_point};
  const hh_mm_ss time_of_day{point - day_point};

  return {
      .year = static_cast<int>(date.year()),
      .month = static_cast<int>(static_cast<unsigned>(date.month())),
      .day = static_cast<int>(static_cast<unsigned>(date.day())),
      .hour = static_cast<int>(time_of_day.hours().count()),
      .minute = static_cast<int>(time_of_day.minutes().count()),
      .second = static_cast<int>(time_of_day.seconds().count()),
  };
}

Stamp format_stamp(const CivilTime &time) {
  Stamp out{};
  std::snprintf(out.data(), out.size(), "%04u-%02u-%02u-%02u-%02u-%02u",
                static_cast<unsigned>(time.year) % 10000U,
                static_cast<unsigned>(time.month) % 100U,
                static_cast<unsigned>(time.day) % 100U,
                static_cast<unsigned>(time.hour) % 100U,
                static_cast<unsigned>(time.minute) % 100U,
                static_cast<unsigned>(time.second) % 100U);
  return out;
}

Clock::Clock()
    : Clock([] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
      }) {}

Clock::Clock(Monotonic monotonic) : monotonic_(std::move(monotonic)) {}

void Clock::set(int64_t local_seconds) {
  if (to_civil(local_seconds).year < MIN_VALID_YEAR) {
    offset_ms_.store(UNSET_OFFSET);
    return;
  }
  offset_ms_.store(local_seconds * 1000 - monotonic_().count());
}

void Clock::reset() { offset_ms_.store(UNSET_OFFSET); }

bool Clock::is_set() const { return offset_ms_.load() != UNSET_OFFSET; }

int64_t Clock::local_ms(int64_t offset) const {
  return monotonic_().count() + offset;
}

int64_t Clock::seconds() const {
  auto offset = offset_ms_.load();
  if (offset == UNSET_OFFSET) {
    return 0;
  }
  auto ms = local_ms(offset);
  // Floor division; local time is never before 2000 here
  return ms / 1000;
}

CivilTime Clock::now() const {
  auto offset = offset_ms_.load();
  if (offset == UNSET_OFFSET) {
    return UNSET_TIME;
  }
  return to_civil(local_ms(offset) / 1000);
}

} // namespace core
