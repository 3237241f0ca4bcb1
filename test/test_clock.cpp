/**
 * @file test_clock.cpp
 * @brief Civil time conversion, clock sentinel and log stamps
 */

#include "fakes.hpp"

#include <core/clock.hpp>
#include <core/log_stamp.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

std::string text(const core::Stamp &stamp) { return stamp.data(); }

TEST(ToCivil, UnixEpoch) {
  EXPECT_EQ(core::to_civil(0), (core::CivilTime{1970, 1, 1, 0, 0, 0}));
}

TEST(ToCivil, KnownInstants) {
  EXPECT_EQ(core::to_civil(1577836800),
            (core::CivilTime{2020, 1, 1, 0, 0, 0}));
  EXPECT_EQ(core::to_civil(1744029588),
            (core::CivilTime{2025, 4, 7, 12, 39, 48}));
}

TEST(ToCivil, SecondBeforeEpoch) {
  EXPECT_EQ(core::to_civil(-1), (core::CivilTime{1969, 12, 31, 23, 59, 59}));
}

TEST(FormatStamp, ZeroPaddedDashSeparated) {
  EXPECT_EQ(text(core::format_stamp({2025, 4, 7, 12, 39, 48})),
            "2025-04-07-12-39-48");
  EXPECT_EQ(text(core::format_stamp(core::UNSET_TIME)), "1900-01-01-12-00-00");
}

TEST(Clock, UnsetUntilFirstSync) {
  test::Harness h;

  EXPECT_FALSE(h.clock.is_set());
  EXPECT_EQ(h.clock.now(), core::UNSET_TIME);
  EXPECT_LT(h.clock.now().year, core::MIN_VALID_YEAR);
}

TEST(Clock, AdvancesFromLastSet) {
  test::Harness h;

  h.clock.set(1577836800);
  EXPECT_TRUE(h.clock.is_set());
  EXPECT_EQ(text(h.clock.stamp()), "2020-01-01-00-00-00");

  h.pacer.wait(61s);
  EXPECT_EQ(text(h.clock.stamp()), "2020-01-01-00-01-01");
  EXPECT_EQ(h.clock.seconds(), 1577836861);
}

TEST(Clock, ImplausibleTimeStaysUnset) {
  test::Harness h;

  h.clock.set(0);

  EXPECT_FALSE(h.clock.is_set());
  EXPECT_EQ(h.clock.now(), core::UNSET_TIME);
}

TEST(Clock, ResetReturnsToSentinel) {
  test::Harness h;
  h.clock.set(1744029588);

  h.clock.reset();

  EXPECT_FALSE(h.clock.is_set());
  EXPECT_EQ(h.clock.now(), core::UNSET_TIME);
}

TEST(LogStamp, PlaceholderWhileUnset) {
  test::Harness h;

  EXPECT_EQ(text(core::log_stamp(h.clock)), "*******************");
  EXPECT_EQ(text(core::log_stamp(h.clock)).size(),
            text(core::format_stamp(core::UNSET_TIME)).size());
}

TEST(LogStamp, WallClockOnceSet) {
  test::Harness h;
  h.clock.set(1744029588);

  EXPECT_EQ(text(core::log_stamp(h.clock)), "2025-04-07-12-39-48");
}

TEST(LogStamp, ConcurrentSetAndResetNeverTearTheStamp) {
  // Fixed monotonic source so only set() and reset() move the clock
  core::Clock clock([] { return std::chrono::milliseconds{5000}; });
  const std::string early = "2020-01-01-00-00-00";
  const std::string late = "2025-04-07-12-39-48";
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> loggers;
  for (int i = 0; i < 4; ++i) {
    loggers.emplace_back([&] {
      while (!done.load()) {
        auto stamp = text(core::log_stamp(clock));
        if (stamp != core::UNSET_STAMP && stamp != early && stamp != late) {
          ++torn;
        }
        auto civil = text(clock.stamp());
        if (civil != text(core::format_stamp(core::UNSET_TIME)) &&
            civil != early && civil != late) {
          ++torn;
        }
      }
    });
  }

  for (int i = 0; i < 20000; ++i) {
    switch (i % 3) {
    case 0:
      clock.set(1577836800);
      break;
    case 1:
      clock.set(1744029588);
      break;
    default:
      clock.reset();
      break;
    }
  }
  done = true;
  for (auto &t : loggers) {
    t.join();
  }

  EXPECT_EQ(torn.load(), 0);
}

} // namespace
