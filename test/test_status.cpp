/**
 * @file test_status.cpp
 * @brief LED protocol, rest patterns and watchdog pacing
 */

#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;
using core::StatusSignal;

TEST(BlinkCount, FieldProtocolCodes) {
  EXPECT_EQ(core::blink_count(StatusSignal::ConnectingWifi), 2);
  EXPECT_EQ(core::blink_count(StatusSignal::SyncingTime), 3);
  EXPECT_EQ(core::blink_count(StatusSignal::Reporting), 4);
  EXPECT_EQ(core::blink_count(StatusSignal::ReportComplete), 5);
  EXPECT_EQ(core::blink_count(StatusSignal::Boot), 0);
}

struct SignalCase {
  StatusSignal signal;
  int transitions;
  std::chrono::milliseconds duration;
};

class StatusSignalTest : public ::testing::TestWithParam<SignalCase> {};

TEST_P(StatusSignalTest, BlinksThenPausesAndEndsDark) {
  test::Harness h;
  const auto &param = GetParam();

  h.status.signal(param.signal);

  EXPECT_EQ(h.led.transitions, param.transitions);
  EXPECT_EQ(h.time.now, param.duration);
  EXPECT_FALSE(h.led.get());
}

INSTANTIATE_TEST_SUITE_P(
    Signals, StatusSignalTest,
    ::testing::Values(SignalCase{StatusSignal::ConnectingWifi, 4, 1800ms},
                      SignalCase{StatusSignal::SyncingTime, 6, 2200ms},
                      SignalCase{StatusSignal::Reporting, 8, 2600ms},
                      SignalCase{StatusSignal::ReportComplete, 10, 3000ms},
                      SignalCase{StatusSignal::Boot, 10, 500ms}));

TEST(StatusIndicator, SignalStartsFromDarkWhenLedWasLit) {
  test::Harness h;
  h.led.set(true);
  h.led.transitions = 0;

  h.status.signal(StatusSignal::ConnectingWifi);

  // One transition to switch off, then two per blink
  EXPECT_EQ(h.led.transitions, 5);
  EXPECT_FALSE(h.led.get());
}

TEST(StatusIndicator, HeartbeatTogglesEveryTwoSecondsForFortyMinutes) {
  test::Harness h;

  h.status.heartbeat(40min);

  EXPECT_EQ(h.time.now, 40min);
  EXPECT_EQ(h.led.transitions, 1200);
  EXPECT_FALSE(h.led.get());
  EXPECT_LE(h.time.longest_unfed, 1000ms);
}

TEST(StatusIndicator, AlarmRepeatsRapidBurstsForTenMinutes) {
  test::Harness h;

  h.status.alarm(10min);

  // 20 toggles at 100 ms plus a 1 s pause per burst
  EXPECT_EQ(h.time.now, 10min);
  EXPECT_EQ(h.led.transitions, 200 * 20);
  EXPECT_FALSE(h.led.get());
  EXPECT_LE(h.time.longest_unfed, 1000ms);
}

TEST(Pacer, SlicesLongWaitsAndFeedsAfterEachSlice) {
  test::FakeTime time;
  core::Pacer pacer(time, time, 1000ms);

  pacer.wait(2500ms);

  EXPECT_EQ(time.now, 2500ms);
  EXPECT_EQ(time.delays, 3);
  EXPECT_EQ(time.feeds, 4);
  EXPECT_EQ(time.last_feed, 2500ms);
  EXPECT_LE(time.longest_unfed, 1000ms);
}

TEST(Pacer, ZeroWaitStillFeeds) {
  test::FakeTime time;
  core::Pacer pacer(time, time);

  pacer.wait(0ms);

  EXPECT_EQ(time.delays, 0);
  EXPECT_EQ(time.feeds, 1);
}

TEST(Pacer, NonPositiveSliceFallsBackToDefault) {
  test::FakeTime time;
  core::Pacer pacer(time, time, 0ms);

  EXPECT_EQ(pacer.max_slice(), core::pacer_defaults::MAX_SLICE);
}

} // namespace
