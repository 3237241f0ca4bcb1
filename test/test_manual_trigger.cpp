/**
 * @file test_manual_trigger.cpp
 * @brief Post-boot window selecting a manual pass
 */

#include "fakes.hpp"

#include <control/manual_trigger.hpp>

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;

TEST(ManualTrigger, PressInsideWindowSelectsManualPass) {
  test::Harness h;
  h.time.on_delay = [&](std::chrono::milliseconds now) {
    if (now == 1200ms) {
      h.abort.request();
    }
  };

  EXPECT_TRUE(control::await_manual_request(h.ctx, 3000ms, 100ms));

  // Returns at the first poll after the press, with the request consumed
  EXPECT_EQ(h.time.now, 1200ms);
  EXPECT_FALSE(h.abort.requested());
}

TEST(ManualTrigger, NoPressRunsTheFullWindow) {
  test::Harness h;

  EXPECT_FALSE(control::await_manual_request(h.ctx, 3000ms, 100ms));

  EXPECT_EQ(h.time.now, 3000ms);
  EXPECT_EQ(h.time.delays, 30);
  EXPECT_LE(h.time.longest_unfed, 1000ms);
}

TEST(ManualTrigger, PressBeforeWindowIsDiscarded) {
  test::Harness h;
  h.abort.request();

  EXPECT_FALSE(control::await_manual_request(h.ctx, 500ms, 100ms));
  EXPECT_FALSE(h.abort.requested());
}

TEST(ManualTrigger, UnevenWindowEndsExactly) {
  test::Harness h;

  EXPECT_FALSE(control::await_manual_request(h.ctx, 250ms, 100ms));
  EXPECT_EQ(h.time.now, 250ms);
}

} // namespace
