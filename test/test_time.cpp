/**
 * @file test_time.cpp
 * @brief NTP decoding, HTTP time service and clock synchronization
 */

#include "fakes.hpp"

#include <network/http_time.hpp>
#include <network/ntp.hpp>
#include <network/time_sync.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace {

using namespace std::chrono_literals;
using ::testing::Return;
using ::testing::Throw;

network::ntp::Packet reply_with_transmit(uint32_t seconds) {
  network::ntp::Packet packet{};
  packet[0] = 0x24; // LI 0, VN 4, mode 4 (server)
  packet[40] = static_cast<uint8_t>(seconds >> 24U);
  packet[41] = static_cast<uint8_t>(seconds >> 16U);
  packet[42] = static_cast<uint8_t>(seconds >> 8U);
  packet[43] = static_cast<uint8_t>(seconds);
  return packet;
}

TEST(NtpRequest, ClientModeHeaderOnly) {
  constexpr auto request = network::ntp::make_request();

  EXPECT_EQ(request.size(), 48U);
  EXPECT_EQ(request[0], 0x23);
  for (size_t i = 1; i < request.size(); ++i) {
    EXPECT_EQ(request[i], 0) << "byte " << i;
  }
}

TEST(NtpParse, SubtractsNtpEraOffset) {
  auto packet = reply_with_transmit(0xE1B65F80U);

  auto unix_time = network::ntp::parse_unix_time(packet);

  ASSERT_TRUE(unix_time.ok());
  EXPECT_EQ(*unix_time, 1577836800);
}

TEST(NtpParse, DocumentedPacketThenFixedOffset) {
  auto packet = reply_with_transmit(0xEB9E8C64U);

  auto unix_time = network::ntp::parse_unix_time(packet);
  ASSERT_TRUE(unix_time.ok());
  EXPECT_EQ(*unix_time, 1744047588);

  auto local = *unix_time + network::time_sync_defaults::UTC_OFFSET.count();
  auto stamp = core::format_stamp(core::to_civil(local));
  EXPECT_EQ(std::string(stamp.data()), "2025-04-07-12-39-48");
}

TEST(NtpParse, ShortPacketRejected) {
  auto packet = reply_with_transmit(0xEB9E8C64U);

  auto unix_time =
      network::ntp::parse_unix_time(std::span(packet).first(44));

  EXPECT_EQ(unix_time.error(), ESP_ERR_INVALID_RESPONSE);
}

TEST(NtpParse, EmptyTransmitTimestampRejected) {
  auto packet = reply_with_transmit(0);

  EXPECT_EQ(network::ntp::parse_unix_time(packet).error(),
            ESP_ERR_INVALID_RESPONSE);
}

TEST(TimeApi, ParsesWorldTimeApiBody) {
  auto reply = network::parse_time_api(
      R"({"abbreviation":"UTC","datetime":"2025-04-07T17:39:48.123456+00:00",)"
      R"("raw_offset":0,"unixtime":1744047588,"utc_offset":"+00:00"})");

  ASSERT_TRUE(reply.ok());
  EXPECT_EQ(reply->unixtime, 1744047588);
  EXPECT_EQ(reply->datetime, "2025-04-07T17:39:48.123456+00:00");
  EXPECT_EQ(reply->raw_offset, 0);
}

TEST(TimeApi, ToleratesWhitespaceAndNegativeOffset) {
  auto reply = network::parse_time_api(
      "{ \"unixtime\" : 1744047588 , \"raw_offset\": -18000 }");

  ASSERT_TRUE(reply.ok());
  EXPECT_EQ(reply->unixtime, 1744047588);
  EXPECT_EQ(reply->raw_offset, -18000);
}

TEST(TimeApi, MissingOrNonNumericUnixtimeRejected) {
  EXPECT_EQ(network::parse_time_api(R"({"datetime":"x"})").error(),
            ESP_ERR_INVALID_RESPONSE);
  EXPECT_EQ(network::parse_time_api(R"({"unixtime":"soon"})").error(),
            ESP_ERR_INVALID_RESPONSE);
  EXPECT_EQ(network::parse_time_api("").error(), ESP_ERR_INVALID_RESPONSE);
}

TEST(HttpTimeSource, GetsConfiguredUrl) {
  test::FakeTransport transport;
  transport.handler = [](const test::SentRequest &) {
    return transport::Response(std::string_view{R"({"unixtime":1744047588})"},
                               200);
  };
  network::HttpTimeSource source(transport, "http://time.example/utc");

  auto unix_time = source.fetch_unix_time();

  ASSERT_TRUE(unix_time.ok());
  EXPECT_EQ(*unix_time, 1744047588);
  ASSERT_EQ(transport.sent().size(), 1U);
  EXPECT_EQ(transport.sent()[0].method, transport::HttpMethod::Get);
  EXPECT_EQ(transport.sent()[0].url, "http://time.example/utc");
}

TEST(HttpTimeSource, ErrorStatusRejected) {
  test::FakeTransport transport;
  transport.handler = [](const test::SentRequest &) {
    return transport::Response(std::string_view{"busy"}, 503);
  };
  network::HttpTimeSource source(transport, "http://time.example/utc");

  EXPECT_EQ(source.fetch_unix_time().error(), ESP_ERR_INVALID_RESPONSE);
}

TEST(HttpTimeSource, TransportErrorPropagates) {
  test::FakeTransport transport;
  transport.handler =
      [](const test::SentRequest &) -> core::Result<transport::Response> {
    return core::Err(ESP_ERR_TIMEOUT);
  };
  network::HttpTimeSource source(transport, "http://time.example/utc");

  EXPECT_EQ(source.fetch_unix_time().error(), ESP_ERR_TIMEOUT);
}

class TimeSyncTest : public ::testing::Test {
protected:
  test::Harness h;
  test::MockTimeSource source;
};

TEST_F(TimeSyncTest, RetriesUntilTheSourceAnswers) {
  EXPECT_CALL(source, fetch_unix_time())
      .WillOnce(Return(core::Result<int64_t>(core::Err(ESP_ERR_TIMEOUT))))
      .WillOnce(
          Return(core::Result<int64_t>(core::Err(ESP_ERR_INVALID_RESPONSE))))
      .WillOnce(Return(core::Result<int64_t>(int64_t{1744047588})));
  h.clock_frozen = true;
  network::TimeSync sync(source, h.ctx);

  EXPECT_TRUE(sync.sync().ok());

  EXPECT_TRUE(h.clock.is_set());
  EXPECT_EQ(std::string(h.clock.stamp().data()), "2025-04-07-12-39-48");
  EXPECT_EQ(h.led.transitions,
            3 * test::transitions_for(core::StatusSignal::SyncingTime));
}

TEST_F(TimeSyncTest, ClockUntouchedWhenBoundedPolicyRunsOut) {
  EXPECT_CALL(source, fetch_unix_time())
      .Times(2)
      .WillRepeatedly(Return(core::Result<int64_t>(core::Err(ESP_FAIL))));
  network::TimeSync sync(
      source, h.ctx, {.retry = {.max_attempts = 2, .interval = 0ms}});

  EXPECT_EQ(sync.sync().error(), ESP_ERR_TIMEOUT);
  EXPECT_FALSE(h.clock.is_set());
}

TEST_F(TimeSyncTest, AppliesConfiguredOffset) {
  EXPECT_CALL(source, fetch_unix_time())
      .WillOnce(Return(core::Result<int64_t>(int64_t{1577836800})));
  h.clock_frozen = true;
  network::TimeSync sync(source, h.ctx, {.utc_offset = 0s});

  ASSERT_TRUE(sync.sync().ok());

  EXPECT_EQ(std::string(h.clock.stamp().data()), "2020-01-01-00-00-00");
}

TEST_F(TimeSyncTest, AbortBeforeSyncSkipsTheExchange) {
  EXPECT_CALL(source, fetch_unix_time()).Times(0);
  h.abort.request();
  network::TimeSync sync(source, h.ctx);

  EXPECT_EQ(sync.sync().error(), ESP_ERR_NOT_FINISHED);
  EXPECT_FALSE(h.clock.is_set());
}

} // namespace
