/**
 * @file test_config.cpp
 * @brief Configuration string parsing
 */

#include <core/config.hpp>
#include <network/connectivity.hpp>
#include <sensor/descriptor.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(Trim, StripsSurroundingWhitespace) {
  EXPECT_EQ(core::trim("  a b \t\r\n"), "a b");
  EXPECT_EQ(core::trim(" \n "), "");
  EXPECT_EQ(core::trim(""), "");
}

TEST(ParseRecords, SplitsRecordsAndFields) {
  auto records = core::parse_records("a,b;c,d", 2);

  ASSERT_TRUE(records.ok());
  EXPECT_THAT(*records, ElementsAre(ElementsAre("a", "b"),
                                    ElementsAre("c", "d")));
}

TEST(ParseRecords, TrimsFieldsAndDropsTrailingSeparator) {
  auto records = core::parse_records(" a , b ;\n c,d ; ", 2);

  ASSERT_TRUE(records.ok());
  EXPECT_THAT(*records, ElementsAre(ElementsAre("a", "b"),
                                    ElementsAre("c", "d")));
}

TEST(ParseRecords, EmptyInputIsInvalid) {
  EXPECT_EQ(core::parse_records("", 2).error(), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(core::parse_records("  ", 2).error(), ESP_ERR_INVALID_ARG);
}

TEST(ParseRecords, WrongFieldCountIsInvalid) {
  EXPECT_EQ(core::parse_records("a,b,c", 2).error(), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(core::parse_records("a,b;c", 2).error(), ESP_ERR_INVALID_ARG);
}

TEST(ParseRecords, EmptyRecordInsideListIsInvalid) {
  EXPECT_EQ(core::parse_records("a,b;;c,d", 2).error(), ESP_ERR_INVALID_ARG);
}

TEST(ParseList, SkipsEmptyItems) {
  EXPECT_THAT(core::parse_list(" GPIO1, GPIO2,,"),
              ElementsAre("GPIO1", "GPIO2"));
  EXPECT_THAT(core::parse_list(""), IsEmpty());
}

TEST(WifiCandidates, ParsedInOrder) {
  auto candidates =
      network::parse_wifi_candidates("home,HomeNet,pw1;cafe,CafeOpen,");

  ASSERT_TRUE(candidates.ok());
  ASSERT_EQ(candidates->size(), 2U);
  EXPECT_EQ((*candidates)[0].name, "home");
  EXPECT_EQ((*candidates)[0].ssid, "HomeNet");
  EXPECT_EQ((*candidates)[0].secret, "pw1");
  EXPECT_EQ((*candidates)[1].ssid, "CafeOpen");
  EXPECT_EQ((*candidates)[1].secret, "");
}

TEST(WifiCandidates, EmptyOrMalformedListIsInvalid) {
  EXPECT_EQ(network::parse_wifi_candidates("").error(), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(network::parse_wifi_candidates("home,HomeNet").error(),
            ESP_ERR_INVALID_ARG);
  EXPECT_EQ(network::parse_wifi_candidates("home,,pw").error(),
            ESP_ERR_INVALID_ARG);
}

TEST(WifiCandidates, OverlongSsidIsInvalid) {
  std::string setting = "home," + std::string(33, 's') + ",pw";

  EXPECT_EQ(network::parse_wifi_candidates(setting).error(),
            ESP_ERR_INVALID_ARG);
}

TEST(SensorDescriptors, ParsedInOrder) {
  auto descriptors =
      sensor::parse_sensor_descriptors("Pantry,GPIO4; Garage , GPIO5");

  ASSERT_TRUE(descriptors.ok());
  ASSERT_EQ(descriptors->size(), 2U);
  EXPECT_EQ((*descriptors)[0].logical_id, "Pantry");
  EXPECT_EQ((*descriptors)[0].port_name, "GPIO4");
  EXPECT_EQ((*descriptors)[1].logical_id, "Garage");
  EXPECT_EQ((*descriptors)[1].port_name, "GPIO5");
}

TEST(SensorDescriptors, DuplicateIdIsInvalid) {
  EXPECT_EQ(
      sensor::parse_sensor_descriptors("Pantry,GPIO4;Pantry,GPIO5").error(),
      ESP_ERR_INVALID_ARG);
}

TEST(SensorDescriptors, EmptyFieldIsInvalid) {
  EXPECT_EQ(sensor::parse_sensor_descriptors("Pantry,").error(),
            ESP_ERR_INVALID_ARG);
  EXPECT_EQ(sensor::parse_sensor_descriptors(",GPIO4").error(),
            ESP_ERR_INVALID_ARG);
}

} // namespace
