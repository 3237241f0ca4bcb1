/**
 * @file test_onewire.cpp
 * @brief ROM codes, SEARCH ROM and DS18x20 transactions over simulated buses
 */

#include "fakes.hpp"

#include <onewire/ds18x20.hpp>
#include <onewire/interface.hpp>
#include <onewire/types.hpp>

#include <core/crc.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <deque>
#include <vector>

namespace {

using namespace std::chrono_literals;
using namespace driver::onewire;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

constexpr RomCode ROM_A{{0x28, 0xaa, 0x01, 0x02, 0x03, 0x04, 0x05, 0xa7}};
constexpr RomCode ROM_B{{0x28, 0xaa, 0x01, 0x02, 0x03, 0x04, 0x06, 0x45}};
constexpr RomCode ROM_C{{0x10, 0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xfb}};

using Scratchpad = std::array<uint8_t, SCRATCHPAD_SIZE>;

// 25.0625 C on a DS18B20
constexpr Scratchpad SCRATCHPAD_25{0x91, 0x01, 0x4b, 0x46, 0x7f,
                                   0xff, 0x0f, 0x10, 0x25};

/// Devices answering SEARCH ROM with wired-AND semantics
class SimBus final : public IBus {
public:
  explicit SimBus(std::vector<RomCode> devices)
      : devices_(std::move(devices)) {}

  bool reset() override {
    active_.assign(devices_.size(), true);
    command_bits_ = 0;
    command_ = 0;
    searching_ = false;
    bit_ = 0;
    phase_ = 0;
    ++resets;
    return !devices_.empty();
  }

  void write_bit(bool value) override {
    if (!searching_) {
      if (value) {
        command_ = static_cast<uint8_t>(command_ | (1U << command_bits_));
      }
      if (++command_bits_ == 8) {
        searching_ = command_ == rom_cmd::SEARCH;
      }
      return;
    }
    // Direction bit: devices that disagree drop out
    for (size_t i = 0; i < devices_.size(); ++i) {
      if (active_[i] && devices_[i].get_bit(bit_) != value) {
        active_[i] = false;
      }
    }
    ++bit_;
    phase_ = 0;
  }

  bool read_bit() override {
    bool want_complement = phase_++ == 1;
    bool line = true;
    for (size_t i = 0; i < devices_.size(); ++i) {
      if (active_[i]) {
        bool bit = devices_[i].get_bit(bit_);
        line = line && (want_complement ? !bit : bit);
      }
    }
    return line;
  }

  int resets{0};

private:
  std::vector<RomCode> devices_;
  std::vector<bool> active_;
  uint8_t command_{0};
  int command_bits_{0};
  bool searching_{false};
  size_t bit_{0};
  int phase_{0};
};

/// Byte-level script: records writes, replays a scratchpad
class ScriptBus final : public IBus {
public:
  bool reset() override {
    ++resets;
    return present;
  }
  void write_bit(bool) override {}
  bool read_bit() override { return true; }

  void write_byte(uint8_t byte) override { written.push_back(byte); }

  uint8_t read_byte() override {
    if (reply.empty()) {
      return 0xff;
    }
    uint8_t byte = reply.front();
    reply.pop_front();
    return byte;
  }

  bool present{true};
  int resets{0};
  std::vector<uint8_t> written;
  std::deque<uint8_t> reply;
};

Scratchpad with_crc(Scratchpad pad) {
  pad[8] = core::Crc8::compute(std::span(pad).first(8));
  return pad;
}

TEST(RomCode, HexInTransmissionOrder) {
  constexpr RomCode rom{{0x28, 0xff, 0x64, 0x1e, 0x0f, 0x00, 0x00, 0x34}};

  EXPECT_EQ(rom.to_string(), "28ff641e0f000034");
  EXPECT_EQ(rom.family_code(), family::DS18B20);
  EXPECT_TRUE(rom.crc_valid());
}

TEST(RomCode, CorruptedCrcDetected) {
  RomCode rom = ROM_A;
  rom.bytes[3] ^= 0x10;

  EXPECT_FALSE(rom.crc_valid());
}

TEST(RomCode, BitAccessIsLsbFirstPerByte) {
  RomCode rom;
  rom.set_bit(0, true);
  rom.set_bit(9, true);

  EXPECT_EQ(rom.bytes[0], 0x01);
  EXPECT_EQ(rom.bytes[1], 0x02);
  EXPECT_TRUE(rom.get_bit(9));
  rom.set_bit(9, false);
  EXPECT_EQ(rom.bytes[1], 0x00);
}

TEST(RomCode, ThermometerFamilies) {
  EXPECT_TRUE(is_thermometer(0x28));
  EXPECT_TRUE(is_thermometer(0x22));
  EXPECT_TRUE(is_thermometer(0x10));
  EXPECT_FALSE(is_thermometer(0x01));
  EXPECT_FALSE(is_thermometer(0x3b));
}

TEST(Scratchpad, Ds18b20Resolution) {
  auto celsius = decode_scratchpad(family::DS18B20, SCRATCHPAD_25);

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, 25.0625F);
}

TEST(Scratchpad, NegativeTemperature) {
  constexpr Scratchpad pad{0x5e, 0xff, 0x4b, 0x46, 0x7f,
                           0xff, 0x02, 0x10, 0xb6};

  auto celsius = decode_scratchpad(family::DS18B20, pad);

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, -10.125F);
}

TEST(Scratchpad, PowerOnValueDecodesAsIs) {
  constexpr Scratchpad pad{0x50, 0x05, 0x4b, 0x46, 0x7f,
                           0xff, 0x0c, 0x10, 0x1c};

  auto celsius = decode_scratchpad(family::DS1822, pad);

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, 85.0F);
}

TEST(Scratchpad, Ds18s20ExtendedResolution) {
  constexpr Scratchpad pad{0x32, 0x00, 0x4b, 0x46, 0xff,
                           0xff, 0x0c, 0x10, 0x6b};

  auto celsius = decode_scratchpad(family::DS18S20, pad);

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, 25.0F);
}

TEST(Scratchpad, Ds18s20WithoutCountPerDegree) {
  auto pad = with_crc({0x33, 0x00, 0x4b, 0x46, 0xff, 0xff, 0x0c, 0x00, 0x00});

  auto celsius = decode_scratchpad(family::DS18S20, pad);

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, 25.5F);
}

TEST(Scratchpad, Rejections) {
  Scratchpad zeros{};
  Scratchpad corrupt = SCRATCHPAD_25;
  corrupt[0] ^= 0x01;

  EXPECT_EQ(decode_scratchpad(family::DS18B20,
                              std::span(SCRATCHPAD_25).first(8))
                .error(),
            ESP_ERR_INVALID_SIZE);
  EXPECT_EQ(decode_scratchpad(family::DS18B20, zeros).error(),
            ESP_ERR_INVALID_RESPONSE);
  EXPECT_EQ(decode_scratchpad(family::DS18B20, corrupt).error(),
            ESP_ERR_INVALID_CRC);
  EXPECT_EQ(decode_scratchpad(0x01, SCRATCHPAD_25).error(),
            ESP_ERR_NOT_SUPPORTED);
}

TEST(Search, EnumeratesEveryDevice) {
  SimBus bus({ROM_A, ROM_B, ROM_C});

  auto roms = search(bus, 8);

  ASSERT_TRUE(roms.ok());
  EXPECT_THAT(*roms, UnorderedElementsAre(ROM_A, ROM_B, ROM_C));
  EXPECT_EQ(bus.resets, 3);
}

TEST(Search, SingleDevice) {
  SimBus bus({ROM_B});

  auto roms = search(bus, 8);

  ASSERT_TRUE(roms.ok());
  EXPECT_THAT(*roms, ElementsAre(ROM_B));
}

TEST(Search, SilentBusIsEmptyNotAnError) {
  SimBus bus({});

  auto roms = search(bus, 8);

  ASSERT_TRUE(roms.ok());
  EXPECT_THAT(*roms, IsEmpty());
}

TEST(Search, StopsAtMaxDevices) {
  SimBus bus({ROM_A, ROM_B, ROM_C});

  auto roms = search(bus, 1);

  ASSERT_TRUE(roms.ok());
  EXPECT_EQ(roms->size(), 1U);
}

TEST(Search, CorruptedRomRejected) {
  RomCode bad = ROM_A;
  bad.bytes[7] ^= 0xff;
  SimBus bus({bad});

  EXPECT_EQ(search(bus, 8).error(), ESP_ERR_INVALID_CRC);
}

class Ds18x20Test : public ::testing::Test {
protected:
  void SetUp() override {
    auto owned = std::make_unique<ScriptBus>();
    bus = owned.get();
    probe = std::make_unique<Ds18x20>(std::move(owned), ROM_A, h.pacer);
  }

  test::Harness h;
  ScriptBus *bus{nullptr};
  std::unique_ptr<Ds18x20> probe;
};

TEST_F(Ds18x20Test, ConvertsThenReadsAddressedDevice) {
  bus->reply.assign(SCRATCHPAD_25.begin(), SCRATCHPAD_25.end());

  auto celsius = probe->read_celsius();

  ASSERT_TRUE(celsius.ok());
  EXPECT_FLOAT_EQ(*celsius, 25.0625F);

  std::vector<uint8_t> expected;
  for (uint8_t command : {function_cmd::CONVERT_T,
                          function_cmd::READ_SCRATCHPAD}) {
    expected.push_back(rom_cmd::MATCH);
    expected.insert(expected.end(), ROM_A.bytes.begin(), ROM_A.bytes.end());
    expected.push_back(command);
  }
  EXPECT_THAT(bus->written, ElementsAreArray(expected));
  EXPECT_EQ(bus->resets, 2);
  EXPECT_EQ(h.time.now, CONVERSION_TIME);
  EXPECT_LE(h.time.longest_unfed, 1000ms);
}

TEST_F(Ds18x20Test, MissingPresenceIsNotFound) {
  bus->present = false;

  EXPECT_EQ(probe->read_celsius().error(), ESP_ERR_NOT_FOUND);
  EXPECT_THAT(bus->written, IsEmpty());
}

TEST_F(Ds18x20Test, FloatingLineFailsCrc) {
  // Nothing queued: every byte reads back as 0xff
  EXPECT_EQ(probe->read_celsius().error(), ESP_ERR_INVALID_CRC);
}

TEST_F(Ds18x20Test, DescribesItselfByRom) {
  EXPECT_EQ(probe->describe(), "28aa0102030405a7");
}

} // namespace
