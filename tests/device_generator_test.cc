// Device Generator Unit Tests
//
// Tests cover:
// - Device count (random and explicit)
// - Field ranges
// - Reproducibility with a fixed seed

#include "device_generator.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace bandwidth {
namespace {

using namespace std::chrono_literals;

class DeviceGeneratorTest : public ::testing::Test {
 protected:
  void SetUp() override { clock_.SetTime(FromUnixMillis(1'700'000'000'000)); }

  FakeClock clock_;
};

TEST_F(DeviceGeneratorTest, RandomCountWithinBounds) {
  for (uint64_t seed = 0; seed < 50; ++seed) {
    Mt19937RandomSource random(seed);
    auto devices = GenerateDevices(random, clock_);
    EXPECT_GE(devices.size(), kMinGeneratedDevices);
    EXPECT_LE(devices.size(), kMaxGeneratedDevices);
  }
}

TEST_F(DeviceGeneratorTest, ExplicitCount) {
  Mt19937RandomSource random(1);
  EXPECT_EQ(GenerateDevices(random, clock_, 3).size(), 3);
  EXPECT_TRUE(GenerateDevices(random, clock_, 0).empty());
}

TEST_F(DeviceGeneratorTest, FieldsWithinRanges) {
  Mt19937RandomSource random(2024);
  TimePoint now = clock_.Now();

  for (const auto& device : GenerateDevices(random, clock_, 64)) {
    EXPECT_NE(device.name.find(' '), std::string::npos) << device.name;
    EXPECT_GE(device.usage, 1.0);
    EXPECT_LE(device.usage, 1000.0);
    EXPECT_TRUE(IsValidPriority(device.priority));
    EXPECT_GE(device.signal_strength, 50.0);
    EXPECT_LE(device.signal_strength, 100.0);
    EXPECT_GE(device.data_transferred, 0.1);
    EXPECT_LE(device.data_transferred, 10.0);
    EXPECT_EQ(device.ip_address.rfind("192.168.1.", 0), 0);
    EXPECT_LE(device.connected_since, now - 1h);
    EXPECT_GE(device.connected_since, now - 24h);
  }
}

TEST_F(DeviceGeneratorTest, SameSeedSameNetwork) {
  Mt19937RandomSource first(77);
  Mt19937RandomSource second(77);

  auto a = GenerateDevices(first, clock_);
  auto b = GenerateDevices(second, clock_);

  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].name, b[i].name);
    EXPECT_DOUBLE_EQ(a[i].usage, b[i].usage);
    EXPECT_EQ(a[i].activity, b[i].activity);
    EXPECT_EQ(a[i].ip_address, b[i].ip_address);
  }
}

}  // namespace
}  // namespace bandwidth
