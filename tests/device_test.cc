// Device Unit Tests
//
// Tests cover:
// - Activity names and parsing
// - Range clamps for usage and signal strength
// - Monotonic data transferred counter

#include "device.h"

#include <gtest/gtest.h>

namespace bandwidth {
namespace {

TEST(DeviceTest, ActivityNamesParseBack) {
  for (Activity activity : kAllActivities) {
    auto parsed = ParseActivity(ActivityName(activity));
    ASSERT_TRUE(parsed.has_value()) << ActivityName(activity);
    EXPECT_EQ(*parsed, activity);
  }
}

TEST(DeviceTest, ActivityDisplayNames) {
  EXPECT_STREQ(ActivityName(Activity::kVideoCall), "Video Call");
  EXPECT_STREQ(ActivityName(Activity::kIoTCommunication), "IoT Communication");
  EXPECT_STREQ(ActivityName(Activity::kWebBrowsing), "Web Browsing");
}

TEST(DeviceTest, ParseUnknownActivityFails) {
  EXPECT_FALSE(ParseActivity("").has_value());
  EXPECT_FALSE(ParseActivity("VideoCall").has_value());
  EXPECT_FALSE(ParseActivity("gaming").has_value());
}

TEST(DeviceTest, ValidPriorities) {
  EXPECT_FALSE(IsValidPriority(0));
  EXPECT_TRUE(IsValidPriority(1));
  EXPECT_TRUE(IsValidPriority(2));
  EXPECT_TRUE(IsValidPriority(3));
  EXPECT_FALSE(IsValidPriority(4));
}

TEST(DeviceTest, ClampUsage) {
  EXPECT_DOUBLE_EQ(ClampUsage(-10.0), 0.0);
  EXPECT_DOUBLE_EQ(ClampUsage(500.0), 500.0);
  EXPECT_DOUBLE_EQ(ClampUsage(1000.5), 1000.0);
}

TEST(DeviceTest, ClampSignalStrength) {
  EXPECT_DOUBLE_EQ(ClampSignalStrength(12.0), 50.0);
  EXPECT_DOUBLE_EQ(ClampSignalStrength(75.5), 75.5);
  EXPECT_DOUBLE_EQ(ClampSignalStrength(104.0), 100.0);
}

TEST(DeviceTest, DataTransferredNeverDecreases) {
  Device device;
  device.data_transferred = 1.5;

  AddDataTransferred(&device, 0.25);
  EXPECT_DOUBLE_EQ(device.data_transferred, 1.75);

  AddDataTransferred(&device, -1.0);
  EXPECT_DOUBLE_EQ(device.data_transferred, 1.75);
}

TEST(DeviceTest, RoundTo) {
  EXPECT_DOUBLE_EQ(RoundTo(3.14159, 2), 3.14);
  EXPECT_DOUBLE_EQ(RoundTo(2.675001, 2), 2.68);
  EXPECT_DOUBLE_EQ(RoundTo(87.46, 1), 87.5);
}

}  // namespace
}  // namespace bandwidth
