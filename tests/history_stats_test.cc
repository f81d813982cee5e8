// History Statistics Unit Tests
//
// Tests cover:
// - Per-device usage/allocation aggregates
// - Peak usage detection
// - Network utilization summary

#include "history_stats.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace bandwidth {
namespace {

using namespace std::chrono_literals;

Device MakeDevice(const std::string& name, double usage) {
  Device device;
  device.name = name;
  device.usage = usage;
  return device;
}

HistoricalSnapshot MakeSnapshot(TimePoint timestamp,
                                std::vector<Device> devices,
                                Allocation allocation) {
  HistoricalSnapshot snapshot;
  snapshot.timestamp = timestamp;
  snapshot.devices = std::move(devices);
  snapshot.allocation = std::move(allocation);
  return snapshot;
}

// =============================================================================
// Device Stats Tests
// =============================================================================

TEST(HistoryStatsTest, DeviceStatsOverSnapshots) {
  TimePoint t0{};
  std::vector<HistoricalSnapshot> snapshots = {
      MakeSnapshot(t0, {MakeDevice("tv", 100), MakeDevice("cam", 10)},
                   {{"tv", 80.0}, {"cam", 5.0}}),
      MakeSnapshot(t0 + 1s, {MakeDevice("tv", 300), MakeDevice("cam", 20)},
                   {{"tv", 120.0}, {"cam", 10.0}}),
  };

  auto stats = ComputeDeviceStats(snapshots);

  ASSERT_EQ(stats.size(), 2);
  EXPECT_EQ(stats.at("tv").samples, 2);
  EXPECT_DOUBLE_EQ(stats.at("tv").mean_usage, 200.0);
  EXPECT_DOUBLE_EQ(stats.at("tv").max_usage, 300.0);
  EXPECT_DOUBLE_EQ(stats.at("tv").mean_allocated, 100.0);
  EXPECT_DOUBLE_EQ(stats.at("tv").max_allocated, 120.0);
  EXPECT_DOUBLE_EQ(stats.at("cam").mean_usage, 15.0);
  EXPECT_DOUBLE_EQ(stats.at("cam").mean_allocated, 7.5);
}

TEST(HistoryStatsTest, MissingAllocationCountsAsZero) {
  std::vector<HistoricalSnapshot> snapshots = {
      MakeSnapshot(TimePoint{}, {MakeDevice("tv", 100)}, {}),
      MakeSnapshot(TimePoint{} + 1s, {MakeDevice("tv", 100)}, {{"tv", 50.0}}),
  };

  auto stats = ComputeDeviceStats(snapshots);

  EXPECT_DOUBLE_EQ(stats.at("tv").mean_allocated, 25.0);
  EXPECT_DOUBLE_EQ(stats.at("tv").max_allocated, 50.0);
}

TEST(HistoryStatsTest, MeansRoundedToTwoDecimals) {
  std::vector<HistoricalSnapshot> snapshots = {
      MakeSnapshot(TimePoint{}, {MakeDevice("tv", 1)}, {{"tv", 0.0}}),
      MakeSnapshot(TimePoint{}, {MakeDevice("tv", 1)}, {{"tv", 0.0}}),
      MakeSnapshot(TimePoint{}, {MakeDevice("tv", 2)}, {{"tv", 0.0}}),
  };

  EXPECT_DOUBLE_EQ(ComputeDeviceStats(snapshots).at("tv").mean_usage, 1.33);
}

TEST(HistoryStatsTest, NoSnapshotsNoStats) {
  EXPECT_TRUE(ComputeDeviceStats({}).empty());
}

// =============================================================================
// Peak Usage Tests
// =============================================================================

TEST(HistoryStatsTest, PeakUsageFindsBusiestSnapshot) {
  TimePoint t0{};
  std::vector<HistoricalSnapshot> snapshots = {
      MakeSnapshot(t0, {MakeDevice("a", 100), MakeDevice("b", 100)}, {}),
      MakeSnapshot(t0 + 1s, {MakeDevice("a", 400), MakeDevice("b", 150)}, {}),
      MakeSnapshot(t0 + 2s, {MakeDevice("a", 300), MakeDevice("b", 100)}, {}),
  };

  auto peak = FindPeakUsage(snapshots);

  ASSERT_TRUE(peak.has_value());
  EXPECT_EQ(peak->timestamp, t0 + 1s);
  EXPECT_DOUBLE_EQ(peak->total_usage, 550.0);
}

TEST(HistoryStatsTest, PeakUsageEarliestWinsTies) {
  TimePoint t0{};
  std::vector<HistoricalSnapshot> snapshots = {
      MakeSnapshot(t0, {MakeDevice("a", 200)}, {}),
      MakeSnapshot(t0 + 1s, {MakeDevice("a", 200)}, {}),
  };

  EXPECT_EQ(FindPeakUsage(snapshots)->timestamp, t0);
}

TEST(HistoryStatsTest, PeakUsageOfEmptyHistory) {
  EXPECT_FALSE(FindPeakUsage({}).has_value());
}

// =============================================================================
// Network Summary Tests
// =============================================================================

TEST(HistoryStatsTest, NetworkSummary) {
  std::vector<Device> devices = {
      MakeDevice("a", 200),
      MakeDevice("b", 0),
      MakeDevice("c", 100),
  };

  NetworkSummary summary = ComputeNetworkSummary(devices, 400.0);

  EXPECT_DOUBLE_EQ(summary.total_usage, 300.0);
  EXPECT_DOUBLE_EQ(summary.utilization_percent, 75.0);
  EXPECT_EQ(summary.active_devices, 2);
  EXPECT_EQ(summary.device_count, 3);
}

TEST(HistoryStatsTest, UtilizationRoundedToOneDecimal) {
  NetworkSummary summary =
      ComputeNetworkSummary({MakeDevice("a", 100)}, 300.0);

  EXPECT_DOUBLE_EQ(summary.utilization_percent, 33.3);
}

TEST(HistoryStatsTest, UtilizationWithZeroBudget) {
  NetworkSummary summary = ComputeNetworkSummary({MakeDevice("a", 100)}, 0.0);

  EXPECT_DOUBLE_EQ(summary.utilization_percent, 0.0);
  EXPECT_EQ(summary.active_devices, 1);
}

}  // namespace
}  // namespace bandwidth
