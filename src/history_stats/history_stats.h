// History Statistics
//
// Story:
// Read-only analytics over retained history and the live device set, used
// by the historical-analysis and overview views: per-device usage versus
// allocation, the busiest tick, and current utilization of the budget.
//
// All functions are pure; callers pass copies obtained from HistoryStore
// or DeviceRegistry.

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "clock.h"
#include "device.h"
#include "history_store.h"

namespace bandwidth {

/// Usage and allocation aggregates for one device across snapshots.
struct DeviceStats {
  size_t samples = 0;
  double mean_usage = 0.0;
  double max_usage = 0.0;
  double mean_allocated = 0.0;
  double max_allocated = 0.0;
};

/// The snapshot with the highest summed device usage.
struct PeakUsage {
  TimePoint timestamp{};
  double total_usage = 0.0;
};

/// Point-in-time utilization of the budget.
struct NetworkSummary {
  double total_usage = 0.0;
  double utilization_percent = 0.0;
  size_t active_devices = 0;
  size_t device_count = 0;
};

/// Aggregates usage and allocation per device name.
///
/// A device missing from its snapshot's allocation counts as 0 allocated.
/// Means and maxima are rounded to 2 decimals.
std::map<std::string, DeviceStats> ComputeDeviceStats(
    const std::vector<HistoricalSnapshot>& snapshots);

/// Finds the snapshot with the highest summed usage. Earliest wins ties.
/// @return The peak, or std::nullopt for empty input.
std::optional<PeakUsage> FindPeakUsage(
    const std::vector<HistoricalSnapshot>& snapshots);

/// Summarizes current demand against the budget.
///
/// utilization_percent = total_usage / total_bandwidth * 100, rounded to
/// one decimal; 0 when total_bandwidth <= 0. A device is active when its
/// usage is above 0.
NetworkSummary ComputeNetworkSummary(const std::vector<Device>& devices,
                                     double total_bandwidth);

}  // namespace bandwidth
