// History Statistics - Implementation

#include "history_stats.h"

#include <algorithm>

namespace bandwidth {

std::map<std::string, DeviceStats> ComputeDeviceStats(
    const std::vector<HistoricalSnapshot>& snapshots) {
  struct Totals {
    size_t samples = 0;
    double usage_sum = 0.0;
    double usage_max = 0.0;
    double allocated_sum = 0.0;
    double allocated_max = 0.0;
  };
  std::map<std::string, Totals> totals;

  for (const auto& snapshot : snapshots) {
    for (const auto& device : snapshot.devices) {
      double allocated = 0.0;
      auto it = snapshot.allocation.find(device.name);
      if (it != snapshot.allocation.end()) {
        allocated = it->second;
      }

      Totals& t = totals[device.name];
      t.samples++;
      t.usage_sum += device.usage;
      t.usage_max = std::max(t.usage_max, device.usage);
      t.allocated_sum += allocated;
      t.allocated_max = std::max(t.allocated_max, allocated);
    }
  }

  std::map<std::string, DeviceStats> stats;
  for (const auto& [name, t] : totals) {
    DeviceStats s;
    s.samples = t.samples;
    s.mean_usage = RoundTo(t.usage_sum / static_cast<double>(t.samples), 2);
    s.max_usage = RoundTo(t.usage_max, 2);
    s.mean_allocated =
        RoundTo(t.allocated_sum / static_cast<double>(t.samples), 2);
    s.max_allocated = RoundTo(t.allocated_max, 2);
    stats[name] = s;
  }
  return stats;
}

std::optional<PeakUsage> FindPeakUsage(
    const std::vector<HistoricalSnapshot>& snapshots) {
  std::optional<PeakUsage> peak;

  for (const auto& snapshot : snapshots) {
    double total = 0.0;
    for (const auto& device : snapshot.devices) {
      total += device.usage;
    }
    if (!peak || total > peak->total_usage) {
      peak = PeakUsage{snapshot.timestamp, total};
    }
  }

  return peak;
}

NetworkSummary ComputeNetworkSummary(const std::vector<Device>& devices,
                                     double total_bandwidth) {
  NetworkSummary summary;
  summary.device_count = devices.size();

  for (const auto& device : devices) {
    summary.total_usage += device.usage;
    if (device.usage > 0.0) {
      summary.active_devices++;
    }
  }

  if (total_bandwidth > 0.0) {
    summary.utilization_percent =
        RoundTo(summary.total_usage / total_bandwidth * 100.0, 1);
  }
  return summary;
}

}  // namespace bandwidth
