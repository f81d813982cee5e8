// Allocation Engine - Implementation
//
// See allocation_engine.h for the Story and algorithm description.

#include "allocation_engine.h"

#include <algorithm>
#include <cmath>

namespace bandwidth {

namespace {

// Largest 2-decimal value not above value.
double FloorToCents(double value) {
  return std::floor(value * 100.0) / 100.0;
}

}  // namespace

double ActivityMultiplier(Activity activity) {
  switch (activity) {
    case Activity::kVideoCall:
      return 1.5;
    case Activity::kGaming:
      return 1.3;
    case Activity::kStreaming:
      return 1.2;
    case Activity::kDownload:
    case Activity::kUpload:
      return 1.0;
    case Activity::kWebBrowsing:
      return 0.8;
    case Activity::kIoTCommunication:
      return 0.5;
  }
  return 1.0;
}

double AdjustedPriority(const Device& device) {
  return device.priority * ActivityMultiplier(device.activity) *
         (device.signal_strength / 100.0);
}

std::vector<Device> RankDevices(const std::vector<Device>& devices) {
  std::vector<Device> ranked = devices;
  for (auto& device : ranked) {
    device.adjusted_priority = AdjustedPriority(device);
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Device& a, const Device& b) {
                     if (a.adjusted_priority != b.adjusted_priority) {
                       return a.adjusted_priority > b.adjusted_priority;
                     }
                     return a.usage > b.usage;
                   });
  return ranked;
}

Allocation Allocate(const std::vector<Device>& devices,
                    double total_bandwidth) {
  Allocation allocation;
  if (devices.empty()) {
    return allocation;
  }

  double remaining = std::max(0.0, total_bandwidth);

  for (const auto& device : RankDevices(devices)) {
    if (remaining <= 0.0) {
      allocation[device.name] = 0.0;
      continue;
    }

    double demand = std::max(0.0, device.usage * device.adjusted_priority);
    double share = RoundTo(std::min(demand, remaining), 2);
    if (share > remaining) {
      share = FloorToCents(remaining);
    }

    allocation[device.name] = share;
    remaining -= share;
  }

  return allocation;
}

}  // namespace bandwidth
