// Device
//
// Story:
// A device is one network client on the monitored network. It carries the
// live metrics the simulation jitters every tick (usage, signal strength,
// activity, cumulative data) plus display-only identity fields.
//
// Ranges:
// - usage           [0, 1000] Mbps
// - priority        {1, 2, 3}, 3 = highest
// - signal_strength [50, 100] percent
// - data_transferred cumulative GB, never decreases
//
// Mutations go through the Clamp/Add helpers below so a device never leaves
// its declared ranges.

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "clock.h"

namespace bandwidth {

/// What a device is currently doing on the network.
enum class Activity {
  kStreaming,
  kGaming,
  kWebBrowsing,
  kVideoCall,
  kDownload,
  kUpload,
  kIoTCommunication,
};

/// Every activity, in declaration order. Used for uniform random picks.
inline constexpr std::array<Activity, 7> kAllActivities = {
    Activity::kStreaming,   Activity::kGaming,   Activity::kWebBrowsing,
    Activity::kVideoCall,   Activity::kDownload, Activity::kUpload,
    Activity::kIoTCommunication,
};

inline constexpr double kMinUsage = 0.0;
inline constexpr double kMaxUsage = 1000.0;
inline constexpr double kMinSignalStrength = 50.0;
inline constexpr double kMaxSignalStrength = 100.0;
inline constexpr int kMinPriority = 1;
inline constexpr int kMaxPriority = 3;

/// One network client and its live metrics.
struct Device {
  std::string name;
  double usage = 0.0;
  int priority = kMinPriority;
  Activity activity = Activity::kWebBrowsing;
  double signal_strength = kMaxSignalStrength;
  double data_transferred = 0.0;

  // Derived. Recomputed by every allocation pass on its own copies.
  double adjusted_priority = 0.0;

  // Display-only
  std::string ip_address;
  TimePoint connected_since{};
};

/// Allocation result: device name -> allocated bandwidth (Mbps, >= 0).
using Allocation = std::map<std::string, double>;

/// Returns the display name of an activity (e.g. "Video Call").
const char* ActivityName(Activity activity);

/// Parses a display name back to an activity.
/// @return The activity, or std::nullopt for an unknown name.
std::optional<Activity> ParseActivity(const std::string& name);

/// Returns true if priority is one of {1, 2, 3}.
bool IsValidPriority(int priority);

/// Clamps usage into [kMinUsage, kMaxUsage].
double ClampUsage(double usage);

/// Clamps signal strength into [kMinSignalStrength, kMaxSignalStrength].
double ClampSignalStrength(double signal_strength);

/// Adds delta to data_transferred. Negative deltas are ignored so the
/// counter never decreases.
void AddDataTransferred(Device* device, double delta);

/// Rounds to the given number of decimal places.
double RoundTo(double value, int decimals);

}  // namespace bandwidth
