// Device - Implementation

#include "device.h"

#include <algorithm>
#include <cmath>

namespace bandwidth {

const char* ActivityName(Activity activity) {
  switch (activity) {
    case Activity::kStreaming:
      return "Streaming";
    case Activity::kGaming:
      return "Gaming";
    case Activity::kWebBrowsing:
      return "Web Browsing";
    case Activity::kVideoCall:
      return "Video Call";
    case Activity::kDownload:
      return "Download";
    case Activity::kUpload:
      return "Upload";
    case Activity::kIoTCommunication:
      return "IoT Communication";
  }
  return "Unknown";
}

std::optional<Activity> ParseActivity(const std::string& name) {
  for (Activity activity : kAllActivities) {
    if (name == ActivityName(activity)) {
      return activity;
    }
  }
  return std::nullopt;
}

bool IsValidPriority(int priority) {
  return priority >= kMinPriority && priority <= kMaxPriority;
}

double ClampUsage(double usage) {
  return std::clamp(usage, kMinUsage, kMaxUsage);
}

double ClampSignalStrength(double signal_strength) {
  return std::clamp(signal_strength, kMinSignalStrength, kMaxSignalStrength);
}

void AddDataTransferred(Device* device, double delta) {
  if (delta > 0.0) {
    device->data_transferred += delta;
  }
}

double RoundTo(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

}  // namespace bandwidth
