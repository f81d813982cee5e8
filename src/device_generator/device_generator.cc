// Device Generator - Implementation

#include "device_generator.h"

#include <array>
#include <chrono>
#include <string>
#include <utility>

namespace bandwidth {

namespace {

constexpr std::array<const char*, 8> kDeviceTypes = {
    "Smartphone", "Laptop",          "Smart TV",      "Gaming Console",
    "Tablet",     "Security Camera", "Smart Speaker", "Desktop PC",
};

constexpr std::array<const char*, 8> kManufacturers = {
    "Apple", "Samsung", "Sony", "Microsoft", "Google", "Amazon", "LG", "Dell",
};

}  // namespace

std::vector<Device> GenerateDevices(RandomSource& random, const Clock& clock,
                                    std::optional<size_t> count) {
  size_t n = count ? *count
                   : static_cast<size_t>(random.UniformInt(
                         static_cast<int>(kMinGeneratedDevices),
                         static_cast<int>(kMaxGeneratedDevices)));

  TimePoint now = clock.Now();
  std::vector<Device> devices;
  devices.reserve(n);

  for (size_t i = 0; i < n; ++i) {
    const char* type = kDeviceTypes[random.Index(kDeviceTypes.size())];
    const char* manufacturer =
        kManufacturers[random.Index(kManufacturers.size())];

    Device device;
    device.name = std::string(manufacturer) + " " + type;
    device.usage = random.UniformInt(1, 1000);
    device.priority = random.UniformInt(kMinPriority, kMaxPriority);
    device.activity = kAllActivities[random.Index(kAllActivities.size())];
    device.signal_strength = random.UniformInt(50, 100);
    device.data_transferred = RoundTo(random.Uniform(0.1, 10.0), 2);
    device.ip_address = "192.168.1." + std::to_string(random.UniformInt(2, 254));
    device.connected_since = now - std::chrono::hours(random.UniformInt(1, 24));
    devices.push_back(std::move(device));
  }

  return devices;
}

}  // namespace bandwidth
