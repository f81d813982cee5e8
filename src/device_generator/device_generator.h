// Device Generator
//
// Story:
// Stands in for device discovery: builds a plausible household device set
// so the monitor has something to manage. Every draw goes through the
// injected RandomSource, so a fixed seed reproduces the same network.
//
// Each device gets:
// - name "<Manufacturer> <DeviceType>"
// - usage integer in [1, 1000], priority in [1, 3], a uniform activity
// - signal strength integer in [50, 100]
// - data transferred in [0.1, 10.0] GB, rounded to 2 decimals
// - ip 192.168.1.<2..254>, connected 1 to 24 hours before now

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "clock.h"
#include "device.h"
#include "random_source.h"

namespace bandwidth {

inline constexpr size_t kMinGeneratedDevices = 8;
inline constexpr size_t kMaxGeneratedDevices = 15;

/// Generates a random device set.
///
/// @param random Source of every random draw.
/// @param clock Provides "now" for connected_since.
/// @param count Number of devices; if std::nullopt, uniform in
///              [kMinGeneratedDevices, kMaxGeneratedDevices].
std::vector<Device> GenerateDevices(RandomSource& random, const Clock& clock,
                                    std::optional<size_t> count = std::nullopt);

}  // namespace bandwidth
