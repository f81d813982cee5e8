// Allocation Engine
//
// Story:
// This module partitions a shared bandwidth budget among devices. It is a
// pure function of its inputs: no shared state, no locking, no side effects.
// Callers hand it a snapshot of the device set and get back a mapping from
// device name to allocated Mbps.
//
// Algorithm:
// 1. adjusted_priority = priority * activity_multiplier * (signal / 100)
//      Video Call 1.5, Gaming 1.3, Streaming 1.2, Download 1.0, Upload 1.0,
//      Web Browsing 0.8, IoT Communication 0.5
// 2. Rank by adjusted_priority descending, then usage descending. Devices
//    tied on both keys keep their input order (stable sort).
// 3. Walk the ranking with remaining = total_bandwidth:
//      remaining <= 0 -> 0
//      otherwise share = min(usage * adjusted_priority, remaining)
// 4. Each share is rounded to 2 decimals and the rounded value is what is
//    subtracted from remaining. A rounded share is capped at the remaining
//    budget so the published values never sum above total_bandwidth.
//
// Devices sharing a name share one key; the lower-ranked one overwrites.
//
// Thread Safety:
// Stateless. Safe to call from any thread.

#pragma once

#include <vector>

#include "device.h"

namespace bandwidth {

/// Returns the ranking multiplier for an activity.
double ActivityMultiplier(Activity activity);

/// Computes priority * multiplier * (signal_strength / 100).
double AdjustedPriority(const Device& device);

/// Returns a copy of devices in allocation order, with adjusted_priority
/// populated on every entry.
std::vector<Device> RankDevices(const std::vector<Device>& devices);

/// Partitions total_bandwidth among devices.
///
/// Example:
///   // A: usage 100, priority 3, Gaming, signal 100   -> adjusted 3.9
///   // B: usage 200, priority 1, IoT,    signal 100   -> adjusted 0.5
///   Allocation a = Allocate({a, b}, 150.0);  // {A: 150.0, B: 0.0}
///
/// @param devices Device snapshot. Not modified.
/// @param total_bandwidth Budget in Mbps. Negative values are treated as 0.
/// @return Mapping of every device name to its share (>= 0). Empty input
///         yields an empty mapping.
Allocation Allocate(const std::vector<Device>& devices, double total_bandwidth);

}  // namespace bandwidth
