// Device Registry
//
// Story:
// This module holds the live device set and the allocation computed for it.
// It is the only mutable state shared between the simulation thread (the
// single writer) and any number of readers (RPC handlers, displays).
//
// Consistency:
// Devices and their allocation are committed together under one lock.
// Readers always receive copies, so they never observe a partially updated
// device record or a device set paired with another tick's allocation.
//
// Writer Ownership:
// At most one simulation loop may drive a registry. A loop claims the
// registry with AcquireWriter() and gives it back with ReleaseWriter();
// a second claim is rejected.
//
// Thread Safety:
// All public methods are thread-safe (protected by mutex).

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "clock.h"
#include "device.h"

namespace bandwidth {

/// Consistent copy of the registry contents.
struct RegistrySnapshot {
  std::vector<Device> devices;
  Allocation allocation;
  TimePoint updated_at{};
};

/// Thread-safe holder of the current device set.
///
/// Example:
///   DeviceRegistry registry(GenerateDevices(random, clock));
///   RegistrySnapshot state = registry.Snapshot();
///   for (const auto& device : state.devices) { ... }
class DeviceRegistry {
 public:
  /// Constructs a registry with the initial device set and no allocation.
  explicit DeviceRegistry(std::vector<Device> devices = {});

  ~DeviceRegistry() = default;

  // Non-copyable, non-movable
  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  /// Returns a copy of devices, allocation and last update time.
  RegistrySnapshot Snapshot() const;

  /// Returns a copy of the current devices.
  std::vector<Device> Devices() const;

  /// Returns a copy of the current allocation.
  Allocation CurrentAllocation() const;

  /// Looks up a device by name (first match in registry order).
  /// @return Copy of the device, or std::nullopt if absent.
  std::optional<Device> Find(const std::string& name) const;

  /// Returns the number of devices.
  size_t Size() const;

  /// Replaces devices and allocation atomically.
  ///
  /// Only the registry's writer should call this.
  ///
  /// @param devices The new device set.
  /// @param allocation Allocation computed for exactly these devices.
  /// @param updated_at Time of the tick that produced them.
  void Commit(std::vector<Device> devices, Allocation allocation,
              TimePoint updated_at);

  /// Claims the registry for a writer.
  /// @return true if claimed, false if another writer already holds it.
  bool AcquireWriter();

  /// Releases a claim made with AcquireWriter(). No-op if unclaimed.
  void ReleaseWriter();

  /// Returns whether a writer currently holds the registry.
  bool HasWriter() const;

 private:
  std::vector<Device> devices_;
  Allocation allocation_;
  TimePoint updated_at_{};
  bool writer_attached_ = false;

  // Thread safety
  mutable std::mutex mutex_;
};

}  // namespace bandwidth
