// Device Registry - Implementation
//
// See device_registry.h for the Story and consistency rules.

#include "device_registry.h"

#include <utility>

namespace bandwidth {

DeviceRegistry::DeviceRegistry(std::vector<Device> devices)
    : devices_(std::move(devices)) {}

RegistrySnapshot DeviceRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RegistrySnapshot snapshot;
  snapshot.devices = devices_;
  snapshot.allocation = allocation_;
  snapshot.updated_at = updated_at_;
  return snapshot;
}

std::vector<Device> DeviceRegistry::Devices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_;
}

Allocation DeviceRegistry::CurrentAllocation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocation_;
}

std::optional<Device> DeviceRegistry::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& device : devices_) {
    if (device.name == name) {
      return device;
    }
  }
  return std::nullopt;
}

size_t DeviceRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

void DeviceRegistry::Commit(std::vector<Device> devices, Allocation allocation,
                            TimePoint updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_ = std::move(devices);
  allocation_ = std::move(allocation);
  updated_at_ = updated_at;
}

bool DeviceRegistry::AcquireWriter() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (writer_attached_) {
    return false;
  }
  writer_attached_ = true;
  return true;
}

void DeviceRegistry::ReleaseWriter() {
  std::lock_guard<std::mutex> lock(mutex_);
  writer_attached_ = false;
}

bool DeviceRegistry::HasWriter() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writer_attached_;
}

}  // namespace bandwidth
