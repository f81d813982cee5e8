// Bandwidth Service gRPC Server - Implementation
//
// See bandwidth_server.h for the Story and design description.

#include "bandwidth_server.h"

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "allocation_engine.h"
#include "history_stats.h"

namespace bandwidth {

namespace {

void ToProto(const Device& device, DeviceInfo* info) {
  info->set_name(device.name);
  info->set_usage(device.usage);
  info->set_priority(device.priority);
  info->set_activity(ActivityName(device.activity));
  info->set_signal_strength(device.signal_strength);
  info->set_data_transferred(device.data_transferred);
  info->set_adjusted_priority(device.adjusted_priority);
  info->set_ip_address(device.ip_address);
  info->set_connected_since_ms(ToUnixMillis(device.connected_since));
}

void ToProto(const std::vector<Device>& devices, const Allocation& allocation,
             TimePoint timestamp, Snapshot* snapshot) {
  snapshot->set_timestamp_ms(ToUnixMillis(timestamp));
  for (const auto& device : devices) {
    ToProto(device, snapshot->add_devices());
  }
  auto* alloc_map = snapshot->mutable_allocation();
  for (const auto& [name, share] : allocation) {
    (*alloc_map)[name] = share;
  }
}

// Converts a wire device. Numeric fields are clamped into range; only
// fields that cannot be clamped are rejected.
std::optional<Device> FromProto(const DeviceInfo& info, std::string* error) {
  auto activity = ParseActivity(info.activity());
  if (!activity) {
    *error = "unknown activity: " + info.activity();
    return std::nullopt;
  }
  if (!std::isfinite(info.usage()) || !std::isfinite(info.signal_strength()) ||
      !std::isfinite(info.data_transferred())) {
    *error = "usage, signal_strength and data_transferred must be finite "
             "for device: " + info.name();
    return std::nullopt;
  }
  if (!IsValidPriority(info.priority())) {
    *error = "priority must be 1, 2 or 3 for device: " + info.name();
    return std::nullopt;
  }

  Device device;
  device.name = info.name();
  device.usage = ClampUsage(info.usage());
  device.priority = info.priority();
  device.activity = *activity;
  device.signal_strength = ClampSignalStrength(info.signal_strength());
  device.data_transferred = info.data_transferred();
  device.ip_address = info.ip_address();
  device.connected_since = FromUnixMillis(info.connected_since_ms());
  return device;
}

}  // namespace

BandwidthServiceImpl::BandwidthServiceImpl(DeviceRegistry* registry,
                                           HistoryStore* history,
                                           SimulationLoop* loop)
    : registry_(registry), history_(history), loop_(loop) {}

grpc::Status BandwidthServiceImpl::StartMonitoring(
    grpc::ServerContext* /*context*/,
    const StartMonitoringRequest* /*request*/,
    StartMonitoringResponse* response) {
  if (!loop_->Start()) {
    response->set_success(false);
    response->set_error_message("registry is driven by another loop");
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                        "registry is driven by another loop");
  }

  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::StopMonitoring(
    grpc::ServerContext* /*context*/,
    const StopMonitoringRequest* /*request*/,
    StopMonitoringResponse* response) {
  // Stop is idempotent - always succeeds
  loop_->Stop();
  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::GetCurrentState(
    grpc::ServerContext* /*context*/,
    const GetCurrentStateRequest* /*request*/,
    GetCurrentStateResponse* response) {
  RegistrySnapshot state = registry_->Snapshot();
  double total_bandwidth = loop_->total_bandwidth();

  response->set_running(loop_->IsRunning());
  response->set_total_bandwidth(total_bandwidth);
  ToProto(state.devices, state.allocation, state.updated_at,
          response->mutable_state());

  NetworkSummary summary = ComputeNetworkSummary(state.devices, total_bandwidth);
  auto* summary_info = response->mutable_summary();
  summary_info->set_total_usage(summary.total_usage);
  summary_info->set_utilization_percent(summary.utilization_percent);
  summary_info->set_active_devices(static_cast<int32_t>(summary.active_devices));
  summary_info->set_device_count(static_cast<int32_t>(summary.device_count));

  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::GetDevice(grpc::ServerContext* /*context*/,
                                             const GetDeviceRequest* request,
                                             GetDeviceResponse* response) {
  const std::string& name = request->name();

  // Validate input
  if (name.empty()) {
    response->set_success(false);
    response->set_error_message("name cannot be empty");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "name cannot be empty");
  }

  auto device = registry_->Find(name);
  if (!device) {
    response->set_success(false);
    response->set_error_message("device not found");
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "device not found");
  }

  Allocation allocation = registry_->CurrentAllocation();
  auto it = allocation.find(name);

  response->set_success(true);
  ToProto(*device, response->mutable_device());
  response->set_allocated(it != allocation.end() ? it->second : 0.0);
  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::GetHistory(
    grpc::ServerContext* /*context*/,
    const GetHistoryRequest* request,
    GetHistoryResponse* response) {
  TimePoint from = request->from_ms() == 0 ? TimePoint::min()
                                           : FromUnixMillis(request->from_ms());
  TimePoint to = request->to_ms() == 0 ? TimePoint::max()
                                       : FromUnixMillis(request->to_ms());

  // Validate input
  if (to < from) {
    response->set_success(false);
    response->set_error_message("to_ms must not precede from_ms");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "to_ms must not precede from_ms");
  }

  for (const auto& entry : history_->Query(from, to)) {
    ToProto(entry.devices, entry.allocation, entry.timestamp,
            response->add_snapshots());
  }

  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::Allocate(grpc::ServerContext* /*context*/,
                                            const AllocateRequest* request,
                                            AllocateResponse* response) {
  if (!std::isfinite(request->total_bandwidth())) {
    response->set_success(false);
    response->set_error_message("total_bandwidth must be finite");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "total_bandwidth must be finite");
  }

  std::vector<Device> devices;
  devices.reserve(request->devices_size());

  for (const auto& info : request->devices()) {
    std::string error;
    auto device = FromProto(info, &error);
    if (!device) {
      response->set_success(false);
      response->set_error_message(error);
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
    }
    devices.push_back(*device);
  }

  // Negative budgets are clamped to 0 by the engine
  Allocation allocation =
      ::bandwidth::Allocate(devices, request->total_bandwidth());

  response->set_success(true);
  auto* alloc_map = response->mutable_allocation();
  for (const auto& [name, share] : allocation) {
    (*alloc_map)[name] = share;
  }

  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::SetTotalBandwidth(
    grpc::ServerContext* /*context*/,
    const SetTotalBandwidthRequest* request,
    SetTotalBandwidthResponse* response) {
  double total_bandwidth = request->total_bandwidth();

  if (!std::isfinite(total_bandwidth) ||
      total_bandwidth < kMinTotalBandwidth ||
      total_bandwidth > kMaxTotalBandwidth) {
    response->set_success(false);
    response->set_error_message("total_bandwidth must be in [100, 1000]");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "total_bandwidth must be in [100, 1000]");
  }

  loop_->SetTotalBandwidth(total_bandwidth);
  response->set_success(true);
  return grpc::Status::OK;
}

grpc::Status BandwidthServiceImpl::GetDeviceStats(
    grpc::ServerContext* /*context*/,
    const GetDeviceStatsRequest* /*request*/,
    GetDeviceStatsResponse* response) {
  std::vector<HistoricalSnapshot> snapshots = history_->All();

  for (const auto& [name, stats] : ComputeDeviceStats(snapshots)) {
    auto* info = response->add_stats();
    info->set_name(name);
    info->set_samples(static_cast<int32_t>(stats.samples));
    info->set_mean_usage(stats.mean_usage);
    info->set_max_usage(stats.max_usage);
    info->set_mean_allocated(stats.mean_allocated);
    info->set_max_allocated(stats.max_allocated);
  }

  auto peak = FindPeakUsage(snapshots);
  response->set_has_peak(peak.has_value());
  if (peak) {
    response->set_peak_timestamp_ms(ToUnixMillis(peak->timestamp));
    response->set_peak_total_usage(peak->total_usage);
  }

  return grpc::Status::OK;
}

}  // namespace bandwidth
