// Bandwidth Service gRPC Server Implementation
//
// Story:
// This module implements the gRPC service handlers that expose the monitor
// to dashboards and other consumers. It wires together DeviceRegistry,
// HistoryStore and SimulationLoop. Handlers are thin - they validate input,
// delegate to dependencies, and build responses.
//
// Error Handling:
// - Uses gRPC error codes (INVALID_ARGUMENT, FAILED_PRECONDITION)
// - Unknown activity name or priority outside {1,2,3} -> INVALID_ARGUMENT
// - Non-finite usage, signal, data or budget -> INVALID_ARGUMENT
// - Empty device name -> INVALID_ARGUMENT, unknown device name -> NOT_FOUND
// - total_bandwidth outside [100, 1000] on SetTotalBandwidth -> INVALID_ARGUMENT
// - Inverted history range -> INVALID_ARGUMENT
// - Another loop already drives the registry -> FAILED_PRECONDITION
//
// Thread Safety:
// Stateless handlers delegate to thread-safe dependencies.

#pragma once

#include <grpcpp/grpcpp.h>

#include "bandwidth_service.grpc.pb.h"
#include "device_registry.h"
#include "history_store.h"
#include "simulation_loop.h"

namespace bandwidth {

/// Bounds accepted by SetTotalBandwidth.
inline constexpr double kMinTotalBandwidth = 100.0;
inline constexpr double kMaxTotalBandwidth = 1000.0;

/// gRPC service implementation for the bandwidth manager.
///
/// Stateless - all state is in DeviceRegistry, HistoryStore and
/// SimulationLoop.
///
/// Example:
///   DeviceRegistry registry(devices);
///   HistoryStore history;
///   SimulationLoop loop(&registry, &history);
///   BandwidthServiceImpl service(&registry, &history, &loop);
///   // Use service with grpc::ServerBuilder
class BandwidthServiceImpl final : public BandwidthService::Service {
 public:
  /// Constructs the service implementation.
  ///
  /// @param registry Live device set (not owned).
  /// @param history Snapshot log (not owned).
  /// @param loop Simulation loop driving the registry (not owned).
  /// All must outlive this object.
  BandwidthServiceImpl(DeviceRegistry* registry, HistoryStore* history,
                       SimulationLoop* loop);

  ~BandwidthServiceImpl() = default;

  // Non-copyable, non-movable
  BandwidthServiceImpl(const BandwidthServiceImpl&) = delete;
  BandwidthServiceImpl& operator=(const BandwidthServiceImpl&) = delete;

  // =========================================================================
  // gRPC Service Methods
  // =========================================================================

  /// Starts the simulation loop.
  /// @return FAILED_PRECONDITION if another loop drives the registry.
  grpc::Status StartMonitoring(grpc::ServerContext* context,
                               const StartMonitoringRequest* request,
                               StartMonitoringResponse* response) override;

  /// Stops the simulation loop.
  /// @return Always OK (idempotent).
  grpc::Status StopMonitoring(grpc::ServerContext* context,
                              const StopMonitoringRequest* request,
                              StopMonitoringResponse* response) override;

  /// Returns the current devices, allocation and summary.
  grpc::Status GetCurrentState(grpc::ServerContext* context,
                               const GetCurrentStateRequest* request,
                               GetCurrentStateResponse* response) override;

  /// Returns one device by name and its current allocation.
  /// @return INVALID_ARGUMENT if name is empty, NOT_FOUND if unknown.
  grpc::Status GetDevice(grpc::ServerContext* context,
                         const GetDeviceRequest* request,
                         GetDeviceResponse* response) override;

  /// Returns retained snapshots in [from_ms, to_ms]; 0 leaves a side open.
  /// @return INVALID_ARGUMENT if to_ms < from_ms.
  grpc::Status GetHistory(grpc::ServerContext* context,
                          const GetHistoryRequest* request,
                          GetHistoryResponse* response) override;

  /// Allocates a caller-supplied budget among caller-supplied devices.
  /// @return INVALID_ARGUMENT for an unknown activity, invalid priority or
  ///         non-finite number.
  grpc::Status Allocate(grpc::ServerContext* context,
                        const AllocateRequest* request,
                        AllocateResponse* response) override;

  /// Sets the budget used by the simulation loop.
  /// @return INVALID_ARGUMENT if outside [100, 1000].
  grpc::Status SetTotalBandwidth(grpc::ServerContext* context,
                                 const SetTotalBandwidthRequest* request,
                                 SetTotalBandwidthResponse* response) override;

  /// Returns per-device statistics and peak usage over retained history.
  grpc::Status GetDeviceStats(grpc::ServerContext* context,
                              const GetDeviceStatsRequest* request,
                              GetDeviceStatsResponse* response) override;

 private:
  DeviceRegistry* registry_;
  HistoryStore* history_;
  SimulationLoop* loop_;
};

}  // namespace bandwidth
