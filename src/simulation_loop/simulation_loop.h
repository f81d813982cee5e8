// Simulation Loop
//
// Story:
// This module is the single writer of a DeviceRegistry. While running it
// wakes once per tick period, jitters every device's live metrics,
// re-partitions the bandwidth budget with the Allocation Engine, publishes
// the result to the registry, and appends a snapshot to the history store.
//
// Algorithm (one tick):
// 1. Copy the registry's devices. For each device:
//      usage           += Uniform(-50, 50), clamped to [0, 1000]
//      signal_strength += Uniform(-5, 5),   clamped to [50, 100]
//      data_transferred += Uniform(0.01, 0.1) rounded to 2 decimals
//      with probability 0.10, activity = uniform pick of all activities
// 2. allocation = Allocate(devices, total_bandwidth)
// 3. Commit devices + allocation to the registry in one step.
// 4. Append {now, devices, allocation} to history (which prunes itself).
//
// States:
//   Stopped --Start()--> Running --Stop()--> Stopped
// Start() and Stop() are idempotent. Start() claims the registry as its
// writer; a second loop on the same registry is rejected. Stop() wakes the
// loop, joins it, and returns only after the last tick has finished, so no
// mutation happens after Stop() returns.
//
// Thread Safety:
// All public methods are thread-safe. Ticks are serialized.
//
// Testability:
// Clock and RandomSource are injected. Tick() runs one tick synchronously.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "clock.h"
#include "device.h"
#include "device_registry.h"
#include "history_store.h"
#include "random_source.h"

namespace bandwidth {

/// Tunables for the simulation loop.
struct SimulationConfig {
  double total_bandwidth = 500.0;                  // Mbps
  std::chrono::milliseconds tick_period{1000};     // Time between ticks
};

/// Jitter bounds applied to each device on every tick.
inline constexpr double kUsageJitter = 50.0;
inline constexpr double kSignalJitter = 5.0;
inline constexpr double kMinDataIncrement = 0.01;
inline constexpr double kMaxDataIncrement = 0.1;
inline constexpr double kActivityChangeProbability = 0.10;

/// Applies one tick of jitter to a device, keeping it within its ranges.
void PerturbDevice(Device* device, RandomSource& random);

/// Periodic actor that drives a DeviceRegistry.
///
/// Example:
///   DeviceRegistry registry(GenerateDevices(random, clock));
///   HistoryStore history(std::chrono::hours(24));
///   SimulationLoop loop(&registry, &history, {500.0, std::chrono::seconds(1)});
///   loop.Start();
///   ...
///   RegistrySnapshot state = registry.Snapshot();
///   loop.Stop();
class SimulationLoop {
 public:
  /// Constructs a stopped simulation loop.
  ///
  /// @param registry Device set to drive (not owned, must outlive this).
  /// @param history Snapshot log to append to (not owned, must outlive this).
  /// @param config Budget and tick period. Negative budgets are treated as 0;
  ///               a non-positive period falls back to 1 second.
  /// @param random Source of jitter. If nullptr, uses Mt19937RandomSource.
  /// @param clock Timestamp source. If nullptr, uses RealClock.
  SimulationLoop(DeviceRegistry* registry, HistoryStore* history,
                 SimulationConfig config = {},
                 std::shared_ptr<RandomSource> random = nullptr,
                 std::shared_ptr<Clock> clock = nullptr);

  /// Destructor. Calls Stop() if running.
  ~SimulationLoop();

  // Non-copyable, non-movable
  SimulationLoop(const SimulationLoop&) = delete;
  SimulationLoop& operator=(const SimulationLoop&) = delete;

  /// Starts ticking on a background thread. The first tick runs immediately.
  ///
  /// @return true if running after the call (including when already
  ///         running), false if another loop already drives the registry.
  bool Start();

  /// Stops ticking and waits for the background thread to exit.
  /// No-op if already stopped.
  void Stop();

  /// Runs one tick synchronously on the calling thread.
  ///
  /// @return true if the tick ran, false if another loop drives the registry.
  bool Tick();

  /// Returns whether the background thread is running.
  bool IsRunning() const;

  /// Changes the budget used from the next tick on. Negative values become 0.
  void SetTotalBandwidth(double total_bandwidth);

  /// Returns the current budget.
  double total_bandwidth() const;

  std::chrono::milliseconds tick_period() const { return tick_period_; }

  /// Returns the number of ticks completed since construction.
  uint64_t tick_count() const;

 private:
  /// Background thread function.
  void RunLoop();

  /// Performs one tick. Must hold tick_mutex_ and own the registry.
  void TickLocked();

  // Dependencies (not owned, must outlive this object)
  DeviceRegistry* registry_;
  HistoryStore* history_;

  // Injected
  std::shared_ptr<RandomSource> random_;
  std::shared_ptr<Clock> clock_;

  // Configuration
  std::atomic<double> total_bandwidth_;
  const std::chrono::milliseconds tick_period_;

  // Tick state (protected by tick_mutex_)
  bool owns_registry_ = false;
  std::atomic<uint64_t> tick_count_{0};
  mutable std::mutex tick_mutex_;

  // Thread control
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::mutex control_mutex_;  // Serializes Start()/Stop()
  std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace bandwidth
