// Simulation Loop - Implementation
//
// See simulation_loop.h for the Story and algorithm description.

#include "simulation_loop.h"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

#include "allocation_engine.h"

namespace bandwidth {

void PerturbDevice(Device* device, RandomSource& random) {
  device->usage =
      ClampUsage(device->usage + random.Uniform(-kUsageJitter, kUsageJitter));
  device->signal_strength = ClampSignalStrength(
      device->signal_strength + random.Uniform(-kSignalJitter, kSignalJitter));
  AddDataTransferred(
      device,
      RoundTo(random.Uniform(kMinDataIncrement, kMaxDataIncrement), 2));

  if (random.Chance(kActivityChangeProbability)) {
    device->activity = kAllActivities[random.Index(kAllActivities.size())];
  }
}

SimulationLoop::SimulationLoop(DeviceRegistry* registry, HistoryStore* history,
                               SimulationConfig config,
                               std::shared_ptr<RandomSource> random,
                               std::shared_ptr<Clock> clock)
    : registry_(registry),
      history_(history),
      random_(random ? std::move(random)
                     : std::make_shared<Mt19937RandomSource>()),
      clock_(clock ? std::move(clock) : std::make_shared<RealClock>()),
      total_bandwidth_(std::max(0.0, config.total_bandwidth)),
      tick_period_(config.tick_period.count() > 0
                       ? config.tick_period
                       : std::chrono::milliseconds(1000)) {}

SimulationLoop::~SimulationLoop() {
  if (running_.load()) {
    Stop();
  }
}

bool SimulationLoop::Start() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (running_.load()) {
    return true;  // Already running
  }

  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (!registry_->AcquireWriter()) {
      std::cerr << "Simulation start rejected: registry already driven by "
                   "another loop"
                << std::endl;
      return false;
    }
    owns_registry_ = true;
  }

  running_.store(true);
  thread_ = std::thread(&SimulationLoop::RunLoop, this);

  std::cout << "Simulation started (tick period " << tick_period_.count()
            << " ms, budget " << total_bandwidth() << " Mbps)" << std::endl;
  return true;
}

void SimulationLoop::Stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!running_.load()) {
    return;  // Already stopped
  }

  // Signal thread to stop
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();

  // Wait for the in-flight tick (if any) to finish
  if (thread_.joinable()) {
    thread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    owns_registry_ = false;
    registry_->ReleaseWriter();
  }

  std::cout << "Simulation stopped after " << tick_count() << " ticks"
            << std::endl;
}

bool SimulationLoop::Tick() {
  std::lock_guard<std::mutex> lock(tick_mutex_);

  if (owns_registry_) {
    TickLocked();
    return true;
  }

  // Not running: claim the registry just for this tick.
  if (!registry_->AcquireWriter()) {
    return false;
  }
  TickLocked();
  registry_->ReleaseWriter();
  return true;
}

bool SimulationLoop::IsRunning() const {
  return running_.load();
}

void SimulationLoop::SetTotalBandwidth(double total_bandwidth) {
  total_bandwidth_.store(std::max(0.0, total_bandwidth));
}

double SimulationLoop::total_bandwidth() const {
  return total_bandwidth_.load();
}

uint64_t SimulationLoop::tick_count() const {
  return tick_count_.load();
}

void SimulationLoop::RunLoop() {
  auto next_tick = std::chrono::steady_clock::now();

  while (running_.load()) {
    {
      std::lock_guard<std::mutex> lock(tick_mutex_);
      TickLocked();
    }

    next_tick += tick_period_;
    auto now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      next_tick = now;  // Fell behind; don't burst to catch up
    }

    // Wait for the next tick boundary or stop signal
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, next_tick, [this]() { return !running_.load(); });
  }
}

void SimulationLoop::TickLocked() {
  std::vector<Device> devices = registry_->Devices();
  for (auto& device : devices) {
    PerturbDevice(&device, *random_);
    device.adjusted_priority = AdjustedPriority(device);
  }

  Allocation allocation = Allocate(devices, total_bandwidth());
  TimePoint now = clock_->Now();

  HistoricalSnapshot snapshot;
  snapshot.timestamp = now;
  snapshot.devices = devices;
  snapshot.allocation = allocation;

  registry_->Commit(std::move(devices), std::move(allocation), now);
  history_->Append(std::move(snapshot));
  tick_count_++;
}

}  // namespace bandwidth
