// Bandwidth Manager - Main Application
//
// Story:
// Entry point for the bandwidth manager server. Generates the initial device
// set, wires the registry, history store and simulation loop together,
// starts the gRPC server, and handles graceful shutdown on SIGINT/SIGTERM.
//
// Usage:
//   ./bandwidth_server [--port=PORT] [--total-bandwidth=MBPS] ...
//
// Options:
//   --port=PORT              Server port (default: 50051)
//   --total-bandwidth=MBPS   Budget to partition, 100-1000 (default: 500)
//   --tick-period=SEC        Seconds between simulation ticks, 1-60 (default: 1)
//   --retention-hours=H      History retention window (default: 24)
//   --devices=N              Number of simulated devices, 1-64 (default: 8-15)
//   --seed=SEED              Fixed random seed for reproducible runs
//   --autostart              Start the simulation loop immediately
//   --help                   Show usage

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "bandwidth_server.h"
#include "clock.h"
#include "device_generator.h"
#include "device_registry.h"
#include "history_store.h"
#include "random_source.h"
#include "simulation_loop.h"

namespace {

// =============================================================================
// Configuration
// =============================================================================

struct ServerConfig {
  uint16_t port = 50051;
  double total_bandwidth = 500.0;
  std::chrono::seconds tick_period{1};
  std::chrono::hours retention_window{24};
  std::optional<size_t> device_count;
  std::optional<uint64_t> seed;
  bool autostart = false;
};

// =============================================================================
// Global State (for signal handling)
// =============================================================================

std::atomic<bool> g_shutdown_requested{false};
std::mutex g_shutdown_mutex;
std::condition_variable g_shutdown_cv;

// =============================================================================
// Signal Handler
// =============================================================================

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
    g_shutdown_cv.notify_all();
  }
}

// =============================================================================
// Command-Line Parsing
// =============================================================================

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Options:\n"
            << "  --port=PORT              Server port (default: 50051)\n"
            << "  --total-bandwidth=MBPS   Bandwidth budget in Mbps, 100-1000 "
               "(default: 500)\n"
            << "  --tick-period=SEC        Seconds between simulation ticks, "
               "1-60 (default: 1)\n"
            << "  --retention-hours=H      History retention in hours "
               "(default: 24)\n"
            << "  --devices=N              Simulated device count, 1-64 "
               "(default: random 8-15)\n"
            << "  --seed=SEED              Fixed random seed\n"
            << "  --autostart              Start monitoring immediately\n"
            << "  --help                   Show this help message\n";
}

// Parses the value of a "--name=value" integer flag within [min, max].
std::optional<long long> ParseIntFlag(const std::string& name,
                                      const std::string& value, long long min,
                                      long long max) {
  try {
    size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed < min || parsed > max) {
      std::cerr << "Error: Invalid " << name << ": " << value << std::endl;
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception& e) {
    std::cerr << "Error: Invalid " << name << ": " << value << std::endl;
    return std::nullopt;
  }
}

std::optional<ServerConfig> ParseArgs(int argc, char* argv[]) {
  ServerConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return std::nullopt;
    }

    if (arg == "--autostart") {
      config.autostart = true;
      continue;
    }

    if (arg.rfind("--port=", 0) == 0) {
      auto port = ParseIntFlag("port number", arg.substr(7), 1, 65535);
      if (!port) {
        return std::nullopt;
      }
      config.port = static_cast<uint16_t>(*port);
      continue;
    }

    if (arg.rfind("--total-bandwidth=", 0) == 0) {
      std::string value = arg.substr(18);
      try {
        double total = std::stod(value);
        if (total < bandwidth::kMinTotalBandwidth ||
            total > bandwidth::kMaxTotalBandwidth) {
          std::cerr << "Error: Total bandwidth must be in [100, 1000]: "
                    << value << std::endl;
          return std::nullopt;
        }
        config.total_bandwidth = total;
      } catch (const std::exception& e) {
        std::cerr << "Error: Invalid total bandwidth: " << value << std::endl;
        return std::nullopt;
      }
      continue;
    }

    if (arg.rfind("--tick-period=", 0) == 0) {
      auto seconds = ParseIntFlag("tick period", arg.substr(14), 1, 60);
      if (!seconds) {
        return std::nullopt;
      }
      config.tick_period = std::chrono::seconds(*seconds);
      continue;
    }

    if (arg.rfind("--retention-hours=", 0) == 0) {
      auto hours = ParseIntFlag("retention hours", arg.substr(18), 1, 24 * 365);
      if (!hours) {
        return std::nullopt;
      }
      config.retention_window = std::chrono::hours(*hours);
      continue;
    }

    if (arg.rfind("--devices=", 0) == 0) {
      auto count = ParseIntFlag("device count", arg.substr(10), 1, 64);
      if (!count) {
        return std::nullopt;
      }
      config.device_count = static_cast<size_t>(*count);
      continue;
    }

    if (arg.rfind("--seed=", 0) == 0) {
      auto seed = ParseIntFlag("seed", arg.substr(7), 0, INT64_MAX);
      if (!seed) {
        return std::nullopt;
      }
      config.seed = static_cast<uint64_t>(*seed);
      continue;
    }

    std::cerr << "Error: Unknown argument: " << arg << std::endl;
    PrintUsage(argv[0]);
    return std::nullopt;
  }

  return config;
}

// =============================================================================
// Server Runner
// =============================================================================

int RunServer(const ServerConfig& config) {
  // Build server address
  std::string server_address = "0.0.0.0:" + std::to_string(config.port);

  // Create components
  auto clock = std::make_shared<bandwidth::RealClock>();
  auto random = std::make_shared<bandwidth::Mt19937RandomSource>(config.seed);

  bandwidth::DeviceRegistry registry(
      bandwidth::GenerateDevices(*random, *clock, config.device_count));
  bandwidth::HistoryStore history(config.retention_window);

  bandwidth::SimulationConfig sim_config;
  sim_config.total_bandwidth = config.total_bandwidth;
  sim_config.tick_period = config.tick_period;
  bandwidth::SimulationLoop loop(&registry, &history, sim_config, random,
                                 clock);

  // Create service implementation
  bandwidth::BandwidthServiceImpl service(&registry, &history, &loop);

  // Build and start server
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    std::cerr << "Error: Failed to start server on " << server_address
              << std::endl;
    return 1;
  }

  std::cout << "Bandwidth manager started on " << server_address << std::endl;
  std::cout << "Devices: " << registry.Size()
            << ", budget: " << config.total_bandwidth << " Mbps"
            << ", retention: " << config.retention_window.count() << " h"
            << std::endl;

  if (config.autostart && !loop.Start()) {
    std::cerr << "Error: Failed to start simulation loop" << std::endl;
    server->Shutdown();
    return 1;
  }

  std::cout << "Press Ctrl+C to shutdown..." << std::endl;

  // Start a thread that waits for shutdown signal and calls server->Shutdown()
  std::thread shutdown_thread([&server, &loop]() {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.wait(lock, []() { return g_shutdown_requested.load(); });

    std::cout << "\nShutdown requested, stopping server..." << std::endl;
    loop.Stop();
    server->Shutdown();
  });

  // Wait for server to finish (will unblock when Shutdown() is called)
  server->Wait();

  // Wait for shutdown thread to complete
  shutdown_thread.join();

  std::cout << "Server shutdown complete." << std::endl;

  return 0;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  // Parse command-line arguments
  auto config = ParseArgs(argc, argv);
  if (!config) {
    return 1;
  }

  // Setup signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Run the server
  return RunServer(*config);
}
