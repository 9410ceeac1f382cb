// Repository: BellWatch
// Component: Tracker Server Entry Point
// Purpose: Wires BellEngine to the BellTracker gRPC service and serves until signalled.
// Copyright (c) 2026 BellWatch

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "bell_tracker_service.h"
#include "bellwatch/config/ServerOptions.hpp"
#include "bellwatch/detect/SimulatedDetector.hpp"
#include "bellwatch/exporter/SessionExportWriter.hpp"
#include "bellwatch/runtime/BellEngine.hpp"
#include "bellwatch/runtime/TimerRevertScheduler.hpp"
#include "bellwatch/util/Logger.hpp"
#include "time/SystemTimeSource.hpp"

namespace {

using bellwatch::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = bellwatch::config::ParseServerOptions(argc, argv);

  if (options.help) {
    bellwatch::config::PrintUsage(argv[0]);
    return 0;
  }

  if (!options.valid) {
    std::cerr << "Error: " << options.error << "\n\n";
    bellwatch::config::PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto time_source = std::make_shared<bellwatch::SystemTimeSource>();
  auto scheduler = std::make_shared<bellwatch::runtime::TimerRevertScheduler>(time_source);
  auto detector = std::make_shared<bellwatch::detect::SimulatedDetector>(
      options.detector, time_source);

  std::unique_ptr<bellwatch::exporter::SessionExportWriter> export_writer;
  if (!options.export_dir.empty()) {
    export_writer =
        std::make_unique<bellwatch::exporter::SessionExportWriter>(options.export_dir);
  }

  auto engine = std::make_shared<bellwatch::runtime::BellEngine>(
      options.engine, time_source, detector, scheduler, std::move(export_writer));
  bellwatch::tracker::BellTrackerImpl service(engine);

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(options.listen_address, grpc::InsecureServerCredentials(),
                           &selected_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || selected_port == 0) {
    Logger::Error("[Main] LISTEN_FAILED address=" + options.listen_address);
    return 1;
  }

  {
    std::ostringstream oss;
    oss << "[Main] SERVER_START address=" << options.listen_address
        << " port=" << selected_port
        << " export_dir=" << (options.export_dir.empty() ? "(disabled)" : options.export_dir)
        << " revert_delay_ms=" << options.engine.revert_delay_ms
        << " probe_interval_ms=" << options.engine.probe_interval_ms;
    Logger::Info(oss.str());
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[Main] SHUTDOWN_REQUESTED");
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  engine->Shutdown();
  scheduler->Shutdown();
  Logger::Info("[Main] SERVER_STOP");
  return 0;
}
