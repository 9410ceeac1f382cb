// Repository: BellWatch
// Component: Server Options
// Purpose: Command-line and environment configuration for the tracker server.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_CONFIG_SERVER_OPTIONS_HPP_
#define BELLWATCH_CONFIG_SERVER_OPTIONS_HPP_

#include <functional>
#include <string>
#include <vector>

#include "bellwatch/detect/SimulatedDetector.hpp"
#include "bellwatch/exporter/SessionExportWriter.hpp"
#include "bellwatch/runtime/EngineConfig.hpp"

namespace bellwatch::config {

struct ServerOptions {
  std::string listen_address = "0.0.0.0:3000";
  // Empty disables writing export files.
  std::string export_dir = exporter::SessionExportWriter::kDefaultExportDir;
  runtime::EngineConfig engine;
  detect::SimulatedDetector::Config detector;

  bool help = false;
  bool valid = false;
  std::string error;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// Environment first (BELLWATCH_LISTEN, PORT, BELLWATCH_EXPORT_DIR), then
// flags. PORT only applies when BELLWATCH_LISTEN is unset.
ServerOptions ParseServerOptions(const std::vector<std::string>& args,
                                 const EnvLookup& env);

ServerOptions ParseServerOptions(int argc, char* argv[]);

void PrintUsage(const char* program_name);

}  // namespace bellwatch::config

#endif  // BELLWATCH_CONFIG_SERVER_OPTIONS_HPP_
