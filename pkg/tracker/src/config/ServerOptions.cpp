// Repository: BellWatch
// Component: Server Options
// Copyright (c) 2026 BellWatch

#include "bellwatch/config/ServerOptions.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace bellwatch::config {

namespace {

bool ParseInt(const std::string& text, int64_t* out) {
  try {
    std::size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size()) return false;
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseDouble(const std::string& text, double* out) {
  try {
    std::size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != text.size()) return false;
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool IsProbability(double p) { return p >= 0.0 && p <= 1.0; }

void ApplyEnvironment(const EnvLookup& env, ServerOptions* options) {
  if (!env) return;
  if (const char* listen = env("BELLWATCH_LISTEN"); listen && *listen) {
    options->listen_address = listen;
  } else if (const char* port = env("PORT"); port && *port) {
    options->listen_address = std::string("0.0.0.0:") + port;
  }
  if (const char* dir = env("BELLWATCH_EXPORT_DIR"); dir) {
    options->export_dir = dir;
  }
}

}  // namespace

ServerOptions ParseServerOptions(const std::vector<std::string>& args,
                                 const EnvLookup& env) {
  ServerOptions options;
  ApplyEnvironment(env, &options);

  auto fail = [&options](const std::string& error) {
    options.error = error;
    options.valid = false;
    return options;
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    const bool has_value = i + 1 < args.size();

    if (arg == "--help" || arg == "-h") {
      options.help = true;
      options.valid = true;
      return options;
    } else if (arg == "--no-clamp-confidence") {
      options.engine.classifier.clamp_confidence = false;
    } else if (!has_value) {
      return fail("Unknown argument or missing value: " + arg);
    } else if (arg == "--listen") {
      options.listen_address = args[++i];
    } else if (arg == "--export-dir") {
      options.export_dir = args[++i];
    } else if (arg == "--revert-delay-ms") {
      int64_t v = 0;
      if (!ParseInt(args[++i], &v) || v < 0 || v > runtime::kMaxRevertDelayMs) {
        return fail("Invalid --revert-delay-ms");
      }
      options.engine.revert_delay_ms = v;
    } else if (arg == "--max-payload-bytes") {
      int64_t v = 0;
      if (!ParseInt(args[++i], &v) || v <= 0) return fail("Invalid --max-payload-bytes");
      options.engine.max_payload_bytes = static_cast<std::size_t>(v);
    } else if (arg == "--probe-interval-ms") {
      int64_t v = 0;
      if (!ParseInt(args[++i], &v) || v < 0) return fail("Invalid --probe-interval-ms");
      options.engine.probe_interval_ms = v;
    } else if (arg == "--probe-probability") {
      double v = 0.0;
      if (!ParseDouble(args[++i], &v) || !IsProbability(v)) {
        return fail("Invalid --probe-probability");
      }
      options.engine.probe_probability = v;
    } else if (arg == "--detector-hit-probability") {
      double v = 0.0;
      if (!ParseDouble(args[++i], &v) || !IsProbability(v)) {
        return fail("Invalid --detector-hit-probability");
      }
      options.detector.hit_probability = v;
    } else if (arg == "--detector-latency-ms") {
      int64_t v = 0;
      if (!ParseInt(args[++i], &v) || v < 0) return fail("Invalid --detector-latency-ms");
      options.detector.latency_ms = v;
    } else if (arg == "--seed") {
      int64_t v = 0;
      if (!ParseInt(args[++i], &v) || v < 0) return fail("Invalid --seed");
      options.detector.seed = static_cast<uint32_t>(v);
      options.engine.probe_seed = static_cast<uint32_t>(v);
    } else {
      return fail("Unknown argument: " + arg);
    }
  }

  if (options.listen_address.empty()) {
    return fail("Listen address must not be empty");
  }

  options.valid = true;
  return options;
}

ServerOptions ParseServerOptions(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return ParseServerOptions(args, [](const char* name) { return std::getenv(name); });
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "BellWatch tracker: gRPC server that turns bell detections into\n"
            << "per-session bus status, timelines and global statistics.\n"
            << "\n"
            << "SERVER:\n"
            << "  --listen ADDR                  gRPC listen address (default: 0.0.0.0:3000)\n"
            << "  --export-dir DIR               Export JSON directory, empty disables\n"
            << "                                 (default: data/exports)\n"
            << "\n"
            << "ENGINE:\n"
            << "  --revert-delay-ms MS           Delay before bus status returns to idle\n"
            << "                                 (default: 10000, max: 86400000)\n"
            << "  --max-payload-bytes N          Largest accepted audio payload (default: 10485760)\n"
            << "  --no-clamp-confidence          Do not clamp boosted double-bell confidence at 1.0\n"
            << "\n"
            << "PROBING AND DETECTOR:\n"
            << "  --probe-interval-ms MS         Synthetic probe interval while recording, 0 disables\n"
            << "                                 (default: 2000)\n"
            << "  --probe-probability P          Chance a probe tick runs detection (default: 0.15)\n"
            << "  --detector-hit-probability P   Simulated detector hit rate (default: 0.3)\n"
            << "  --detector-latency-ms MS       Simulated detector latency (default: 100)\n"
            << "  --seed N                       Fixed random seed, 0 = random (default: 0)\n"
            << "  --help                         Show this help message\n"
            << "\n"
            << "ENVIRONMENT (overridden by flags):\n"
            << "  BELLWATCH_LISTEN, PORT, BELLWATCH_EXPORT_DIR, BELLWATCH_DEBUG\n"
            << "\n";
}

}  // namespace bellwatch::config
