// Repository: BellWatch
// Component: Simulated Detector
// Copyright (c) 2026 BellWatch

#include "bellwatch/detect/SimulatedDetector.hpp"

#include <chrono>
#include <sstream>
#include <thread>

#include "bellwatch/util/Logger.hpp"

namespace bellwatch::detect {

using bellwatch::util::Logger;

namespace {

uint32_t ResolveSeed(uint32_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return rd();
}

}  // namespace

SimulatedDetector::SimulatedDetector(Config config, std::shared_ptr<ITimeSource> time_source)
    : config_(config),
      time_source_(std::move(time_source)),
      rng_(ResolveSeed(config.seed)) {}

double SimulatedDetector::NextUniform() {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return unit_(rng_);
}

std::optional<runtime::RawDetection> SimulatedDetector::Detect(
    const runtime::AudioPayload& payload,
    const std::string& session_id) {
  if (config_.latency_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.latency_ms));
  }

  if (NextUniform() >= config_.hit_probability) {
    return std::nullopt;
  }

  runtime::RawDetection raw;
  raw.timestamp_ms = time_source_->NowUtcMs();
  raw.confidence = 0.85 + NextUniform() * 0.15;
  raw.frequency_hz = 900.0 + NextUniform() * 300.0;
  raw.duration_ms = 200.0 + NextUniform() * 200.0;

  std::ostringstream oss;
  oss << "[SimulatedDetector] HIT session=" << session_id
      << " bytes=" << payload.data.size()
      << " confidence=" << raw.confidence;
  Logger::Debug(oss.str());
  return raw;
}

}  // namespace bellwatch::detect
