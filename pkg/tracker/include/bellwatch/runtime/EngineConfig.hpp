// Repository: BellWatch
// Component: Engine Configuration
// Purpose: Tunables for classification, session retention, probing and export.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_ENGINE_CONFIG_HPP_
#define BELLWATCH_RUNTIME_ENGINE_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace bellwatch::runtime {

struct ClassifierConfig {
  // A bell is "double" when min < gap < max (both exclusive).
  int64_t double_min_gap_ms = 50;
  int64_t double_max_gap_ms = 1500;
  double double_confidence_boost = 0.1;
  bool clamp_confidence = true;  // clamp boosted confidence at 1.0
};

// Upper bound accepted for revert_delay_ms (one day).
constexpr int64_t kMaxRevertDelayMs = 86'400'000;

struct EngineConfig {
  ClassifierConfig classifier;

  int64_t revert_delay_ms = 10'000;  // 0..kMaxRevertDelayMs
  std::size_t timeline_capacity = 10;

  std::size_t max_payload_bytes = 10 * 1024 * 1024;

  // Read-time limits for GetSession / QueryHistory.
  std::size_t session_view_history_limit = 50;
  std::size_t session_view_timeline_limit = 20;
  std::size_t history_query_limit = 100;

  // Synthetic probing while recording. interval 0 disables it.
  int64_t probe_interval_ms = 2'000;
  double probe_probability = 0.15;
  std::size_t probe_payload_bytes = 1024;
  uint32_t probe_seed = 0;  // 0 = seed from std::random_device
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_ENGINE_CONFIG_HPP_
