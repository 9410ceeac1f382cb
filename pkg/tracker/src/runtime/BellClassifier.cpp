// Repository: BellWatch
// Component: Bell Classifier
// Copyright (c) 2026 BellWatch

#include "bellwatch/runtime/BellClassifier.hpp"

#include <algorithm>

namespace bellwatch::runtime {

BellClassifier::BellClassifier(ClassifierConfig config) : config_(config) {}

bool BellClassifier::IsDoubleGap(int64_t gap_ms) const {
  return gap_ms > config_.double_min_gap_ms && gap_ms < config_.double_max_gap_ms;
}

ClassifiedEvent BellClassifier::Classify(
    const RawDetection& raw,
    std::optional<int64_t> last_bell_time_ms) const {
  ClassifiedEvent event;
  event.type = BellType::kSingle;
  event.timestamp_ms = raw.timestamp_ms;
  event.confidence = raw.confidence;
  event.frequency_hz = raw.frequency_hz;
  event.duration_ms = raw.duration_ms;

  if (!last_bell_time_ms.has_value()) {
    return event;
  }

  const int64_t gap_ms = raw.timestamp_ms - *last_bell_time_ms;
  if (IsDoubleGap(gap_ms)) {
    event.type = BellType::kDouble;
    event.confidence = raw.confidence + config_.double_confidence_boost;
    if (config_.clamp_confidence) {
      event.confidence = std::min(event.confidence, 1.0);
    }
  }
  return event;
}

}  // namespace bellwatch::runtime
