// Repository: BellWatch
// Component: Bell Classifier
// Purpose: Derives single/double bell type from timing against the previous bell.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_RUNTIME_BELL_CLASSIFIER_HPP_
#define BELLWATCH_RUNTIME_BELL_CLASSIFIER_HPP_

#include <cstdint>
#include <optional>

#include "bellwatch/runtime/BellTypes.hpp"
#include "bellwatch/runtime/EngineConfig.hpp"

namespace bellwatch::runtime {

// Pure function object. Any type hint the detector might carry is ignored.
//
//   gap = raw.timestamp - last_bell_time
//   min < gap < max  -> double, confidence + boost (clamped at 1.0 if enabled)
//   otherwise        -> single, confidence unchanged
//
// No previous bell means an infinite gap, so the first bell is always single.
class BellClassifier {
 public:
  explicit BellClassifier(ClassifierConfig config = ClassifierConfig{});

  [[nodiscard]] ClassifiedEvent Classify(
      const RawDetection& raw,
      std::optional<int64_t> last_bell_time_ms) const;

  [[nodiscard]] const ClassifierConfig& config() const { return config_; }

 private:
  bool IsDoubleGap(int64_t gap_ms) const;

  ClassifierConfig config_;
};

}  // namespace bellwatch::runtime

#endif  // BELLWATCH_RUNTIME_BELL_CLASSIFIER_HPP_
