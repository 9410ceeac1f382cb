// Repository: BellWatch
// Component: Simulated Detector
// Purpose: Stochastic stand-in for the acoustic model.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_DETECT_SIMULATED_DETECTOR_HPP_
#define BELLWATCH_DETECT_SIMULATED_DETECTOR_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

#include "bellwatch/detect/IDetector.hpp"
#include "time/ITimeSource.hpp"

namespace bellwatch::detect {

// Ignores the audio content. Each call sleeps for `latency_ms`, then reports
// a bell with probability `hit_probability`:
//   confidence  in [0.85, 1.0)
//   frequency   in [900, 1200) Hz
//   duration    in [200, 400) ms
//   timestamp   = time source now
class SimulatedDetector : public IDetector {
 public:
  struct Config {
    double hit_probability = 0.3;
    int64_t latency_ms = 100;
    uint32_t seed = 0;  // 0 = seed from std::random_device
  };

  SimulatedDetector(Config config, std::shared_ptr<ITimeSource> time_source);

  std::optional<runtime::RawDetection> Detect(
      const runtime::AudioPayload& payload,
      const std::string& session_id) override;

 private:
  double NextUniform();

  Config config_;
  std::shared_ptr<ITimeSource> time_source_;

  std::mutex rng_mutex_;
  std::mt19937 rng_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

}  // namespace bellwatch::detect

#endif  // BELLWATCH_DETECT_SIMULATED_DETECTOR_HPP_
