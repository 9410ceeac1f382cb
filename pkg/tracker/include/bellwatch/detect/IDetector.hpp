// Repository: BellWatch
// Component: Detector Interface
// Purpose: Pluggable source of raw bell detections.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_DETECT_IDETECTOR_HPP_
#define BELLWATCH_DETECT_IDETECTOR_HPP_

#include <optional>
#include <stdexcept>
#include <string>

#include "bellwatch/runtime/BellTypes.hpp"

namespace bellwatch::detect {

// Thrown by detectors when analysis could not run. The engine logs it and
// treats the call as "no detection".
class DetectorError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// IDetector may block (model inference, simulated latency). Calls for one
// session are serialized; calls for different sessions may run
// concurrently. Session state is never locked during a call.
class IDetector {
 public:
  virtual ~IDetector() = default;

  // nullopt: nothing detected in this payload.
  virtual std::optional<runtime::RawDetection> Detect(
      const runtime::AudioPayload& payload,
      const std::string& session_id) = 0;
};

}  // namespace bellwatch::detect

#endif  // BELLWATCH_DETECT_IDETECTOR_HPP_
