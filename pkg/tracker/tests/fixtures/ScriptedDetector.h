// Repository: BellWatch
// Component: Scripted Detector
// Purpose: Test detector that replays a queue of canned outcomes.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_TESTS_FIXTURES_SCRIPTED_DETECTOR_H_
#define BELLWATCH_TESTS_FIXTURES_SCRIPTED_DETECTOR_H_

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "bellwatch/detect/IDetector.hpp"

namespace bellwatch::tests::fixtures
{

  // ScriptedDetector pops one step per Detect() call. An exhausted script
  // behaves like "nothing detected".
  class ScriptedDetector : public detect::IDetector
  {
  public:
    void QueueHit(int64_t timestamp_ms, double confidence = 0.9,
                  double frequency_hz = 1000.0, double duration_ms = 300.0)
    {
      Step step;
      step.kind = StepKind::kHit;
      step.raw.timestamp_ms = timestamp_ms;
      step.raw.confidence = confidence;
      step.raw.frequency_hz = frequency_hz;
      step.raw.duration_ms = duration_ms;
      Push(step);
    }

    void QueueMiss()
    {
      Step step;
      step.kind = StepKind::kMiss;
      Push(step);
    }

    void QueueFailure(const std::string &error)
    {
      Step step;
      step.kind = StepKind::kFailure;
      step.error = error;
      Push(step);
    }

    std::optional<runtime::RawDetection> Detect(const runtime::AudioPayload &payload,
                                                const std::string &session_id) override
    {
      Step step;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(session_id);
        last_payload_size_ = payload.data.size();
        if (steps_.empty())
        {
          return std::nullopt;
        }
        step = steps_.front();
        steps_.pop_front();
      }
      switch (step.kind)
      {
      case StepKind::kHit:
        return step.raw;
      case StepKind::kFailure:
        throw detect::DetectorError(step.error);
      case StepKind::kMiss:
        break;
      }
      return std::nullopt;
    }

    size_t CallCount() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return calls_.size();
    }

    size_t LastPayloadSize() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return last_payload_size_;
    }

  private:
    enum class StepKind
    {
      kHit,
      kMiss,
      kFailure
    };

    struct Step
    {
      StepKind kind = StepKind::kMiss;
      runtime::RawDetection raw;
      std::string error;
    };

    void Push(const Step &step)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      steps_.push_back(step);
    }

    mutable std::mutex mutex_;
    std::deque<Step> steps_;
    std::vector<std::string> calls_;
    size_t last_payload_size_ = 0;
  };

} // namespace bellwatch::tests::fixtures

#endif // BELLWATCH_TESTS_FIXTURES_SCRIPTED_DETECTOR_H_
