// Repository: BellWatch
// Component: Audio payload validation and simulated detector unit tests

#include <gtest/gtest.h>

#include <memory>

#include "bellwatch/detect/SimulatedDetector.hpp"
#include "bellwatch/runtime/AudioPayloadValidator.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace bellwatch {
namespace {

runtime::AudioPayload Payload(std::size_t bytes, const std::string& mime) {
  runtime::AudioPayload payload;
  payload.mime_type = mime;
  payload.data.assign(bytes, 0);
  return payload;
}

// -----------------------------------------------------------------------------
// AudioPayloadValidator
// -----------------------------------------------------------------------------
TEST(AudioPayloadValidatorTest, AcceptsAudioUploadWithinLimit) {
  runtime::AudioPayloadValidator validator(1024);
  auto result = validator.ValidateUpload(Payload(1024, "audio/webm"));
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.error, runtime::PayloadError::kNone);
}

TEST(AudioPayloadValidatorTest, RejectsEmptyOversizedAndNonAudio) {
  runtime::AudioPayloadValidator validator(1024);

  EXPECT_EQ(validator.ValidateUpload(Payload(0, "audio/wav")).error,
            runtime::PayloadError::kEmpty);
  EXPECT_EQ(validator.ValidateUpload(Payload(1025, "audio/wav")).error,
            runtime::PayloadError::kOversized);
  EXPECT_EQ(validator.ValidateUpload(Payload(10, "video/mp4")).error,
            runtime::PayloadError::kNotAudio);
  EXPECT_EQ(validator.ValidateUpload(Payload(10, "")).error,
            runtime::PayloadError::kNotAudio);
  EXPECT_EQ(validator.ValidateUpload(Payload(10, "audio")).error,
            runtime::PayloadError::kNotAudio);
}

TEST(AudioPayloadValidatorTest, ChunksSkipMimeCheck) {
  runtime::AudioPayloadValidator validator(16);
  EXPECT_TRUE(validator.ValidateChunk(Payload(16, "")).valid);
  EXPECT_EQ(validator.ValidateChunk(Payload(17, "")).error, runtime::PayloadError::kOversized);
  EXPECT_EQ(validator.ValidateChunk(Payload(0, "")).error, runtime::PayloadError::kEmpty);
}

// -----------------------------------------------------------------------------
// SimulatedDetector
// -----------------------------------------------------------------------------
TEST(SimulatedDetectorTest, CertainHitStaysInDocumentedRanges) {
  auto clock = std::make_shared<DeterministicTimeSource>(42'000);
  detect::SimulatedDetector::Config config;
  config.hit_probability = 1.0;
  config.latency_ms = 0;
  config.seed = 99;
  detect::SimulatedDetector detector(config, clock);

  for (int i = 0; i < 200; ++i) {
    auto raw = detector.Detect(Payload(8, "audio/wav"), "s1");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->timestamp_ms, 42'000);
    EXPECT_GE(raw->confidence, 0.85);
    EXPECT_LE(raw->confidence, 1.0);
    EXPECT_GE(raw->frequency_hz, 900.0);
    EXPECT_LT(raw->frequency_hz, 1200.0);
    EXPECT_GE(raw->duration_ms, 200.0);
    EXPECT_LT(raw->duration_ms, 400.0);
  }
}

TEST(SimulatedDetectorTest, ZeroProbabilityNeverHits) {
  auto clock = std::make_shared<DeterministicTimeSource>(0);
  detect::SimulatedDetector::Config config;
  config.hit_probability = 0.0;
  config.latency_ms = 0;
  config.seed = 5;
  detect::SimulatedDetector detector(config, clock);

  for (int i = 0; i < 100; ++i) {
    EXPECT_FALSE(detector.Detect(Payload(8, "audio/wav"), "s1").has_value());
  }
}

TEST(SimulatedDetectorTest, SameSeedSameSequence) {
  auto clock = std::make_shared<DeterministicTimeSource>(0);
  detect::SimulatedDetector::Config config;
  config.hit_probability = 0.5;
  config.latency_ms = 0;
  config.seed = 1234;
  detect::SimulatedDetector a(config, clock);
  detect::SimulatedDetector b(config, clock);

  for (int i = 0; i < 50; ++i) {
    auto ra = a.Detect(Payload(8, "audio/wav"), "s1");
    auto rb = b.Detect(Payload(8, "audio/wav"), "s1");
    ASSERT_EQ(ra.has_value(), rb.has_value());
    if (ra) {
      EXPECT_DOUBLE_EQ(ra->confidence, rb->confidence);
    }
  }
}

}  // namespace
}  // namespace bellwatch
