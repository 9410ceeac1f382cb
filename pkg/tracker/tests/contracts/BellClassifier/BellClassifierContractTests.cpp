// Repository: BellWatch
// Component: BellClassifier Contract Tests
// Purpose: Verify the single/double gap window and confidence clamping.
// Copyright (c) 2026 BellWatch

#include <gtest/gtest.h>

#include "bellwatch/runtime/BellClassifier.hpp"

namespace bellwatch::tests::contracts {

namespace {

runtime::RawDetection Raw(int64_t timestamp_ms, double confidence = 0.9) {
  runtime::RawDetection raw;
  raw.timestamp_ms = timestamp_ms;
  raw.confidence = confidence;
  raw.frequency_hz = 1000.0;
  raw.duration_ms = 300.0;
  return raw;
}

}  // namespace

class BellClassifierContractTest : public ::testing::Test {
 protected:
  runtime::BellClassifier classifier_;
};

TEST_F(BellClassifierContractTest, CLS_001_FirstBellOfSessionIsSingle) {
  auto event = classifier_.Classify(Raw(5'000, 0.9), std::nullopt);
  EXPECT_EQ(event.type, runtime::BellType::kSingle);
  EXPECT_DOUBLE_EQ(event.confidence, 0.9);
  EXPECT_EQ(event.timestamp_ms, 5'000);
}

TEST_F(BellClassifierContractTest, CLS_002_GapInsideWindowIsDouble) {
  auto event = classifier_.Classify(Raw(2'000, 0.8), 1'000);
  EXPECT_EQ(event.type, runtime::BellType::kDouble);
  EXPECT_NEAR(event.confidence, 0.9, 1e-9);
}

TEST_F(BellClassifierContractTest, CLS_003_GapOutsideWindowIsSingle) {
  auto event = classifier_.Classify(Raw(2'000, 0.8), 0);
  EXPECT_EQ(event.type, runtime::BellType::kSingle);
  EXPECT_DOUBLE_EQ(event.confidence, 0.8);
}

TEST_F(BellClassifierContractTest, CLS_004_WindowBoundsAreExclusive) {
  EXPECT_EQ(classifier_.Classify(Raw(1'050), 1'000).type, runtime::BellType::kSingle);
  EXPECT_EQ(classifier_.Classify(Raw(1'051), 1'000).type, runtime::BellType::kDouble);
  EXPECT_EQ(classifier_.Classify(Raw(2'499), 1'000).type, runtime::BellType::kDouble);
  EXPECT_EQ(classifier_.Classify(Raw(2'500), 1'000).type, runtime::BellType::kSingle);
}

TEST_F(BellClassifierContractTest, CLS_005_BoostedConfidenceClampedAtOne) {
  auto event = classifier_.Classify(Raw(1'200, 0.97), 1'000);
  EXPECT_EQ(event.type, runtime::BellType::kDouble);
  EXPECT_DOUBLE_EQ(event.confidence, 1.0);
}

TEST_F(BellClassifierContractTest, CLS_006_ClampCanBeDisabled) {
  runtime::ClassifierConfig config;
  config.clamp_confidence = false;
  runtime::BellClassifier unclamped(config);

  auto event = unclamped.Classify(Raw(1'200, 0.97), 1'000);
  EXPECT_EQ(event.type, runtime::BellType::kDouble);
  EXPECT_NEAR(event.confidence, 1.07, 1e-9);
}

TEST_F(BellClassifierContractTest, CLS_007_DetectionOlderThanLastBellIsSingle) {
  auto event = classifier_.Classify(Raw(900), 1'000);
  EXPECT_EQ(event.type, runtime::BellType::kSingle);
}

TEST_F(BellClassifierContractTest, CLS_008_MeasurementsCopiedThrough) {
  runtime::RawDetection raw = Raw(3'000, 0.5);
  raw.frequency_hz = 1111.5;
  raw.duration_ms = 250.25;

  auto event = classifier_.Classify(raw, 2'000);
  EXPECT_DOUBLE_EQ(event.frequency_hz, 1111.5);
  EXPECT_DOUBLE_EQ(event.duration_ms, 250.25);
  EXPECT_EQ(event.timestamp_ms, 3'000);
}

}  // namespace bellwatch::tests::contracts
