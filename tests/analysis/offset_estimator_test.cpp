/**
 * @file offset_estimator_test.cpp
 * @brief Tests for envelope cross-correlation and onset offset estimation.
 */

#include "analysis/offset_estimator.h"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "test_support/test_helpers.h"

namespace vocalcoach {
namespace {

using test::makeBurstEnvelope;

// ============================================================================
// Building blocks
// ============================================================================

TEST(NormalizedCorrelationTest, AlignedBurstsCorrelateFully) {
  auto ref = makeBurstEnvelope(40, 10, 20);
  auto rec = makeBurstEnvelope(40, 14, 24);
  EXPECT_NEAR(normalizedCorrelation(ref, rec, 4), 1.0, 1e-12);
  EXPECT_LT(normalizedCorrelation(ref, rec, 0), 1.0);
}

TEST(NormalizedCorrelationTest, TooLittleOverlapIsZero) {
  std::vector<double> a = {0.0, 1.0, 0.5, 0.2};
  EXPECT_DOUBLE_EQ(normalizedCorrelation(a, a, 2), 0.0);
  EXPECT_DOUBLE_EQ(normalizedCorrelation({1.0, 2.0}, {1.0, 2.0}, 0), 0.0);
}

TEST(NormalizedCorrelationTest, FlatOverlapIsZero) {
  EXPECT_DOUBLE_EQ(normalizedCorrelation({1.0, 1.0, 1.0, 1.0}, {0.0, 1.0, 0.0, 1.0}, 0), 0.0);
}

TEST(OnsetLagTest, DifferenceOfFirstOnsets) {
  auto ref = makeBurstEnvelope(40, 10, 20);
  auto rec = makeBurstEnvelope(40, 14, 24, 2.0, 0.1);
  EXPECT_EQ(onsetLagBins(ref, rec, 0.4), std::optional<int>(4));
  EXPECT_EQ(onsetLagBins(rec, ref, 0.4), std::optional<int>(-4));
}

TEST(OnsetLagTest, EmptyEnvelopeHasNoOnset) {
  EXPECT_FALSE(onsetLagBins({}, {1.0}, 0.4).has_value());
  EXPECT_FALSE(onsetLagBins({1.0}, {}, 0.4).has_value());
}

// ============================================================================
// EnvelopeOffsetEstimator
// ============================================================================

TEST(EnvelopeOffsetEstimatorTest, DelayedRecordingGivesPositiveOffset) {
  EnvelopeOffsetEstimator estimator;
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(40, 10, 20), makeBurstEnvelope(40, 14, 24));
  EXPECT_EQ(estimate.method, OffsetMethod::XCorr);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 200.0);
  ASSERT_TRUE(estimate.correlation.has_value());
  EXPECT_NEAR(*estimate.correlation, 1.0, 1e-9);
}

TEST(EnvelopeOffsetEstimatorTest, EarlyRecordingGivesNegativeOffset) {
  EnvelopeOffsetEstimator estimator;
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(40, 10, 20), makeBurstEnvelope(40, 7, 17));
  EXPECT_EQ(estimate.method, OffsetMethod::XCorr);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, -150.0);
}

TEST(EnvelopeOffsetEstimatorTest, StepSizeScalesOffset) {
  OffsetEstimatorConfig config;
  config.step_sec = 0.02;
  EnvelopeOffsetEstimator estimator(config);
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(60, 10, 20), makeBurstEnvelope(60, 15, 25));
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 100.0);
}

TEST(EnvelopeOffsetEstimatorTest, OffsetStaysWithinSearchBound) {
  OffsetEstimatorConfig config;
  config.max_offset_ms = 100.0;
  EnvelopeOffsetEstimator estimator(config);
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(40, 10, 20), makeBurstEnvelope(40, 16, 26));
  EXPECT_LE(std::abs(estimate.offset_ms), 100.0);
}

TEST(EnvelopeOffsetEstimatorTest, WeakCorrelationFallsBackToOnset) {
  OffsetEstimatorConfig config;
  config.min_correlation = 2.0;
  EnvelopeOffsetEstimator estimator(config);
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(40, 10, 20), makeBurstEnvelope(40, 14, 24));
  EXPECT_EQ(estimate.method, OffsetMethod::Onset);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 200.0);
  EXPECT_FALSE(estimate.correlation.has_value());
}

TEST(EnvelopeOffsetEstimatorTest, OnsetOffsetIsClamped) {
  OffsetEstimatorConfig config;
  config.min_correlation = 2.0;
  config.max_offset_ms = 100.0;
  EnvelopeOffsetEstimator estimator(config);
  OffsetEstimate estimate =
      estimator.estimate(makeBurstEnvelope(40, 2, 6), makeBurstEnvelope(40, 30, 34));
  EXPECT_EQ(estimate.method, OffsetMethod::Onset);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 100.0);
}

TEST(EnvelopeOffsetEstimatorTest, SilentEnvelopesFallBackToOnsetAtZero) {
  EnvelopeOffsetEstimator estimator;
  OffsetEstimate estimate =
      estimator.estimate(std::vector<double>(20, 0.0), std::vector<double>(20, 0.0));
  EXPECT_EQ(estimate.method, OffsetMethod::Onset);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 0.0);
}

TEST(EnvelopeOffsetEstimatorTest, EmptyInputGivesNone) {
  EnvelopeOffsetEstimator estimator;
  OffsetEstimate estimate = estimator.estimate({}, makeBurstEnvelope(10, 2, 4));
  EXPECT_EQ(estimate.method, OffsetMethod::None);
  EXPECT_DOUBLE_EQ(estimate.offset_ms, 0.0);
  EXPECT_FALSE(estimate.correlation.has_value());
}

TEST(EnvelopeOffsetEstimatorTest, MethodNames) {
  EXPECT_STREQ(offsetMethodName(OffsetMethod::None), "none");
  EXPECT_STREQ(offsetMethodName(OffsetMethod::XCorr), "xcorr");
  EXPECT_STREQ(offsetMethodName(OffsetMethod::Onset), "onset");
}

// ============================================================================
// Custom estimators
// ============================================================================

class FixedOffsetEstimator : public IOffsetEstimator {
 public:
  explicit FixedOffsetEstimator(double offset_ms) : offset_ms_(offset_ms) {}

  OffsetEstimate estimate(const std::vector<double>&, const std::vector<double>&) const override {
    OffsetEstimate result;
    result.offset_ms = offset_ms_;
    result.method = OffsetMethod::Onset;
    return result;
  }

 private:
  double offset_ms_;
};

TEST(OffsetEstimatorInterfaceTest, ImplementationsAreInterchangeable) {
  std::vector<std::unique_ptr<IOffsetEstimator>> estimators;
  estimators.push_back(std::make_unique<EnvelopeOffsetEstimator>());
  estimators.push_back(std::make_unique<FixedOffsetEstimator>(200.0));

  auto ref = makeBurstEnvelope(40, 10, 20);
  auto rec = makeBurstEnvelope(40, 14, 24);
  for (const auto& estimator : estimators) {
    EXPECT_DOUBLE_EQ(estimator->estimate(ref, rec).offset_ms, 200.0);
  }
}

}  // namespace
}  // namespace vocalcoach
