/**
 * @file signal_utils_test.cpp
 * @brief Tests for contour and envelope statistics.
 */

#include "analysis/signal_utils.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_support/test_helpers.h"

namespace vocalcoach {
namespace {

using test::makeFlatContour;

// ============================================================================
// Contours
// ============================================================================

TEST(SignalUtilsTest, SanitizeZeroesOutOfBandSamples) {
  std::vector<PitchSample> contour = {{0.0, 30.0}, {0.05, 220.0}, {0.1, 1500.0}, {0.15, 0.0}};
  auto clean = sanitizeContour(contour, 50.0, 1100.0);
  ASSERT_EQ(clean.size(), 4u);
  EXPECT_DOUBLE_EQ(clean[0].frequency, 0.0);
  EXPECT_DOUBLE_EQ(clean[1].frequency, 220.0);
  EXPECT_DOUBLE_EQ(clean[2].frequency, 0.0);
  EXPECT_DOUBLE_EQ(clean[3].frequency, 0.0);
  EXPECT_DOUBLE_EQ(clean[2].time, 0.1);
}

TEST(SignalUtilsTest, CentsOff) {
  EXPECT_NEAR(centsOff(440.0, 880.0), 1200.0, 1e-9);
  EXPECT_NEAR(centsOff(440.0, 220.0), -1200.0, 1e-9);
  EXPECT_DOUBLE_EQ(centsOff(0.0, 440.0), 0.0);
  EXPECT_DOUBLE_EQ(centsOff(440.0, 0.0), 0.0);
}

TEST(SignalUtilsTest, AverageCentsSkipsUnvoicedPairs) {
  std::vector<PitchSample> ref = {{0.0, 440.0}, {0.05, 440.0}, {0.1, 0.0}};
  std::vector<PitchSample> user = {{0.0, 880.0}, {0.05, 0.0}, {0.1, 300.0}};
  EXPECT_NEAR(averageAbsoluteCentsDiff(ref, user), 1200.0, 1e-9);
  EXPECT_DOUBLE_EQ(averageAbsoluteCentsDiff(ref, {}), 0.0);
}

TEST(SignalUtilsTest, StabilityOfSteadyNoteIsPerfect) {
  EXPECT_EQ(pitchStabilityScore(makeFlatContour(20, 330.0), 5), 100);
}

TEST(SignalUtilsTest, StabilityPenalizesWobble) {
  std::vector<PitchSample> contour;
  for (int i = 0; i < 20; ++i) contour.push_back({i * 0.05, i % 2 == 0 ? 440.0 : 442.0});
  EXPECT_EQ(pitchStabilityScore(contour, 5), 84);
}

TEST(SignalUtilsTest, StabilityNeedsEnoughVoicedSamples) {
  auto contour = makeFlatContour(4, 330.0);
  contour.push_back({0.2, 0.0});
  EXPECT_EQ(pitchStabilityScore(contour, 5), 50);
  EXPECT_EQ(pitchStabilityScore({}, 0), 50);
}

TEST(SignalUtilsTest, VoicedRatio) {
  std::vector<PitchSample> contour = {{0.0, 200.0}, {0.05, 0.0}, {0.1, 0.0}, {0.15, 210.0}};
  EXPECT_DOUBLE_EQ(voicedRatio(contour), 0.5);
  EXPECT_DOUBLE_EQ(voicedRatio({}), 0.0);
}

// ============================================================================
// Envelopes
// ============================================================================

TEST(SignalUtilsTest, CorrelationOfIdenticalEnvelopesIsOne) {
  std::vector<double> env = {0.1, 0.5, 0.9, 0.4, 0.2};
  EXPECT_NEAR(energyCorrelation(env, env), 1.0, 1e-12);
}

TEST(SignalUtilsTest, CorrelationOfFlatOrEmptyIsZero) {
  std::vector<double> env = {0.1, 0.5, 0.9};
  EXPECT_DOUBLE_EQ(energyCorrelation(env, {0.3, 0.3, 0.3}), 0.0);
  EXPECT_DOUBLE_EQ(energyCorrelation(env, {}), 0.0);
}

TEST(SignalUtilsTest, NegativeCorrelationClampsToZero) {
  EXPECT_DOUBLE_EQ(energyCorrelation({1.0, 0.0, 1.0, 0.0}, {0.0, 1.0, 0.0, 1.0}), 0.0);
}

TEST(SignalUtilsTest, CorrelationUsesCommonPrefix) {
  std::vector<double> a = {0.0, 1.0, 0.0, 1.0};
  std::vector<double> b = {0.0, 1.0, 0.0, 1.0, 5.0, 0.0};
  EXPECT_NEAR(energyCorrelation(a, b), 1.0, 1e-12);
}

TEST(SignalUtilsTest, AverageEnergy) {
  EXPECT_DOUBLE_EQ(averageEnergy({0.2, 0.4}), 0.3);
  EXPECT_DOUBLE_EQ(averageEnergy({}), 0.0);
}

TEST(SignalUtilsTest, ShiftEnvelopeKeepsLength) {
  std::vector<double> env = {1.0, 2.0, 3.0, 4.0};
  EXPECT_EQ(shiftEnvelope(env, 1), (std::vector<double>{0.0, 1.0, 2.0, 3.0}));
  EXPECT_EQ(shiftEnvelope(env, -1), (std::vector<double>{2.0, 3.0, 4.0, 0.0}));
  EXPECT_EQ(shiftEnvelope(env, 0), env);
  EXPECT_EQ(shiftEnvelope(env, 9), (std::vector<double>(4, 0.0)));
}

}  // namespace
}  // namespace vocalcoach
