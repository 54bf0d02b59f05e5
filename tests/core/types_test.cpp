/**
 * @file types_test.cpp
 * @brief Tests for core type helpers.
 */

#include "core/types.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "core/math_utils.h"

namespace vocalcoach {
namespace {

TEST(ConfidenceLabelTest, Thresholds) {
  EXPECT_EQ(confidenceLabelFor(1.0), ConfidenceLabel::High);
  EXPECT_EQ(confidenceLabelFor(0.78), ConfidenceLabel::High);
  EXPECT_EQ(confidenceLabelFor(0.77), ConfidenceLabel::Medium);
  EXPECT_EQ(confidenceLabelFor(0.5), ConfidenceLabel::Medium);
  EXPECT_EQ(confidenceLabelFor(0.49), ConfidenceLabel::Low);
  EXPECT_EQ(confidenceLabelFor(0.0), ConfidenceLabel::Low);
}

TEST(ConfidenceLabelTest, Names) {
  EXPECT_STREQ(confidenceLabelName(ConfidenceLabel::High), "High");
  EXPECT_STREQ(confidenceLabelName(ConfidenceLabel::Medium), "Medium");
  EXPECT_STREQ(confidenceLabelName(ConfidenceLabel::Low), "Low");
}

TEST(AlignmentStatusTest, CorrectStatuses) {
  EXPECT_TRUE(isCorrectStatus(AlignmentStatus::Correct));
  EXPECT_TRUE(isCorrectStatus(AlignmentStatus::CorrectEarly));
  EXPECT_TRUE(isCorrectStatus(AlignmentStatus::CorrectLate));
  EXPECT_FALSE(isCorrectStatus(AlignmentStatus::Incorrect));
  EXPECT_FALSE(isCorrectStatus(AlignmentStatus::Missed));
  EXPECT_FALSE(isCorrectStatus(AlignmentStatus::ExtraIgnored));
}

TEST(AlignmentStatusTest, WireNames) {
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::Correct), "correct");
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::CorrectEarly), "correct_early");
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::CorrectLate), "correct_late");
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::Incorrect), "incorrect");
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::Missed), "missed");
  EXPECT_STREQ(alignmentStatusName(AlignmentStatus::ExtraIgnored), "extra_ignored");
}

// ============================================================================
// Rounding
// ============================================================================

TEST(MathUtilsTest, RoundHalfAwayFromZero) {
  EXPECT_EQ(roundToInt(2.5), 3);
  EXPECT_EQ(roundToInt(-2.5), -3);
  EXPECT_EQ(roundToInt(2.49), 2);
  EXPECT_EQ(roundToInt(-0.4), 0);
}

TEST(MathUtilsTest, RoundSaturatesToIntRange) {
  EXPECT_EQ(roundToInt(5e12), std::numeric_limits<int>::max());
  EXPECT_EQ(roundToInt(-5e12), std::numeric_limits<int>::min());
  EXPECT_EQ(roundToInt(std::numeric_limits<double>::infinity()), std::numeric_limits<int>::max());
  EXPECT_EQ(roundToInt(std::numeric_limits<double>::quiet_NaN()), 0);
}

TEST(MathUtilsTest, RepresentableMilliseconds) {
  EXPECT_TRUE(isRepresentableMs(2.0e9));
  EXPECT_FALSE(isRepresentableMs(5e12));
  EXPECT_FALSE(isRepresentableMs(-5e12));
  EXPECT_FALSE(isRepresentableMs(std::numeric_limits<double>::quiet_NaN()));
  EXPECT_TRUE(isRepresentableSec(3600.0));
  EXPECT_FALSE(isRepresentableSec(3.0e6));
}

TEST(MathUtilsTest, ClampScore) {
  EXPECT_EQ(clampScore(-12.0), 0);
  EXPECT_EQ(clampScore(99.5), 100);
  EXPECT_EQ(clampScore(140.0), 100);
  EXPECT_EQ(clampScore(63.2), 63);
}

TEST(MathUtilsTest, MeanOfEmptyIsZero) {
  EXPECT_DOUBLE_EQ(mean({}), 0.0);
  EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 3.0}), 2.0);
}

}  // namespace
}  // namespace vocalcoach
