/**
 * @file word_aligner_test.cpp
 * @brief Tests for reference/user word alignment.
 */

#include "alignment/word_aligner.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "test_support/test_helpers.h"

namespace vocalcoach {
namespace {

using test::makeWord;
using test::makeWords;
using test::shiftWords;

size_t countMatched(const AlignmentResult& result) {
  return static_cast<size_t>(
      std::count_if(result.per_word.begin(), result.per_word.end(),
                    [](const AlignmentWordResult& w) { return w.status != AlignmentStatus::Missed; }));
}

// ============================================================================
// Shape
// ============================================================================

TEST(WordAlignerTest, OneResultPerReferenceWord) {
  auto ref = makeWords("hold on to the night");
  auto user = makeWords("oh hold on the night tonight");
  AlignmentResult result = alignWords(ref, user);

  ASSERT_EQ(result.per_word.size(), ref.size());
  for (size_t i = 0; i < ref.size(); ++i) {
    EXPECT_EQ(result.per_word[i].ref_index, ref[i].index);
    EXPECT_EQ(result.per_word[i].ref_word, ref[i].word);
  }
  EXPECT_EQ(result.extras.size(), user.size() - countMatched(result));
}

TEST(WordAlignerTest, ExtrasKeepUserOrder) {
  auto ref = makeWords("hold on");
  auto user = makeWords("oh hold on tight");
  AlignmentResult result = alignWords(ref, user);

  ASSERT_EQ(result.extras.size(), 2u);
  EXPECT_EQ(result.extras[0].word, "oh");
  EXPECT_EQ(result.extras[1].word, "tight");
  EXPECT_EQ(result.metrics.extra_words, (std::vector<std::string>{"oh", "tight"}));
  EXPECT_EQ(result.metrics.word_accuracy_pct, 100);
}

TEST(WordAlignerTest, EmptyReference) {
  AlignmentResult result = alignWords({}, makeWords("la la"));
  EXPECT_TRUE(result.per_word.empty());
  EXPECT_EQ(result.extras.size(), 2u);
  EXPECT_EQ(result.metrics.word_accuracy_pct, 0);
  EXPECT_EQ(result.confidence_label, ConfidenceLabel::Low);
}

TEST(WordAlignerTest, EmptyUserMissesEverything) {
  auto ref = makeWords("shine a light");
  AlignmentResult result = alignWords(ref, {});
  ASSERT_EQ(result.per_word.size(), 3u);
  for (const auto& word : result.per_word) {
    EXPECT_EQ(word.status, AlignmentStatus::Missed);
    EXPECT_FALSE(word.user_word.has_value());
    EXPECT_FALSE(word.delta_ms.has_value());
    ASSERT_TRUE(word.confidence.has_value());
    EXPECT_DOUBLE_EQ(*word.confidence, 0.0);
  }
  EXPECT_EQ(result.metrics.word_accuracy_pct, 0);
  EXPECT_EQ(result.metrics.missed_words.size(), 3u);
  EXPECT_EQ(result.confidence_label, ConfidenceLabel::Low);
}

// ============================================================================
// Verdicts
// ============================================================================

TEST(WordAlignerTest, IdenticalSequencesAreAllCorrect) {
  auto ref = makeWords("we are young and free");
  AlignmentResult result = alignWords(ref, ref);

  for (const auto& word : result.per_word) {
    EXPECT_EQ(word.status, AlignmentStatus::Correct);
    ASSERT_TRUE(word.delta_ms.has_value());
    EXPECT_EQ(*word.delta_ms, 0);
    EXPECT_EQ(word.confidence_label, ConfidenceLabel::High);
  }
  EXPECT_EQ(result.metrics.word_accuracy_pct, 100);
  EXPECT_EQ(result.metrics.timing_mean_abs_ms, 0);
  EXPECT_TRUE(result.metrics.missed_words.empty());
  EXPECT_TRUE(result.extras.empty());
  EXPECT_EQ(result.confidence_label, ConfidenceLabel::High);
}

TEST(WordAlignerTest, CaseAndPunctuationDoNotMatter) {
  auto ref = makeWords("Hello, world!");
  auto user = makeWords("hello world");
  AlignmentResult result = alignWords(ref, user);
  EXPECT_EQ(result.per_word[0].status, AlignmentStatus::Correct);
  EXPECT_EQ(result.per_word[1].status, AlignmentStatus::Correct);
}

TEST(WordAlignerTest, PhoneticMisspellingIsIncorrectWithHighConfidence) {
  auto ref = makeWords("shine the light");
  auto user = makeWords("shine the lite");
  AlignmentResult result = alignWords(ref, user);

  const AlignmentWordResult& word = result.per_word[2];
  EXPECT_EQ(word.status, AlignmentStatus::Incorrect);
  ASSERT_TRUE(word.confidence.has_value());
  EXPECT_GT(*word.confidence, 0.4);
  ASSERT_TRUE(word.confidence_label.has_value());
  EXPECT_NE(*word.confidence_label, ConfidenceLabel::Low);
  EXPECT_EQ(word.user_word, std::optional<std::string>("lite"));
  EXPECT_EQ(result.metrics.missed_words, (std::vector<std::string>{"light"}));
}

TEST(WordAlignerTest, UnrelatedSubstitutionHasLowerConfidence) {
  auto ref = makeWords("shine the light");
  AlignmentResult close = alignWords(ref, makeWords("shine the lite"));
  AlignmentResult far = alignWords(ref, makeWords("shine the banana"));

  ASSERT_EQ(far.per_word[2].status, AlignmentStatus::Incorrect);
  EXPECT_LT(*far.per_word[2].confidence + 0.5, *close.per_word[2].confidence);
  EXPECT_EQ(far.per_word[2].confidence_label, ConfidenceLabel::Low);
}

TEST(WordAlignerTest, DroppedWordIsMissed) {
  auto ref = makeWords("hold on to me");
  std::vector<WordToken> user = {makeWord("hold", 0.0, 0.4, 0), makeWord("on", 0.5, 0.9, 1),
                                 makeWord("me", 1.5, 1.9, 2)};
  AlignmentResult result = alignWords(ref, user);

  EXPECT_EQ(result.per_word[2].status, AlignmentStatus::Missed);
  EXPECT_EQ(result.per_word[3].status, AlignmentStatus::Correct);
  EXPECT_EQ(result.metrics.word_accuracy_pct, 75);
  EXPECT_EQ(result.metrics.missed_words, (std::vector<std::string>{"to"}));
}

// ============================================================================
// Timing
// ============================================================================

TEST(WordAlignerTest, EarlyAndLateClassification) {
  std::vector<WordToken> ref = {makeWord("one", 1.0, 1.4, 0), makeWord("two", 2.0, 2.4, 1),
                                makeWord("three", 3.0, 3.4, 2)};
  std::vector<WordToken> user = {makeWord("one", 0.7, 1.1, 0), makeWord("two", 2.1, 2.5, 1),
                                 makeWord("three", 3.35, 3.7, 2)};
  AlignmentResult result = alignWords(ref, user);

  EXPECT_EQ(result.per_word[0].status, AlignmentStatus::CorrectEarly);
  EXPECT_EQ(*result.per_word[0].delta_ms, -300);
  EXPECT_EQ(result.per_word[1].status, AlignmentStatus::Correct);
  EXPECT_EQ(*result.per_word[1].delta_ms, 100);
  EXPECT_EQ(result.per_word[2].status, AlignmentStatus::CorrectLate);
  EXPECT_EQ(*result.per_word[2].delta_ms, 350);
  EXPECT_EQ(result.metrics.timing_mean_abs_ms, 250);
  // Early and late still count as correct.
  EXPECT_EQ(result.metrics.word_accuracy_pct, 100);
}

TEST(WordAlignerTest, ThresholdIsConfigurable) {
  std::vector<WordToken> ref = {makeWord("one", 1.0, 1.4, 0)};
  std::vector<WordToken> user = {makeWord("one", 1.15, 1.5, 0)};
  AlignmentOptions options;
  options.early_late_threshold_ms = 100;
  AlignmentResult result = alignWords(ref, user, options);
  EXPECT_EQ(result.per_word[0].status, AlignmentStatus::CorrectLate);
}

TEST(WordAlignerTest, UserOffsetShiftsDeltas) {
  auto ref = makeWords("we are young");
  auto user = shiftWords(ref, 0.3);

  AlignmentResult raw = alignWords(ref, user);
  AlignmentOptions options;
  options.user_offset_sec = 0.3;
  AlignmentResult corrected = alignWords(ref, user, options);

  for (size_t i = 0; i < ref.size(); ++i) {
    EXPECT_EQ(*raw.per_word[i].delta_ms, 300);
    EXPECT_EQ(*corrected.per_word[i].delta_ms, 0);
    EXPECT_EQ(corrected.per_word[i].status, AlignmentStatus::Correct);
    EXPECT_NEAR(*corrected.per_word[i].user_start, ref[i].start, 1e-9);
  }
}

TEST(WordAlignerTest, ReferenceOffsetRebasesReferenceTimes) {
  std::vector<WordToken> ref = {makeWord("go", 10.0, 10.4, 0)};
  std::vector<WordToken> user = {makeWord("go", 0.0, 0.4, 0)};
  AlignmentOptions options;
  options.reference_offset_sec = 10.0;
  AlignmentResult result = alignWords(ref, user, options);
  EXPECT_DOUBLE_EQ(result.per_word[0].ref_start, 0.0);
  EXPECT_EQ(*result.per_word[0].delta_ms, 0);
}

TEST(WordAlignerTest, PaceRatio) {
  auto ref = makeWords("a b");
  AlignmentOptions options;
  options.reference_duration_sec = 10.0;
  options.user_duration_sec = 12.0;
  EXPECT_DOUBLE_EQ(alignWords(ref, ref, options).metrics.pace_ratio, 1.2);

  options.user_duration_sec = 0.0;
  EXPECT_DOUBLE_EQ(alignWords(ref, ref, options).metrics.pace_ratio, 1.0);
}

// ============================================================================
// Properties
// ============================================================================

TEST(WordAlignerTest, AccuracyNeverRisesAsUserIsTruncated) {
  auto ref = makeWords("shine a light through the night we are young and free");
  int previous = 101;
  for (size_t keep = ref.size() + 1; keep-- > 0;) {
    std::vector<WordToken> user(ref.begin(), ref.begin() + static_cast<long>(keep));
    int accuracy = alignWords(ref, user).metrics.word_accuracy_pct;
    EXPECT_LE(accuracy, previous) << "keep=" << keep;
    previous = accuracy;
  }
  EXPECT_EQ(previous, 0);
}

TEST(WordAlignerTest, AverageConfidenceIgnoresMissingValues) {
  std::vector<AlignmentWordResult> words(3);
  words[0].confidence = 1.0;
  words[1].confidence = 0.5;
  EXPECT_DOUBLE_EQ(averageConfidence(words), 0.75);
  EXPECT_DOUBLE_EQ(averageConfidence({}), 0.0);
}

}  // namespace
}  // namespace vocalcoach
