/**
 * @file token_normalizer_test.cpp
 * @brief Tests for token normalization, phonetic skeletons and similarity.
 */

#include "alignment/token_normalizer.h"

#include <gtest/gtest.h>

namespace vocalcoach {
namespace {

// ============================================================================
// normalizeToken
// ============================================================================

TEST(NormalizeTokenTest, LowercasesAndStripsPunctuation) {
  EXPECT_EQ(normalizeToken("Hello,"), "hello");
  EXPECT_EQ(normalizeToken("NIGHT!"), "night");
  EXPECT_EQ(normalizeToken("(oh)"), "oh");
}

TEST(NormalizeTokenTest, RemovesApostrophes) {
  EXPECT_EQ(normalizeToken("don't"), "dont");
  EXPECT_EQ(normalizeToken("don\xE2\x80\x99t"), "dont");
}

TEST(NormalizeTokenTest, KeepsDigits) { EXPECT_EQ(normalizeToken("24/7"), "247"); }

TEST(NormalizeTokenTest, PunctuationOnlyBecomesEmpty) {
  EXPECT_EQ(normalizeToken("..."), "");
  EXPECT_EQ(normalizeToken(""), "");
}

// ============================================================================
// phoneticNormalize
// ============================================================================

TEST(PhoneticNormalizeTest, DigraphsAndVowels) {
  EXPECT_EQ(phoneticNormalize("light"), "lt");
  EXPECT_EQ(phoneticNormalize("lite"), "lt");
  EXPECT_EQ(phoneticNormalize("phone"), "fn");
  EXPECT_EQ(phoneticNormalize("knight"), "nt");
}

TEST(PhoneticNormalizeTest, CollapsesRepeats) {
  EXPECT_EQ(phoneticNormalize("little"), "ltl");
  EXPECT_EQ(phoneticNormalize("apple"), "pl");
}

TEST(PhoneticNormalizeTest, EmptyInput) {
  EXPECT_EQ(phoneticNormalize(""), "");
  EXPECT_EQ(phoneticNormalize("!!"), "");
}

// ============================================================================
// Similarity
// ============================================================================

TEST(LevenshteinTest, Basics) {
  EXPECT_EQ(levenshteinDistance("", "abc"), 3u);
  EXPECT_EQ(levenshteinDistance("abc", ""), 3u);
  EXPECT_EQ(levenshteinDistance("kitten", "sitting"), 3u);
  EXPECT_EQ(levenshteinDistance("same", "same"), 0u);
}

TEST(TokenSimilarityTest, Bounds) {
  EXPECT_DOUBLE_EQ(tokenSimilarity("", "x"), 0.0);
  EXPECT_DOUBLE_EQ(tokenSimilarity("abc", "abc"), 1.0);
  EXPECT_DOUBLE_EQ(tokenSimilarity("abcd", "abcx"), 0.75);
  EXPECT_DOUBLE_EQ(tokenSimilarity("ab", "xy"), 0.0);
}

TEST(PhoneticSimilarityTest, SoundAlikesScoreHigh) {
  EXPECT_DOUBLE_EQ(phoneticSimilarity("light", "lite"), 1.0);
  EXPECT_GT(phoneticSimilarity("night", "knight"), 0.9);
}

TEST(PhoneticSimilarityTest, UnrelatedWordsScoreLow) {
  EXPECT_LT(phoneticSimilarity("light", "banana"), 0.4);
  EXPECT_DOUBLE_EQ(phoneticSimilarity("", "light"), 0.0);
}

}  // namespace
}  // namespace vocalcoach
