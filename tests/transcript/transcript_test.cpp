/**
 * @file transcript_test.cpp
 * @brief Tests for transcript flattening and verse slicing.
 */

#include "transcript/transcript.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_support/test_helpers.h"

namespace vocalcoach {
namespace {

using test::makeLine;
using test::makeWord;

TranscriptSegment makeSegment(double start, double end, const std::string& text,
                              std::vector<TranscriptWord> words = {}) {
  TranscriptSegment segment;
  segment.start = start;
  segment.end = end;
  segment.text = text;
  segment.words = std::move(words);
  return segment;
}

// ============================================================================
// Flattening
// ============================================================================

TEST(FlattenTranscriptTest, UsesWordTimingsWhenPresent) {
  std::vector<TranscriptSegment> segments = {
      makeSegment(0.0, 1.0, "Hold on", {{"Hold", 0.1, 0.4}, {"", 0.4, 0.5}, {"on", 0.5, 0.9}}),
      makeSegment(1.2, 2.0, "to me", {{"to", 1.2, 1.5}, {"me", 1.6, 1.9}})};
  auto tokens = flattenTranscript(segments);

  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].word, "Hold");
  EXPECT_DOUBLE_EQ(tokens[0].start, 0.1);
  EXPECT_EQ(tokens[1].word, "on");
  EXPECT_EQ(tokens[1].index, 1);
  EXPECT_EQ(tokens[1].line_index, std::optional<int>(0));
  EXPECT_EQ(tokens[2].index, 2);
  EXPECT_EQ(tokens[2].line_index, std::optional<int>(1));
  EXPECT_DOUBLE_EQ(tokens[3].end, 1.9);
}

TEST(FlattenTranscriptTest, SpreadsTextWithoutWordTimings) {
  auto tokens = flattenTranscript({makeSegment(2.0, 3.0, "  never  let go ")});
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].word, "never");
  EXPECT_DOUBLE_EQ(tokens[0].start, 2.0);
  EXPECT_NEAR(tokens[1].start, 2.0 + 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(tokens[1].end, 2.0 + 2.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(tokens[2].end, 3.0);
}

TEST(FlattenTranscriptTest, ZeroLengthSegmentGetsMinimumSpan) {
  auto tokens = flattenTranscript({makeSegment(5.0, 5.0, "oh oh")});
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_GT(tokens[1].end, tokens[0].start);
  EXPECT_NEAR(tokens[1].end, 5.01, 1e-12);
}

TEST(FlattenTranscriptTest, EmptySegmentsKeepLinePositions) {
  auto tokens = flattenTranscript(
      {makeSegment(0.0, 1.0, ""), makeSegment(1.0, 2.0, "hey")});
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].index, 0);
  EXPECT_EQ(tokens[0].line_index, std::optional<int>(1));
}

TEST(LinesFromSegmentsTest, OneLinePerSegment) {
  auto lines = linesFromSegments({makeSegment(0.0, 1.0, "first"), makeSegment(1.5, 3.0, "second")});
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[1].index, 1);
  EXPECT_EQ(lines[1].text, "second");
  EXPECT_DOUBLE_EQ(lines[1].start, 1.5);
  EXPECT_DOUBLE_EQ(lines[1].end, 3.0);
}

// ============================================================================
// Verse slicing
// ============================================================================

TEST(SliceVerseTest, KeepsWordsStartingInsideRange) {
  std::vector<WordToken> song = {makeWord("a", 9.0, 9.5, 0), makeWord("b", 10.0, 10.4, 1, 2),
                                 makeWord("c", 14.8, 15.3, 2, 2), makeWord("d", 15.0, 15.5, 3)};
  auto verse = sliceVerse(song, 10.0, 15.0);

  ASSERT_EQ(verse.size(), 2u);
  EXPECT_EQ(verse[0].word, "b");
  EXPECT_EQ(verse[0].index, 0);
  EXPECT_DOUBLE_EQ(verse[0].start, 0.0);
  EXPECT_NEAR(verse[0].end, 0.4, 1e-12);
  EXPECT_EQ(verse[0].line_index, std::optional<int>(2));
  EXPECT_EQ(verse[1].word, "c");
  EXPECT_EQ(verse[1].index, 1);
  EXPECT_NEAR(verse[1].start, 4.8, 1e-12);
}

TEST(SliceVerseTest, EmptyRange) {
  std::vector<WordToken> song = {makeWord("a", 1.0, 1.5, 0)};
  EXPECT_TRUE(sliceVerse(song, 2.0, 2.0).empty());
}

TEST(SliceVerseLinesTest, KeepsOverlappingLines) {
  std::vector<ReferenceLine> lines = {makeLine(0, "intro", 0.0, 10.0),
                                      makeLine(1, "verse one", 9.5, 12.0),
                                      makeLine(2, "verse two", 12.0, 15.0),
                                      makeLine(3, "chorus", 15.0, 20.0)};
  auto verse = sliceVerseLines(lines, 10.0, 15.0);

  ASSERT_EQ(verse.size(), 2u);
  EXPECT_EQ(verse[0].index, 1);
  EXPECT_DOUBLE_EQ(verse[0].start, 0.0);
  EXPECT_DOUBLE_EQ(verse[0].end, 2.0);
  EXPECT_EQ(verse[1].text, "verse two");
  EXPECT_DOUBLE_EQ(verse[1].start, 2.0);
  EXPECT_DOUBLE_EQ(verse[1].end, 5.0);
}

}  // namespace
}  // namespace vocalcoach
