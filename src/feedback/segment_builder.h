/**
 * @file segment_builder.h
 * @brief Partitioning of the reference timeline into scored lyric segments.
 */

#ifndef VOCALCOACH_FEEDBACK_SEGMENT_BUILDER_H
#define VOCALCOACH_FEEDBACK_SEGMENT_BUILDER_H

#include <string>
#include <vector>

#include "core/coach_config.h"
#include "core/types.h"

namespace vocalcoach {

/// @brief Localized feedback for one span of the reference timeline.
struct SegmentFeedback {
  int segment_index = 0;             ///< Line index, or running index for word buckets
  std::string text;                  ///< Segment lyric text
  double start = 0.0;                ///< Span start (seconds)
  double end = 0.0;                  ///< Span end (seconds)
  int word_accuracy_pct = 0;         ///< Weighted accuracy of the words in the span
  int timing_mean_abs_ms = 0;        ///< Mean |delta| over correct words in the span
  std::vector<std::string> main_issues;  ///< Coaching notes, never empty after scoring
};

/**
 * @brief One segment per reference line.
 *
 * The span comes from the line's own words (first start, last end), falling
 * back to the line's declared span when no word carries its index. Text is
 * the trimmed line text, or the joined words when the line text is blank.
 */
std::vector<SegmentFeedback> buildSegmentsFromLines(const std::vector<ReferenceLine>& lines,
                                                    const std::vector<WordToken>& words);

/**
 * @brief Greedy pause- and punctuation-delimited buckets.
 *
 * Consecutive words are collected up to `max_segment_words`. A gap larger
 * than `pause_gap_sec` before a word starts a new bucket; a word ending in
 * `.`, `!` or `?` closes the current one.
 */
std::vector<SegmentFeedback> buildSegmentsFromWords(const std::vector<WordToken>& words,
                                                    const FeedbackConfig& config = FeedbackConfig{});

/**
 * @brief Merge segments shorter than `min_segment_sec` into their predecessor.
 *
 * Merging is backward only: text is appended to the previous segment and its
 * end is extended. A short first segment has no predecessor and is kept.
 */
std::vector<SegmentFeedback> mergeShortSegments(std::vector<SegmentFeedback> segments,
                                                double min_segment_sec);

/**
 * @brief Weighted correct-word count.
 *
 * Correct statuses count 1. Incorrect words whose confidence is below
 * `low_confidence_weight_below` count 0.5 as likely transcription noise.
 */
double weightedCorrect(const std::vector<const AlignmentWordResult*>& words,
                       double low_confidence_weight_below);

/**
 * @brief Rounded mean |delta_ms| over correct-status words (0 when none).
 */
int correctTimingMeanAbsMs(const std::vector<const AlignmentWordResult*>& words);

/**
 * @brief Fixed-priority issue notes for one segment.
 *
 * Missed words (up to 4), then incorrect words (up to 4) while fewer than
 * two issues exist, then a timing note above the warning threshold. Falls
 * back to an encouragement note.
 */
std::vector<std::string> buildSegmentIssues(const std::vector<const AlignmentWordResult*>& words,
                                            int timing_mean_abs_ms, int timing_warning_ms);

/**
 * @brief Score segments against an alignment.
 *
 * A reference word belongs to a segment when it starts at or after the
 * segment start and ends no later than the segment end (+10 ms tolerance).
 *
 * @param segments Segments to score (modified in place)
 * @param reference_words Reference tokens used for the alignment
 * @param per_word Alignment results keyed by reference index
 * @param config Weighting and warning thresholds
 */
void scoreSegments(std::vector<SegmentFeedback>& segments,
                   const std::vector<WordToken>& reference_words,
                   const std::vector<AlignmentWordResult>& per_word, const FeedbackConfig& config);

}  // namespace vocalcoach

#endif  // VOCALCOACH_FEEDBACK_SEGMENT_BUILDER_H
