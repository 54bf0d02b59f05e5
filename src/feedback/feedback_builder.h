/**
 * @file feedback_builder.h
 * @brief Word-level coaching report: coverage guard, alignment, segments, tips and drill.
 */

#ifndef VOCALCOACH_FEEDBACK_FEEDBACK_BUILDER_H
#define VOCALCOACH_FEEDBACK_FEEDBACK_BUILDER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/coach_config.h"
#include "core/input_error.h"
#include "core/types.h"
#include "feedback/segment_builder.h"

namespace vocalcoach {

/// @brief Input for buildDetailedFeedback().
struct FeedbackInput {
  std::vector<WordToken> reference_words;                  ///< Verse-relative reference words
  std::vector<WordToken> user_words;                       ///< Transcribed attempt words
  std::optional<std::vector<ReferenceLine>> reference_lines;  ///< Lyric lines, if known
  double verse_start_sec = 0.0;
  double verse_end_sec = 0.0;
  std::optional<double> estimated_offset_ms;  ///< Recording lag behind the reference
};

/// @brief Kind of practice drill.
enum class DrillType : uint8_t {
  RepeatSegment,  ///< Repeat the weakest segment
  SlowDown,       ///< Verse is rushed
  TimingLock,     ///< Timing is loose
  AccuracyClean   ///< Default: clean delivery
};

/** @brief Wire name ("repeat_segment", "slow_down", "timing_lock", "accuracy_clean"). */
const char* drillTypeName(DrillType type);

/// @brief The single drill recommended for the next take.
///
/// `target_segment_index` and `repeat_count` are set only for RepeatSegment.
struct NextDrill {
  DrillType type = DrillType::AccuracyClean;
  std::optional<int> target_segment_index;
  std::optional<int> repeat_count;
  std::string note;
};

/// @brief 0-100 subscores derived from the report metrics.
struct FeedbackSubscores {
  int word_accuracy = 0;
  int timing = 0;
  int pace = 0;
};

/// @brief "You said X instead of Y" entry for an incorrect word.
struct Substitution {
  std::string ref_word;
  std::string user_word;
  double confidence = 0.0;
  ConfidenceLabel confidence_label = ConfidenceLabel::Low;
};

/// @brief Complete word-level feedback for one attempt.
struct DetailedFeedback {
  int word_accuracy_pct = 0;       ///< Weighted accuracy over the scored words
  int timing_mean_abs_ms = 0;      ///< Mean |delta| over correct words
  double pace_ratio = 1.0;         ///< User duration / verse duration
  std::vector<std::string> missed_words;  ///< Normalized, empty entries dropped
  std::vector<std::string> extra_words;   ///< Normalized, empty entries dropped
  std::vector<AlignmentWordResult> per_word;
  std::vector<SegmentFeedback> segments;
  std::vector<std::string> tips;
  NextDrill next_drill;
  FeedbackSubscores subscores;
  std::vector<Substitution> substitutions;
  ConfidenceLabel confidence_label = ConfidenceLabel::Low;
  std::vector<std::string> warnings;
  std::optional<std::string> message;         ///< Set when the take stopped early
  std::optional<double> estimated_offset_ms;  ///< Echo of the input offset
  double coverage = 1.0;                      ///< Last user word end / verse duration
};

/**
 * @brief Build the word-level coaching report for one attempt.
 *
 * Pure function: never throws for well-typed input. Callers that accept
 * untrusted data should run validateFeedbackInput() first.
 *
 * @param input Reference and user words, optional lines, verse span and offset
 * @param config Thresholds (defaults match the documented scoring rules)
 * @return Report with exactly one per-word result per scored reference word
 */
DetailedFeedback buildDetailedFeedback(const FeedbackInput& input,
                                       const FeedbackConfig& config = FeedbackConfig{});

/**
 * @brief Check timings and ranges before scoring.
 *
 * Rejects non-finite values, negative times, words whose end precedes their
 * start, decreasing start times within a sequence, reversed line spans, a
 * reversed verse range and a non-finite offset.
 */
InputError validateFeedbackInput(const FeedbackInput& input);

/**
 * @brief Check one token sequence for finite, non-negative, monotonic timings.
 * @return true if the sequence is well-formed
 */
bool isMonotonicTiming(const std::vector<WordToken>& words);

}  // namespace vocalcoach

#endif  // VOCALCOACH_FEEDBACK_FEEDBACK_BUILDER_H
