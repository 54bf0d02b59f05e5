/**
 * @file types.h
 * @brief Word timing and alignment result types shared by all scoring stages.
 */

#ifndef VOCALCOACH_CORE_TYPES_H
#define VOCALCOACH_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vocalcoach {

/// @brief A timed word from a reference transcript or a user transcription.
///
/// Times are in seconds relative to the start of the word's own audio.
/// `index` is the token's position in its own sequence and serves as its
/// identity key when results are mapped back to reference words.
struct WordToken {
  std::string word;               ///< Word as transcribed (punctuation kept)
  double start = 0.0;             ///< Start time in seconds
  double end = 0.0;               ///< End time in seconds
  int index = 0;                  ///< Position within its own sequence
  std::optional<int> line_index;  ///< Lyric line the word belongs to
};

/// @brief A lyric line of the reference transcript.
struct ReferenceLine {
  int index = 0;      ///< Line index (matches WordToken::line_index)
  std::string text;   ///< Line text
  double start = 0.0; ///< Declared start in seconds
  double end = 0.0;   ///< Declared end in seconds
};

/// @brief Outcome of aligning one reference word.
enum class AlignmentStatus : uint8_t {
  Correct,       ///< Right word, on time
  CorrectEarly,  ///< Right word, sung before the early/late threshold
  CorrectLate,   ///< Right word, sung after the early/late threshold
  Incorrect,     ///< Aligned to a different word
  Missed,        ///< No user word aligned
  ExtraIgnored   ///< User word with no reference slot
};

/// @brief Bucketed confidence of a word verdict.
enum class ConfidenceLabel : uint8_t {
  Low,
  Medium,
  High
};

/// @name Confidence thresholds
/// @{
constexpr double kHighConfidence = 0.78;
constexpr double kMediumConfidence = 0.5;
/// @}

/// @brief Alignment result for one reference word.
struct AlignmentWordResult {
  int ref_index = 0;       ///< WordToken::index of the reference word
  std::string ref_word;    ///< Reference word text
  double ref_start = 0.0;  ///< Reference start, offset-relative (seconds)
  double ref_end = 0.0;    ///< Reference end, offset-relative (seconds)
  AlignmentStatus status = AlignmentStatus::Missed;
  std::optional<std::string> user_word;  ///< Aligned user word, if any
  std::optional<double> user_start;      ///< User start, offset-relative
  std::optional<double> user_end;        ///< User end, offset-relative
  std::optional<int> delta_ms;           ///< User start minus reference start
  std::optional<double> confidence;      ///< Verdict confidence (0.0-1.0)
  std::optional<ConfidenceLabel> confidence_label;
};

/// @brief Aggregate metrics over one alignment.
struct AlignmentMetrics {
  int word_accuracy_pct = 0;              ///< Correct words / reference words
  int timing_mean_abs_ms = 0;             ///< Mean |delta| over correct words
  double pace_ratio = 1.0;                ///< User duration / reference duration
  std::vector<std::string> missed_words;  ///< Reference words not sung correctly
  std::vector<std::string> extra_words;   ///< User words with no reference slot
};

/// @brief Complete output of the word aligner.
struct AlignmentResult {
  std::vector<AlignmentWordResult> per_word;  ///< One entry per reference word
  std::vector<WordToken> extras;              ///< Unattached user words
  AlignmentMetrics metrics;
  ConfidenceLabel confidence_label = ConfidenceLabel::Low;  ///< Label of mean confidence
};

/// @brief True for Correct, CorrectEarly and CorrectLate.
inline bool isCorrectStatus(AlignmentStatus status) {
  return status == AlignmentStatus::Correct || status == AlignmentStatus::CorrectEarly ||
         status == AlignmentStatus::CorrectLate;
}

/**
 * @brief Bucket a confidence value.
 * @param confidence Confidence (0.0-1.0)
 * @return High at >= 0.78, Medium at >= 0.5, otherwise Low
 */
ConfidenceLabel confidenceLabelFor(double confidence);

/** @brief Wire name of a status ("correct", "correct_early", ...). */
const char* alignmentStatusName(AlignmentStatus status);

/** @brief Display name of a label ("High", "Medium", "Low"). */
const char* confidenceLabelName(ConfidenceLabel label);

}  // namespace vocalcoach

#endif  // VOCALCOACH_CORE_TYPES_H
