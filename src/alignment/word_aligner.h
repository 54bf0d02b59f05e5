/**
 * @file word_aligner.h
 * @brief Edit-distance alignment of a reference lyric timeline to a sung transcription.
 */

#ifndef VOCALCOACH_ALIGNMENT_WORD_ALIGNER_H
#define VOCALCOACH_ALIGNMENT_WORD_ALIGNER_H

#include <vector>

#include "core/types.h"

namespace vocalcoach {

/// @brief Options for alignWords().
struct AlignmentOptions {
  double reference_offset_sec = 0.0;  ///< Subtracted from reference times
  double user_offset_sec = 0.0;       ///< Subtracted from user times (estimated lag)
  int early_late_threshold_ms = 200;  ///< Early/late classification bound
  double reference_duration_sec = 0.0;  ///< 0 or less = unknown
  double user_duration_sec = 0.0;       ///< 0 or less = unknown
};

/// @name Substitution costs
/// @{
constexpr double kExactMatchCost = 0.0;
constexpr double kPhoneticMatchCost = 0.5;  ///< Cheaper than delete + insert (2.0)
constexpr double kMismatchCost = 1.0;
constexpr double kGapCost = 1.0;                   ///< Delete or insert
constexpr double kPhoneticMatchThreshold = 0.7;    ///< Similarity for kPhoneticMatchCost
/// @}

/**
 * @brief Align reference words to user words.
 *
 * Weighted Levenshtein over the two token sequences. Substitution cost is 0
 * for equal normalized tokens, 0.5 when the phonetic skeletons are at least
 * 0.7 similar, and 1 otherwise; gaps cost 1. Backtracking prefers match,
 * then delete, then insert on equal cost.
 *
 * Matched pairs are correct only when their normalized tokens are equal and
 * non-empty. Unmatched reference words become Missed; unmatched user words
 * are returned in AlignmentResult::extras and never consume a reference slot.
 *
 * Complexity is O(n*m) time and memory. Callers that accept untrusted
 * transcripts should bound n*m before calling.
 *
 * @param reference Reference tokens (ground truth)
 * @param user Transcribed user tokens
 * @param options Offsets, thresholds and durations
 * @return Exactly one AlignmentWordResult per reference token
 */
AlignmentResult alignWords(const std::vector<WordToken>& reference,
                           const std::vector<WordToken>& user,
                           const AlignmentOptions& options = AlignmentOptions{});

/**
 * @brief Unweighted mean of the per-word confidences (0 when empty).
 */
double averageConfidence(const std::vector<AlignmentWordResult>& per_word);

}  // namespace vocalcoach

#endif  // VOCALCOACH_ALIGNMENT_WORD_ALIGNER_H
