/**
 * @file transcript.h
 * @brief Conversion of transcription segments into timed word tokens and lines.
 */

#ifndef VOCALCOACH_TRANSCRIPT_TRANSCRIPT_H
#define VOCALCOACH_TRANSCRIPT_TRANSCRIPT_H

#include <string>
#include <vector>

#include "core/types.h"

namespace vocalcoach {

/// @brief A word with timing as reported by a speech-to-text engine.
struct TranscriptWord {
  std::string word;
  double start = 0.0;
  double end = 0.0;
};

/// @brief One transcription segment (usually a lyric line or phrase).
struct TranscriptSegment {
  double start = 0.0;
  double end = 0.0;
  std::string text;
  std::vector<TranscriptWord> words;  ///< Word timings, empty if the engine gave none
};

/**
 * @brief Flatten segments into one ordered token sequence.
 *
 * Segments with word timings contribute their non-empty words. Segments
 * without them have their whitespace-split text spread evenly over the
 * segment span (at least 0.01 s). Tokens are indexed in output order and
 * carry their segment position as `line_index`.
 */
std::vector<WordToken> flattenTranscript(const std::vector<TranscriptSegment>& segments);

/**
 * @brief One ReferenceLine per segment, indexed by segment position.
 *
 * Matches the `line_index` values produced by flattenTranscript().
 */
std::vector<ReferenceLine> linesFromSegments(const std::vector<TranscriptSegment>& segments);

/**
 * @brief Cut a verse out of a song-level token sequence.
 *
 * Keeps tokens starting inside [verse_start_sec, verse_end_sec), rebases
 * their times to the verse start and renumbers `index` from 0. Line
 * indices are kept.
 */
std::vector<WordToken> sliceVerse(const std::vector<WordToken>& words, double verse_start_sec,
                                  double verse_end_sec);

/**
 * @brief Cut the lines of a verse, rebased like sliceVerse().
 *
 * A line is kept when its span overlaps the verse.
 */
std::vector<ReferenceLine> sliceVerseLines(const std::vector<ReferenceLine>& lines,
                                           double verse_start_sec, double verse_end_sec);

}  // namespace vocalcoach

#endif  // VOCALCOACH_TRANSCRIPT_TRANSCRIPT_H
