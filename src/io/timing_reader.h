/**
 * @file timing_reader.h
 * @brief Plain-text readers for word timings, lyric lines, envelopes and pitch contours.
 *
 * File formats (one record per line, `#` starts a comment, blank lines skipped):
 * - words:    `start end word [line_index]`
 * - lines:    `index start end text...`
 * - envelope: `value`
 * - contour:  `time frequency`
 */

#ifndef VOCALCOACH_IO_TIMING_READER_H
#define VOCALCOACH_IO_TIMING_READER_H

#include <string>
#include <vector>

#include "analysis/signal_utils.h"
#include "core/types.h"

namespace vocalcoach {

/// @brief Reads timing files used by the CLI.
///
/// Every read*/parse* call replaces the previous result of the same kind.
/// On failure the method returns false and getError() names the source and
/// line number.
class TimingReader {
 public:
  TimingReader() = default;

  bool readWords(const std::string& path);
  bool readLines(const std::string& path);
  bool readEnvelope(const std::string& path);
  bool readContour(const std::string& path);

  /// @name In-memory parsing
  /// @{
  bool parseWords(const std::string& text, const std::string& source = "<memory>");
  bool parseLines(const std::string& text, const std::string& source = "<memory>");
  bool parseEnvelope(const std::string& text, const std::string& source = "<memory>");
  bool parseContour(const std::string& text, const std::string& source = "<memory>");
  /// @}

  const std::vector<WordToken>& getWords() const { return words_; }
  const std::vector<ReferenceLine>& getLines() const { return lines_; }
  const std::vector<double>& getEnvelope() const { return envelope_; }
  const std::vector<PitchSample>& getContour() const { return contour_; }

  /// @brief Last error message (empty after a successful call).
  const std::string& getError() const { return error_; }

 private:
  bool loadFile(const std::string& path, std::string& text);
  bool fail(const std::string& source, int line_number, const std::string& message);

  std::vector<WordToken> words_;
  std::vector<ReferenceLine> lines_;
  std::vector<double> envelope_;
  std::vector<PitchSample> contour_;
  std::string error_;
};

}  // namespace vocalcoach

#endif  // VOCALCOACH_IO_TIMING_READER_H
