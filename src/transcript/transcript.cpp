/**
 * @file transcript.cpp
 * @brief Transcript flattening and verse slicing.
 */

#include "transcript/transcript.h"

#include <algorithm>
#include <sstream>

namespace vocalcoach {

namespace {

constexpr double kMinSegmentSpanSec = 0.01;

std::vector<std::string> splitWhitespace(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream iss(text);
  std::string token;
  while (iss >> token) tokens.push_back(token);
  return tokens;
}

}  // namespace

std::vector<WordToken> flattenTranscript(const std::vector<TranscriptSegment>& segments) {
  std::vector<WordToken> tokens;
  int next_index = 0;

  for (size_t seg = 0; seg < segments.size(); ++seg) {
    const TranscriptSegment& segment = segments[seg];
    const int line_index = static_cast<int>(seg);

    if (!segment.words.empty()) {
      for (const auto& word : segment.words) {
        if (word.word.empty()) continue;
        WordToken token;
        token.word = word.word;
        token.start = word.start;
        token.end = word.end;
        token.index = next_index++;
        token.line_index = line_index;
        tokens.push_back(std::move(token));
      }
      continue;
    }

    // No word timings: spread the text evenly over the segment.
    const std::vector<std::string> words = splitWhitespace(segment.text);
    if (words.empty()) continue;
    const double span = std::max(kMinSegmentSpanSec, segment.end - segment.start);
    const double count = static_cast<double>(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
      WordToken token;
      token.word = words[i];
      token.start = segment.start + span * static_cast<double>(i) / count;
      token.end = segment.start + span * static_cast<double>(i + 1) / count;
      token.index = next_index++;
      token.line_index = line_index;
      tokens.push_back(std::move(token));
    }
  }
  return tokens;
}

std::vector<ReferenceLine> linesFromSegments(const std::vector<TranscriptSegment>& segments) {
  std::vector<ReferenceLine> lines;
  lines.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    ReferenceLine line;
    line.index = static_cast<int>(i);
    line.text = segments[i].text;
    line.start = segments[i].start;
    line.end = segments[i].end;
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<WordToken> sliceVerse(const std::vector<WordToken>& words, double verse_start_sec,
                                  double verse_end_sec) {
  std::vector<WordToken> verse;
  int next_index = 0;
  for (const auto& word : words) {
    if (word.start < verse_start_sec || word.start >= verse_end_sec) continue;
    WordToken token = word;
    token.start -= verse_start_sec;
    token.end -= verse_start_sec;
    token.index = next_index++;
    verse.push_back(std::move(token));
  }
  return verse;
}

std::vector<ReferenceLine> sliceVerseLines(const std::vector<ReferenceLine>& lines,
                                           double verse_start_sec, double verse_end_sec) {
  std::vector<ReferenceLine> verse;
  for (const auto& line : lines) {
    if (line.end <= verse_start_sec || line.start >= verse_end_sec) continue;
    ReferenceLine rebased = line;
    rebased.start = std::max(0.0, line.start - verse_start_sec);
    rebased.end = line.end - verse_start_sec;
    verse.push_back(std::move(rebased));
  }
  return verse;
}

}  // namespace vocalcoach
