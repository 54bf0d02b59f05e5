/**
 * @file segment_builder.cpp
 * @brief Implementation of segmentation, merging and per-segment scoring.
 */

#include "feedback/segment_builder.h"

#include <algorithm>
#include <cstdlib>
#include <unordered_map>

#include "core/math_utils.h"

namespace vocalcoach {

namespace {

constexpr double kSegmentEndTolerance = 0.01;
constexpr size_t kMaxIssueWords = 4;

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

std::string joinWords(const std::vector<const WordToken*>& words) {
  std::string text;
  for (const auto* word : words) {
    if (!text.empty()) text += ' ';
    text += word->word;
  }
  return text;
}

std::string joinList(const std::vector<std::string>& items, size_t limit) {
  std::string text;
  for (size_t i = 0; i < items.size() && i < limit; ++i) {
    if (i > 0) text += ", ";
    text += items[i];
  }
  return text;
}

bool endsSentence(const std::string& word) {
  if (word.empty()) return false;
  char last = word.back();
  return last == '.' || last == '!' || last == '?';
}

}  // namespace

std::vector<SegmentFeedback> buildSegmentsFromLines(const std::vector<ReferenceLine>& lines,
                                                    const std::vector<WordToken>& words) {
  std::vector<SegmentFeedback> segments;
  segments.reserve(lines.size());
  for (const auto& line : lines) {
    std::vector<const WordToken*> line_words;
    for (const auto& word : words) {
      if (word.line_index && *word.line_index == line.index) line_words.push_back(&word);
    }

    SegmentFeedback segment;
    segment.segment_index = line.index;
    segment.text = trim(line.text);
    if (segment.text.empty()) segment.text = joinWords(line_words);
    segment.start = line_words.empty() ? line.start : line_words.front()->start;
    segment.end = line_words.empty() ? line.end : line_words.back()->end;
    segments.push_back(std::move(segment));
  }
  return segments;
}

std::vector<SegmentFeedback> buildSegmentsFromWords(const std::vector<WordToken>& words,
                                                    const FeedbackConfig& config) {
  std::vector<SegmentFeedback> segments;
  if (words.empty()) return segments;

  std::vector<const WordToken*> bucket;
  int segment_index = 0;

  auto flush = [&]() {
    if (bucket.empty()) return;
    SegmentFeedback segment;
    segment.segment_index = segment_index++;
    segment.text = joinWords(bucket);
    segment.start = bucket.front()->start;
    segment.end = bucket.back()->end;
    segments.push_back(std::move(segment));
    bucket.clear();
  };

  bucket.push_back(&words[0]);
  for (size_t i = 1; i < words.size(); ++i) {
    const WordToken& word = words[i];
    // The bucket is empty right after a sentence-end or word-limit flush.
    if (!bucket.empty() && word.start - bucket.back()->end > config.pause_gap_sec) {
      flush();
      bucket.push_back(&word);
      continue;
    }
    bucket.push_back(&word);
    if (static_cast<int>(bucket.size()) >= config.max_segment_words || endsSentence(word.word)) {
      flush();
    }
  }
  flush();
  return segments;
}

std::vector<SegmentFeedback> mergeShortSegments(std::vector<SegmentFeedback> segments,
                                                double min_segment_sec) {
  if (segments.size() < 2) return segments;

  std::vector<SegmentFeedback> merged;
  merged.reserve(segments.size());
  for (auto& segment : segments) {
    if (!merged.empty() && segment.end - segment.start < min_segment_sec) {
      SegmentFeedback& prev = merged.back();
      prev.text = trim(prev.text + " " + segment.text);
      prev.end = std::max(prev.end, segment.end);
      continue;
    }
    merged.push_back(std::move(segment));
  }
  return merged;
}

double weightedCorrect(const std::vector<const AlignmentWordResult*>& words,
                       double low_confidence_weight_below) {
  double total = 0.0;
  for (const auto* word : words) {
    if (isCorrectStatus(word->status)) {
      total += 1.0;
    } else if (word->status == AlignmentStatus::Incorrect && word->confidence &&
               *word->confidence < low_confidence_weight_below) {
      total += 0.5;
    }
  }
  return total;
}

int correctTimingMeanAbsMs(const std::vector<const AlignmentWordResult*>& words) {
  double sum = 0.0;
  int count = 0;
  for (const auto* word : words) {
    if (!isCorrectStatus(word->status) || !word->delta_ms) continue;
    sum += std::abs(*word->delta_ms);
    ++count;
  }
  return count > 0 ? roundToInt(sum / count) : 0;
}

std::vector<std::string> buildSegmentIssues(const std::vector<const AlignmentWordResult*>& words,
                                            int timing_mean_abs_ms, int timing_warning_ms) {
  std::vector<std::string> missed;
  std::vector<std::string> incorrect;
  for (const auto* word : words) {
    if (word->status == AlignmentStatus::Missed) missed.push_back(word->ref_word);
    if (word->status == AlignmentStatus::Incorrect) incorrect.push_back(word->ref_word);
  }

  std::vector<std::string> issues;
  if (!missed.empty()) {
    issues.push_back("Missed " + joinList(missed, kMaxIssueWords) + ".");
  }
  if (!incorrect.empty() && issues.size() < 2) {
    issues.push_back("Incorrect words: " + joinList(incorrect, kMaxIssueWords) + ".");
  }
  if (timing_mean_abs_ms > timing_warning_ms) {
    issues.push_back("Timing off by ~" + std::to_string(timing_mean_abs_ms) + "ms.");
  }
  if (issues.empty()) {
    issues.push_back("Nice line. Keep the timing consistent.");
  }
  return issues;
}

void scoreSegments(std::vector<SegmentFeedback>& segments,
                   const std::vector<WordToken>& reference_words,
                   const std::vector<AlignmentWordResult>& per_word, const FeedbackConfig& config) {
  std::unordered_map<int, const AlignmentWordResult*> by_ref_index;
  for (const auto& word : per_word) by_ref_index[word.ref_index] = &word;

  for (auto& segment : segments) {
    std::vector<const AlignmentWordResult*> aligned;
    for (const auto& ref : reference_words) {
      if (ref.start < segment.start || ref.end > segment.end + kSegmentEndTolerance) continue;
      auto it = by_ref_index.find(ref.index);
      if (it != by_ref_index.end()) aligned.push_back(it->second);
    }

    segment.word_accuracy_pct =
        aligned.empty()
            ? 0
            : roundToInt(100.0 * weightedCorrect(aligned, config.low_confidence_weight_below) /
                         static_cast<double>(aligned.size()));
    segment.timing_mean_abs_ms = correctTimingMeanAbsMs(aligned);
    segment.main_issues =
        buildSegmentIssues(aligned, segment.timing_mean_abs_ms, config.timing_warning_ms);
  }
}

}  // namespace vocalcoach
