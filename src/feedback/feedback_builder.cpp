/**
 * @file feedback_builder.cpp
 * @brief Implementation of the word-level coaching report.
 */

#include "feedback/feedback_builder.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>

#include "alignment/token_normalizer.h"
#include "alignment/word_aligner.h"
#include "core/math_utils.h"

#ifndef FEEDBACK_DEBUG_LOG
#define FEEDBACK_DEBUG_LOG 0
#endif

namespace vocalcoach {

namespace {

constexpr double kCoverageSlackSec = 0.01;
constexpr size_t kMaxTipWords = 5;

std::vector<std::string> normalizedNonEmpty(const std::vector<std::string>& words) {
  std::vector<std::string> result;
  result.reserve(words.size());
  for (const auto& word : words) {
    std::string norm = normalizeToken(word);
    if (!norm.empty()) result.push_back(std::move(norm));
  }
  return result;
}

std::string joinFirst(const std::vector<std::string>& items, size_t limit) {
  std::string text;
  for (size_t i = 0; i < items.size() && i < limit; ++i) {
    if (i > 0) text += ", ";
    text += items[i];
  }
  return text;
}

std::string repeatPhrase(int count) {
  switch (count) {
    case 1:
      return "once";
    case 2:
      return "twice";
    case 3:
      return "three times";
    default:
      return std::to_string(count) + " times";
  }
}

int timingSubscore(int timing_mean_abs_ms) {
  return clampScore(100.0 - timing_mean_abs_ms / 5.0);
}

int paceSubscore(double pace_ratio) {
  return clampScore(100.0 - std::abs(1.0 - pace_ratio) * 200.0);
}

std::vector<std::string> buildCoachTips(const DetailedFeedback& report,
                                        const std::vector<std::string>& raw_missed,
                                        const std::optional<double>& offset_ms,
                                        const FeedbackConfig& config) {
  std::vector<std::string> tips;

  if (report.word_accuracy_pct < config.accuracy_tip_below) {
    std::string missed = joinFirst(raw_missed, kMaxTipWords);
    tips.push_back(missed.empty() ? "Focus on lyric accuracy - keep the words tight."
                                  : "Focus on the missed words: " + missed + ".");
  }

  if (report.timing_mean_abs_ms > config.timing_warning_ms) {
    std::string offset_note;
    if (offset_ms && std::abs(*offset_ms) > config.offset_note_above_ms) {
      offset_note = " (offset corrected by " + std::to_string(roundToInt(*offset_ms)) + "ms)";
    }
    tips.push_back("Timing is off by about " + std::to_string(report.timing_mean_abs_ms) + "ms" +
                   offset_note + ". Lock into the reference cue.");
  }

  if (report.pace_ratio > config.rushing_pace) {
    tips.push_back("You're rushing this verse. Slow down slightly and match the phrasing.");
  }
  if (report.pace_ratio < config.dragging_pace) {
    tips.push_back("You're dragging a bit. Push forward to match the reference pace.");
  }

  if (tips.empty()) {
    tips.push_back("Nice take - aim for even tighter timing on the next pass.");
  }
  return tips;
}

NextDrill selectDrill(const SegmentFeedback& worst, const DetailedFeedback& report,
                      const FeedbackConfig& config) {
  NextDrill drill;
  if (worst.word_accuracy_pct < config.drill_accuracy_below) {
    drill.type = DrillType::RepeatSegment;
    drill.target_segment_index = worst.segment_index;
    drill.repeat_count = config.repeat_count;
    drill.note = "Repeat the weakest line (" + std::to_string(worst.segment_index + 1) + ") " +
                 repeatPhrase(config.repeat_count) + " for clarity.";
  } else if (report.timing_mean_abs_ms > config.timing_warning_ms) {
    drill.type = DrillType::TimingLock;
    drill.note = "Clap the beat, then sing the line to lock timing.";
  } else if (report.pace_ratio > config.rushing_pace) {
    drill.type = DrillType::SlowDown;
    drill.note = "Slow the verse slightly and land the word starts on the beat.";
  } else {
    drill.type = DrillType::AccuracyClean;
    drill.note = "Repeat the verse focusing on clean word delivery.";
  }
  return drill;
}

bool isFiniteToken(const WordToken& word) {
  return isFinite(word.start) && isFinite(word.end) && word.start >= 0.0 && word.end >= word.start;
}

}  // namespace

const char* drillTypeName(DrillType type) {
  switch (type) {
    case DrillType::RepeatSegment:
      return "repeat_segment";
    case DrillType::SlowDown:
      return "slow_down";
    case DrillType::TimingLock:
      return "timing_lock";
    case DrillType::AccuracyClean:
      return "accuracy_clean";
  }
  return "unknown";
}

DetailedFeedback buildDetailedFeedback(const FeedbackInput& input, const FeedbackConfig& config) {
  DetailedFeedback report;

  const double verse_duration = std::max(0.0, input.verse_end_sec - input.verse_start_sec);
  const std::vector<WordToken>& user = input.user_words;
  const double user_duration =
      user.empty() ? 0.0 : std::max(0.0, user.back().end - user.front().start);
  const double last_user_end = user.empty() ? 0.0 : user.back().end;

  // ---------------------------------------------------------------------------
  // Coverage guard: drop reference material the user never reached.
  // ---------------------------------------------------------------------------
  report.coverage = verse_duration > 0.0 ? last_user_end / verse_duration : 1.0;
  const double coverage_end =
      verse_duration > 0.0 ? std::min(verse_duration, last_user_end + config.coverage_tail_sec)
                           : last_user_end;
  const bool stopped_early = report.coverage < config.coverage_threshold;

  std::vector<WordToken> reference_words;
  std::vector<ReferenceLine> reference_lines;
  const double cutoff = coverage_end + kCoverageSlackSec;
  for (const auto& word : input.reference_words) {
    if (!stopped_early || word.start <= cutoff) reference_words.push_back(word);
  }
  if (input.reference_lines) {
    for (const auto& line : *input.reference_lines) {
      if (!stopped_early || line.start <= cutoff) reference_lines.push_back(line);
    }
  }
  if (stopped_early) {
    report.message = "You stopped early. Record the full verse to score it.";
  }

#if FEEDBACK_DEBUG_LOG
  std::cerr << "[feedback] verse=" << verse_duration << "s coverage=" << report.coverage
            << (stopped_early ? " (truncated)" : "") << " ref=" << reference_words.size() << "/"
            << input.reference_words.size() << " user=" << user.size() << "\n";
#endif

  // ---------------------------------------------------------------------------
  // Alignment
  // ---------------------------------------------------------------------------
  AlignmentOptions options;
  options.reference_offset_sec = 0.0;
  options.user_offset_sec = input.estimated_offset_ms ? *input.estimated_offset_ms / 1000.0 : 0.0;
  options.early_late_threshold_ms = config.early_late_threshold_ms;
  options.reference_duration_sec = verse_duration;
  options.user_duration_sec = user_duration;
  AlignmentResult alignment = alignWords(reference_words, user, options);

  // ---------------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------------
  std::vector<SegmentFeedback> segments = !reference_lines.empty()
                                              ? buildSegmentsFromLines(reference_lines,
                                                                       reference_words)
                                              : buildSegmentsFromWords(reference_words, config);
  segments = mergeShortSegments(std::move(segments), config.min_segment_sec);
  scoreSegments(segments, reference_words, alignment.per_word, config);

  SegmentFeedback fallback;
  fallback.word_accuracy_pct = 100;
  const SegmentFeedback* worst = segments.empty() ? &fallback : &segments.front();
  for (const auto& segment : segments) {
    if (segment.word_accuracy_pct < worst->word_accuracy_pct) worst = &segment;
  }

  // ---------------------------------------------------------------------------
  // Report metrics
  // ---------------------------------------------------------------------------
  if (alignment.per_word.empty()) {
    report.word_accuracy_pct = alignment.metrics.word_accuracy_pct;
  } else {
    std::vector<const AlignmentWordResult*> all;
    all.reserve(alignment.per_word.size());
    for (const auto& word : alignment.per_word) all.push_back(&word);
    report.word_accuracy_pct =
        roundToInt(100.0 * weightedCorrect(all, config.low_confidence_weight_below) /
                   static_cast<double>(all.size()));
  }
  report.timing_mean_abs_ms = alignment.metrics.timing_mean_abs_ms;
  report.pace_ratio = alignment.metrics.pace_ratio;

  report.tips = buildCoachTips(report, alignment.metrics.missed_words, input.estimated_offset_ms,
                               config);
  report.next_drill = selectDrill(*worst, report, config);

  report.subscores.word_accuracy = clampScore(report.word_accuracy_pct);
  report.subscores.timing = timingSubscore(report.timing_mean_abs_ms);
  report.subscores.pace = paceSubscore(report.pace_ratio);

  for (const auto& word : alignment.per_word) {
    if (word.status != AlignmentStatus::Incorrect || !word.user_word) continue;
    Substitution sub;
    sub.ref_word = word.ref_word;
    sub.user_word = *word.user_word;
    sub.confidence = word.confidence.value_or(0.0);
    sub.confidence_label = word.confidence_label.value_or(confidenceLabelFor(sub.confidence));
    report.substitutions.push_back(std::move(sub));
  }

  report.confidence_label = confidenceLabelFor(averageConfidence(alignment.per_word));
  if (report.confidence_label == ConfidenceLabel::Low) {
    report.warnings.push_back("Low transcription confidence; word penalties softened.");
  }

  report.missed_words = normalizedNonEmpty(alignment.metrics.missed_words);
  report.extra_words = normalizedNonEmpty(alignment.metrics.extra_words);
  report.estimated_offset_ms = input.estimated_offset_ms;
  report.per_word = std::move(alignment.per_word);
  report.segments = std::move(segments);

#if FEEDBACK_DEBUG_LOG
  std::cerr << "[feedback] accuracy=" << report.word_accuracy_pct
            << "% timing=" << report.timing_mean_abs_ms << "ms pace=" << report.pace_ratio
            << " segments=" << report.segments.size()
            << " drill=" << drillTypeName(report.next_drill.type) << "\n";
#endif

  return report;
}

bool isMonotonicTiming(const std::vector<WordToken>& words) {
  for (size_t i = 0; i < words.size(); ++i) {
    if (!isFiniteToken(words[i])) return false;
    if (i > 0 && words[i].start < words[i - 1].start) return false;
  }
  return true;
}

InputError validateFeedbackInput(const FeedbackInput& input) {
  if (!isMonotonicTiming(input.reference_words)) return InputError::InvalidReferenceTiming;
  if (!isMonotonicTiming(input.user_words)) return InputError::InvalidUserTiming;

  if (input.reference_lines) {
    for (const auto& line : *input.reference_lines) {
      if (!isFinite(line.start) || !isFinite(line.end) || line.end < line.start) {
        return InputError::InvalidLineTiming;
      }
    }
  }

  if (!isFinite(input.verse_start_sec) || !isFinite(input.verse_end_sec) ||
      input.verse_end_sec < input.verse_start_sec) {
    return InputError::InvalidVerseRange;
  }

  if (input.estimated_offset_ms && !isFinite(*input.estimated_offset_ms)) {
    return InputError::InvalidOffset;
  }

  // Deltas and spans are reported in int milliseconds.
  if (!isRepresentableSec(input.verse_start_sec) || !isRepresentableSec(input.verse_end_sec)) {
    return InputError::TimeOutOfRange;
  }
  for (const auto* words : {&input.reference_words, &input.user_words}) {
    for (const auto& word : *words) {
      if (!isRepresentableSec(word.end)) return InputError::TimeOutOfRange;
    }
  }
  if (input.reference_lines) {
    for (const auto& line : *input.reference_lines) {
      if (!isRepresentableSec(line.start) || !isRepresentableSec(line.end)) {
        return InputError::TimeOutOfRange;
      }
    }
  }
  if (input.estimated_offset_ms && !isRepresentableMs(*input.estimated_offset_ms)) {
    return InputError::TimeOutOfRange;
  }
  return InputError::OK;
}

}  // namespace vocalcoach
