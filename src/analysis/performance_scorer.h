/**
 * @file performance_scorer.h
 * @brief Multi-metric performance score from pitch contours and energy envelopes.
 */

#ifndef VOCALCOACH_ANALYSIS_PERFORMANCE_SCORER_H
#define VOCALCOACH_ANALYSIS_PERFORMANCE_SCORER_H

#include <optional>
#include <string>
#include <vector>

#include "analysis/signal_utils.h"
#include "core/coach_config.h"
#include "core/input_error.h"

namespace vocalcoach {

/// @brief Relative subscore weights of one practice mode.
struct PerformanceWeights {
  double pitch = 0.0;
  double timing = 0.0;
  double stability = 0.0;
  double words = 0.0;
};

/// @name Pitch score labels
/// @{
constexpr const char* kPitchAccuracyLabel = "Pitch Accuracy";
constexpr const char* kToneMatchLabel = "Tone Match";
/// @}

/**
 * @brief Fixed weight record of a practice mode.
 *
 * | Mode   | pitch | timing | stability | words |
 * |--------|-------|--------|-----------|-------|
 * | full   | 0.40  | 0.25   | 0.20      | 0.15  |
 * | words  | 0.10  | 0.15   | 0.05      | 0.70  |
 * | timing | 0.10  | 0.70   | 0.05      | 0.15  |
 * | pitch  | 0.70  | 0.10   | 0.20      | 0.00  |
 *
 * Out-of-range modes resolve to the full profile.
 */
PerformanceWeights resolveWeights(PracticeMode mode);

/// @brief Scale weights to sum to 1 (an all-zero record is returned unchanged).
PerformanceWeights normalizeWeights(const PerformanceWeights& weights);

/**
 * @brief Blend subscores into one overall score.
 *
 * Weights are normalized first. A missing word score contributes 0; the
 * words term is never skipped.
 */
int computeOverallScore(int pitch, int timing, int stability, std::optional<int> words,
                        const PerformanceWeights& weights);

/// @brief Signal input for analyzePerformance().
///
/// Durations of zero or less are treated as unknown.
struct PerformanceAnalysisInput {
  std::optional<double> reference_duration_sec;
  std::optional<double> recording_duration_sec;
  std::vector<PitchSample> reference_contour;
  std::vector<PitchSample> recording_contour;
  std::vector<double> reference_envelope;  ///< Fixed-step energy values
  std::vector<double> recording_envelope;  ///< Fixed-step energy values
  std::optional<double> estimated_offset_ms;
  std::optional<PracticeMode> practice_mode;  ///< Overrides PerformanceConfig::practice_mode
  std::optional<int> word_score;              ///< External word score (0-100)
};

/// @brief Headline multi-metric score.
struct PerformanceAnalysisResult {
  int overall = 0;
  int pitch = 0;
  int timing = 0;
  int stability = 0;
  std::optional<int> words;
  std::string label = kPitchAccuracyLabel;  ///< kPitchAccuracyLabel or kToneMatchLabel
  std::vector<std::string> tips;
  double timing_correlation = 0.0;  ///< Envelope correlation, 0-1
  bool low_signal = false;          ///< Recording energy too low to score
};

/**
 * @brief Score a take from its signals.
 *
 * Independent of word alignment. Never throws; missing signals fall back to
 * neutral defaults (pitch 55, timing 60, duration score 60).
 *
 * @param input Contours, envelopes, durations, offset and optional word score
 * @param config Pitch band, low-signal threshold and default practice mode
 */
PerformanceAnalysisResult analyzePerformance(const PerformanceAnalysisInput& input,
                                             const PerformanceConfig& config = PerformanceConfig{});

/**
 * @brief Check signal input before scoring.
 *
 * Rejects negative or non-finite durations, non-finite or time-reversed
 * contour samples, negative or non-finite envelope values, a non-finite
 * offset and a word score outside 0-100.
 */
InputError validatePerformanceInput(const PerformanceAnalysisInput& input);

}  // namespace vocalcoach

#endif  // VOCALCOACH_ANALYSIS_PERFORMANCE_SCORER_H
