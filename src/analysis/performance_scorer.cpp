/**
 * @file performance_scorer.cpp
 * @brief Implementation of signal-based performance scoring.
 */

#include "analysis/performance_scorer.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>

#include "core/math_utils.h"

#ifndef PERFORMANCE_DEBUG_LOG
#define PERFORMANCE_DEBUG_LOG 0
#endif

namespace vocalcoach {

namespace {

constexpr PerformanceWeights kPracticeWeights[PRACTICE_MODE_COUNT] = {
    {0.4, 0.25, 0.2, 0.15},  // Full
    {0.1, 0.15, 0.05, 0.7},  // Words
    {0.1, 0.7, 0.05, 0.15},  // Timing
    {0.7, 0.1, 0.2, 0.0},    // Pitch
};

constexpr int kDefaultPitchScore = 55;
constexpr int kDefaultTimingScore = 60;
constexpr int kDefaultDurationScore = 60;
constexpr int kTipThreshold = 75;

std::optional<double> knownDuration(const std::optional<double>& duration) {
  if (duration && *duration > 0.0) return duration;
  return std::nullopt;
}

// Bin size of the envelopes, from whichever envelope has a known duration.
double envelopeStepSec(const PerformanceAnalysisInput& input, const PerformanceConfig& config) {
  auto ref_duration = knownDuration(input.reference_duration_sec);
  auto rec_duration = knownDuration(input.recording_duration_sec);
  if (!input.reference_envelope.empty() && ref_duration) {
    return *ref_duration / static_cast<double>(input.reference_envelope.size());
  }
  if (!input.recording_envelope.empty() && rec_duration) {
    return *rec_duration / static_cast<double>(input.recording_envelope.size());
  }
  return config.default_step_ms / 1000.0;
}

int durationScore(const PerformanceAnalysisInput& input) {
  auto ref = knownDuration(input.reference_duration_sec);
  auto rec = knownDuration(input.recording_duration_sec);
  if (!ref || !rec) return kDefaultDurationScore;
  const double relative = std::abs(*rec - *ref) / std::max(0.1, *ref);
  return std::max(0, roundToInt(100.0 - std::min(100.0, relative * 120.0)));
}

struct TipContext {
  int pitch = 0;
  int timing = 0;
  int stability = 0;
  bool tone_match = false;
  bool too_short = false;
  bool low_signal = false;
};

std::vector<std::string> buildPerformanceTips(const TipContext& ctx) {
  std::vector<std::string> tips;
  if (ctx.low_signal) {
    tips.push_back(
        "Low input level detected. Try moving closer to the mic or increasing input gain.");
    return tips;
  }
  if (ctx.too_short) {
    tips.push_back("Recording is very short. Try a longer take for better scoring.");
  }
  if (ctx.pitch < kTipThreshold) {
    tips.push_back(ctx.tone_match
                       ? "Tone match is off. Focus on resonance and dynamics to match the "
                         "reference."
                       : "Pitch accuracy needs tightening. Match the reference tone early in "
                         "each line.");
  }
  if (ctx.timing < kTipThreshold) {
    tips.push_back("Timing is loose. Enter phrases right on the reference cue.");
  }
  if (ctx.stability < kTipThreshold) {
    tips.push_back("Stability could improve. Hold sustained notes steady.");
  }
  if (tips.empty()) {
    tips.push_back("Great take. Try a fresh pass for even tighter timing.");
  }
  return tips;
}

bool isValidContour(const std::vector<PitchSample>& contour) {
  for (size_t i = 0; i < contour.size(); ++i) {
    const PitchSample& s = contour[i];
    if (!isFinite(s.time) || !isFinite(s.frequency) || s.time < 0.0 || s.frequency < 0.0) {
      return false;
    }
    if (i > 0 && s.time < contour[i - 1].time) return false;
  }
  return true;
}

bool isValidEnvelope(const std::vector<double>& envelope) {
  return std::all_of(envelope.begin(), envelope.end(),
                     [](double v) { return isFinite(v) && v >= 0.0; });
}

}  // namespace

PerformanceWeights resolveWeights(PracticeMode mode) {
  auto index = static_cast<uint8_t>(mode);
  if (index >= PRACTICE_MODE_COUNT) return kPracticeWeights[0];
  return kPracticeWeights[index];
}

PerformanceWeights normalizeWeights(const PerformanceWeights& weights) {
  double total = weights.pitch + weights.timing + weights.stability + weights.words;
  if (total == 0.0) total = 1.0;
  return {weights.pitch / total, weights.timing / total, weights.stability / total,
          weights.words / total};
}

int computeOverallScore(int pitch, int timing, int stability, std::optional<int> words,
                        const PerformanceWeights& weights) {
  const PerformanceWeights w = normalizeWeights(weights);
  const double blended = pitch * w.pitch + timing * w.timing + stability * w.stability +
                         words.value_or(0) * w.words;
  return roundToInt(blended);
}

PerformanceAnalysisResult analyzePerformance(const PerformanceAnalysisInput& input,
                                             const PerformanceConfig& config) {
  const std::vector<PitchSample> ref_contour =
      sanitizeContour(input.reference_contour, config.min_pitch_hz, config.max_pitch_hz);
  const std::vector<PitchSample> rec_contour =
      sanitizeContour(input.recording_contour, config.min_pitch_hz, config.max_pitch_hz);
  const std::vector<double>& ref_envelope = input.reference_envelope;

  // Offset compensation: move the recording onto the reference time base.
  const double step_sec = envelopeStepSec(input, config);
  // Lower bound keeps the negation below within int range.
  const int offset_bins =
      input.estimated_offset_ms && step_sec > 0.0
          ? std::max(roundToInt(*input.estimated_offset_ms / (step_sec * 1000.0)),
                     -std::numeric_limits<int>::max())
          : 0;
  const std::vector<double> rec_envelope = shiftEnvelope(input.recording_envelope, -offset_bins);

  const double avg_energy = averageEnergy(rec_envelope);
  const bool low_signal = avg_energy > 0.0 && avg_energy < config.low_signal_energy;
  const bool too_short =
      input.recording_duration_sec && *input.recording_duration_sec < config.short_recording_sec;
  const double timing_correlation = energyCorrelation(ref_envelope, rec_envelope);

  PerformanceAnalysisResult result;
  result.low_signal = low_signal;
  result.timing_correlation = timing_correlation;

  // Pitch
  bool tone_match = false;
  int pitch = kDefaultPitchScore;
  if (!ref_contour.empty() && !rec_contour.empty() && !low_signal) {
    if (voicedRatio(ref_contour) < config.min_voiced_ratio) {
      tone_match = true;
      pitch = roundToInt(timing_correlation * 100.0);
    } else {
      const double avg_cents = averageAbsoluteCentsDiff(ref_contour, rec_contour);
      pitch = std::max(0, roundToInt(100.0 - std::min(100.0, avg_cents * 2.0)));
    }
  }

  // Timing
  int timing = kDefaultTimingScore;
  const int duration_score = durationScore(input);
  if (!low_signal) {
    timing = timing_correlation > 0.0
                 ? roundToInt(std::min(100.0, timing_correlation * 85.0 + duration_score * 0.15))
                 : duration_score;
  }

  // Stability
  int stability = 0;
  if (!rec_contour.empty() && !low_signal) {
    stability = pitchStabilityScore(rec_contour, config.min_stability_samples);
  } else {
    stability = std::clamp(roundToInt(55.0 + timing_correlation * 20.0), 40, 90);
  }

  if (low_signal) {
    pitch = 0;
    timing = 0;
  }

  const PracticeMode mode = input.practice_mode.value_or(config.practice_mode);
  result.pitch = pitch;
  result.timing = timing;
  result.stability = stability;
  result.words = input.word_score;
  result.label = tone_match ? kToneMatchLabel : kPitchAccuracyLabel;
  result.overall =
      computeOverallScore(pitch, timing, stability, input.word_score, resolveWeights(mode));

  TipContext ctx;
  ctx.pitch = pitch;
  ctx.timing = timing;
  ctx.stability = stability;
  ctx.tone_match = tone_match;
  ctx.too_short = too_short;
  ctx.low_signal = low_signal;
  result.tips = buildPerformanceTips(ctx);

#if PERFORMANCE_DEBUG_LOG
  std::cerr << "[performance] mode=" << practiceModeName(mode) << " step=" << step_sec
            << "s offset_bins=" << offset_bins << " energy=" << avg_energy
            << " corr=" << timing_correlation << " pitch=" << pitch << " timing=" << timing
            << " stability=" << stability << " overall=" << result.overall << "\n";
#endif

  return result;
}

InputError validatePerformanceInput(const PerformanceAnalysisInput& input) {
  for (const auto& duration : {input.reference_duration_sec, input.recording_duration_sec}) {
    if (!duration) continue;
    if (!isFinite(*duration) || *duration < 0.0) return InputError::NegativeDuration;
  }
  if (!isValidContour(input.reference_contour) || !isValidContour(input.recording_contour)) {
    return InputError::InvalidContour;
  }
  for (const auto& duration : {input.reference_duration_sec, input.recording_duration_sec}) {
    if (duration && !isRepresentableSec(*duration)) return InputError::TimeOutOfRange;
  }
  for (const auto* contour : {&input.reference_contour, &input.recording_contour}) {
    if (!contour->empty() && !isRepresentableSec(contour->back().time)) {
      return InputError::TimeOutOfRange;
    }
  }
  if (!isValidEnvelope(input.reference_envelope) || !isValidEnvelope(input.recording_envelope)) {
    return InputError::InvalidEnvelope;
  }
  if (input.estimated_offset_ms && !isFinite(*input.estimated_offset_ms)) {
    return InputError::InvalidOffset;
  }
  if (input.estimated_offset_ms && !isRepresentableMs(*input.estimated_offset_ms)) {
    return InputError::TimeOutOfRange;
  }
  if (input.word_score && (*input.word_score < 0 || *input.word_score > 100)) {
    return InputError::InvalidWordScore;
  }
  return InputError::OK;
}

}  // namespace vocalcoach
