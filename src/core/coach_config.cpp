/**
 * @file coach_config.cpp
 * @brief Configuration serialization and validation.
 */

#include "core/coach_config.h"

#include <cmath>
#include <initializer_list>
#include <sstream>

namespace vocalcoach {

namespace {

// Marks a practice mode that could not be parsed so validation can reject it.
constexpr uint8_t kInvalidPracticeMode = 0xFF;

bool finiteAll(std::initializer_list<double> values) {
  for (double v : values) {
    if (!std::isfinite(v)) return false;
  }
  return true;
}

}  // namespace

const char* practiceModeName(PracticeMode mode) {
  switch (mode) {
    case PracticeMode::Full:
      return "full";
    case PracticeMode::Words:
      return "words";
    case PracticeMode::Timing:
      return "timing";
    case PracticeMode::Pitch:
      return "pitch";
  }
  return "unknown";
}

bool parsePracticeMode(const std::string& name, PracticeMode& out) {
  for (uint8_t i = 0; i < PRACTICE_MODE_COUNT; ++i) {
    auto mode = static_cast<PracticeMode>(i);
    if (name == practiceModeName(mode)) {
      out = mode;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Serialization
// ============================================================================

void FeedbackConfig::writeTo(json::Writer& w) const {
  w.write("early_late_threshold_ms", early_late_threshold_ms)
      .write("timing_warning_ms", timing_warning_ms)
      .write("min_segment_sec", min_segment_sec)
      .write("pause_gap_sec", pause_gap_sec)
      .write("max_segment_words", max_segment_words)
      .write("coverage_threshold", coverage_threshold)
      .write("coverage_tail_sec", coverage_tail_sec)
      .write("low_confidence_weight_below", low_confidence_weight_below)
      .write("accuracy_tip_below", accuracy_tip_below)
      .write("drill_accuracy_below", drill_accuracy_below)
      .write("rushing_pace", rushing_pace)
      .write("dragging_pace", dragging_pace)
      .write("offset_note_above_ms", offset_note_above_ms)
      .write("repeat_count", repeat_count);
}

void FeedbackConfig::readFrom(const json::Parser& p) {
  FeedbackConfig d;
  early_late_threshold_ms = p.getInt("early_late_threshold_ms", d.early_late_threshold_ms);
  timing_warning_ms = p.getInt("timing_warning_ms", d.timing_warning_ms);
  min_segment_sec = p.getDouble("min_segment_sec", d.min_segment_sec);
  pause_gap_sec = p.getDouble("pause_gap_sec", d.pause_gap_sec);
  max_segment_words = p.getInt("max_segment_words", d.max_segment_words);
  coverage_threshold = p.getDouble("coverage_threshold", d.coverage_threshold);
  coverage_tail_sec = p.getDouble("coverage_tail_sec", d.coverage_tail_sec);
  low_confidence_weight_below =
      p.getDouble("low_confidence_weight_below", d.low_confidence_weight_below);
  accuracy_tip_below = p.getInt("accuracy_tip_below", d.accuracy_tip_below);
  drill_accuracy_below = p.getInt("drill_accuracy_below", d.drill_accuracy_below);
  rushing_pace = p.getDouble("rushing_pace", d.rushing_pace);
  dragging_pace = p.getDouble("dragging_pace", d.dragging_pace);
  offset_note_above_ms = p.getInt("offset_note_above_ms", d.offset_note_above_ms);
  repeat_count = p.getInt("repeat_count", d.repeat_count);
}

void PerformanceConfig::writeTo(json::Writer& w) const {
  w.write("practice_mode", practiceModeName(practice_mode))
      .write("min_pitch_hz", min_pitch_hz)
      .write("max_pitch_hz", max_pitch_hz)
      .write("low_signal_energy", low_signal_energy)
      .write("min_voiced_ratio", min_voiced_ratio)
      .write("min_stability_samples", min_stability_samples)
      .write("default_step_ms", default_step_ms)
      .write("short_recording_sec", short_recording_sec);
}

void PerformanceConfig::readFrom(const json::Parser& p) {
  PerformanceConfig d;
  if (p.has("practice_mode")) {
    if (p.isString("practice_mode")) {
      PracticeMode mode = d.practice_mode;
      practice_mode = parsePracticeMode(p.getString("practice_mode"), mode)
                          ? mode
                          : static_cast<PracticeMode>(kInvalidPracticeMode);
    } else {
      int raw = p.getInt("practice_mode", kInvalidPracticeMode);
      practice_mode = static_cast<PracticeMode>(
          raw >= 0 && raw < PRACTICE_MODE_COUNT ? raw : kInvalidPracticeMode);
    }
  }
  min_pitch_hz = p.getDouble("min_pitch_hz", d.min_pitch_hz);
  max_pitch_hz = p.getDouble("max_pitch_hz", d.max_pitch_hz);
  low_signal_energy = p.getDouble("low_signal_energy", d.low_signal_energy);
  min_voiced_ratio = p.getDouble("min_voiced_ratio", d.min_voiced_ratio);
  min_stability_samples = p.getInt("min_stability_samples", d.min_stability_samples);
  default_step_ms = p.getDouble("default_step_ms", d.default_step_ms);
  short_recording_sec = p.getDouble("short_recording_sec", d.short_recording_sec);
}

void OffsetEstimatorConfig::writeTo(json::Writer& w) const {
  w.write("step_sec", step_sec)
      .write("max_offset_ms", max_offset_ms)
      .write("min_correlation", min_correlation)
      .write("onset_threshold", onset_threshold);
}

void OffsetEstimatorConfig::readFrom(const json::Parser& p) {
  OffsetEstimatorConfig d;
  step_sec = p.getDouble("step_sec", d.step_sec);
  max_offset_ms = p.getDouble("max_offset_ms", d.max_offset_ms);
  min_correlation = p.getDouble("min_correlation", d.min_correlation);
  onset_threshold = p.getDouble("onset_threshold", d.onset_threshold);
}

void CoachConfig::writeTo(json::Writer& w) const {
  // practice_mode is hoisted to the top level for callers that only set the mode.
  w.write("practice_mode", practiceModeName(performance.practice_mode));
  w.beginObject("feedback");
  feedback.writeTo(w);
  w.endObject();
  w.beginObject("performance");
  performance.writeTo(w);
  w.endObject();
  w.beginObject("offset");
  offset.writeTo(w);
  w.endObject();
}

void CoachConfig::readFrom(const json::Parser& p) {
  if (p.has("feedback")) feedback.readFrom(p.getObject("feedback"));
  if (p.has("performance")) performance.readFrom(p.getObject("performance"));
  if (p.has("offset")) offset.readFrom(p.getObject("offset"));
  if (p.has("practice_mode")) {
    // Top-level mode wins over the nested one.
    PerformanceConfig mode_only = performance;
    mode_only.readFrom(p);
    performance.practice_mode = mode_only.practice_mode;
  }
}

// ============================================================================
// Validation
// ============================================================================

CoachConfigError validateCoachConfig(const CoachConfig& config) {
  const FeedbackConfig& f = config.feedback;
  const PerformanceConfig& perf = config.performance;
  const OffsetEstimatorConfig& off = config.offset;

  if (static_cast<uint8_t>(perf.practice_mode) >= PRACTICE_MODE_COUNT) {
    return CoachConfigError::InvalidPracticeMode;
  }

  if (f.early_late_threshold_ms < 0 || f.timing_warning_ms < 0 || f.offset_note_above_ms < 0) {
    return CoachConfigError::InvalidTimingThreshold;
  }

  if (!finiteAll({f.min_segment_sec, f.pause_gap_sec}) || f.min_segment_sec < 0.0 ||
      f.pause_gap_sec <= 0.0 || f.max_segment_words < 1 || f.repeat_count < 1) {
    return CoachConfigError::InvalidSegmentParams;
  }

  if (!finiteAll({f.coverage_threshold, f.coverage_tail_sec, f.low_confidence_weight_below}) ||
      f.coverage_threshold < 0.0 || f.coverage_threshold > 1.0 || f.coverage_tail_sec < 0.0) {
    return CoachConfigError::InvalidCoverage;
  }

  if (!finiteAll({f.rushing_pace, f.dragging_pace}) || f.dragging_pace <= 0.0 ||
      f.dragging_pace >= 1.0 || f.rushing_pace <= 1.0) {
    return CoachConfigError::InvalidPaceBounds;
  }

  if (!finiteAll({perf.min_pitch_hz, perf.max_pitch_hz}) || perf.min_pitch_hz <= 0.0 ||
      perf.min_pitch_hz >= perf.max_pitch_hz) {
    return CoachConfigError::InvalidPitchBand;
  }

  if (!finiteAll({perf.low_signal_energy, perf.min_voiced_ratio, perf.default_step_ms,
                  perf.short_recording_sec}) ||
      perf.low_signal_energy < 0.0 || perf.min_voiced_ratio < 0.0 ||
      perf.min_voiced_ratio > 1.0 || perf.default_step_ms <= 0.0 ||
      perf.min_stability_samples < 1 || perf.short_recording_sec < 0.0) {
    return CoachConfigError::InvalidSignalParams;
  }

  if (!finiteAll({off.step_sec, off.max_offset_ms, off.min_correlation, off.onset_threshold}) ||
      off.step_sec <= 0.0 || off.max_offset_ms < 0.0 || off.onset_threshold < 0.0 ||
      off.onset_threshold > 1.0) {
    return CoachConfigError::InvalidOffsetParams;
  }

  return CoachConfigError::OK;
}

const char* coachConfigErrorString(CoachConfigError error) {
  switch (error) {
    case CoachConfigError::OK:
      return "No error";
    case CoachConfigError::InvalidPracticeMode:
      return "Invalid practice mode (must be full, words, timing or pitch)";
    case CoachConfigError::InvalidTimingThreshold:
      return "Invalid timing threshold (must be >= 0 ms)";
    case CoachConfigError::InvalidSegmentParams:
      return "Invalid segment parameters (gap and word count must be positive)";
    case CoachConfigError::InvalidCoverage:
      return "Invalid coverage parameters (threshold 0-1, tail >= 0)";
    case CoachConfigError::InvalidPaceBounds:
      return "Invalid pace bounds (dragging in (0,1), rushing > 1)";
    case CoachConfigError::InvalidPitchBand:
      return "Invalid pitch band (0 < min_pitch_hz < max_pitch_hz)";
    case CoachConfigError::InvalidSignalParams:
      return "Invalid signal parameters";
    case CoachConfigError::InvalidOffsetParams:
      return "Invalid offset estimator parameters";
  }
  return "Unknown config error";
}

CoachConfig coachConfigFromJson(const std::string& json_text) {
  json::Parser p(json_text);
  CoachConfig config;
  config.readFrom(p);
  return config;
}

std::string coachConfigToJson(const CoachConfig& config) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();
  config.writeTo(w);
  w.endObject();
  return oss.str();
}

}  // namespace vocalcoach
