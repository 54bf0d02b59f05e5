/**
 * @file coach_config.h
 * @brief Scoring thresholds, practice modes and configuration validation.
 */

#ifndef VOCALCOACH_CORE_COACH_CONFIG_H
#define VOCALCOACH_CORE_COACH_CONFIG_H

#include <cstdint>
#include <string>

#include "core/json_helpers.h"

namespace vocalcoach {

/// @brief Weighting profile for blending performance subscores.
enum class PracticeMode : uint8_t {
  Full,    ///< Balanced, pitch-led
  Words,   ///< Lyric accuracy dominates
  Timing,  ///< Timing dominates
  Pitch    ///< Pitch and stability dominate
};

constexpr uint8_t PRACTICE_MODE_COUNT = 4;

/** @brief Wire name of a practice mode ("full", "words", "timing", "pitch"). */
const char* practiceModeName(PracticeMode mode);

/**
 * @brief Parse a practice mode name.
 * @param name Mode name (case-sensitive)
 * @param out Receives the mode on success
 * @return false for unknown names (out is left unchanged)
 */
bool parsePracticeMode(const std::string& name, PracticeMode& out);

/// @brief Thresholds for word alignment, segmentation, tips and drills.
struct FeedbackConfig {
  int early_late_threshold_ms = 200;       ///< |delta| beyond this is early/late
  int timing_warning_ms = 250;             ///< Mean |delta| that triggers timing notes
  double min_segment_sec = 0.6;            ///< Shorter segments merge backward
  double pause_gap_sec = 0.9;              ///< Gap that forces a segment break
  int max_segment_words = 10;              ///< Words per pause-delimited segment
  double coverage_threshold = 0.6;         ///< Below this the take counts as incomplete
  double coverage_tail_sec = 0.5;          ///< Reference kept past the last user word
  double low_confidence_weight_below = 0.45;  ///< Incorrect words below this count half
  int accuracy_tip_below = 75;             ///< Word accuracy that triggers the accuracy tip
  int drill_accuracy_below = 70;           ///< Worst segment accuracy for repeat_segment
  double rushing_pace = 1.12;              ///< Pace ratio above this is rushing
  double dragging_pace = 0.88;             ///< Pace ratio below this is dragging
  int offset_note_above_ms = 40;           ///< Offset mentioned in tips above this
  int repeat_count = 3;                    ///< Repetitions for repeat_segment drills

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/// @brief Thresholds for signal-based performance scoring.
struct PerformanceConfig {
  PracticeMode practice_mode = PracticeMode::Full;
  double min_pitch_hz = 50.0;             ///< Samples below are treated as unvoiced
  double max_pitch_hz = 1100.0;           ///< Samples above are treated as unvoiced
  double low_signal_energy = 0.002;       ///< Mean energy below this is unscorable
  double min_voiced_ratio = 0.3;          ///< Below this pitch falls back to Tone Match
  int min_stability_samples = 5;          ///< Voiced samples needed for stability
  double default_step_ms = 50.0;          ///< Envelope bin size when durations are unknown
  double short_recording_sec = 3.0;       ///< Recordings shorter than this get a tip

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/// @brief Search parameters for envelope-based offset estimation.
struct OffsetEstimatorConfig {
  double step_sec = 0.05;         ///< Envelope bin size
  double max_offset_ms = 800.0;   ///< Lag search bound (both directions)
  double min_correlation = 0.2;   ///< Best lag must exceed this to be trusted
  double onset_threshold = 0.4;   ///< Fraction of peak that marks an onset

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/// @brief Complete coach configuration.
struct CoachConfig {
  FeedbackConfig feedback;
  PerformanceConfig performance;
  OffsetEstimatorConfig offset;

  void writeTo(json::Writer& w) const;
  void readFrom(const json::Parser& p);
};

/// @brief Configuration validation error codes.
enum class CoachConfigError : uint8_t {
  OK = 0,
  InvalidPracticeMode,     // Practice mode out of range or unknown name
  InvalidTimingThreshold,  // Negative millisecond threshold
  InvalidSegmentParams,    // Non-positive segment duration, gap or word count
  InvalidCoverage,         // Coverage threshold outside 0-1 or negative tail
  InvalidPaceBounds,       // Dragging bound must be below 1, rushing above 1
  InvalidPitchBand,        // min_pitch_hz must be positive and below max_pitch_hz
  InvalidSignalParams,     // Negative energy/ratio or non-positive step
  InvalidOffsetParams      // Non-positive step or negative search bound
};

/**
 * @brief Validates a CoachConfig.
 * @param config Configuration to validate
 * @return Error code (OK if valid)
 */
CoachConfigError validateCoachConfig(const CoachConfig& config);

/** @brief Human-readable description of a config error. */
const char* coachConfigErrorString(CoachConfigError error);

/**
 * @brief Parse a configuration from JSON text.
 *
 * Missing keys keep their defaults. `practice_mode` may be a name or an
 * integer; unknown values surface as InvalidPracticeMode from validation.
 */
CoachConfig coachConfigFromJson(const std::string& json_text);

/** @brief Serialize a configuration to JSON text. */
std::string coachConfigToJson(const CoachConfig& config);

}  // namespace vocalcoach

#endif  // VOCALCOACH_CORE_COACH_CONFIG_H
