#ifndef VOCALCOACH_C_H
#define VOCALCOACH_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

// Opaque handle to a VocalCoach instance.
typedef void* VocalCoachHandle;

// Error codes returned by API functions.
typedef enum {
  VOCALCOACH_OK = 0,
  VOCALCOACH_ERROR_INVALID_PARAM = 1,
  VOCALCOACH_ERROR_INVALID_CONFIG = 2,
  VOCALCOACH_ERROR_INVALID_INPUT = 3,
  VOCALCOACH_ERROR_NO_REPORT = 4,
  VOCALCOACH_ERROR_OUT_OF_MEMORY = 5,
} VocalCoachError;

// Input validation error codes (see vocalcoach_get_last_input_error).
typedef enum {
  VOCALCOACH_INPUT_OK = 0,
  VOCALCOACH_INPUT_INVALID_REFERENCE_TIMING = 1,
  VOCALCOACH_INPUT_INVALID_USER_TIMING = 2,
  VOCALCOACH_INPUT_INVALID_LINE_TIMING = 3,
  VOCALCOACH_INPUT_INVALID_VERSE_RANGE = 4,
  VOCALCOACH_INPUT_INVALID_OFFSET = 5,
  VOCALCOACH_INPUT_NEGATIVE_DURATION = 6,
  VOCALCOACH_INPUT_INVALID_CONTOUR = 7,
  VOCALCOACH_INPUT_INVALID_ENVELOPE = 8,
  VOCALCOACH_INPUT_INVALID_WORD_SCORE = 9,
  VOCALCOACH_INPUT_TIME_OUT_OF_RANGE = 10,
} VocalCoachInputError;

// Config validation error codes.
typedef enum {
  VOCALCOACH_CONFIG_OK = 0,
  VOCALCOACH_CONFIG_INVALID_PRACTICE_MODE = 1,
  VOCALCOACH_CONFIG_INVALID_TIMING_THRESHOLD = 2,
  VOCALCOACH_CONFIG_INVALID_SEGMENT_PARAMS = 3,
  VOCALCOACH_CONFIG_INVALID_COVERAGE = 4,
  VOCALCOACH_CONFIG_INVALID_PACE_BOUNDS = 5,
  VOCALCOACH_CONFIG_INVALID_PITCH_BAND = 6,
  VOCALCOACH_CONFIG_INVALID_SIGNAL_PARAMS = 7,
  VOCALCOACH_CONFIG_INVALID_OFFSET_PARAMS = 8,
} VocalCoachConfigError;

// ============================================================================
// Input Data Structures
// ============================================================================

// A timed word. line_index < 0 means "no line".
typedef struct {
  const char* word;  // UTF-8, NUL-terminated
  double start;      // Seconds
  double end;        // Seconds
  int32_t line_index;
} VocalCoachWord;

// A reference lyric line.
typedef struct {
  int32_t index;
  const char* text;  // UTF-8, NUL-terminated
  double start;
  double end;
} VocalCoachLine;

// A pitch tracker frame (frequency 0 = unvoiced).
typedef struct {
  double time;
  double frequency;
} VocalCoachPitchSample;

// Word-level attempt input.
typedef struct {
  const VocalCoachWord* reference_words;
  size_t reference_word_count;
  const VocalCoachWord* user_words;
  size_t user_word_count;
  const VocalCoachLine* lines;  // NULL = segment by pauses
  size_t line_count;
  double verse_start_sec;
  double verse_end_sec;
  uint8_t has_offset;  // 1 = offset_ms is set
  double offset_ms;
} VocalCoachAttempt;

// Signal input. Any array may be NULL with count 0.
typedef struct {
  const VocalCoachPitchSample* reference_contour;
  size_t reference_contour_count;
  const VocalCoachPitchSample* recording_contour;
  size_t recording_contour_count;
  const double* reference_envelope;
  size_t reference_envelope_count;
  const double* recording_envelope;
  size_t recording_envelope_count;
  double reference_duration_sec;  // <= 0 = unknown
  double recording_duration_sec;  // <= 0 = unknown
  int32_t word_score;             // < 0 = use the feedback word accuracy
} VocalCoachSignals;

// JSON output.
typedef struct {
  char* json;     // JSON string
  size_t length;  // String length
} VocalCoachReportData;

// Offset estimation result.
typedef struct {
  double offset_ms;
  uint8_t method;      // 0=none, 1=xcorr, 2=onset
  double correlation;  // 0 unless method is xcorr
} VocalCoachOffset;

// ============================================================================
// Lifecycle
// ============================================================================

// Creates a new VocalCoach instance.
// @returns Handle to the instance (must be freed with vocalcoach_destroy)
VocalCoachHandle vocalcoach_create(void);

// Destroys a VocalCoach instance.
// @param handle Handle to destroy
void vocalcoach_destroy(VocalCoachHandle handle);

// ============================================================================
// Configuration
// ============================================================================

// Applies a JSON configuration. Missing keys keep their defaults.
// @returns VOCALCOACH_OK, or VOCALCOACH_ERROR_INVALID_CONFIG (see
//          vocalcoach_get_last_config_error)
VocalCoachError vocalcoach_set_config_json(VocalCoachHandle handle, const char* config_json,
                                           size_t json_length);

// Returns the current configuration as JSON.
// @returns Static buffer valid until the next call (do not free)
const char* vocalcoach_get_config_json(VocalCoachHandle handle);

// Validates a JSON configuration without applying it.
VocalCoachConfigError vocalcoach_validate_config_json(const char* config_json, size_t json_length);

// Returns the last config validation error from set_config_json.
VocalCoachConfigError vocalcoach_get_last_config_error(VocalCoachHandle handle);

// Returns a human-readable message for a config error (static, do not free).
const char* vocalcoach_config_error_string(VocalCoachConfigError error);

// Sets the practice mode by name ("full", "words", "timing", "pitch").
VocalCoachError vocalcoach_set_practice_mode(VocalCoachHandle handle, const char* mode);

// ============================================================================
// Evaluation
// ============================================================================

// Scores one attempt.
// @param attempt Word input (required)
// @param signals Signal input (NULL = word feedback only)
// @returns VOCALCOACH_OK, or VOCALCOACH_ERROR_INVALID_INPUT (see
//          vocalcoach_get_last_input_error)
VocalCoachError vocalcoach_evaluate(VocalCoachHandle handle, const VocalCoachAttempt* attempt,
                                    const VocalCoachSignals* signals);

// Returns the last input validation error from vocalcoach_evaluate.
VocalCoachInputError vocalcoach_get_last_input_error(VocalCoachHandle handle);

// Returns a human-readable message for an input error (static, do not free).
const char* vocalcoach_input_error_string(VocalCoachInputError error);

// Returns the last report as JSON.
// @returns Pointer to ReportData (must be freed with vocalcoach_free_report),
//          NULL before a successful evaluation
VocalCoachReportData* vocalcoach_get_report(VocalCoachHandle handle);

// Frees report data returned by vocalcoach_get_report.
void vocalcoach_free_report(VocalCoachReportData* data);

// Overall performance score of the last report, or -1 if signals were not scored.
int32_t vocalcoach_get_overall_score(VocalCoachHandle handle);

// Word accuracy of the last report, or -1 before a successful evaluation.
int32_t vocalcoach_get_word_accuracy(VocalCoachHandle handle);

// ============================================================================
// Utilities
// ============================================================================

// Estimates the recording lag with the configured estimator.
VocalCoachOffset vocalcoach_estimate_offset(VocalCoachHandle handle,
                                            const double* reference_envelope,
                                            size_t reference_count,
                                            const double* recording_envelope,
                                            size_t recording_count);

// Returns the library version string.
const char* vocalcoach_version(void);

#ifdef __cplusplus
}
#endif

#endif  // VOCALCOACH_C_H
