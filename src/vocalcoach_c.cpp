/**
 * @file vocalcoach_c.cpp
 * @brief Implementation of C API for WASM and FFI bindings.
 */

#include "vocalcoach_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <unordered_map>

#include "vocalcoach.h"

namespace {

// Last validation errors per handle
std::unordered_map<void*, VocalCoachConfigError> g_last_config_errors;
std::unordered_map<void*, VocalCoachInputError> g_last_input_errors;

// Static buffer for JSON config output
std::string s_json_config_buffer;

VocalCoachConfigError mapConfigError(vocalcoach::CoachConfigError error) {
  // Enumerators are declared in the same order.
  return static_cast<VocalCoachConfigError>(static_cast<int>(error));
}

VocalCoachInputError mapInputError(vocalcoach::InputError error) {
  return static_cast<VocalCoachInputError>(static_cast<int>(error));
}

std::vector<vocalcoach::WordToken> toWords(const VocalCoachWord* words, size_t count) {
  std::vector<vocalcoach::WordToken> tokens;
  if (!words) return tokens;
  tokens.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    vocalcoach::WordToken token;
    token.word = words[i].word ? words[i].word : "";
    token.start = words[i].start;
    token.end = words[i].end;
    token.index = static_cast<int>(i);
    if (words[i].line_index >= 0) token.line_index = words[i].line_index;
    tokens.push_back(std::move(token));
  }
  return tokens;
}

std::vector<vocalcoach::PitchSample> toContour(const VocalCoachPitchSample* samples, size_t count) {
  std::vector<vocalcoach::PitchSample> contour;
  if (!samples) return contour;
  contour.reserve(count);
  for (size_t i = 0; i < count; ++i) contour.push_back({samples[i].time, samples[i].frequency});
  return contour;
}

std::vector<double> toEnvelope(const double* values, size_t count) {
  if (!values) return {};
  return std::vector<double>(values, values + count);
}

std::optional<double> knownDuration(double sec) {
  if (sec > 0.0) return sec;
  return std::nullopt;
}

vocalcoach::AttemptInput toAttempt(const VocalCoachAttempt& attempt,
                                   const VocalCoachSignals* signals) {
  vocalcoach::AttemptInput input;
  input.words.reference_words = toWords(attempt.reference_words, attempt.reference_word_count);
  input.words.user_words = toWords(attempt.user_words, attempt.user_word_count);
  if (attempt.lines && attempt.line_count > 0) {
    std::vector<vocalcoach::ReferenceLine> lines;
    lines.reserve(attempt.line_count);
    for (size_t i = 0; i < attempt.line_count; ++i) {
      vocalcoach::ReferenceLine line;
      line.index = attempt.lines[i].index;
      line.text = attempt.lines[i].text ? attempt.lines[i].text : "";
      line.start = attempt.lines[i].start;
      line.end = attempt.lines[i].end;
      lines.push_back(std::move(line));
    }
    input.words.reference_lines = std::move(lines);
  }
  input.words.verse_start_sec = attempt.verse_start_sec;
  input.words.verse_end_sec = attempt.verse_end_sec;
  if (attempt.has_offset) input.words.estimated_offset_ms = attempt.offset_ms;

  if (signals) {
    vocalcoach::PerformanceAnalysisInput perf;
    perf.reference_contour =
        toContour(signals->reference_contour, signals->reference_contour_count);
    perf.recording_contour =
        toContour(signals->recording_contour, signals->recording_contour_count);
    perf.reference_envelope =
        toEnvelope(signals->reference_envelope, signals->reference_envelope_count);
    perf.recording_envelope =
        toEnvelope(signals->recording_envelope, signals->recording_envelope_count);
    perf.reference_duration_sec = knownDuration(signals->reference_duration_sec);
    perf.recording_duration_sec = knownDuration(signals->recording_duration_sec);
    if (signals->word_score >= 0) perf.word_score = signals->word_score;
    input.signals = std::move(perf);
  }
  return input;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

VocalCoachHandle vocalcoach_create(void) { return new vocalcoach::VocalCoach(); }

void vocalcoach_destroy(VocalCoachHandle handle) {
  if (handle) {
    g_last_config_errors.erase(handle);
    g_last_input_errors.erase(handle);
  }
  delete static_cast<vocalcoach::VocalCoach*>(handle);
}

// ============================================================================
// Configuration
// ============================================================================

VocalCoachError vocalcoach_set_config_json(VocalCoachHandle handle, const char* config_json,
                                           size_t json_length) {
  if (!handle || !config_json) {
    return VOCALCOACH_ERROR_INVALID_PARAM;
  }

  g_last_config_errors[handle] = VOCALCOACH_CONFIG_OK;

  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  vocalcoach::json::Parser p(std::string(config_json, json_length));
  vocalcoach::CoachConfig config = coach->getConfig();
  config.readFrom(p);

  auto validation = coach->setConfig(config);
  if (validation != vocalcoach::CoachConfigError::OK) {
    g_last_config_errors[handle] = mapConfigError(validation);
    return VOCALCOACH_ERROR_INVALID_CONFIG;
  }
  return VOCALCOACH_OK;
}

const char* vocalcoach_get_config_json(VocalCoachHandle handle) {
  if (!handle) return nullptr;
  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  s_json_config_buffer = vocalcoach::coachConfigToJson(coach->getConfig());
  return s_json_config_buffer.c_str();
}

VocalCoachConfigError vocalcoach_validate_config_json(const char* config_json,
                                                      size_t json_length) {
  if (!config_json) {
    return VOCALCOACH_CONFIG_INVALID_PRACTICE_MODE;
  }
  vocalcoach::CoachConfig config =
      vocalcoach::coachConfigFromJson(std::string(config_json, json_length));
  return mapConfigError(vocalcoach::validateCoachConfig(config));
}

VocalCoachConfigError vocalcoach_get_last_config_error(VocalCoachHandle handle) {
  if (!handle) {
    return VOCALCOACH_CONFIG_OK;
  }
  auto it = g_last_config_errors.find(handle);
  if (it != g_last_config_errors.end()) {
    return it->second;
  }
  return VOCALCOACH_CONFIG_OK;
}

const char* vocalcoach_config_error_string(VocalCoachConfigError error) {
  return vocalcoach::coachConfigErrorString(
      static_cast<vocalcoach::CoachConfigError>(static_cast<int>(error)));
}

VocalCoachError vocalcoach_set_practice_mode(VocalCoachHandle handle, const char* mode) {
  if (!handle || !mode) {
    return VOCALCOACH_ERROR_INVALID_PARAM;
  }
  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  vocalcoach::CoachConfig config = coach->getConfig();
  if (!vocalcoach::parsePracticeMode(mode, config.performance.practice_mode)) {
    g_last_config_errors[handle] = VOCALCOACH_CONFIG_INVALID_PRACTICE_MODE;
    return VOCALCOACH_ERROR_INVALID_CONFIG;
  }
  auto validation = coach->setConfig(config);
  g_last_config_errors[handle] = mapConfigError(validation);
  return validation == vocalcoach::CoachConfigError::OK ? VOCALCOACH_OK
                                                        : VOCALCOACH_ERROR_INVALID_CONFIG;
}

// ============================================================================
// Evaluation
// ============================================================================

VocalCoachError vocalcoach_evaluate(VocalCoachHandle handle, const VocalCoachAttempt* attempt,
                                    const VocalCoachSignals* signals) {
  if (!handle || !attempt) {
    return VOCALCOACH_ERROR_INVALID_PARAM;
  }

  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  auto result = coach->evaluate(toAttempt(*attempt, signals));
  g_last_input_errors[handle] = mapInputError(result);
  return result == vocalcoach::InputError::OK ? VOCALCOACH_OK : VOCALCOACH_ERROR_INVALID_INPUT;
}

VocalCoachInputError vocalcoach_get_last_input_error(VocalCoachHandle handle) {
  if (!handle) {
    return VOCALCOACH_INPUT_OK;
  }
  auto it = g_last_input_errors.find(handle);
  if (it != g_last_input_errors.end()) {
    return it->second;
  }
  return VOCALCOACH_INPUT_OK;
}

const char* vocalcoach_input_error_string(VocalCoachInputError error) {
  return vocalcoach::inputErrorString(
      static_cast<vocalcoach::InputError>(static_cast<int>(error)));
}

VocalCoachReportData* vocalcoach_get_report(VocalCoachHandle handle) {
  if (!handle) return nullptr;

  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  if (!coach->hasReport()) return nullptr;
  std::string json = coach->getReportJson();

  auto* result = static_cast<VocalCoachReportData*>(malloc(sizeof(VocalCoachReportData)));
  if (!result) return nullptr;

  result->length = json.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, json.c_str(), result->length + 1);
  return result;
}

void vocalcoach_free_report(VocalCoachReportData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

int32_t vocalcoach_get_overall_score(VocalCoachHandle handle) {
  if (!handle) return -1;
  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  if (!coach->hasReport() || !coach->getReport().performance) return -1;
  return coach->getReport().performance->overall;
}

int32_t vocalcoach_get_word_accuracy(VocalCoachHandle handle) {
  if (!handle) return -1;
  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  if (!coach->hasReport()) return -1;
  return coach->getReport().feedback.word_accuracy_pct;
}

// ============================================================================
// Utilities
// ============================================================================

VocalCoachOffset vocalcoach_estimate_offset(VocalCoachHandle handle,
                                            const double* reference_envelope,
                                            size_t reference_count,
                                            const double* recording_envelope,
                                            size_t recording_count) {
  VocalCoachOffset offset{};
  if (!handle) return offset;

  auto* coach = static_cast<vocalcoach::VocalCoach*>(handle);
  vocalcoach::OffsetEstimate estimate =
      coach->estimateOffset(toEnvelope(reference_envelope, reference_count),
                            toEnvelope(recording_envelope, recording_count));
  offset.offset_ms = estimate.offset_ms;
  offset.method = static_cast<uint8_t>(estimate.method);
  offset.correlation = estimate.correlation.value_or(0.0);
  return offset;
}

const char* vocalcoach_version(void) { return vocalcoach::VocalCoach::version(); }

}  // extern "C"
