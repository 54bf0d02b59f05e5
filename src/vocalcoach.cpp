/**
 * @file vocalcoach.cpp
 * @brief Implementation of the high-level coaching API.
 */

#include "vocalcoach.h"

#include <utility>

#include "analysis/offset_estimator.h"
#include "core/math_utils.h"

namespace vocalcoach {

namespace {

constexpr const char* kVersion = "0.1.0";

std::optional<double> suppliedOffset(const AttemptInput& input) {
  if (input.words.estimated_offset_ms) return input.words.estimated_offset_ms;
  if (input.signals && input.signals->estimated_offset_ms) {
    return input.signals->estimated_offset_ms;
  }
  return std::nullopt;
}

}  // namespace

VocalCoach::VocalCoach() : estimator_(std::make_unique<EnvelopeOffsetEstimator>(config_.offset)) {}

VocalCoach::~VocalCoach() = default;

CoachConfigError VocalCoach::setConfig(const CoachConfig& config) {
  CoachConfigError error = validateCoachConfig(config);
  if (error != CoachConfigError::OK) return error;
  config_ = config;
  if (!custom_estimator_) estimator_ = std::make_unique<EnvelopeOffsetEstimator>(config_.offset);
  return CoachConfigError::OK;
}

void VocalCoach::setOffsetEstimator(std::unique_ptr<IOffsetEstimator> estimator) {
  custom_estimator_ = estimator != nullptr;
  estimator_ = estimator ? std::move(estimator)
                         : std::make_unique<EnvelopeOffsetEstimator>(config_.offset);
}

InputError VocalCoach::evaluate(const AttemptInput& input) {
  report_ = CoachReport{};
  has_report_ = false;

  InputError error = validateFeedbackInput(input.words);
  if (error != InputError::OK) return error;
  if (input.signals) {
    error = validatePerformanceInput(*input.signals);
    if (error != InputError::OK) return error;
  }

  // Offset: caller-supplied wins, otherwise estimate from envelopes.
  std::optional<double> offset_ms = suppliedOffset(input);
  if (!offset_ms && input.signals && !input.signals->reference_envelope.empty() &&
      !input.signals->recording_envelope.empty()) {
    OffsetEstimate estimate =
        estimator_->estimate(input.signals->reference_envelope, input.signals->recording_envelope);
    report_.offset_estimate = estimate;
    if (estimate.method != OffsetMethod::None) offset_ms = estimate.offset_ms;
  }

  FeedbackInput words = input.words;
  words.estimated_offset_ms = offset_ms;
  report_.feedback = buildDetailedFeedback(words, config_.feedback);

  if (input.signals) {
    PerformanceAnalysisInput signals = *input.signals;
    signals.estimated_offset_ms = offset_ms;
    if (!signals.word_score) signals.word_score = clampScore(report_.feedback.word_accuracy_pct);
    report_.performance = analyzePerformance(signals, config_.performance);
  }

  has_report_ = true;
  return InputError::OK;
}

std::string VocalCoach::getReportJson(bool pretty) const {
  return coachReportToJson(report_, pretty);
}

OffsetEstimate VocalCoach::estimateOffset(const std::vector<double>& reference_envelope,
                                          const std::vector<double>& recording_envelope) const {
  return estimator_->estimate(reference_envelope, recording_envelope);
}

const char* VocalCoach::version() { return kVersion; }

}  // namespace vocalcoach
