/**
 * @file offset_estimator.cpp
 * @brief Implementation of EnvelopeOffsetEstimator.
 */

#include "analysis/offset_estimator.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/math_utils.h"

namespace vocalcoach {

namespace {

constexpr int kMinOverlapBins = 3;

std::optional<size_t> firstIndexReaching(const std::vector<double>& envelope, double threshold) {
  for (size_t i = 0; i < envelope.size(); ++i) {
    if (envelope[i] >= threshold) return i;
  }
  return std::nullopt;
}

}  // namespace

const char* offsetMethodName(OffsetMethod method) {
  switch (method) {
    case OffsetMethod::None:
      return "none";
    case OffsetMethod::XCorr:
      return "xcorr";
    case OffsetMethod::Onset:
      return "onset";
  }
  return "unknown";
}

double normalizedCorrelation(const std::vector<double>& a, const std::vector<double>& b, int lag) {
  double sum = 0.0;
  double sum_a = 0.0;
  double sum_b = 0.0;
  double sum_aa = 0.0;
  double sum_bb = 0.0;
  int count = 0;

  const long b_len = static_cast<long>(b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    const long j = static_cast<long>(i) + lag;
    if (j < 0 || j >= b_len) continue;
    const double av = a[i];
    const double bv = b[static_cast<size_t>(j)];
    sum += av * bv;
    sum_a += av;
    sum_b += bv;
    sum_aa += av * av;
    sum_bb += bv * bv;
    ++count;
  }

  if (count < kMinOverlapBins) return 0.0;
  const double denom_a = sum_aa - (sum_a * sum_a) / count;
  const double denom_b = sum_bb - (sum_b * sum_b) / count;
  if (denom_a <= 0.0 || denom_b <= 0.0) return 0.0;
  return (sum - (sum_a * sum_b) / count) / std::sqrt(denom_a * denom_b);
}

std::optional<int> onsetLagBins(const std::vector<double>& reference,
                                const std::vector<double>& recording, double threshold) {
  if (reference.empty() || recording.empty()) return std::nullopt;
  const double ref_peak = std::max(0.0, *std::max_element(reference.begin(), reference.end()));
  const double rec_peak = std::max(0.0, *std::max_element(recording.begin(), recording.end()));
  auto ref_index = firstIndexReaching(reference, ref_peak * threshold);
  auto rec_index = firstIndexReaching(recording, rec_peak * threshold);
  if (!ref_index || !rec_index) return std::nullopt;
  return static_cast<int>(*rec_index) - static_cast<int>(*ref_index);
}

double EnvelopeOffsetEstimator::clampOffset(double offset_ms) const {
  return std::clamp(offset_ms, -config_.max_offset_ms, config_.max_offset_ms);
}

OffsetEstimate EnvelopeOffsetEstimator::estimate(
    const std::vector<double>& reference_envelope,
    const std::vector<double>& recording_envelope) const {
  OffsetEstimate result;
  if (reference_envelope.empty() || recording_envelope.empty()) return result;

  const double step_ms = config_.step_sec * 1000.0;
  const int max_lag = std::max(1, roundToInt(config_.max_offset_ms / step_ms));

  int best_lag = 0;
  double best_corr = -std::numeric_limits<double>::infinity();
  for (int lag = -max_lag; lag <= max_lag; ++lag) {
    const double corr = normalizedCorrelation(reference_envelope, recording_envelope, lag);
    if (corr > best_corr) {
      best_corr = corr;
      best_lag = lag;
    }
  }

  if (best_corr > config_.min_correlation) {
    result.offset_ms = clampOffset(roundToInt(best_lag * step_ms));
    result.method = OffsetMethod::XCorr;
    result.correlation = best_corr;
    return result;
  }

  auto onset_lag = onsetLagBins(reference_envelope, recording_envelope, config_.onset_threshold);
  if (onset_lag) {
    result.offset_ms = clampOffset(roundToInt(*onset_lag * step_ms));
    result.method = OffsetMethod::Onset;
  }
  return result;
}

}  // namespace vocalcoach
