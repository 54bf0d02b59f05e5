/**
 * @file offset_estimator.h
 * @brief Envelope cross-correlation offset estimator with onset fallback.
 */

#ifndef VOCALCOACH_ANALYSIS_OFFSET_ESTIMATOR_H
#define VOCALCOACH_ANALYSIS_OFFSET_ESTIMATOR_H

#include <optional>
#include <vector>

#include "analysis/i_offset_estimator.h"
#include "core/coach_config.h"

namespace vocalcoach {

/**
 * @brief Normalized correlation of `a[i]` against `b[i + lag]`.
 * @return 0 with fewer than 3 overlapping bins or a flat overlap
 */
double normalizedCorrelation(const std::vector<double>& a, const std::vector<double>& b, int lag);

/**
 * @brief Bin lag between the first onsets of two envelopes.
 *
 * An onset is the first bin reaching `threshold` times the envelope peak.
 * @return recording onset bin minus reference onset bin, or nullopt
 */
std::optional<int> onsetLagBins(const std::vector<double>& reference,
                                const std::vector<double>& recording, double threshold);

/**
 * @brief Default IOffsetEstimator.
 *
 * Searches every lag within +/- max_offset_ms for the highest normalized
 * correlation. A best correlation above min_correlation yields XCorr;
 * otherwise the onset difference is used; otherwise None. Results are
 * clamped to +/- max_offset_ms.
 */
class EnvelopeOffsetEstimator : public IOffsetEstimator {
 public:
  EnvelopeOffsetEstimator() = default;
  explicit EnvelopeOffsetEstimator(const OffsetEstimatorConfig& config) : config_(config) {}

  OffsetEstimate estimate(const std::vector<double>& reference_envelope,
                          const std::vector<double>& recording_envelope) const override;

  const OffsetEstimatorConfig& config() const { return config_; }

 private:
  double clampOffset(double offset_ms) const;

  OffsetEstimatorConfig config_;
};

}  // namespace vocalcoach

#endif  // VOCALCOACH_ANALYSIS_OFFSET_ESTIMATOR_H
