/**
 * @file i_offset_estimator.h
 * @brief Interface for estimating the start lag between reference and recording.
 *
 * Scoring consumes only the millisecond lag. Implementations are free to use
 * any signal; the bundled one works on energy envelopes.
 */

#ifndef VOCALCOACH_ANALYSIS_I_OFFSET_ESTIMATOR_H
#define VOCALCOACH_ANALYSIS_I_OFFSET_ESTIMATOR_H

#include <cstdint>
#include <optional>
#include <vector>

namespace vocalcoach {

/// @brief How an offset estimate was obtained (informational only).
enum class OffsetMethod : uint8_t {
  None,   ///< No usable signal, offset is 0
  XCorr,  ///< Best normalized cross-correlation lag
  Onset   ///< Difference of first onsets
};

/** @brief Wire name ("none", "xcorr", "onset"). */
const char* offsetMethodName(OffsetMethod method);

/// @brief Signed lag of the recording behind the reference.
struct OffsetEstimate {
  double offset_ms = 0.0;                 ///< Positive = recording starts later
  OffsetMethod method = OffsetMethod::None;
  std::optional<double> correlation;      ///< Set for XCorr
};

/**
 * @brief Interface for start-offset estimation.
 *
 * Implementations must be deterministic and must not throw for empty input.
 */
class IOffsetEstimator {
 public:
  virtual ~IOffsetEstimator() = default;

  /**
   * @brief Estimate the lag between two fixed-step energy envelopes.
   * @param reference_envelope Reference track energy
   * @param recording_envelope Recorded attempt energy
   * @return Estimate (method None with 0 ms when no lag can be found)
   */
  virtual OffsetEstimate estimate(const std::vector<double>& reference_envelope,
                                  const std::vector<double>& recording_envelope) const = 0;
};

}  // namespace vocalcoach

#endif  // VOCALCOACH_ANALYSIS_I_OFFSET_ESTIMATOR_H
