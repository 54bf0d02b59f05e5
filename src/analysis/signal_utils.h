/**
 * @file signal_utils.h
 * @brief Pitch contour and energy envelope statistics used by performance scoring.
 */

#ifndef VOCALCOACH_ANALYSIS_SIGNAL_UTILS_H
#define VOCALCOACH_ANALYSIS_SIGNAL_UTILS_H

#include <vector>

namespace vocalcoach {

/// @brief One pitch-tracker frame. Frequency 0 marks an unvoiced frame.
struct PitchSample {
  double time = 0.0;       ///< Seconds from the start of the audio
  double frequency = 0.0;  ///< Hz, 0 = unvoiced
};

/**
 * @brief Zero every sample whose frequency lies outside [min_hz, max_hz].
 *
 * Out-of-band values are octave errors or noise; they are treated as
 * unvoiced for all later statistics.
 */
std::vector<PitchSample> sanitizeContour(const std::vector<PitchSample>& samples, double min_hz,
                                         double max_hz);

/// @brief Deviation of `actual` from `reference` in cents (0 if either is unvoiced).
double centsOff(double reference_hz, double actual_hz);

/**
 * @brief Mean |cents| over index-aligned frames voiced in both contours.
 * @return 0 when no frame pair is voiced
 */
double averageAbsoluteCentsDiff(const std::vector<PitchSample>& reference,
                                const std::vector<PitchSample>& actual);

/**
 * @brief Steadiness of the voiced frames.
 *
 * The frame standard deviation is expressed in cents around the mean
 * (1200 * log2((mean + std) / mean)) and penalized at 4 points per cent.
 *
 * @param samples Contour (sanitized)
 * @param min_voiced_samples Below this many voiced frames the score is 50
 * @return Score 0-100
 */
int pitchStabilityScore(const std::vector<PitchSample>& samples, int min_voiced_samples);

/**
 * @brief Pearson correlation over the common prefix of two envelopes.
 * @return Correlation clamped to [0, 1]; 0 if either input is empty or flat
 */
double energyCorrelation(const std::vector<double>& a, const std::vector<double>& b);

/// @brief Mean envelope value (0 for an empty envelope).
double averageEnergy(const std::vector<double>& envelope);

/**
 * @brief Move every bin `offset_bins` positions later (negative = earlier).
 *
 * The length is unchanged; bins shifted out of range are dropped and the
 * vacated bins are zero.
 */
std::vector<double> shiftEnvelope(const std::vector<double>& envelope, int offset_bins);

/// @brief Fraction of voiced frames (0 for an empty contour).
double voicedRatio(const std::vector<PitchSample>& samples);

}  // namespace vocalcoach

#endif  // VOCALCOACH_ANALYSIS_SIGNAL_UTILS_H
