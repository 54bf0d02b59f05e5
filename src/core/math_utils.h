/**
 * @file math_utils.h
 * @brief Rounding and clamping used at every scoring output point.
 *
 * All integer scores and millisecond values go through roundToInt() so the
 * same half-away-from-zero rule applies across the pipeline.
 */

#ifndef VOCALCOACH_CORE_MATH_UTILS_H
#define VOCALCOACH_CORE_MATH_UTILS_H

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace vocalcoach {

/// @brief Round half away from zero (2.5 -> 3, -2.5 -> -3).
///
/// Saturates to the int range; NaN rounds to 0.
inline int roundToInt(double value) {
  constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
  constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
  if (std::isnan(value)) return 0;
  const double rounded = std::round(value);
  if (rounded >= kMax) return std::numeric_limits<int>::max();
  if (rounded <= kMin) return std::numeric_limits<int>::min();
  return static_cast<int>(rounded);
}

/// @brief Round and clamp to a 0-100 score.
inline int clampScore(double value) { return std::clamp(roundToInt(value), 0, 100); }

/// @brief Arithmetic mean, 0 for an empty range.
inline double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

/// @brief True if the value is neither NaN nor infinite.
inline bool isFinite(double value) { return std::isfinite(value); }

/// @brief True if a millisecond value is finite and rounds inside the int range.
inline bool isRepresentableMs(double ms) {
  return std::isfinite(ms) && std::fabs(ms) < static_cast<double>(std::numeric_limits<int>::max());
}

/// @brief True if a time in seconds is representable in integer milliseconds.
inline bool isRepresentableSec(double sec) { return isRepresentableMs(sec * 1000.0); }

}  // namespace vocalcoach

#endif  // VOCALCOACH_CORE_MATH_UTILS_H
