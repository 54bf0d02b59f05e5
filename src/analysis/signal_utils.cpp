/**
 * @file signal_utils.cpp
 * @brief Contour and envelope statistics.
 */

#include "analysis/signal_utils.h"

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"

namespace vocalcoach {

std::vector<PitchSample> sanitizeContour(const std::vector<PitchSample>& samples, double min_hz,
                                         double max_hz) {
  std::vector<PitchSample> result = samples;
  for (auto& sample : result) {
    if (sample.frequency < min_hz || sample.frequency > max_hz) sample.frequency = 0.0;
  }
  return result;
}

double centsOff(double reference_hz, double actual_hz) {
  if (reference_hz <= 0.0 || actual_hz <= 0.0) return 0.0;
  return 1200.0 * std::log2(actual_hz / reference_hz);
}

double averageAbsoluteCentsDiff(const std::vector<PitchSample>& reference,
                                const std::vector<PitchSample>& actual) {
  const size_t len = std::min(reference.size(), actual.size());
  double total = 0.0;
  int count = 0;
  for (size_t i = 0; i < len; ++i) {
    if (reference[i].frequency <= 0.0 || actual[i].frequency <= 0.0) continue;
    total += std::abs(centsOff(reference[i].frequency, actual[i].frequency));
    ++count;
  }
  return count > 0 ? total / count : 0.0;
}

int pitchStabilityScore(const std::vector<PitchSample>& samples, int min_voiced_samples) {
  std::vector<double> voiced;
  for (const auto& sample : samples) {
    if (sample.frequency > 0.0) voiced.push_back(sample.frequency);
  }
  if (static_cast<int>(voiced.size()) < min_voiced_samples || voiced.empty()) return 50;

  const double avg = mean(voiced);
  double variance = 0.0;
  for (double f : voiced) variance += (f - avg) * (f - avg);
  variance /= static_cast<double>(voiced.size());
  const double std_dev = std::sqrt(variance);

  const double cents_std = avg > 0.0 ? 1200.0 * std::log2((avg + std_dev) / avg) : 0.0;
  return clampScore(100.0 - cents_std * 4.0);
}

double energyCorrelation(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.empty() || b.empty()) return 0.0;
  const size_t len = std::min(a.size(), b.size());

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (size_t i = 0; i < len; ++i) {
    mean_a += a[i];
    mean_b += b[i];
  }
  mean_a /= static_cast<double>(len);
  mean_b /= static_cast<double>(len);

  double num = 0.0;
  double denom_a = 0.0;
  double denom_b = 0.0;
  for (size_t i = 0; i < len; ++i) {
    const double da = a[i] - mean_a;
    const double db = b[i] - mean_b;
    num += da * db;
    denom_a += da * da;
    denom_b += db * db;
  }
  if (denom_a == 0.0 || denom_b == 0.0) return 0.0;
  return std::clamp(num / std::sqrt(denom_a * denom_b), 0.0, 1.0);
}

double averageEnergy(const std::vector<double>& envelope) { return mean(envelope); }

std::vector<double> shiftEnvelope(const std::vector<double>& envelope, int offset_bins) {
  if (offset_bins == 0) return envelope;
  const long len = static_cast<long>(envelope.size());
  std::vector<double> result(envelope.size(), 0.0);
  for (long i = 0; i < len; ++i) {
    const long j = i + offset_bins;
    if (j < 0 || j >= len) continue;
    result[static_cast<size_t>(j)] = envelope[static_cast<size_t>(i)];
  }
  return result;
}

double voicedRatio(const std::vector<PitchSample>& samples) {
  const auto voiced = std::count_if(samples.begin(), samples.end(),
                                    [](const PitchSample& s) { return s.frequency > 0.0; });
  return static_cast<double>(voiced) / static_cast<double>(std::max<size_t>(1, samples.size()));
}

}  // namespace vocalcoach
