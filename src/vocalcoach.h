/**
 * @file vocalcoach.h
 * @brief High-level API combining word feedback, offset estimation and performance scoring.
 */

#ifndef VOCALCOACH_H
#define VOCALCOACH_H

#include <memory>
#include <optional>
#include <string>

#include "analysis/i_offset_estimator.h"
#include "analysis/performance_scorer.h"
#include "core/coach_config.h"
#include "core/input_error.h"
#include "feedback/feedback_builder.h"
#include "report/report_writer.h"

namespace vocalcoach {

/// @brief Everything known about one attempt.
struct AttemptInput {
  FeedbackInput words;                              ///< Word timings and verse span
  std::optional<PerformanceAnalysisInput> signals;  ///< Contours and envelopes, if extracted
};

/// @brief High-level API wrapping the feedback builder and the performance scorer.
///
/// Holds configuration and the last report; scoring itself is stateless, so
/// one instance per thread is enough for concurrent use.
class VocalCoach {
 public:
  VocalCoach();
  ~VocalCoach();

  /**
   * @brief Replace the configuration after validating it.
   * @param config New configuration
   * @return OK, or the validation error (the old configuration is kept)
   */
  CoachConfigError setConfig(const CoachConfig& config);

  /// @brief Current configuration.
  const CoachConfig& getConfig() const { return config_; }

  /**
   * @brief Replace the offset estimator.
   *
   * Passing nullptr restores the default EnvelopeOffsetEstimator built from
   * the current configuration.
   */
  void setOffsetEstimator(std::unique_ptr<IOffsetEstimator> estimator);

  /**
   * @brief Validate and score one attempt.
   *
   * When signals carry both envelopes but no offset was supplied anywhere,
   * the offset estimator runs first and its lag is used for both alignment
   * and envelope compensation. The performance word score defaults to the
   * feedback word accuracy.
   *
   * @param input Attempt input
   * @return OK on success; on error the previous report is cleared
   */
  InputError evaluate(const AttemptInput& input);

  /// @brief True after a successful evaluate().
  bool hasReport() const { return has_report_; }

  /// @brief Last report (empty report before the first successful evaluate()).
  const CoachReport& getReport() const { return report_; }

  /// @brief Last report as JSON.
  std::string getReportJson(bool pretty = false) const;

  /// @brief Run the configured offset estimator directly.
  OffsetEstimate estimateOffset(const std::vector<double>& reference_envelope,
                                const std::vector<double>& recording_envelope) const;

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "0.1.0")
   */
  static const char* version();

 private:
  CoachConfig config_;
  std::unique_ptr<IOffsetEstimator> estimator_;
  bool custom_estimator_ = false;
  CoachReport report_;
  bool has_report_ = false;
};

}  // namespace vocalcoach

#endif  // VOCALCOACH_H
