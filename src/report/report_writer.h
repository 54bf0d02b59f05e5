/**
 * @file report_writer.h
 * @brief JSON and plain-text rendering of coaching reports.
 */

#ifndef VOCALCOACH_REPORT_REPORT_WRITER_H
#define VOCALCOACH_REPORT_REPORT_WRITER_H

#include <optional>
#include <string>

#include "analysis/i_offset_estimator.h"
#include "analysis/performance_scorer.h"
#include "core/json_helpers.h"
#include "feedback/feedback_builder.h"

namespace vocalcoach {

/// @brief Combined output of one evaluated attempt.
struct CoachReport {
  DetailedFeedback feedback;                           ///< Word-level report
  std::optional<PerformanceAnalysisResult> performance;  ///< Set when signals were given
  std::optional<OffsetEstimate> offset_estimate;       ///< Set when the offset was estimated
};

/// @name Streaming writers
/// Each writes the members of one object into the writer's current object.
/// @{
void writeAlignmentWord(json::Writer& w, const AlignmentWordResult& word);
void writeSegment(json::Writer& w, const SegmentFeedback& segment);
void writeFeedback(json::Writer& w, const DetailedFeedback& feedback);
void writePerformance(json::Writer& w, const PerformanceAnalysisResult& performance);
void writeOffsetEstimate(json::Writer& w, const OffsetEstimate& estimate);
/// @}

/** @brief Serialize a word-level report as a JSON object. */
std::string feedbackToJson(const DetailedFeedback& feedback, bool pretty = false);

/** @brief Serialize a performance score as a JSON object. */
std::string performanceToJson(const PerformanceAnalysisResult& performance, bool pretty = false);

/**
 * @brief Serialize a combined report.
 *
 * Layout: `{"feedback":{...},"performance":{...},"offset_estimate":{...}}`;
 * absent parts are omitted.
 */
std::string coachReportToJson(const CoachReport& report, bool pretty = false);

/**
 * @brief Human-readable summary for terminals.
 * @param report Report to render
 * @param title Optional title (e.g. the user transcript file name)
 */
std::string coachReportToText(const CoachReport& report, const std::string& title = "");

}  // namespace vocalcoach

#endif  // VOCALCOACH_REPORT_REPORT_WRITER_H
