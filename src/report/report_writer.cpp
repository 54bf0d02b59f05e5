/**
 * @file report_writer.cpp
 * @brief Report serialization.
 */

#include "report/report_writer.h"

#include <iomanip>
#include <sstream>

namespace vocalcoach {

namespace {

void writeStringArray(json::Writer& w, const char* key, const std::vector<std::string>& values) {
  w.beginArray(key);
  for (const auto& value : values) w.value(value);
  w.endArray();
}

std::string formatSeconds(double sec) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << sec << "s";
  return ss.str();
}

}  // namespace

// ============================================================================
// JSON
// ============================================================================

void writeAlignmentWord(json::Writer& w, const AlignmentWordResult& word) {
  w.write("ref_index", word.ref_index)
      .write("ref_word", word.ref_word)
      .write("ref_start", word.ref_start)
      .write("ref_end", word.ref_end)
      .write("status", alignmentStatusName(word.status))
      .writeOptional("user_word", word.user_word)
      .writeOptional("user_start", word.user_start)
      .writeOptional("user_end", word.user_end)
      .writeOptional("delta_ms", word.delta_ms)
      .writeOptional("confidence", word.confidence);
  if (word.confidence_label) {
    w.write("confidence_label", confidenceLabelName(*word.confidence_label));
  }
}

void writeSegment(json::Writer& w, const SegmentFeedback& segment) {
  w.write("segment_index", segment.segment_index)
      .write("text", segment.text)
      .write("start", segment.start)
      .write("end", segment.end)
      .write("word_accuracy_pct", segment.word_accuracy_pct)
      .write("timing_mean_abs_ms", segment.timing_mean_abs_ms);
  writeStringArray(w, "main_issues", segment.main_issues);
}

void writeFeedback(json::Writer& w, const DetailedFeedback& feedback) {
  w.write("word_accuracy_pct", feedback.word_accuracy_pct)
      .write("timing_mean_abs_ms", feedback.timing_mean_abs_ms)
      .write("pace_ratio", feedback.pace_ratio)
      .write("coverage", feedback.coverage);

  w.beginArray("per_word");
  for (const auto& word : feedback.per_word) {
    w.beginObject();
    writeAlignmentWord(w, word);
    w.endObject();
  }
  w.endArray();

  w.beginArray("segments");
  for (const auto& segment : feedback.segments) {
    w.beginObject();
    writeSegment(w, segment);
    w.endObject();
  }
  w.endArray();

  writeStringArray(w, "coach_tips", feedback.tips);

  const NextDrill& drill = feedback.next_drill;
  w.beginObject("next_drill")
      .write("type", drillTypeName(drill.type))
      .writeOptional("target_segment_index", drill.target_segment_index)
      .writeOptional("repeat_count", drill.repeat_count)
      .write("note", drill.note)
      .endObject();

  w.beginObject("subscores")
      .write("word_accuracy", feedback.subscores.word_accuracy)
      .write("timing", feedback.subscores.timing)
      .write("pace", feedback.subscores.pace)
      .endObject();

  writeStringArray(w, "missed_words", feedback.missed_words);
  writeStringArray(w, "extra_words", feedback.extra_words);

  w.beginArray("substitutions");
  for (const auto& sub : feedback.substitutions) {
    w.beginObject()
        .write("ref_word", sub.ref_word)
        .write("user_word", sub.user_word)
        .write("confidence", sub.confidence)
        .write("confidence_label", confidenceLabelName(sub.confidence_label))
        .endObject();
  }
  w.endArray();

  w.write("confidence_label", confidenceLabelName(feedback.confidence_label));
  w.writeOptional("estimated_offset_ms", feedback.estimated_offset_ms);
  w.writeOptional("message", feedback.message);
  if (!feedback.warnings.empty()) writeStringArray(w, "warnings", feedback.warnings);
}

void writePerformance(json::Writer& w, const PerformanceAnalysisResult& performance) {
  w.write("overall", performance.overall)
      .write("pitch", performance.pitch)
      .write("timing", performance.timing)
      .write("stability", performance.stability)
      .writeOptional("words", performance.words)
      .write("label", performance.label);
  writeStringArray(w, "tips", performance.tips);
  w.beginObject("alignment").write("timing_correlation", performance.timing_correlation).endObject();
}

void writeOffsetEstimate(json::Writer& w, const OffsetEstimate& estimate) {
  w.write("offset_ms", estimate.offset_ms)
      .write("method", offsetMethodName(estimate.method))
      .writeOptional("correlation", estimate.correlation);
}

std::string feedbackToJson(const DetailedFeedback& feedback, bool pretty) {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject();
  writeFeedback(w, feedback);
  w.endObject();
  return oss.str();
}

std::string performanceToJson(const PerformanceAnalysisResult& performance, bool pretty) {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject();
  writePerformance(w, performance);
  w.endObject();
  return oss.str();
}

std::string coachReportToJson(const CoachReport& report, bool pretty) {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject();
  w.beginObject("feedback");
  writeFeedback(w, report.feedback);
  w.endObject();
  if (report.performance) {
    w.beginObject("performance");
    writePerformance(w, *report.performance);
    w.endObject();
  }
  if (report.offset_estimate) {
    w.beginObject("offset_estimate");
    writeOffsetEstimate(w, *report.offset_estimate);
    w.endObject();
  }
  w.endObject();
  return oss.str();
}

// ============================================================================
// Text
// ============================================================================

std::string coachReportToText(const CoachReport& report, const std::string& title) {
  const DetailedFeedback& fb = report.feedback;
  std::ostringstream ss;

  ss << std::string(60, '=') << "\n";
  ss << "Vocal Coach Report";
  if (!title.empty()) ss << ": " << title;
  ss << "\n";
  ss << std::string(60, '=') << "\n";

  if (fb.message) ss << "! " << *fb.message << "\n\n";

  ss << "--- Words ---\n";
  ss << "Accuracy: " << fb.word_accuracy_pct << "%\n";
  ss << "Timing:   " << fb.timing_mean_abs_ms << " ms mean offset\n";
  ss << "Pace:     " << std::fixed << std::setprecision(2) << fb.pace_ratio << "x\n";
  ss << "Subscores: words " << fb.subscores.word_accuracy << ", timing " << fb.subscores.timing
     << ", pace " << fb.subscores.pace << "\n";
  ss << "Confidence: " << confidenceLabelName(fb.confidence_label) << "\n";
  if (fb.estimated_offset_ms) {
    ss << "Offset:   " << std::setprecision(0) << *fb.estimated_offset_ms << " ms";
    if (report.offset_estimate) ss << " (" << offsetMethodName(report.offset_estimate->method) << ")";
    ss << "\n";
  }
  ss << "\n";

  if (!fb.segments.empty()) {
    ss << "--- Segments ---\n";
    for (const auto& segment : fb.segments) {
      ss << "  [" << segment.segment_index + 1 << "] " << formatSeconds(segment.start) << " - "
         << formatSeconds(segment.end) << "  " << segment.word_accuracy_pct << "%  "
         << segment.text << "\n";
      for (const auto& issue : segment.main_issues) ss << "      - " << issue << "\n";
    }
    ss << "\n";
  }

  if (!fb.substitutions.empty()) {
    ss << "--- Substitutions ---\n";
    for (const auto& sub : fb.substitutions) {
      ss << "  \"" << sub.user_word << "\" instead of \"" << sub.ref_word << "\" ("
         << confidenceLabelName(sub.confidence_label) << ")\n";
    }
    ss << "\n";
  }

  if (report.performance) {
    const PerformanceAnalysisResult& perf = *report.performance;
    ss << "--- Performance ---\n";
    ss << "Overall:   " << perf.overall << "\n";
    ss << perf.label << ": " << perf.pitch << "\n";
    ss << "Timing:    " << perf.timing << "\n";
    ss << "Stability: " << perf.stability << "\n";
    if (perf.words) ss << "Words:     " << *perf.words << "\n";
    ss << "\n";
  }

  ss << "--- Tips ---\n";
  for (const auto& tip : fb.tips) ss << "  * " << tip << "\n";
  if (report.performance) {
    for (const auto& tip : report.performance->tips) ss << "  * " << tip << "\n";
  }
  for (const auto& warning : fb.warnings) ss << "  ! " << warning << "\n";
  ss << "\n";

  ss << "Next drill: " << drillTypeName(fb.next_drill.type) << "\n";
  ss << "  " << fb.next_drill.note << "\n";
  ss << std::string(60, '=') << "\n";

  return ss.str();
}

}  // namespace vocalcoach
