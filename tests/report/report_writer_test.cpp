/**
 * @file report_writer_test.cpp
 * @brief Tests for JSON and text report rendering.
 */

#include "report/report_writer.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "test_support/test_helpers.h"

namespace vocalcoach {
namespace {

using test::makeWord;
using test::makeWords;

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

DetailedFeedback makeFeedback() {
  FeedbackInput input;
  input.reference_words = makeWords("shine the light tonight");
  input.user_words = {makeWord("shine", 0.0, 0.4, 0), makeWord("the", 0.5, 0.9, 1),
                      makeWord("lite", 1.0, 1.4, 2), makeWord("tonight", 1.5, 1.9, 3)};
  input.verse_end_sec = 1.9;
  return buildDetailedFeedback(input);
}

// ============================================================================
// JSON
// ============================================================================

TEST(ReportJsonTest, FeedbackUsesWireKeys) {
  DetailedFeedback feedback = makeFeedback();
  json::Parser p(feedbackToJson(feedback));

  EXPECT_EQ(p.getInt("word_accuracy_pct"), feedback.word_accuracy_pct);
  EXPECT_EQ(p.getInt("timing_mean_abs_ms"), 0);
  EXPECT_DOUBLE_EQ(p.getDouble("pace_ratio"), 1.0);
  EXPECT_TRUE(p.has("per_word"));
  EXPECT_TRUE(p.has("segments"));
  EXPECT_TRUE(p.has("coach_tips"));
  EXPECT_TRUE(p.has("substitutions"));
  EXPECT_EQ(p.getString("confidence_label"), confidenceLabelName(feedback.confidence_label));
  EXPECT_FALSE(p.has("message"));
  EXPECT_FALSE(p.has("warnings"));
  EXPECT_FALSE(p.has("estimated_offset_ms"));

  json::Parser drill = p.getObject("next_drill");
  EXPECT_EQ(drill.getString("type"), drillTypeName(feedback.next_drill.type));
  EXPECT_EQ(drill.getString("note"), feedback.next_drill.note);

  json::Parser subscores = p.getObject("subscores");
  EXPECT_EQ(subscores.getInt("word_accuracy"), feedback.subscores.word_accuracy);
  EXPECT_EQ(subscores.getInt("timing"), 100);
  EXPECT_EQ(subscores.getInt("pace"), 100);
}

TEST(ReportJsonTest, PerWordEntriesCarryVerdicts) {
  const std::string json = feedbackToJson(makeFeedback());
  EXPECT_TRUE(contains(json, R"("ref_word":"light")"));
  EXPECT_TRUE(contains(json, R"("status":"incorrect")"));
  EXPECT_TRUE(contains(json, R"("user_word":"lite")"));
  EXPECT_TRUE(contains(json, R"("status":"correct")"));
  EXPECT_TRUE(contains(json, R"("substitutions":[{"ref_word":"light","user_word":"lite")"));
}

TEST(ReportJsonTest, MissedWordOmitsUserFields) {
  AlignmentWordResult word;
  word.ref_index = 2;
  word.ref_word = "to";
  word.ref_start = 1.0;
  word.ref_end = 1.4;
  word.status = AlignmentStatus::Missed;
  word.confidence = 0.0;
  word.confidence_label = ConfidenceLabel::Low;

  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();
  writeAlignmentWord(w, word);
  w.endObject();

  EXPECT_EQ(oss.str(),
            R"({"ref_index":2,"ref_word":"to","ref_start":1,"ref_end":1.4,"status":"missed",)"
            R"("confidence":0,"confidence_label":"Low"})");
}

TEST(ReportJsonTest, OptionalFeedbackFields) {
  DetailedFeedback feedback = makeFeedback();
  feedback.message = "You stopped early. Record the full verse to score it.";
  feedback.warnings.push_back("Low transcription confidence; word penalties softened.");
  feedback.estimated_offset_ms = 120.0;

  json::Parser p(feedbackToJson(feedback));
  EXPECT_EQ(p.getString("message"), *feedback.message);
  EXPECT_TRUE(p.has("warnings"));
  EXPECT_DOUBLE_EQ(p.getDouble("estimated_offset_ms"), 120.0);
}

TEST(ReportJsonTest, PerformanceBlock) {
  PerformanceAnalysisResult performance;
  performance.overall = 72;
  performance.pitch = 80;
  performance.timing = 65;
  performance.stability = 70;
  performance.words = 75;
  performance.label = kToneMatchLabel;
  performance.tips = {"Timing is loose. Enter phrases right on the reference cue."};
  performance.timing_correlation = 0.5;

  json::Parser p(performanceToJson(performance));
  EXPECT_EQ(p.getInt("overall"), 72);
  EXPECT_EQ(p.getInt("words"), 75);
  EXPECT_EQ(p.getString("label"), "Tone Match");
  EXPECT_TRUE(p.has("tips"));
  EXPECT_DOUBLE_EQ(p.getObject("alignment").getDouble("timing_correlation"), 0.5);

  performance.words.reset();
  EXPECT_FALSE(json::Parser(performanceToJson(performance)).has("words"));
}

TEST(ReportJsonTest, CombinedReportOmitsAbsentParts) {
  CoachReport report;
  report.feedback = makeFeedback();

  json::Parser bare(coachReportToJson(report));
  EXPECT_TRUE(bare.has("feedback"));
  EXPECT_FALSE(bare.has("performance"));
  EXPECT_FALSE(bare.has("offset_estimate"));

  report.performance = PerformanceAnalysisResult{};
  OffsetEstimate estimate;
  estimate.offset_ms = 150.0;
  estimate.method = OffsetMethod::XCorr;
  estimate.correlation = 0.9;
  report.offset_estimate = estimate;

  json::Parser full(coachReportToJson(report, true));
  EXPECT_TRUE(full.has("performance"));
  json::Parser offset = full.getObject("offset_estimate");
  EXPECT_DOUBLE_EQ(offset.getDouble("offset_ms"), 150.0);
  EXPECT_EQ(offset.getString("method"), "xcorr");
  EXPECT_DOUBLE_EQ(offset.getDouble("correlation"), 0.9);
}

// ============================================================================
// Text
// ============================================================================

TEST(ReportTextTest, ContainsMainSections) {
  CoachReport report;
  report.feedback = makeFeedback();
  const std::string text = coachReportToText(report, "take1.txt");

  EXPECT_TRUE(contains(text, "Vocal Coach Report: take1.txt"));
  EXPECT_TRUE(contains(text, "--- Words ---"));
  EXPECT_TRUE(contains(text, "--- Segments ---"));
  EXPECT_TRUE(contains(text, "\"lite\" instead of \"light\""));
  EXPECT_TRUE(contains(text, "--- Tips ---"));
  EXPECT_TRUE(contains(text, "Next drill: "));
  EXPECT_FALSE(contains(text, "--- Performance ---"));
}

TEST(ReportTextTest, PerformanceAndOffset) {
  CoachReport report;
  report.feedback = makeFeedback();
  report.feedback.estimated_offset_ms = 120.0;
  report.feedback.message = "You stopped early. Record the full verse to score it.";
  PerformanceAnalysisResult performance;
  performance.overall = 64;
  performance.tips = {"Stability could improve. Hold sustained notes steady."};
  report.performance = performance;
  OffsetEstimate estimate;
  estimate.offset_ms = 120.0;
  estimate.method = OffsetMethod::Onset;
  report.offset_estimate = estimate;

  const std::string text = coachReportToText(report);
  EXPECT_TRUE(contains(text, "! You stopped early."));
  EXPECT_TRUE(contains(text, "Offset:   120 ms (onset)"));
  EXPECT_TRUE(contains(text, "--- Performance ---"));
  EXPECT_TRUE(contains(text, "Overall:   64"));
  EXPECT_TRUE(contains(text, "Hold sustained notes steady."));
}

}  // namespace
}  // namespace vocalcoach
