/**
 * @file types.cpp
 * @brief Name tables and label bucketing for core types.
 */

#include "core/types.h"

namespace vocalcoach {

ConfidenceLabel confidenceLabelFor(double confidence) {
  if (confidence >= kHighConfidence) return ConfidenceLabel::High;
  if (confidence >= kMediumConfidence) return ConfidenceLabel::Medium;
  return ConfidenceLabel::Low;
}

const char* alignmentStatusName(AlignmentStatus status) {
  switch (status) {
    case AlignmentStatus::Correct:
      return "correct";
    case AlignmentStatus::CorrectEarly:
      return "correct_early";
    case AlignmentStatus::CorrectLate:
      return "correct_late";
    case AlignmentStatus::Incorrect:
      return "incorrect";
    case AlignmentStatus::Missed:
      return "missed";
    case AlignmentStatus::ExtraIgnored:
      return "extra_ignored";
  }
  return "unknown";
}

const char* confidenceLabelName(ConfidenceLabel label) {
  switch (label) {
    case ConfidenceLabel::High:
      return "High";
    case ConfidenceLabel::Medium:
      return "Medium";
    case ConfidenceLabel::Low:
      return "Low";
  }
  return "Low";
}

}  // namespace vocalcoach
