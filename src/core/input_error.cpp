/**
 * @file input_error.cpp
 * @brief Input error descriptions.
 */

#include "core/input_error.h"

namespace vocalcoach {

const char* inputErrorString(InputError error) {
  switch (error) {
    case InputError::OK:
      return "No error";
    case InputError::InvalidReferenceTiming:
      return "Reference words must have finite, non-negative, non-decreasing timings";
    case InputError::InvalidUserTiming:
      return "User words must have finite, non-negative, non-decreasing timings";
    case InputError::InvalidLineTiming:
      return "Reference lines must have finite spans with end >= start";
    case InputError::InvalidVerseRange:
      return "Verse end must not precede verse start";
    case InputError::InvalidOffset:
      return "Estimated offset must be finite";
    case InputError::NegativeDuration:
      return "Durations must not be negative";
    case InputError::InvalidContour:
      return "Pitch contour must have finite samples in time order";
    case InputError::InvalidEnvelope:
      return "Energy envelope values must be finite and non-negative";
    case InputError::InvalidWordScore:
      return "Word score must be within 0-100";
    case InputError::TimeOutOfRange:
      return "Times and offsets must fit in integer milliseconds";
  }
  return "Unknown input error";
}

}  // namespace vocalcoach
