/**
 * @file input_error.h
 * @brief Error codes for structurally invalid attempt input.
 */

#ifndef VOCALCOACH_CORE_INPUT_ERROR_H
#define VOCALCOACH_CORE_INPUT_ERROR_H

#include <cstdint>

namespace vocalcoach {

/// @brief Reasons an attempt is rejected before scoring.
///
/// The scoring core itself never fails; these codes come from the
/// validate*Input() functions that guard the facade and the C API.
enum class InputError : uint8_t {
  OK = 0,
  InvalidReferenceTiming,  // Non-finite, negative, end < start, or start times decreasing
  InvalidUserTiming,       // Same checks for the user sequence
  InvalidLineTiming,       // Reference line with non-finite or reversed span
  InvalidVerseRange,       // Verse end before verse start, or non-finite bounds
  InvalidOffset,           // Non-finite offset estimate
  NegativeDuration,        // Reference or recording duration below zero
  InvalidContour,          // Non-finite pitch sample or decreasing sample times
  InvalidEnvelope,         // Non-finite or negative envelope value
  InvalidWordScore,        // Word score outside 0-100
  TimeOutOfRange           // Time or offset beyond the integer millisecond range
};

/** @brief Human-readable description of an input error. */
const char* inputErrorString(InputError error);

}  // namespace vocalcoach

#endif  // VOCALCOACH_CORE_INPUT_ERROR_H
