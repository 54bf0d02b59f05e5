/**
 * @file word_aligner.cpp
 * @brief Implementation of weighted edit-distance word alignment.
 */

#include "alignment/word_aligner.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "alignment/token_normalizer.h"
#include "core/math_utils.h"

#ifndef ALIGNER_DEBUG_LOG
#define ALIGNER_DEBUG_LOG 0
#endif

namespace vocalcoach {

namespace {

enum class EditOp : uint8_t { Match, Delete, Insert };

// Normalized form and phonetic skeleton, computed once per token.
struct PreparedToken {
  std::string norm;
  std::string skeleton;
};

std::vector<PreparedToken> prepareTokens(const std::vector<WordToken>& tokens) {
  std::vector<PreparedToken> prepared;
  prepared.reserve(tokens.size());
  for (const auto& token : tokens) {
    std::string norm = normalizeToken(token.word);
    std::string skeleton = phoneticNormalize(norm);
    prepared.push_back({std::move(norm), std::move(skeleton)});
  }
  return prepared;
}

// Same value as phoneticSimilarity() on the normalized tokens.
double skeletonSimilarity(const PreparedToken& a, const PreparedToken& b) {
  return tokenSimilarity(a.skeleton, b.skeleton);
}

double substitutionCost(const PreparedToken& ref, const PreparedToken& sung) {
  if (ref.norm == sung.norm) return kExactMatchCost;
  return skeletonSimilarity(ref, sung) >= kPhoneticMatchThreshold ? kPhoneticMatchCost
                                                                   : kMismatchCost;
}

AlignmentStatus classifyTiming(int delta_ms, int threshold_ms) {
  if (delta_ms < -threshold_ms) return AlignmentStatus::CorrectEarly;
  if (delta_ms > threshold_ms) return AlignmentStatus::CorrectLate;
  return AlignmentStatus::Correct;
}

// Fills the DP tables and returns the operation sequence from (0,0) to (n,m).
std::vector<EditOp> computeEditOps(const std::vector<PreparedToken>& ref,
                                   const std::vector<PreparedToken>& sung) {
  const size_t n = ref.size();
  const size_t m = sung.size();
  const size_t width = m + 1;

  std::vector<double> cost((n + 1) * width, 0.0);
  std::vector<EditOp> back((n + 1) * width, EditOp::Match);
  auto at = [width](size_t i, size_t j) { return i * width + j; };

  for (size_t i = 1; i <= n; ++i) {
    cost[at(i, 0)] = static_cast<double>(i) * kGapCost;
    back[at(i, 0)] = EditOp::Delete;
  }
  for (size_t j = 1; j <= m; ++j) {
    cost[at(0, j)] = static_cast<double>(j) * kGapCost;
    back[at(0, j)] = EditOp::Insert;
  }

  for (size_t i = 1; i <= n; ++i) {
    for (size_t j = 1; j <= m; ++j) {
      double match_cost =
          cost[at(i - 1, j - 1)] + substitutionCost(ref[i - 1], sung[j - 1]);
      double delete_cost = cost[at(i - 1, j)] + kGapCost;
      double insert_cost = cost[at(i, j - 1)] + kGapCost;

      // Ties keep the earlier candidate: match, then delete, then insert.
      double best = match_cost;
      EditOp op = EditOp::Match;
      if (delete_cost < best) {
        best = delete_cost;
        op = EditOp::Delete;
      }
      if (insert_cost < best) {
        best = insert_cost;
        op = EditOp::Insert;
      }
      cost[at(i, j)] = best;
      back[at(i, j)] = op;
    }
  }

  std::vector<EditOp> ops;
  ops.reserve(n + m);
  size_t i = n;
  size_t j = m;
  while (i > 0 || j > 0) {
    EditOp op = back[at(i, j)];
    ops.push_back(op);
    if (op == EditOp::Match) {
      --i;
      --j;
    } else if (op == EditOp::Delete) {
      --i;
    } else {
      --j;
    }
  }
  std::reverse(ops.begin(), ops.end());
  return ops;
}

}  // namespace

AlignmentResult alignWords(const std::vector<WordToken>& reference,
                           const std::vector<WordToken>& user, const AlignmentOptions& options) {
  const std::vector<PreparedToken> ref_prepared = prepareTokens(reference);
  const std::vector<PreparedToken> user_prepared = prepareTokens(user);
  const std::vector<EditOp> ops = computeEditOps(ref_prepared, user_prepared);

  AlignmentResult result;
  result.per_word.reserve(reference.size());
  std::vector<int> correct_deltas;
  const double ref_offset = options.reference_offset_sec;
  const double user_offset = options.user_offset_sec;

  size_t ref_pos = 0;
  size_t user_pos = 0;
  for (EditOp op : ops) {
    if (op == EditOp::Insert) {
      const WordToken& extra = user[user_pos];
      result.extras.push_back(extra);
      result.metrics.extra_words.push_back(extra.word);
      ++user_pos;
      continue;
    }

    const WordToken& ref = reference[ref_pos];
    AlignmentWordResult word;
    word.ref_index = ref.index;
    word.ref_word = ref.word;
    word.ref_start = ref.start - ref_offset;
    word.ref_end = ref.end - ref_offset;

    if (op == EditOp::Delete) {
      word.status = AlignmentStatus::Missed;
      word.confidence = 0.0;
      word.confidence_label = ConfidenceLabel::Low;
      result.metrics.missed_words.push_back(ref.word);
      result.per_word.push_back(std::move(word));
      ++ref_pos;
      continue;
    }

    const WordToken& sung = user[user_pos];
    const PreparedToken& rp = ref_prepared[ref_pos];
    const PreparedToken& up = user_prepared[user_pos];
    const bool is_correct = !rp.norm.empty() && rp.norm == up.norm;
    const double confidence = is_correct ? 1.0 : skeletonSimilarity(rp, up);

    const double user_start_rel = sung.start - user_offset;
    const int delta_ms = roundToInt((user_start_rel - word.ref_start) * 1000.0);

    if (is_correct) {
      word.status = classifyTiming(delta_ms, options.early_late_threshold_ms);
      correct_deltas.push_back(std::abs(delta_ms));
    } else {
      word.status = AlignmentStatus::Incorrect;
      result.metrics.missed_words.push_back(ref.word);
    }
    word.user_word = sung.word;
    word.user_start = user_start_rel;
    word.user_end = sung.end - user_offset;
    word.delta_ms = delta_ms;
    word.confidence = confidence;
    word.confidence_label = confidenceLabelFor(confidence);

#if ALIGNER_DEBUG_LOG
    std::cerr << "[align] ref#" << ref.index << " '" << ref.word << "' <- '" << sung.word
              << "' " << alignmentStatusName(word.status) << " delta=" << delta_ms
              << "ms conf=" << confidence << "\n";
#endif

    result.per_word.push_back(std::move(word));
    ++ref_pos;
    ++user_pos;
  }

  const auto correct_count = std::count_if(
      result.per_word.begin(), result.per_word.end(),
      [](const AlignmentWordResult& w) { return isCorrectStatus(w.status); });
  result.metrics.word_accuracy_pct =
      result.per_word.empty()
          ? 0
          : roundToInt(100.0 * static_cast<double>(correct_count) /
                       static_cast<double>(result.per_word.size()));

  if (!correct_deltas.empty()) {
    double sum = 0.0;
    for (int d : correct_deltas) sum += d;
    result.metrics.timing_mean_abs_ms =
        roundToInt(sum / static_cast<double>(correct_deltas.size()));
  }

  const double ref_duration = options.reference_duration_sec;
  const double user_duration = options.user_duration_sec;
  result.metrics.pace_ratio =
      ref_duration > 0.0 && user_duration > 0.0 ? user_duration / ref_duration : 1.0;

  result.confidence_label = confidenceLabelFor(averageConfidence(result.per_word));

#if ALIGNER_DEBUG_LOG
  std::cerr << "[align] n=" << reference.size() << " m=" << user.size()
            << " accuracy=" << result.metrics.word_accuracy_pct
            << "% timing=" << result.metrics.timing_mean_abs_ms
            << "ms extras=" << result.extras.size() << "\n";
#endif

  return result;
}

double averageConfidence(const std::vector<AlignmentWordResult>& per_word) {
  double sum = 0.0;
  int count = 0;
  for (const auto& word : per_word) {
    if (!word.confidence) continue;
    sum += *word.confidence;
    ++count;
  }
  return count > 0 ? sum / count : 0.0;
}

}  // namespace vocalcoach
