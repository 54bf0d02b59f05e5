/**
 * @file token_normalizer.h
 * @brief Word normalization and phonetic similarity for lyric matching.
 *
 * Correctness is always decided on normalizeToken() equality. The phonetic
 * skeleton only biases alignment cost and confidence.
 */

#ifndef VOCALCOACH_ALIGNMENT_TOKEN_NORMALIZER_H
#define VOCALCOACH_ALIGNMENT_TOKEN_NORMALIZER_H

#include <cstddef>
#include <string>

namespace vocalcoach {

/**
 * @brief Case-fold and strip a token to [a-z0-9].
 *
 * Apostrophes (ASCII and U+2019) are dropped together with every other
 * non-alphanumeric byte, so "Don't" and "dont" normalize identically.
 *
 * @param token Raw token
 * @return Normalized token (empty for empty or all-punctuation input)
 */
std::string normalizeToken(const std::string& token);

/**
 * @brief Reduce a token to a coarse consonant skeleton.
 *
 * Steps, in order: normalizeToken(); digraph substitutions
 * ph->f, ght->t, ck->k, cq->k, qu->k, x->ks, kn->n, wr->r, wh->w;
 * vowel removal (a, e, i, o, u, y); collapse of repeated characters.
 *
 * @example
 * ```cpp
 * phoneticNormalize("Light");  // "lt"
 * phoneticNormalize("lite");   // "lt"
 * phoneticNormalize("phone");  // "fn"
 * ```
 */
std::string phoneticNormalize(const std::string& token);

/**
 * @brief Levenshtein distance (unit insert, delete and substitute costs).
 */
size_t levenshteinDistance(const std::string& a, const std::string& b);

/**
 * @brief Bounded edit similarity of two strings.
 * @return 1 - distance / max(len), clamped to [0,1]; 0 if either is empty
 */
double tokenSimilarity(const std::string& a, const std::string& b);

/**
 * @brief tokenSimilarity() of the phonetic skeletons of two tokens.
 * @return 0 if either token or either skeleton is empty
 */
double phoneticSimilarity(const std::string& a, const std::string& b);

}  // namespace vocalcoach

#endif  // VOCALCOACH_ALIGNMENT_TOKEN_NORMALIZER_H
