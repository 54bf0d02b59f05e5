/**
 * @file token_normalizer.cpp
 * @brief Implementation of token normalization and phonetic similarity.
 */

#include "alignment/token_normalizer.h"

#include <algorithm>
#include <vector>

namespace vocalcoach {

namespace {

// Digraph substitutions, applied in table order over the whole token.
struct Substitution {
  const char* from;
  const char* to;
};

constexpr Substitution kPhoneticSubstitutions[] = {
    {"ph", "f"}, {"ght", "t"}, {"ck", "k"}, {"cq", "k"}, {"qu", "k"},
    {"x", "ks"}, {"kn", "n"},  {"wr", "r"}, {"wh", "w"},
};

bool isAsciiAlnum(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isSkeletonVowel(char c) {
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u' || c == 'y';
}

void replaceAll(std::string& value, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  std::string result;
  result.reserve(value.size() + to.size());
  size_t pos = 0;
  while (pos < value.size()) {
    size_t hit = value.find(from, pos);
    if (hit == std::string::npos) {
      result.append(value, pos, std::string::npos);
      break;
    }
    result.append(value, pos, hit - pos);
    result += to;
    pos = hit + from.size();
  }
  value.swap(result);
}

std::string collapseRepeats(const std::string& value) {
  std::string result;
  result.reserve(value.size());
  for (char c : value) {
    if (result.empty() || result.back() != c) result += c;
  }
  return result;
}

}  // namespace

std::string normalizeToken(const std::string& token) {
  // Non-ASCII bytes (including the UTF-8 encoding of U+2019) are dropped by
  // the alnum filter, so apostrophes need no separate pass.
  std::string result;
  result.reserve(token.size());
  for (char ch : token) {
    auto c = static_cast<unsigned char>(ch);
    if (!isAsciiAlnum(c)) continue;
    if (c >= 'A' && c <= 'Z') c = static_cast<unsigned char>(c - 'A' + 'a');
    result += static_cast<char>(c);
  }
  return result;
}

std::string phoneticNormalize(const std::string& token) {
  std::string value = normalizeToken(token);
  if (value.empty()) return value;

  for (const auto& sub : kPhoneticSubstitutions) {
    replaceAll(value, sub.from, sub.to);
  }
  value.erase(std::remove_if(value.begin(), value.end(), isSkeletonVowel), value.end());
  return collapseRepeats(value);
}

size_t levenshteinDistance(const std::string& a, const std::string& b) {
  if (a.empty()) return b.size();
  if (b.empty()) return a.size();

  // Single-row DP over b.
  std::vector<size_t> row(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) row[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    size_t prev = row[0];
    row[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      size_t saved = row[j];
      size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      row[j] = std::min({row[j] + 1, row[j - 1] + 1, prev + cost});
      prev = saved;
    }
  }
  return row[b.size()];
}

double tokenSimilarity(const std::string& a, const std::string& b) {
  if (a.empty() || b.empty()) return 0.0;
  if (a == b) return 1.0;
  double max_len = static_cast<double>(std::max(a.size(), b.size()));
  double similarity = 1.0 - static_cast<double>(levenshteinDistance(a, b)) / max_len;
  return std::clamp(similarity, 0.0, 1.0);
}

double phoneticSimilarity(const std::string& a, const std::string& b) {
  if (a.empty() || b.empty()) return 0.0;
  return tokenSimilarity(phoneticNormalize(a), phoneticNormalize(b));
}

}  // namespace vocalcoach
