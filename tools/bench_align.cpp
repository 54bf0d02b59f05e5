/**
 * @file bench_align.cpp
 * @brief Benchmark binary for profiling alignment and feedback performance.
 *
 * Usage:
 *   ./build/bin/bench_align                 # Default: 50 runs x 4 verse sizes
 *   ./build/bin/bench_align --runs 200      # More runs
 *   ./build/bin/bench_align --words 400     # Single verse size
 *   ./build/bin/bench_align --wait          # Wait before starting (for sample attach)
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <unistd.h>
#include <vector>

#include "feedback/feedback_builder.h"

using Clock = std::chrono::high_resolution_clock;

namespace {

struct TimingResult {
  int words;
  int run;
  double elapsed_ms;
  int accuracy;
};

const char* kLexicon[] = {"shine", "light", "through", "the", "night", "we",   "are",
                          "young", "and",   "free",    "hold", "on",   "to", "your",
                          "heart", "never", "let",     "go",   "run",  "away"};
constexpr size_t kLexiconSize = sizeof(kLexicon) / sizeof(kLexicon[0]);

std::vector<vocalcoach::WordToken> makeReference(int count, std::mt19937& rng) {
  std::uniform_int_distribution<size_t> pick(0, kLexiconSize - 1);
  std::vector<vocalcoach::WordToken> words;
  words.reserve(count);
  double t = 0.0;
  for (int i = 0; i < count; ++i) {
    vocalcoach::WordToken token;
    token.word = kLexicon[pick(rng)];
    token.start = t;
    token.end = t + 0.35;
    token.index = i;
    token.line_index = i / 8;
    words.push_back(token);
    t += (i % 8 == 7) ? 1.2 : 0.45;
  }
  return words;
}

// Drops, swaps and jitters ~15% of the reference to mimic a transcribed attempt.
std::vector<vocalcoach::WordToken> makeAttempt(const std::vector<vocalcoach::WordToken>& ref,
                                               std::mt19937& rng) {
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  std::uniform_real_distribution<double> jitter(-0.12, 0.12);
  std::uniform_int_distribution<size_t> pick(0, kLexiconSize - 1);
  std::vector<vocalcoach::WordToken> user;
  user.reserve(ref.size());
  for (const auto& word : ref) {
    double r = roll(rng);
    if (r < 0.05) continue;
    vocalcoach::WordToken token = word;
    if (r < 0.10) token.word = kLexicon[pick(rng)];
    double shift = 0.25 + jitter(rng);
    token.start = std::max(0.0, token.start + shift);
    token.end = token.start + 0.3;
    token.line_index.reset();
    if (!user.empty() && token.start < user.back().start) token.start = user.back().start;
    token.index = static_cast<int>(user.size());
    user.push_back(token);
  }
  return user;
}

}  // namespace

int main(int argc, char* argv[]) {
  int num_runs = 50;
  int single_size = -1;
  bool wait_mode = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--runs") == 0 && i + 1 < argc) {
      num_runs = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--words") == 0 && i + 1 < argc) {
      single_size = std::atoi(argv[++i]);
    } else if (std::strcmp(argv[i], "--wait") == 0) {
      wait_mode = true;
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: " << argv[0] << " [options]\n"
                << "  --runs N    Number of runs per verse size (default: 50)\n"
                << "  --words N   Single verse size in words (default: 25, 50, 100, 200)\n"
                << "  --wait      Wait for keypress before starting (for sample attach)\n";
      return 0;
    }
  }
  if (num_runs <= 0) num_runs = 1;

  std::vector<int> sizes;
  if (single_size > 0) {
    sizes.push_back(single_size);
  } else {
    sizes = {25, 50, 100, 200};
  }

  int total = num_runs * static_cast<int>(sizes.size());
  std::cout << "Benchmark: " << total << " evaluations (" << num_runs << " runs x " << sizes.size()
            << " verse sizes)\n";

  if (wait_mode) {
    std::cout << "PID: " << getpid() << "\n";
    std::cout << "Press Enter to start (attach sample profiler now)...\n";
    std::cin.get();
  }

  std::vector<TimingResult> results;
  results.reserve(total);

  int count = 0;
  auto bench_start = Clock::now();

  for (int size : sizes) {
    for (int run = 1; run <= num_runs; ++run) {
      ++count;
      std::mt19937 rng(static_cast<uint32_t>(run * 7919 + size));

      vocalcoach::FeedbackInput input;
      input.reference_words = makeReference(size, rng);
      input.user_words = makeAttempt(input.reference_words, rng);
      input.verse_start_sec = 0.0;
      input.verse_end_sec = input.reference_words.back().end;
      input.estimated_offset_ms = 250.0;

      auto t0 = Clock::now();
      vocalcoach::DetailedFeedback feedback = vocalcoach::buildDetailedFeedback(input);
      auto t1 = Clock::now();

      double elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
      results.push_back({size, run, elapsed_ms, feedback.word_accuracy_pct});

      if (count % 50 == 0 || count == total) {
        std::cout << "  [" << count << "/" << total << "] words=" << size << " run=" << run
                  << " elapsed=" << std::fixed << std::setprecision(2) << elapsed_ms << "ms"
                  << " accuracy=" << feedback.word_accuracy_pct << "\n";
      }
    }
  }

  auto bench_end = Clock::now();
  double total_ms = std::chrono::duration<double, std::milli>(bench_end - bench_start).count();

  // === Report ===
  std::cout << "\n" << std::string(70, '=') << "\n";
  std::cout << "ALIGNMENT BENCHMARK RESULTS\n";
  std::cout << std::string(70, '=') << "\n\n";

  std::vector<double> all_times;
  for (const auto& r : results) all_times.push_back(r.elapsed_ms);
  std::sort(all_times.begin(), all_times.end());

  double sum = std::accumulate(all_times.begin(), all_times.end(), 0.0);
  double avg = sum / all_times.size();
  double med = all_times[all_times.size() / 2];

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "  Total wall time:    " << total_ms << " ms\n";
  std::cout << "  Total evaluations:  " << results.size() << "\n";
  std::cout << "  Throughput:         " << (results.size() / (total_ms / 1000.0)) << " eval/s\n";
  std::cout << "  Mean:               " << avg << " ms\n";
  std::cout << "  Median:             " << med << " ms\n";
  std::cout << "  Min:                " << all_times.front() << " ms\n";
  std::cout << "  Max:                " << all_times.back() << " ms\n";

  size_t p95_idx = static_cast<size_t>(all_times.size() * 0.95);
  std::cout << "  P95:                " << all_times[p95_idx] << " ms\n";

  // Per-size stats
  std::cout << "\n  " << std::left << std::setw(10) << "Words" << std::right << std::setw(10)
            << "Mean" << std::setw(10) << "Med" << std::setw(10) << "Max" << std::setw(10)
            << "Acc%" << "\n";
  std::cout << "  " << std::string(50, '-') << "\n";

  for (int size : sizes) {
    std::vector<double> times;
    double acc_sum = 0.0;
    for (const auto& r : results) {
      if (r.words == size) {
        times.push_back(r.elapsed_ms);
        acc_sum += r.accuracy;
      }
    }
    std::sort(times.begin(), times.end());
    double size_avg = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
    std::cout << "  " << std::left << std::setw(10) << size << std::right << std::fixed
              << std::setprecision(3) << std::setw(10) << size_avg << std::setw(10)
              << times[times.size() / 2] << std::setw(10) << times.back() << std::setw(10)
              << std::setprecision(1) << acc_sum / times.size() << "\n";
  }

  return 0;
}
