/**
 * @file cli_main.cpp
 * @brief Command-line interface for scoring a sung attempt against a reference.
 */

#include "vocalcoach.h"
#include "core/coach_config.h"
#include "io/timing_reader.h"
#include "report/report_writer.h"
#include "transcript/transcript.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " --reference FILE --user FILE [options]\n\n";
  std::cout << "Word timing files hold one 'start end word [line]' record per line.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --reference FILE    Reference word timings (required)\n";
  std::cout << "  --user FILE         Transcribed attempt word timings (required)\n";
  std::cout << "  --lines FILE        Reference lyric lines ('index start end text...')\n";
  std::cout << "  --verse-start S     Verse start in the reference (seconds)\n";
  std::cout << "  --verse-end S       Verse end in the reference (seconds)\n";
  std::cout << "  --offset-ms N       Recording lag behind the reference (ms)\n";
  std::cout << "  --ref-envelope FILE Reference energy envelope (one value per line)\n";
  std::cout << "  --rec-envelope FILE Recording energy envelope\n";
  std::cout << "  --ref-contour FILE  Reference pitch contour ('time frequency')\n";
  std::cout << "  --rec-contour FILE  Recording pitch contour\n";
  std::cout << "  --ref-duration S    Reference audio duration (seconds)\n";
  std::cout << "  --rec-duration S    Recording duration (seconds)\n";
  std::cout << "  --mode MODE         Practice mode: full, words, timing, pitch (default: full)\n";
  std::cout << "  --config FILE       JSON configuration file\n";
  std::cout << "  --estimate-offset   Only estimate the offset from the envelopes and exit\n";
  std::cout << "  --json              Output JSON to stdout\n";
  std::cout << "  --help              Show this help message\n";
}

const char* scoreColor(int score) {
  if (score >= 80) return "\033[32m";  // Green
  if (score >= 60) return "\033[33m";  // Yellow
  return "\033[31m";                   // Red
}

bool readTextFile(const std::string& path, std::string& text) {
  std::ifstream file(path);
  if (!file) return false;
  std::ostringstream oss;
  oss << file.rdbuf();
  text = oss.str();
  return true;
}

bool parseDouble(const char* arg, double& out) {
  char* end = nullptr;
  out = std::strtod(arg, &end);
  return end != arg && *end == '\0';
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string reference_file;
  std::string user_file;
  std::string lines_file;
  std::string ref_envelope_file;
  std::string rec_envelope_file;
  std::string ref_contour_file;
  std::string rec_contour_file;
  std::string config_file;
  std::string mode_name;
  bool has_verse_start = false;
  bool has_verse_end = false;
  double verse_start = 0.0;
  double verse_end = 0.0;
  bool has_offset = false;
  double offset_ms = 0.0;
  double ref_duration = 0.0;  // 0 = unknown
  double rec_duration = 0.0;  // 0 = unknown
  bool estimate_only = false;
  bool json_output = false;

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;
    bool ok = true;
    if (std::strcmp(arg, "--reference") == 0 && has_value) {
      reference_file = argv[++i];
    } else if (std::strcmp(arg, "--user") == 0 && has_value) {
      user_file = argv[++i];
    } else if (std::strcmp(arg, "--lines") == 0 && has_value) {
      lines_file = argv[++i];
    } else if (std::strcmp(arg, "--verse-start") == 0 && has_value) {
      ok = parseDouble(argv[++i], verse_start);
      has_verse_start = true;
    } else if (std::strcmp(arg, "--verse-end") == 0 && has_value) {
      ok = parseDouble(argv[++i], verse_end);
      has_verse_end = true;
    } else if (std::strcmp(arg, "--offset-ms") == 0 && has_value) {
      ok = parseDouble(argv[++i], offset_ms);
      has_offset = true;
    } else if (std::strcmp(arg, "--ref-envelope") == 0 && has_value) {
      ref_envelope_file = argv[++i];
    } else if (std::strcmp(arg, "--rec-envelope") == 0 && has_value) {
      rec_envelope_file = argv[++i];
    } else if (std::strcmp(arg, "--ref-contour") == 0 && has_value) {
      ref_contour_file = argv[++i];
    } else if (std::strcmp(arg, "--rec-contour") == 0 && has_value) {
      rec_contour_file = argv[++i];
    } else if (std::strcmp(arg, "--ref-duration") == 0 && has_value) {
      ok = parseDouble(argv[++i], ref_duration);
    } else if (std::strcmp(arg, "--rec-duration") == 0 && has_value) {
      ok = parseDouble(argv[++i], rec_duration);
    } else if (std::strcmp(arg, "--mode") == 0 && has_value) {
      mode_name = argv[++i];
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      config_file = argv[++i];
    } else if (std::strcmp(arg, "--estimate-offset") == 0) {
      estimate_only = true;
    } else if (std::strcmp(arg, "--json") == 0) {
      json_output = true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
    if (!ok) {
      std::cerr << "Error: " << arg << " expects a number, got '" << argv[i] << "'\n";
      return 1;
    }
  }

  // ==========================================================================
  // Configuration
  // ==========================================================================
  vocalcoach::VocalCoach coach;
  vocalcoach::CoachConfig config;
  if (!config_file.empty()) {
    std::string text;
    if (!readTextFile(config_file, text)) {
      std::cerr << "Error: Failed to open file: " << config_file << "\n";
      return 1;
    }
    config = vocalcoach::coachConfigFromJson(text);
  }
  if (!mode_name.empty() &&
      !vocalcoach::parsePracticeMode(mode_name, config.performance.practice_mode)) {
    std::cerr << "Unknown mode: " << mode_name << " (use full, words, timing or pitch)\n";
    return 1;
  }
  auto config_error = coach.setConfig(config);
  if (config_error != vocalcoach::CoachConfigError::OK) {
    std::cerr << "Error: " << vocalcoach::coachConfigErrorString(config_error) << "\n";
    return 1;
  }

  // ==========================================================================
  // Signals
  // ==========================================================================
  vocalcoach::TimingReader reader;
  vocalcoach::PerformanceAnalysisInput signals;
  bool has_signals = false;

  if (!ref_envelope_file.empty()) {
    if (!reader.readEnvelope(ref_envelope_file)) {
      std::cerr << "Error: " << reader.getError() << "\n";
      return 1;
    }
    signals.reference_envelope = reader.getEnvelope();
    has_signals = true;
  }
  if (!rec_envelope_file.empty()) {
    if (!reader.readEnvelope(rec_envelope_file)) {
      std::cerr << "Error: " << reader.getError() << "\n";
      return 1;
    }
    signals.recording_envelope = reader.getEnvelope();
    has_signals = true;
  }
  if (!ref_contour_file.empty()) {
    if (!reader.readContour(ref_contour_file)) {
      std::cerr << "Error: " << reader.getError() << "\n";
      return 1;
    }
    signals.reference_contour = reader.getContour();
    has_signals = true;
  }
  if (!rec_contour_file.empty()) {
    if (!reader.readContour(rec_contour_file)) {
      std::cerr << "Error: " << reader.getError() << "\n";
      return 1;
    }
    signals.recording_contour = reader.getContour();
    has_signals = true;
  }
  if (ref_duration > 0.0) signals.reference_duration_sec = ref_duration;
  if (rec_duration > 0.0) signals.recording_duration_sec = rec_duration;

  if (estimate_only) {
    if (signals.reference_envelope.empty() || signals.recording_envelope.empty()) {
      std::cerr << "Error: --estimate-offset requires --ref-envelope and --rec-envelope\n";
      return 1;
    }
    vocalcoach::OffsetEstimate estimate =
        coach.estimateOffset(signals.reference_envelope, signals.recording_envelope);
    if (json_output) {
      std::ostringstream oss;
      vocalcoach::json::Writer w(oss);
      w.beginObject();
      vocalcoach::writeOffsetEstimate(w, estimate);
      w.endObject();
      std::cout << oss.str() << "\n";
    } else {
      std::cout << "Offset: " << estimate.offset_ms << " ms ("
                << vocalcoach::offsetMethodName(estimate.method) << ")\n";
    }
    return 0;
  }

  // ==========================================================================
  // Words
  // ==========================================================================
  if (reference_file.empty() || user_file.empty()) {
    std::cerr << "Error: --reference and --user are required\n\n";
    printUsage(argv[0]);
    return 1;
  }

  vocalcoach::AttemptInput attempt;
  if (!reader.readWords(reference_file)) {
    std::cerr << "Error: " << reader.getError() << "\n";
    return 1;
  }
  std::vector<vocalcoach::WordToken> reference = reader.getWords();
  if (!reader.readWords(user_file)) {
    std::cerr << "Error: " << reader.getError() << "\n";
    return 1;
  }
  attempt.words.user_words = reader.getWords();

  std::vector<vocalcoach::ReferenceLine> lines;
  if (!lines_file.empty()) {
    if (!reader.readLines(lines_file)) {
      std::cerr << "Error: " << reader.getError() << "\n";
      return 1;
    }
    lines = reader.getLines();
  }

  // A verse range cuts the verse out of song-level reference timings.
  if (has_verse_start || has_verse_end) {
    const double range_end =
        has_verse_end ? verse_end : std::numeric_limits<double>::infinity();
    if (range_end < verse_start) {
      std::cerr << "Error: --verse-end must not precede --verse-start\n";
      return 1;
    }
    reference = vocalcoach::sliceVerse(reference, verse_start, range_end);
    lines = vocalcoach::sliceVerseLines(lines, verse_start, range_end);
    attempt.words.verse_end_sec =
        has_verse_end ? verse_end - verse_start : (reference.empty() ? 0.0 : reference.back().end);
  } else {
    attempt.words.verse_end_sec = reference.empty() ? 0.0 : reference.back().end;
  }
  attempt.words.verse_start_sec = 0.0;
  attempt.words.reference_words = std::move(reference);
  if (!lines.empty()) attempt.words.reference_lines = std::move(lines);
  if (has_offset) attempt.words.estimated_offset_ms = offset_ms;
  if (has_signals) attempt.signals = std::move(signals);

  // ==========================================================================
  // Evaluate
  // ==========================================================================
  auto input_error = coach.evaluate(attempt);
  if (input_error != vocalcoach::InputError::OK) {
    std::cerr << "Error: " << vocalcoach::inputErrorString(input_error) << "\n";
    return 1;
  }

  const vocalcoach::CoachReport& report = coach.getReport();
  if (json_output) {
    std::cout << coach.getReportJson(true) << "\n";
    return 0;
  }

  std::cout << vocalcoach::coachReportToText(report, user_file);
  const char* reset = "\033[0m";
  const int headline =
      report.performance ? report.performance->overall : report.feedback.word_accuracy_pct;
  std::cout << scoreColor(headline) << (report.performance ? "Overall score: " : "Word accuracy: ")
            << headline << reset << "\n";
  return 0;
}
