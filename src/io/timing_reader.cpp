/**
 * @file timing_reader.cpp
 * @brief Implementation of TimingReader.
 */

#include "io/timing_reader.h"

#include <fstream>
#include <sstream>

namespace vocalcoach {

namespace {

// Strips a trailing comment and surrounding whitespace.
std::string stripLine(const std::string& raw) {
  std::string line = raw.substr(0, raw.find('#'));
  const char* ws = " \t\r\n";
  size_t first = line.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  size_t last = line.find_last_not_of(ws);
  return line.substr(first, last - first + 1);
}

// Reads the rest of a stream after the current position, trimmed.
std::string restOf(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  return stripLine(rest);
}

}  // namespace

bool TimingReader::loadFile(const std::string& path, std::string& text) {
  std::ifstream file(path);
  if (!file) {
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) {
    error_ = "Failed to read file: " + path;
    return false;
  }
  text = oss.str();
  return true;
}

bool TimingReader::fail(const std::string& source, int line_number, const std::string& message) {
  error_ = source + ":" + std::to_string(line_number) + ": " + message;
  return false;
}

bool TimingReader::readWords(const std::string& path) {
  std::string text;
  return loadFile(path, text) && parseWords(text, path);
}

bool TimingReader::readLines(const std::string& path) {
  std::string text;
  return loadFile(path, text) && parseLines(text, path);
}

bool TimingReader::readEnvelope(const std::string& path) {
  std::string text;
  return loadFile(path, text) && parseEnvelope(text, path);
}

bool TimingReader::readContour(const std::string& path) {
  std::string text;
  return loadFile(path, text) && parseContour(text, path);
}

bool TimingReader::parseWords(const std::string& text, const std::string& source) {
  words_.clear();
  error_.clear();

  std::istringstream input(text);
  std::string raw;
  int line_number = 0;
  while (std::getline(input, raw)) {
    ++line_number;
    std::string line = stripLine(raw);
    if (line.empty()) continue;

    std::istringstream iss(line);
    WordToken token;
    if (!(iss >> token.start >> token.end >> token.word)) {
      return fail(source, line_number, "expected 'start end word [line]'");
    }
    int line_index = 0;
    if (iss >> line_index) {
      token.line_index = line_index;
    } else if (!iss.eof()) {
      return fail(source, line_number, "line index must be an integer");
    }
    if (!restOf(iss).empty()) {
      return fail(source, line_number, "unexpected trailing fields");
    }
    token.index = static_cast<int>(words_.size());
    words_.push_back(std::move(token));
  }
  return true;
}

bool TimingReader::parseLines(const std::string& text, const std::string& source) {
  lines_.clear();
  error_.clear();

  std::istringstream input(text);
  std::string raw;
  int line_number = 0;
  while (std::getline(input, raw)) {
    ++line_number;
    std::string line = stripLine(raw);
    if (line.empty()) continue;

    std::istringstream iss(line);
    ReferenceLine ref_line;
    if (!(iss >> ref_line.index >> ref_line.start >> ref_line.end)) {
      return fail(source, line_number, "expected 'index start end text...'");
    }
    ref_line.text = restOf(iss);
    lines_.push_back(std::move(ref_line));
  }
  return true;
}

bool TimingReader::parseEnvelope(const std::string& text, const std::string& source) {
  envelope_.clear();
  error_.clear();

  std::istringstream input(text);
  std::string raw;
  int line_number = 0;
  while (std::getline(input, raw)) {
    ++line_number;
    std::string line = stripLine(raw);
    if (line.empty()) continue;

    std::istringstream iss(line);
    double value = 0.0;
    if (!(iss >> value) || !restOf(iss).empty()) {
      return fail(source, line_number, "expected one energy value");
    }
    envelope_.push_back(value);
  }
  return true;
}

bool TimingReader::parseContour(const std::string& text, const std::string& source) {
  contour_.clear();
  error_.clear();

  std::istringstream input(text);
  std::string raw;
  int line_number = 0;
  while (std::getline(input, raw)) {
    ++line_number;
    std::string line = stripLine(raw);
    if (line.empty()) continue;

    std::istringstream iss(line);
    PitchSample sample;
    if (!(iss >> sample.time >> sample.frequency) || !restOf(iss).empty()) {
      return fail(source, line_number, "expected 'time frequency'");
    }
    contour_.push_back(sample);
  }
  return true;
}

}  // namespace vocalcoach
