/**
 * @file json_helpers.h
 * @brief Streaming JSON writer and flat JSON parser for reports and configuration.
 */

#ifndef VOCALCOACH_CORE_JSON_HELPERS_H
#define VOCALCOACH_CORE_JSON_HELPERS_H

#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vocalcoach {
namespace json {

/**
 * @brief Escapes a string for use inside JSON quotes.
 *
 * Quote, backslash, newline, carriage return and tab get their short forms;
 * any other byte below 0x20 becomes `\u00XX`. UTF-8 lyrics pass through.
 *
 * @example
 * ```cpp
 * json::escape("say \"la\"");  // say \"la\"
 * json::escape("verse\t2");    // verse\t2
 * ```
 */
inline std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    const auto byte = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (byte < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", byte);
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

/**
 * @brief A streaming JSON writer with optional pretty-print support.
 *
 * Commas and indentation are tracked per nesting level. Fields written via
 * writeOptional() are left out when empty, so absent report fields never
 * appear as `null`.
 *
 * Floating-point values keep 10 significant digits: timestamps stay at
 * millisecond resolution up to about 10^6 seconds, and 1.4 is written as
 * `1.4` rather than its full binary expansion.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("ref_word", "light")
 *     .write("ref_start", 1234.5678)
 *     .writeOptional("delta_ms", std::optional<int>(-80))
 *     .beginArray("main_issues")
 *         .value("Missed words")
 *     .endArray()
 * .endObject();
 * // {"ref_word":"light","ref_start":1234.5678,"delta_ms":-80,"main_issues":["Missed words"]}
 * ```
 */
class Writer {
 public:
  /**
   * @param os Destination stream
   * @param pretty Emit newlines and indentation
   * @param indent_size Spaces per nesting level
   */
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /// @brief Open an object; keyed inside an object, unkeyed inside an array.
  Writer& beginObject(const char* key = nullptr) {
    open(key, '{');
    return *this;
  }

  Writer& endObject() {
    close('}');
    return *this;
  }

  Writer& beginArray(const char* key = nullptr) {
    open(key, '[');
    return *this;
  }

  Writer& endArray() {
    close(']');
    return *this;
  }

  Writer& write(const char* key, int value) {
    member(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, double value) {
    member(key);
    number(value);
    return *this;
  }

  Writer& write(const char* key, bool value) {
    member(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    member(key);
    quoted(value);
    return *this;
  }

  Writer& write(const char* key, const char* value) { return write(key, std::string(value)); }

  /**
   * @brief Writes the member only if the optional holds a value.
   * @tparam T Any type accepted by write()
   */
  template <typename T>
  Writer& writeOptional(const char* key, const std::optional<T>& value) {
    if (value) write(key, *value);
    return *this;
  }

  Writer& value(int v) {
    element();
    os_ << v;
    return *this;
  }

  Writer& value(double v) {
    element();
    number(v);
    return *this;
  }

  Writer& value(const std::string& v) {
    element();
    quoted(v);
    return *this;
  }

  Writer& value(const char* v) { return value(std::string(v)); }

 private:
  // Separator and indentation before an array element.
  void element() {
    if (!first_) os_ << ",";
    first_ = false;
    newline();
  }

  // Separator, indentation and key before an object member.
  void member(const char* key) {
    element();
    os_ << "\"" << key << "\":";
    if (pretty_) os_ << " ";
  }

  void open(const char* key, char bracket) {
    if (key) {
      member(key);
    } else {
      if (!first_) os_ << ",";
      first_ = false;
    }
    os_ << bracket;
    ++depth_;
    first_ = true;
  }

  void close(char bracket) {
    --depth_;
    // Empty containers stay on one line.
    if (!first_) newline();
    first_ = false;
    os_ << bracket;
  }

  void quoted(const std::string& s) { os_ << "\"" << escape(s) << "\""; }

  void number(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", value);
    os_ << buf;
  }

  void newline() {
    if (!pretty_) return;
    os_ << "\n" << std::string(static_cast<size_t>(depth_ * indent_size_), ' ');
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

/**
 * @brief Flat JSON object parser for configuration.
 *
 * Reads the top-level members of one object into a key -> raw value map.
 * Nested objects are reachable through getObject(); arrays are recorded as
 * present but not decoded.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"practice_mode":"words","feedback":{"pause_gap_sec":1.2}})");
 * p.isString("practice_mode");                           // true
 * p.getString("practice_mode");                          // "words"
 * p.getObject("feedback").getDouble("pause_gap_sec");    // 1.2
 * p.getObject("offset").getDouble("max_offset_ms", 600); // 600 (absent)
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& json) : json_(json) { parse(); }

  bool has(const std::string& key) const { return values_.count(key) > 0; }

  /// @brief True if the key holds a quoted string.
  bool isString(const std::string& key) const { return string_keys_.count(key) > 0; }

  int getInt(const std::string& key, int default_val = 0) const {
    const std::string* raw = find(key);
    if (!raw) return default_val;
    try {
      return std::stoi(*raw);
    } catch (const std::exception&) {  // malformed number
      return default_val;
    }
  }

  double getDouble(const std::string& key, double default_val = 0.0) const {
    const std::string* raw = find(key);
    if (!raw) return default_val;
    try {
      return std::stod(*raw);
    } catch (const std::exception&) {  // malformed number
      return default_val;
    }
  }

  bool getBool(const std::string& key, bool default_val = false) const {
    const std::string* raw = find(key);
    return raw ? *raw == "true" : default_val;
  }

  std::string getString(const std::string& key, const std::string& default_val = "") const {
    const std::string* raw = find(key);
    return raw ? *raw : default_val;
  }

  /// @brief Nested object as its own parser; empty when absent or not an object.
  Parser getObject(const std::string& key) const {
    auto it = objects_.find(key);
    if (it == objects_.end()) return Parser("{}");
    return Parser(json_.substr(it->second.first, it->second.second - it->second.first));
  }

 private:
  const std::string* find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
  }

  void parse() {
    size_t pos = skipSpace(0);
    if (pos >= json_.size() || json_[pos] != '{') return;
    ++pos;

    while ((pos = skipSpace(pos)) < json_.size() && json_[pos] != '}') {
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }
      const std::string key = readString(pos);
      if (key.empty()) return;

      pos = skipSpace(pos);
      if (pos >= json_.size() || json_[pos] != ':') return;
      pos = skipSpace(pos + 1);
      if (pos >= json_.size()) return;

      const char lead = json_[pos];
      if (lead == '"') {
        values_[key] = readString(pos);
        string_keys_[key] = true;
      } else if (lead == '{' || lead == '[') {
        const size_t start = pos;
        skipContainer(pos);
        if (lead == '{') objects_[key] = {start, pos};
        values_[key] = lead == '{' ? "__object__" : "__array__";
      } else {
        values_[key] = readScalar(pos);
      }
    }
  }

  size_t skipSpace(size_t pos) const {
    while (pos < json_.size() && (json_[pos] == ' ' || json_[pos] == '\t' ||
                                  json_[pos] == '\n' || json_[pos] == '\r')) {
      ++pos;
    }
    return pos;
  }

  // Reads a quoted string starting at pos and leaves pos past the closing quote.
  std::string readString(size_t& pos) const {
    if (pos >= json_.size() || json_[pos] != '"') return "";
    std::string out;
    for (++pos; pos < json_.size() && json_[pos] != '"'; ++pos) {
      if (json_[pos] != '\\' || pos + 1 >= json_.size()) {
        out += json_[pos];
        continue;
      }
      const char code = json_[++pos];
      if (code == 'n') {
        out += '\n';
      } else if (code == 'r') {
        out += '\r';
      } else if (code == 't') {
        out += '\t';
      } else if (code == 'u' && pos + 4 < json_.size()) {
        // Only the \u00XX range the writer emits is decoded to a byte.
        const long cp = std::strtol(json_.substr(pos + 1, 4).c_str(), nullptr, 16);
        if (cp < 0x80) out += static_cast<char>(cp);
        pos += 4;
      } else {
        out += code;
      }
    }
    if (pos < json_.size()) ++pos;
    return out;
  }

  std::string readScalar(size_t& pos) const {
    const size_t start = pos;
    while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' && json_[pos] != ' ' &&
           json_[pos] != '\t' && json_[pos] != '\n' && json_[pos] != '\r') {
      ++pos;
    }
    return json_.substr(start, pos - start);
  }

  // Leaves pos one past the bracket that closes the container at pos.
  void skipContainer(size_t& pos) const {
    int depth = 0;
    bool in_string = false;
    for (; pos < json_.size(); ++pos) {
      const char c = json_[pos];
      if (in_string) {
        if (c == '\\') {
          ++pos;
        } else if (c == '"') {
          in_string = false;
        }
      } else if (c == '"') {
        in_string = true;
      } else if (c == '{' || c == '[') {
        ++depth;
      } else if ((c == '}' || c == ']') && --depth == 0) {
        ++pos;
        return;
      }
    }
  }

  std::string json_;
  std::map<std::string, std::string> values_;
  std::map<std::string, bool> string_keys_;
  std::map<std::string, std::pair<size_t, size_t>> objects_;
};

}  // namespace json
}  // namespace vocalcoach

#endif  // VOCALCOACH_CORE_JSON_HELPERS_H
