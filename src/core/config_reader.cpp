// Flat JSON object reader.

#include "core/config_reader.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace deliberation {

double ConfigValue::asDouble(double default_val) const {
  return type == Number ? number_val : default_val;
}

bool ConfigValue::isCount() const {
  return type == Number && number_val >= 0.0 &&
         number_val <= static_cast<double>(std::numeric_limits<uint32_t>::max()) &&
         std::floor(number_val) == number_val;
}

uint32_t ConfigValue::asUint(uint32_t default_val) const {
  if (!isCount()) return default_val;
  return static_cast<uint32_t>(number_val);
}

bool ConfigValue::asBool(bool default_val) const {
  return type == Bool ? bool_val : default_val;
}

std::string ConfigValue::asString(const std::string& default_val) const {
  return type == String ? string_val : default_val;
}

namespace {

/// @brief Cursor over the input with error recording.
class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  bool atEnd() const { return pos_ >= text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool consume(char expected) {
    skipWhitespace();
    if (peek() != expected) return fail(std::string("expected '") + expected + "'");
    ++pos_;
    return true;
  }

  bool consumeWord(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) {
      return fail("unexpected token");
    }
    pos_ += word.size();
    return true;
  }

  bool readString(std::string& out) {
    if (peek() != '"') return fail("expected string");
    ++pos_;
    out.clear();
    while (!atEnd() && text_[pos_] != '"') {
      char chr = text_[pos_++];
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (atEnd()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        default:  out += esc;  break;  // \" \\ \/
      }
    }
    if (atEnd()) return fail("unterminated string");
    ++pos_;  // closing quote
    return true;
  }

  bool readNumber(double& out) {
    size_t start = pos_;
    if (peek() == '-' || peek() == '+') ++pos_;
    while (!atEnd() && (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                        text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E' ||
                        text_[pos_] == '-' || text_[pos_] == '+')) {
      ++pos_;
    }
    std::string literal(text_.substr(start, pos_ - start));
    char* end = nullptr;
    out = std::strtod(literal.c_str(), &end);
    if (literal.empty() || end != literal.c_str() + literal.size()) {
      return fail("invalid number '" + literal + "'");
    }
    return true;
  }

  /// Skips a nested object or array, honouring strings.
  bool skipContainer() {
    char open = peek();
    char close = open == '{' ? '}' : ']';
    int depth = 0;
    std::string ignored;
    while (!atEnd()) {
      char chr = peek();
      if (chr == '"') {
        if (!readString(ignored)) return false;
        continue;
      }
      ++pos_;
      if (chr == open) ++depth;
      if (chr == close && --depth == 0) return true;
    }
    return fail("unterminated container");
  }

  bool fail(const std::string& message) {
    if (error_.empty()) {
      error_ = message + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  const std::string& error() const { return error_; }

 private:
  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

bool readValue(Reader& reader, ConfigValue& value, bool& skipped) {
  skipped = false;
  reader.skipWhitespace();
  char chr = reader.peek();
  if (chr == '"') {
    value.type = ConfigValue::String;
    return reader.readString(value.string_val);
  }
  if (chr == 't' || chr == 'f') {
    value.type = ConfigValue::Bool;
    value.bool_val = (chr == 't');
    return reader.consumeWord(value.bool_val ? "true" : "false");
  }
  if (chr == 'n') {
    value.type = ConfigValue::Null;
    return reader.consumeWord("null");
  }
  if (chr == '{' || chr == '[') {
    skipped = true;
    return reader.skipContainer();
  }
  value.type = ConfigValue::Number;
  return reader.readNumber(value.number_val);
}

/// Reads `"key": value` pairs up to and including the closing brace.
bool readMembers(Reader& reader, ConfigValues& out) {
  while (true) {
    reader.skipWhitespace();
    std::string key;
    if (!reader.readString(key)) return false;
    if (!reader.consume(':')) return false;

    ConfigValue value;
    bool skipped = false;
    if (!readValue(reader, value, skipped)) return false;
    if (!skipped) out[key] = value;

    reader.skipWhitespace();
    if (reader.peek() != ',') return reader.consume('}');
    if (!reader.consume(',')) return false;
  }
}

}  // namespace

bool readConfigObject(std::string_view text, ConfigValues& out, std::string* error) {
  out.clear();
  Reader reader(text);

  auto finish = [&](bool ok) {
    if (!ok) {
      out.clear();
      if (error) *error = reader.error();
    }
    return ok;
  };

  if (!reader.consume('{')) return finish(false);
  reader.skipWhitespace();
  if (reader.peek() == '}') {
    if (!reader.consume('}')) return finish(false);
  } else if (!readMembers(reader, out)) {
    return finish(false);
  }

  reader.skipWhitespace();
  if (!reader.atEnd()) return finish(reader.fail("trailing characters"));
  return finish(true);
}

}  // namespace deliberation
