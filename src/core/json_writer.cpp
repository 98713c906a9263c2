/// @file
/// @brief JsonWriter implementation.

#include "core/json_writer.h"

#include <cmath>
#include <cstdio>

namespace deliberation {

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::open(char bracket) {
  beginValue();
  buffer_ += bracket;
  needs_comma_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!needs_comma_.empty()) needs_comma_.pop_back();
  endValue();
}

void JsonWriter::key(std::string_view name) {
  beginValue();
  buffer_ += '"';
  buffer_ += escape(name);
  buffer_ += "\":";
  // The value that follows belongs to this key: no comma before it.
  if (!needs_comma_.empty()) needs_comma_.back() = false;
}

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

void JsonWriter::value(std::string_view val) {
  beginValue();
  buffer_ += '"';
  buffer_ += escape(val);
  buffer_ += '"';
  endValue();
}

void JsonWriter::value(int val) {
  beginValue();
  buffer_ += std::to_string(val);
  endValue();
}

void JsonWriter::value(uint32_t val) {
  beginValue();
  buffer_ += std::to_string(val);
  endValue();
}

void JsonWriter::value(uint64_t val) {
  beginValue();
  buffer_ += std::to_string(val);
  endValue();
}

void JsonWriter::value(double val) {
  beginValue();
  if (std::isfinite(val)) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    buffer_ += buf;
  } else {
    buffer_ += "null";
  }
  endValue();
}

void JsonWriter::value(bool val) {
  beginValue();
  buffer_ += val ? "true" : "false";
  endValue();
}

void JsonWriter::valueNull() {
  beginValue();
  buffer_ += "null";
  endValue();
}

void JsonWriter::beginValue() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::endValue() {
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string out;
  out.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  auto newline = [&]() {
    out += '\n';
    out.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];
    if (in_string) {
      out += chr;
      if (chr == '\\' && pos + 1 < buffer_.size()) {
        out += buffer_[++pos];
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    bool next_closes = pos + 1 < buffer_.size() &&
                       (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
    switch (chr) {
      case '"':
        in_string = true;
        out += chr;
        break;
      case '{':
      case '[':
        out += chr;
        ++depth;
        if (!next_closes) newline();  // {} and [] stay compact.
        break;
      case '}':
      case ']':
        --depth;
        if (out.back() != '{' && out.back() != '[') newline();
        out += chr;
        break;
      case ',':
        out += chr;
        newline();
        break;
      case ':':
        out += ": ";
        break;
      default:
        out += chr;
        break;
    }
  }
  return out;
}

std::string JsonWriter::escape(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex[8];
          std::snprintf(hex, sizeof(hex), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          out += hex;
        } else {
          out += chr;
        }
        break;
    }
  }
  return out;
}

}  // namespace deliberation
