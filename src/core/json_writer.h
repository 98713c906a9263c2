// Minimal JSON writer for statistics reports (no external dependencies).
//
// Output only; configuration input is read by core/config_reader.h.

#ifndef DELIBERATION_CORE_JSON_WRITER_H
#define DELIBERATION_CORE_JSON_WRITER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace deliberation {

/// @brief Incremental JSON builder.
///
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("comment_count");
///   writer.value(12u);
///   writer.endObject();
///   writer.toString();  // {"comment_count":12}
/// @endcode
///
/// Commas are inserted automatically. Begin/end pairs are not validated.
class JsonWriter {
 public:
  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(uint32_t val);
  void value(uint64_t val);
  /// NaN and infinities are written as null.
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Convenience: key followed by value.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Compact JSON text.
  const std::string& toString() const { return buffer_; }

  /// @brief Indented JSON text.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  void open(char bracket);
  void close(char bracket);
  void beginValue();
  void endValue();

  static std::string escape(std::string_view input);

  std::string buffer_;
  std::vector<bool> needs_comma_;  ///< One entry per open container.
};

}  // namespace deliberation

#endif  // DELIBERATION_CORE_JSON_WRITER_H
