// Flat JSON object reader for threshold overrides (no external dependencies).
//
// Accepts a single object whose values are strings, numbers, booleans or
// null. Nested objects and arrays are skipped.

#ifndef DELIBERATION_CORE_CONFIG_READER_H
#define DELIBERATION_CORE_CONFIG_READER_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace deliberation {

/// @brief One scalar value read from a config object.
struct ConfigValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  bool isNumber() const { return type == Number; }
  bool isBool() const { return type == Bool; }
  /// Whole number representable as uint32_t.
  bool isCount() const;

  double asDouble(double default_val = 0.0) const;
  /// @brief Value as a count; @p default_val unless isCount().
  uint32_t asUint(uint32_t default_val = 0) const;
  bool asBool(bool default_val = false) const;
  std::string asString(const std::string& default_val = "") const;
};

using ConfigValues = std::map<std::string, ConfigValue>;

/// @brief Parse a flat JSON object.
/// @param text JSON text.
/// @param out Receives the key/value pairs (cleared first).
/// @param error Optional; receives a description of the first syntax error.
/// @return False on malformed input.
bool readConfigObject(std::string_view text, ConfigValues& out,
                      std::string* error = nullptr);

}  // namespace deliberation

#endif  // DELIBERATION_CORE_CONFIG_READER_H
