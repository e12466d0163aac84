// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for certificates,
// plan reports and the canonical configuration form that is hashed.
// Parsing lives in core/json_parser.h.

#ifndef CALIB_CORE_JSON_HELPERS_H
#define CALIB_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace calib {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("layer");
///   writer.value("@chain");
///   writer.key("score");
///   writer.value(0.8);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"layer":"@chain","score":0.8}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
/// Output is a pure function of the call sequence, so equal inputs always
/// serialize to byte-identical strings.
class JsonWriter {
 public:
  JsonWriter() = default;

  /// @brief Begin a JSON object '{'.
  void beginObject();

  /// @brief End a JSON object '}'.
  void endObject();

  /// @brief Begin a JSON array '['.
  void beginArray();

  /// @brief End a JSON array ']'.
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  /// @param name Key string.
  void key(std::string_view name);

  /// @brief Write a string value.
  /// @param val String to write (will be JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C-string value (prevents the implicit bool overload).
  void value(const char* val);

  /// @brief Write an unsigned integer value.
  void value(uint32_t val);

  /// @brief Write a floating-point value.
  ///
  /// Uses the shortest of 15 or 17 significant digits that reads back to the
  /// same double. NaN and infinity are written as null.
  void value(double val);

  /// @brief Write a boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string indented by two spaces per level.
  std::string toPrettyString() const;

  /// @brief Format a double the way value(double) writes it.
  static std::string formatDouble(double val);

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark that the current container now holds an element.
  void markValue();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // Track whether we need a comma before the next element.
  // Each nesting level pushes a new entry.
  std::vector<bool> needs_comma_;
};

}  // namespace calib

#endif  // CALIB_CORE_JSON_HELPERS_H
