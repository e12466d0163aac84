// Minimal JSON tree parser for configuration and evidence input
// (no external dependencies).
//
// Parses the full JSON grammar into a JsonValue tree. Object member order is
// preserved as read. Malformed input is reported with a byte offset instead
// of returning a partial tree.

#ifndef CALIB_CORE_JSON_PARSER_H
#define CALIB_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace calib {

/// @brief A JSON value of any type.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  bool bool_val = false;
  double number_val = 0.0;
  std::string string_val;
  std::vector<JsonValue> array_items;
  std::vector<std::pair<std::string, JsonValue>> members;  ///< Object members.

  bool isNull() const { return type == Null; }
  bool isBool() const { return type == Bool; }
  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Find an object member by key.
  /// @return Pointer to the member value, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& key) const;

  /// @brief True if this is an object with the given key.
  bool has(const std::string& key) const { return find(key) != nullptr; }

  /// @brief Get value as number, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a complete JSON document.
/// @param text JSON text.
/// @param out Receives the parsed tree on success.
/// @param error Receives "offset N: reason" on failure.
/// @return True on success. Trailing non-whitespace is an error.
bool parseJson(const std::string& text, JsonValue& out, std::string& error);

/// @brief Read a file and parse it as JSON.
/// @param path File path.
/// @param out Receives the parsed tree on success.
/// @param error Receives the I/O or parse error on failure.
/// @return True on success.
bool parseJsonFile(const std::string& path, JsonValue& out, std::string& error);

}  // namespace calib

#endif  // CALIB_CORE_JSON_PARSER_H
