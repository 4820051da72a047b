/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Wayfinder {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

/**
 * Immutable JSON document node.
 *
 * as*() throw std::bad_variant_access on a type mismatch; tryAs*() return
 * std::nullopt instead and are what config loaders should use.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Finite number representable as float
  std::optional<float> tryAsFloat() const;
  // Whole number within int range; 3.0 is accepted, 3.5 is not
  std::optional<int> tryAsInt() const;

  /**
   * @brief Member lookup that tells an absent key from an explicit null
   * @return The member, or nullptr if absent or this is not an object
   */
  const JsonValue *find(const std::string &key) const;

  // Absent members (and members of non-objects) read as null
  const JsonValue &operator[](const std::string &key) const;

private:
  ValueType m_value;
};

/**
 * Recursive-descent reader for configuration files.
 *
 * Errors are reported through getLastError() as "Line L, Column C: message",
 * prefixed with "<path>: " when reading a file. parse() and loadFromFile()
 * never throw; on failure the root is null.
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  std::string m_input;
  std::string m_source; // file path, empty for in-memory text
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  bool run(std::string text, std::string source);

  bool atEnd() const { return m_position >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_position]; }
  char advance();
  void skipWhitespace();
  bool consumeLiteral(std::string_view literal);
  bool expect(char c, const char *context);
  void fail(const std::string &message);

  std::optional<JsonValue> parseValue(int depth);
  std::optional<JsonValue> parseObject(int depth);
  std::optional<JsonValue> parseArray(int depth);
  std::optional<std::string> parseString();
  bool parseEscape(std::string &out);
  std::optional<uint32_t> parseHex4();
  std::optional<double> parseNumber();

  static constexpr int MAX_DEPTH = 64;
};

} // namespace Wayfinder

#endif // JSONREADER_HPP
