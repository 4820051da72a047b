/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace Wayfinder {

namespace {

const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t cp) {
  auto cont = [&out](uint32_t bits) { out += static_cast<char>(0x80 | (bits & 0x3F)); };

  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    cont(cp);
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    cont(cp >> 6);
    cont(cp);
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    cont(cp >> 12);
    cont(cp >> 6);
    cont(cp);
  }
}

} // namespace

// ---------------------------------------------------------------- JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *b = std::get_if<bool>(&m_value)) return *b;
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *d = std::get_if<double>(&m_value)) return *d;
  return std::nullopt;
}

std::optional<float> JsonValue::tryAsFloat() const {
  auto number = tryAsNumber();
  if (!number || !std::isfinite(*number) ||
      std::fabs(*number) > std::numeric_limits<float>::max()) {
    return std::nullopt;
  }
  return static_cast<float>(*number);
}

std::optional<int> JsonValue::tryAsInt() const {
  auto number = tryAsNumber();
  if (!number || *number != std::floor(*number) ||
      *number < std::numeric_limits<int>::min() ||
      *number > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*number);
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *obj = std::get_if<JsonObject>(&m_value);
  if (!obj) return nullptr;
  auto it = obj->find(key);
  return it != obj->end() ? &it->second : nullptr;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonValue *member = find(key);
  return member ? *member : nullValue();
}

// --------------------------------------------------------------- JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = std::format("{}: Could not open file", path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return run(buffer.str(), path);
}

bool JsonReader::parse(const std::string &jsonString) {
  return run(jsonString, std::string());
}

bool JsonReader::run(std::string text, std::string source) {
  m_input = std::move(text);
  m_source = std::move(source);
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  auto value = parseValue(0);
  if (!value) return false;

  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected trailing content");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

void JsonReader::fail(const std::string &message) {
  if (!m_lastError.empty()) return; // first error wins

  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  if (!m_source.empty()) {
    m_lastError = m_source + ": " + m_lastError;
  }
}

char JsonReader::advance() {
  if (atEnd()) return '\0';

  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  for (char c = peek(); c == ' ' || c == '\t' || c == '\r' || c == '\n'; c = peek()) {
    advance();
  }
}

bool JsonReader::consumeLiteral(std::string_view literal) {
  if (std::string_view(m_input).substr(m_position, literal.size()) != literal) {
    return false;
  }
  m_position += literal.size();
  m_column += literal.size();
  return true;
}

bool JsonReader::expect(char c, const char *context) {
  skipWhitespace();
  if (peek() != c) {
    fail(std::format("Expected '{}' {}", c, context));
    return false;
  }
  advance();
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    fail("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  const char c = peek();

  if (c == '{') return parseObject(depth + 1);
  if (c == '[') return parseArray(depth + 1);
  if (c == '"') {
    auto str = parseString();
    if (!str) return std::nullopt;
    return JsonValue(std::move(*str));
  }
  if (c == '-' || isDigit(c)) {
    auto number = parseNumber();
    if (!number) return std::nullopt;
    return JsonValue(*number);
  }
  if (consumeLiteral("true")) return JsonValue(true);
  if (consumeLiteral("false")) return JsonValue(false);
  if (consumeLiteral("null")) return JsonValue();

  fail(atEnd() ? std::string("Unexpected end of input")
               : std::format("Unexpected character: {}", c));
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // '{'
  JsonObject members;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(members));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key || !expect(':', "after object key")) return std::nullopt;

    auto value = parseValue(depth);
    if (!value) return std::nullopt;
    members.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    const char sep = advance();
    if (sep == '}') return JsonValue(std::move(members));
    if (sep != ',') {
      fail("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // '['
  JsonArray elements;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(elements));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value) return std::nullopt;
    elements.push_back(std::move(*value));

    skipWhitespace();
    const char sep = advance();
    if (sep == ']') return JsonValue(std::move(elements));
    if (sep != ',') {
      fail("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote

  std::string result;
  while (!atEnd()) {
    const char c = advance();
    if (c == '"') return result;

    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
      return std::nullopt;
    }
    if (c == '\\') {
      if (!parseEscape(result)) return std::nullopt;
    } else {
      result += c;
    }
  }

  fail("Unterminated string");
  return std::nullopt;
}

bool JsonReader::parseEscape(std::string &out) {
  const char escaped = advance();
  switch (escaped) {
  case '"':
  case '\\':
  case '/': out += escaped; return true;
  case 'b': out += '\b'; return true;
  case 'f': out += '\f'; return true;
  case 'n': out += '\n'; return true;
  case 'r': out += '\r'; return true;
  case 't': out += '\t'; return true;
  case 'u': break;
  default:
    fail("Invalid escape sequence");
    return false;
  }

  auto cp = parseHex4();
  if (!cp) return false;

  // High surrogate must be followed by an escaped low surrogate
  if (*cp >= 0xD800 && *cp <= 0xDBFF) {
    if (advance() != '\\' || advance() != 'u') {
      fail("Unpaired high surrogate");
      return false;
    }
    auto low = parseHex4();
    if (!low) return false;
    if (*low < 0xDC00 || *low > 0xDFFF) {
      fail("Invalid low surrogate");
      return false;
    }
    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
  }

  appendUtf8(out, *cp);
  return true;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    uint32_t digit;
    if (isDigit(c)) {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      fail("Invalid unicode escape");
      return std::nullopt;
    }
    value = (value << 4) | digit;
  }
  return value;
}

std::optional<double> JsonReader::parseNumber() {
  const size_t start = m_position;

  // Consumes one or more digits, reporting `error` when there are none
  auto digits = [this](const char *error) {
    if (!isDigit(peek())) {
      fail(error);
      return false;
    }
    while (isDigit(peek())) advance();
    return true;
  };

  if (peek() == '-') advance();
  if (!digits("Invalid number")) return std::nullopt;
  if (peek() == '.') {
    advance();
    if (!digits("Expected digit after decimal point")) return std::nullopt;
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') advance();
    if (!digits("Expected digit in exponent")) return std::nullopt;
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    fail("Number out of range");
    return std::nullopt;
  }
  return value;
}

} // namespace Wayfinder
