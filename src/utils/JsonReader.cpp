/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <format>
#include <fstream>

namespace Snowfall {

namespace {

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return nullValue();
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (!arr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray())
    return arr->size();
  if (const JsonObject *obj = tryAsObject())
    return obj->size();
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  // Tolerate a UTF-8 byte order mark written by some editors
  if (m_input.starts_with("\xEF\xBB\xBF")) {
    m_position = 3;
  }

  skipWhitespace();
  auto value = parseValue(0);
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto text = parseString();
    if (!text)
      return std::nullopt;
    return JsonValue(std::move(*text));
  }
  case 't':
  case 'f':
  case 'n':
    return parseLiteral();
  case '\0':
    if (atEnd()) {
      setError("Unexpected end of input");
      return std::nullopt;
    }
    break;
  default:
    break;
  }

  char c = peek();
  if (c == '-' || (c >= '0' && c <= '9')) {
    return parseNumber();
  }
  setError(std::format("Unexpected character '{}'", c));
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (consume('}')) {
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    skipWhitespace();
    if (!consume(':')) {
      setError("Expected ':' after object key");
      return std::nullopt;
    }

    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    if (consume('}'))
      break;
    if (!consume(',')) {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }
  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (consume(']')) {
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    if (consume(']'))
      break;
    if (!consume(',')) {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }
  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    if (atEnd())
      break;
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b':
      result += '\b';
      break;
    case 'f':
      result += '\f';
      break;
    case 'n':
      result += '\n';
      break;
    case 'r':
      result += '\r';
      break;
    case 't':
      result += '\t';
      break;
    case 'u': {
      auto codepoint = parseHex4();
      if (!codepoint)
        return std::nullopt;
      // Combine UTF-16 surrogate pairs (emoji glyphs)
      if (*codepoint >= 0xD800 && *codepoint <= 0xDBFF) {
        if (!consume('\\') || !consume('u')) {
          setError("Unpaired high surrogate in \\u escape");
          return std::nullopt;
        }
        auto low = parseHex4();
        if (!low)
          return std::nullopt;
        if (*low < 0xDC00 || *low > 0xDFFF) {
          setError("Invalid low surrogate in \\u escape");
          return std::nullopt;
        }
        *codepoint = 0x10000 + ((*codepoint - 0xD800) << 10) + (*low - 0xDC00);
      }
      appendUtf8(result, *codepoint);
      break;
    }
    default:
      setError(std::format("Invalid escape sequence: \\{}", escaped));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid hex digit in \\u escape");
      return std::nullopt;
    }
    value = (value << 4) | digit;
    advance();
  }
  return value;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  consume('-');
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    setError("Invalid number");
    return std::nullopt;
  }
  if (consume('.') && digits() == 0) {
    setError("Expected digits after decimal point");
    return std::nullopt;
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (!consume('+')) {
      consume('-');
    }
    if (digits() == 0) {
      setError("Expected digits in exponent");
      return std::nullopt;
    }
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    setError("Number out of range");
    return std::nullopt;
  }
  return JsonValue(value);
}

std::optional<JsonValue> JsonReader::parseLiteral() {
  auto matches = [this](const char *word) {
    return m_input.compare(m_position, std::char_traits<char>::length(word),
                           word) == 0;
  };

  if (matches("true")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue(true);
  }
  if (matches("false")) {
    for (int i = 0; i < 5; ++i)
      advance();
    return JsonValue(false);
  }
  if (matches("null")) {
    for (int i = 0; i < 4; ++i)
      advance();
    return JsonValue();
  }
  setError("Invalid literal");
  return std::nullopt;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      return;
    advance();
  }
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  if (peek() != expected || atEnd())
    return false;
  advance();
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}, column {}", message, m_line,
                              m_column);
  }
}

} // namespace Snowfall
