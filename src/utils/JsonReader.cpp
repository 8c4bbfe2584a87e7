/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace JournalEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}
} // namespace

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 0:
    return JsonType::Null;
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  default:
    return JsonType::Object;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return static_cast<int>(*value);
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *value = std::get_if<std::string>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  if (object == nullptr) {
    return nullValue();
  }
  auto it = object->find(key);
  return it != object->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = std::get_if<JsonArray>(&m_value);
  if (array == nullptr || index >= array->size()) {
    return nullValue();
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *array = std::get_if<JsonArray>(&m_value)) {
    return array->size();
  }
  if (const JsonObject *object = std::get_if<JsonObject>(&m_value)) {
    return object->size();
  }
  return 0;
}

// ----------------------------------------------------------------------------
// JsonReader
// ----------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  if (atEnd()) {
    return fail("Unexpected end of input");
  }

  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + c + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }

    std::string key;
    if (!parseString(key)) {
      return false;
    }

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }

    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[key] = std::move(value);

    skipWhitespace();
    const char next = advance();
    if (next == '}') {
      break;
    }
    if (next != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    const char next = advance();
    if (next == ']') {
      break;
    }
    if (next != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    const char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }
    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint)) {
        return false;
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(std::string("Invalid escape sequence '\\") + escaped + "'");
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd() || !std::isxdigit(static_cast<unsigned char>(peek()))) {
      return fail("Invalid unicode escape");
    }
    const char hex = advance();
    codepoint <<= 4;
    if (hex >= '0' && hex <= '9') {
      codepoint |= static_cast<uint32_t>(hex - '0');
    } else {
      codepoint |= static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(hex)) - 'a' + 10);
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }
  if (!std::isdigit(static_cast<unsigned char>(peek()))) {
    return fail("Invalid number");
  }
  while (std::isdigit(static_cast<unsigned char>(peek()))) {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Expected digit after decimal point");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Expected digit in exponent");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (atEnd() || advance() != *p) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
  }
  out = std::move(value);
  return true;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
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
  while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
  return false;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace JournalEngine
