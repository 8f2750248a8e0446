/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace Kickoff {

namespace {
const JsonValue s_null{};
constexpr int MAX_DEPTH = 64;
} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *v = std::get_if<bool>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *v = std::get_if<double>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const double *v = std::get_if<double>(&m_value)) {
    return static_cast<int>(*v);
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
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
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr) {
    return s_null;
  }
  auto it = obj->find(key);
  return it == obj->end() ? s_null : it->second;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size()) {
    return s_null;
  }
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray()) {
    return arr->size();
  }
  if (const JsonObject *obj = tryAsObject()) {
    return obj->size();
  }
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_pos = 0;
  m_line = 1;
  m_depth = 0;
  m_lastError.clear();
  m_root = JsonValue();

  std::optional<JsonValue> value = parseValue();
  if (!value) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected trailing characters");
    return false;
  }
  m_root = std::move(*value);
  return true;
}

void JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}", message, m_line);
  }
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = m_input[m_pos];
    if (c == '\n') {
      ++m_line;
    } else if (c != ' ' && c != '\t' && c != '\r') {
      return;
    }
    ++m_pos;
  }
}

std::optional<JsonValue> JsonReader::parseValue() {
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"': {
    std::optional<std::string> s = parseString();
    if (!s) {
      return std::nullopt;
    }
    return JsonValue(std::move(*s));
  }
  case 't':
    if (parseLiteral("true")) {
      return JsonValue(true);
    }
    return std::nullopt;
  case 'f':
    if (parseLiteral("false")) {
      return JsonValue(false);
    }
    return std::nullopt;
  case 'n':
    if (parseLiteral("null")) {
      return JsonValue();
    }
    return std::nullopt;
  case '\0':
    fail("Unexpected end of input");
    return std::nullopt;
  default:
    return parseNumber();
  }
}

std::optional<JsonValue> JsonReader::parseObject() {
  if (++m_depth > MAX_DEPTH) {
    fail("Nesting too deep");
    return std::nullopt;
  }
  ++m_pos; // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    ++m_pos;
    --m_depth;
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key");
      return std::nullopt;
    }
    std::optional<std::string> key = parseString();
    if (!key) {
      return std::nullopt;
    }
    skipWhitespace();
    if (peek() != ':') {
      fail("Expected ':' after key");
      return std::nullopt;
    }
    ++m_pos;

    std::optional<JsonValue> value = parseValue();
    if (!value) {
      return std::nullopt;
    }
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    if (peek() == ',') {
      ++m_pos;
      continue;
    }
    if (peek() == '}') {
      ++m_pos;
      break;
    }
    fail("Expected ',' or '}' in object");
    return std::nullopt;
  }

  --m_depth;
  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray() {
  if (++m_depth > MAX_DEPTH) {
    fail("Nesting too deep");
    return std::nullopt;
  }
  ++m_pos; // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    ++m_pos;
    --m_depth;
    return JsonValue(std::move(array));
  }

  while (true) {
    std::optional<JsonValue> value = parseValue();
    if (!value) {
      return std::nullopt;
    }
    array.push_back(std::move(*value));

    skipWhitespace();
    if (peek() == ',') {
      ++m_pos;
      continue;
    }
    if (peek() == ']') {
      ++m_pos;
      break;
    }
    fail("Expected ',' or ']' in array");
    return std::nullopt;
  }

  --m_depth;
  return JsonValue(std::move(array));
}

std::optional<std::string> JsonReader::parseString() {
  ++m_pos; // opening quote
  std::string out;

  while (!atEnd()) {
    char c = m_input[m_pos++];
    if (c == '"') {
      return out;
    }
    if (c == '\n') {
      fail("Unterminated string");
      return std::nullopt;
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    if (atEnd()) {
      break;
    }
    char esc = m_input[m_pos++];
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      out += esc;
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
    case 'u':
      if (!appendCodePoint(out)) {
        return std::nullopt;
      }
      break;
    default:
      fail(std::format("Invalid escape '\\{}'", esc));
      return std::nullopt;
    }
  }

  fail("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendCodePoint(std::string &out) {
  if (m_pos + 4 > m_input.size()) {
    fail("Truncated unicode escape");
    return false;
  }
  const std::string hex = m_input.substr(m_pos, 4);
  char *end = nullptr;
  const unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
  if (end != hex.c_str() + 4) {
    fail("Invalid unicode escape");
    return false;
  }
  m_pos += 4;

  // UTF-8 encode (surrogate pairs are kept as separate code units)
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_pos;
  auto digits = [this]() {
    size_t n = 0;
    while (!atEnd() && m_input[m_pos] >= '0' && m_input[m_pos] <= '9') {
      ++m_pos;
      ++n;
    }
    return n;
  };

  if (peek() == '-') {
    ++m_pos;
  }
  if (digits() == 0) {
    m_pos = start;
    fail(std::format("Unexpected character '{}'", peek()));
    return std::nullopt;
  }
  if (peek() == '.') {
    ++m_pos;
    if (digits() == 0) {
      fail("Expected digits after decimal point");
      return std::nullopt;
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    ++m_pos;
    if (peek() == '+' || peek() == '-') {
      ++m_pos;
    }
    if (digits() == 0) {
      fail("Expected exponent digits");
      return std::nullopt;
    }
  }

  return JsonValue(std::strtod(m_input.substr(start, m_pos - start).c_str(), nullptr));
}

bool JsonReader::parseLiteral(const char *word) {
  const std::string literal(word);
  if (m_input.compare(m_pos, literal.size(), literal) != 0) {
    fail(std::format("Unexpected token, expected '{}'", literal));
    return false;
  }
  m_pos += literal.size();
  return true;
}

} // namespace Kickoff
