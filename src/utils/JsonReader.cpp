/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace Ragfall {

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
    return static_cast<int>(asNumber());
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

namespace {
void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\r':
      stream << "\\r";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}
} // namespace

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      writeEscaped(stream, key);
      stream << ":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_line = 1;
    m_column = 1;
    setError("Could not open file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_lastError.clear();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  skipWhitespace();
  auto value = parseValue(0);
  if (!value) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing characters");
    return false;
  }

  m_root = std::move(*value);
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  skipWhitespace();
  if (peek() != expected) {
    return false;
  }
  advance();
  return true;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      break;
    }
    advance();
  }
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  if (depth > MAX_DEPTH) {
    setError("Nesting too deep");
    return std::nullopt;
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto str = parseString();
    if (!str)
      return std::nullopt;
    return JsonValue(std::move(*str));
  }
  case 't':
  case 'f':
  case 'n':
    return parseLiteral();
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber();
    }
    setError(std::string("Unexpected character: ") + c);
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  advance(); // '{'
  JsonObject object;

  if (consume('}')) {
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key)
      return std::nullopt;

    if (!consume(':')) {
      setError("Expected ':' after key");
      return std::nullopt;
    }

    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    object.insert_or_assign(std::move(*key), std::move(*value));

    if (consume(',')) {
      continue;
    }
    if (consume('}')) {
      return JsonValue(std::move(object));
    }
    setError("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  advance(); // '['
  JsonArray array;

  if (consume(']')) {
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value)
      return std::nullopt;
    array.push_back(std::move(*value));

    if (consume(',')) {
      continue;
    }
    if (consume(']')) {
      return JsonValue(std::move(array));
    }
    setError("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote

  std::string result;
  while (m_position < m_input.size()) {
    char c = advance();
    if (c == '"') {
      return result;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

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
    case 'u':
      if (!appendUnicodeEscape(result))
        return std::nullopt;
      break;
    default:
      setError(std::string("Invalid escape sequence: \\") + escaped);
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size()) {
    setError("Incomplete unicode escape");
    return false;
  }

  uint32_t codepoint = 0;
  const char *begin = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(begin, begin + 4, codepoint, 16);
  if (ec != std::errc() || ptr != begin + 4) {
    setError("Invalid unicode escape");
    return false;
  }
  for (int i = 0; i < 4; ++i) {
    advance();
  }

  // UTF-8 encode; surrogate pairs are kept as separate code units
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
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;
  if (peek() == '-')
    advance();

  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (digits() == 0) {
    setError("Expected digit");
    return std::nullopt;
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      setError("Expected digit after decimal point");
      return std::nullopt;
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (digits() == 0) {
      setError("Expected digit in exponent");
      return std::nullopt;
    }
  }

  double value = 0.0;
  const char *begin = m_input.data() + start;
  const char *end = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    setError("Invalid number: " + std::string(begin, end));
    return std::nullopt;
  }
  return JsonValue(value);
}

std::optional<JsonValue> JsonReader::parseLiteral() {
  auto matches = [this](const char *word, size_t len) {
    return m_input.compare(m_position, len, word) == 0;
  };
  auto skip = [this](size_t len) {
    for (size_t i = 0; i < len; ++i)
      advance();
  };

  if (matches("true", 4)) {
    skip(4);
    return JsonValue(true);
  }
  if (matches("false", 5)) {
    skip(5);
    return JsonValue(false);
  }
  if (matches("null", 4)) {
    skip(4);
    return JsonValue();
  }
  setError(std::string("Invalid literal starting with '") + peek() + "'");
  return std::nullopt;
}

} // namespace Ragfall
