/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <ostream>
#include <sstream>

namespace Bulwark {

namespace {
const JsonValue NULL_VALUE;
constexpr size_t MAX_NESTING = 128;

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

void writeEscaped(std::string &out, const std::string &s) {
  out += '"';
  for (char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}
} // namespace

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null: return os << "Null";
  case JsonType::Boolean: return os << "Boolean";
  case JsonType::Number: return os << "Number";
  case JsonType::String: return os << "String";
  case JsonType::Array: return os << "Array";
  case JsonType::Object: return os << "Object";
  }
  return os << "Unknown";
}

// ---------------------------------------------------------------- JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *b = std::get_if<bool>(&m_value)) return *b;
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *d = std::get_if<double>(&m_value)) return *d;
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const double *d = std::get_if<double>(&m_value)) return static_cast<int>(*d);
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *s = std::get_if<std::string>(&m_value)) return *s;
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
  if (const JsonObject *obj = tryAsObject()) {
    auto it = obj->find(key);
    if (it != obj->end()) {
      return it->second;
    }
  }
  return NULL_VALUE;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (const JsonArray *arr = tryAsArray()) {
    if (index < arr->size()) {
      return (*arr)[index];
    }
  }
  return NULL_VALUE;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (isNull()) {
    m_value = JsonObject{};
  }
  return std::get<JsonObject>(m_value)[key];
}

double JsonValue::numberOr(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

std::string JsonValue::stringOr(const std::string &key,
                                const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

bool JsonValue::boolOr(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray()) return arr->size();
  if (const JsonObject *obj = tryAsObject()) return obj->size();
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    double d = asNumber();
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
      out += std::format("{}", static_cast<long long>(d));
    } else {
      out += std::format("{}", d);
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &item : asArray()) {
      if (!first) out += ',';
      first = false;
      item.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first) out += ',';
      first = false;
      writeEscaped(out, key);
      out += ':';
      value.write(out);
    }
    out += '}';
    break;
  }
  }
}

// --------------------------------------------------------------- JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    m_root = JsonValue();
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_pos = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_failed = false;
  m_lastError.clear();

  skipWhitespace();
  if (m_pos >= m_input.size()) {
    fail("Empty JSON input");
    m_root = JsonValue();
    return false;
  }

  JsonValue root = parseValue();
  if (!m_failed) {
    skipWhitespace();
    if (m_pos < m_input.size()) {
      fail("Unexpected trailing characters");
    }
  }
  m_root = m_failed ? JsonValue() : std::move(root);
  return !m_failed;
}

char JsonReader::peek() const {
  return m_pos < m_input.size() ? m_input[m_pos] : '\0';
}

char JsonReader::next() {
  if (m_pos >= m_input.size()) {
    return '\0';
  }
  char c = m_input[m_pos++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_pos < m_input.size()) {
    char c = m_input[m_pos];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    next();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    return fail(std::format("Expected '{}'", c));
  }
  next();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  // Keep the first (innermost) error only
  if (!m_failed) {
    m_failed = true;
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
  return false;
}

JsonValue JsonReader::parseValue() {
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case 't':
    return parseLiteral("true", JsonValue(true));
  case 'f':
    return parseLiteral("false", JsonValue(false));
  case 'n':
    return parseLiteral("null", JsonValue());
  case '\0':
    fail("Unexpected end of input");
    return JsonValue();
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber();
    }
    fail(std::format("Unexpected character '{}'", peek()));
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject() {
  if (++m_depth > MAX_NESTING) {
    fail("Maximum nesting depth exceeded");
    return JsonValue();
  }
  next(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    next();
    --m_depth;
    return JsonValue(std::move(object));
  }

  while (!m_failed) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key");
      break;
    }
    std::string key = parseString();
    if (!expect(':')) {
      break;
    }
    JsonValue value = parseValue();
    if (m_failed) {
      break;
    }
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      next();
      continue;
    }
    expect('}');
    break;
  }
  --m_depth;
  return JsonValue(std::move(object));
}

JsonValue JsonReader::parseArray() {
  if (++m_depth > MAX_NESTING) {
    fail("Maximum nesting depth exceeded");
    return JsonValue();
  }
  next(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    next();
    --m_depth;
    return JsonValue(std::move(array));
  }

  while (!m_failed) {
    array.push_back(parseValue());
    if (m_failed) {
      break;
    }
    skipWhitespace();
    if (peek() == ',') {
      next();
      continue;
    }
    expect(']');
    break;
  }
  --m_depth;
  return JsonValue(std::move(array));
}

JsonValue JsonReader::parseNumber() {
  size_t start = m_pos;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      next();
      ++count;
    }
    return count;
  };

  if (peek() == '-') next();
  if (peek() == '0') {
    next();
  } else if (digits() == 0) {
    fail("Invalid number");
    return JsonValue();
  }
  if (peek() == '.') {
    next();
    if (digits() == 0) {
      fail("Expected digit after decimal point");
      return JsonValue();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    next();
    if (peek() == '+' || peek() == '-') next();
    if (digits() == 0) {
      fail("Expected digit in exponent");
      return JsonValue();
    }
  }

  double value = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_pos;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    fail("Number out of range");
    return JsonValue();
  }
  return JsonValue(value);
}

JsonValue JsonReader::parseLiteral(const char *word, JsonValue value) {
  for (const char *c = word; *c != '\0'; ++c) {
    if (peek() != *c) {
      fail(std::format("Invalid literal, expected '{}'", word));
      return JsonValue();
    }
    next();
  }
  return value;
}

uint32_t JsonReader::parseHex4() {
  uint32_t cp = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      fail("Invalid unicode escape");
      return 0;
    }
    next();
    cp = (cp << 4) | digit;
  }
  return cp;
}

std::string JsonReader::parseString() {
  next(); // opening quote
  std::string out;

  while (!m_failed) {
    char c = peek();
    if (c == '\0' && m_pos >= m_input.size()) {
      fail("Unterminated string");
      break;
    }
    next();
    if (c == '"') {
      break;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
      break;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char esc = next();
    switch (esc) {
    case '"': out += '"'; break;
    case '\\': out += '\\'; break;
    case '/': out += '/'; break;
    case 'b': out += '\b'; break;
    case 'f': out += '\f'; break;
    case 'n': out += '\n'; break;
    case 'r': out += '\r'; break;
    case 't': out += '\t'; break;
    case 'u': {
      uint32_t cp = parseHex4();
      // Surrogate pair
      if (!m_failed && cp >= 0xD800 && cp <= 0xDBFF) {
        if (peek() != '\\') {
          fail("Unpaired surrogate in unicode escape");
          break;
        }
        next();
        if (next() != 'u') {
          fail("Unpaired surrogate in unicode escape");
          break;
        }
        uint32_t low = parseHex4();
        if (low < 0xDC00 || low > 0xDFFF) {
          fail("Invalid low surrogate in unicode escape");
          break;
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      if (!m_failed) {
        appendUtf8(out, cp);
      }
      break;
    }
    default:
      fail(std::format("Invalid escape sequence '\\{}'", esc));
      break;
    }
  }
  return out;
}

} // namespace Bulwark
