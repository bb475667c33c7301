/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Bulwark {

class JsonValue;
using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Printable for Boost.Test diagnostics
std::ostream &operator<<(std::ostream &os, JsonType type);

/**
 * @brief Immutable-by-default JSON document node
 *
 * Accessors named asX() throw std::bad_variant_access on a type mismatch;
 * tryAsX() return an empty optional / nullptr instead.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  float asFloat() const { return static_cast<float>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;

  // Missing keys / out-of-range indices yield a shared null value
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](const std::string &key);

  // Typed member lookup with a default, used heavily by the data loaders
  double numberOr(const std::string &key, double fallback) const;
  std::string stringOr(const std::string &key, const std::string &fallback) const;
  bool boolOr(const std::string &key, bool fallback) const;

  size_t size() const;
  std::string toString() const;

private:
  void write(std::string &out) const;

  ValueType m_value;
};

/**
 * @brief Recursive-descent JSON parser
 *
 * Usage:
 *   JsonReader reader;
 *   if (!reader.loadFromFile("res/data/towers.json")) {
 *       CONFIG_ERROR(reader.getLastError());
 *   }
 *   const JsonValue& root = reader.getRoot();
 */
class JsonReader {
public:
  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  JsonValue parseValue();
  JsonValue parseObject();
  JsonValue parseArray();
  JsonValue parseNumber();
  JsonValue parseLiteral(const char *word, JsonValue value);
  std::string parseString();
  uint32_t parseHex4();

  char peek() const;
  char next();
  void skipWhitespace();
  bool expect(char c);
  bool fail(const std::string &message);

  std::string m_input;
  size_t m_pos{0};
  size_t m_line{1};
  size_t m_column{1};
  size_t m_depth{0};
  bool m_failed{false};
  std::string m_lastError;
  JsonValue m_root;
};

} // namespace Bulwark

#endif // JSONREADER_HPP
