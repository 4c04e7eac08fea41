#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace autotile {

// Minimal JSON value + strict parser for tilemap config files.
//
// No comments, no trailing commas. Numbers are doubles. Object members keep their
// file order, which matters for ruleset lists.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape for use inside a JSON string literal (no surrounding quotes).
std::string JsonEscape(const std::string& s);

} // namespace autotile
