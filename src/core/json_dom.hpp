#ifndef CUPKIT_CORE_JSON_DOM_HPP_
#define CUPKIT_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cupkit::core::json {

// Minimal DOM shared by every artifact reader and writer.
// Objects keep insertion order and numbers keep their source text so a
// parse/serialize cycle only changes whitespace, never field order or
// number formatting.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Member = std::pair<std::string, Value>;
  using Object = std::vector<Member>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  std::string number_text;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
};

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(std::int64_t number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = static_cast<double>(number);
  value.number_text = std::to_string(number);
  return value;
}

inline Value MakeBool(bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeObject() {
  Value value;
  value.type = Value::Type::kObject;
  return value;
}

inline Value MakeArray() {
  Value value;
  value.type = Value::Type::kArray;
  return value;
}

inline const Value* FindField(const Value& object, std::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  for (const auto& member : object.object_value) {
    if (member.first == key) {
      return &member.second;
    }
  }
  return nullptr;
}

inline Value* FindField(Value& object, std::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  for (auto& member : object.object_value) {
    if (member.first == key) {
      return &member.second;
    }
  }
  return nullptr;
}

// Replaces an existing member in place or appends a new one at the end.
inline void SetField(Value& object, std::string_view key, Value field) {
  if (Value* existing = FindField(object, key); existing != nullptr) {
    *existing = std::move(field);
    return;
  }
  object.object_value.emplace_back(std::string(key), std::move(field));
}

// Returns the string value of `key`, or an empty view when absent or not a string.
inline std::string_view StringField(const Value& object, std::string_view key) {
  const Value* field = FindField(object, key);
  if (field == nullptr || !field->IsString()) {
    return {};
  }
  return field->string_value;
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed cup files are actionable.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value, error);
    }
    if (StartsWith("true")) {
      value = MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = Value{};
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = MakeObject();

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      // Duplicate keys: last one wins, first position is kept.
      SetField(value, key, std::move(item));

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = MakeArray();

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseHex4(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_unit <<= 4U;
      if (h >= '0' && h <= '9') {
        code_unit |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_unit |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_unit |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ParseHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("high surrogate without low surrogate", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ParseHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unexpected low surrogate in \\u escape", error);
    }

    AppendUtf8(output, code_point);
    return true;
  }

  static void AppendUtf8(std::string& output, std::uint32_t cp) {
    if (cp < 0x80U) {
      output.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  bool ParseNumber(Value& value, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    value.number_text = std::string(input_.substr(start, pos_ - start));
    char* end = nullptr;
    value.number_value = std::strtod(value.number_text.c_str(), &end);
    if (end == nullptr || *end != '\0') {
      return Fail("invalid number token", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

namespace detail {

inline void AppendIndent(std::string& out, std::string_view indent, std::size_t depth) {
  for (std::size_t i = 0; i < depth; ++i) {
    out.append(indent);
  }
}

inline void SerializeInto(const Value& value, std::string_view indent, std::size_t depth,
                          std::string& out) {
  const bool pretty = !indent.empty();
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += value.number_text.empty() ? std::to_string(value.number_value) : value.number_text;
    return;
  case Value::Type::kString:
    out += '"';
    AppendEscapedJson(out, value.string_value);
    out += '"';
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out += '[';
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out += ',';
      }
      first = false;
      if (pretty) {
        out += '\n';
        AppendIndent(out, indent, depth + 1);
      }
      SerializeInto(item, indent, depth + 1, out);
    }
    if (pretty) {
      out += '\n';
      AppendIndent(out, indent, depth);
    }
    out += ']';
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out += '{';
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out += ',';
      }
      first = false;
      if (pretty) {
        out += '\n';
        AppendIndent(out, indent, depth + 1);
      }
      out += '"';
      AppendEscapedJson(out, key);
      out += pretty ? "\": " : "\":";
      SerializeInto(item, indent, depth + 1, out);
    }
    if (pretty) {
      out += '\n';
      AppendIndent(out, indent, depth);
    }
    out += '}';
    return;
  }
  }
}

} // namespace detail

// Serializes `value`. An empty `indent` yields compact output; otherwise each
// nesting level is indented by `indent` and a trailing newline is appended.
inline std::string Serialize(const Value& value, std::string_view indent = "  ") {
  std::string out;
  detail::SerializeInto(value, indent, 0, out);
  if (!indent.empty()) {
    out += '\n';
  }
  return out;
}

} // namespace cupkit::core::json

#endif // CUPKIT_CORE_JSON_DOM_HPP_
