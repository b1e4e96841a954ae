#ifndef CAMKIT_CORE_JSON_DOM_HPP_
#define CAMKIT_CORE_JSON_DOM_HPP_

#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace camkit::core::json {

// Small STL-only DOM shared by the constraints request and the capture config
// loader.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }

  // nullptr when this is not an object or `key` is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

inline const char* ToString(const Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Recursive-descent parser. Diagnostics carry line/column of the offending
// character so a broken config or request points at the exact spot.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    error.clear();
    SkipWhitespace();
    if (!ParseValue(root, 0U, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("trailing characters after the top-level value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, const std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting deeper than 64 levels", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("input ended where a value was expected", error);
    }

    value = Value{};
    switch (input_[pos_]) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", value, Value::Type::kBool, true, error);
    case 'f':
      return ParseLiteral("false", value, Value::Type::kBool, false, error);
    case 'n':
      return ParseLiteral("null", value, Value::Type::kNull, false, error);
    default:
      break;
    }

    if (input_[pos_] == '-' || std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail(std::string("unexpected character '") + input_[pos_] + "'", error);
  }

  bool ParseLiteral(std::string_view word, Value& value, const Value::Type type,
                    const bool flag, std::string& error) {
    if (input_.substr(pos_, word.size()) != word) {
      return Fail("unknown literal, expected '" + std::string(word) + "'", error);
    }
    Skip(word.size());
    value.type = type;
    value.bool_value = flag;
    return true;
  }

  bool ParseObject(Value& value, const std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Skip(1U);
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("object key must be a string", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("missing ':' after key \"" + key + "\"", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      // Last duplicate wins.
      value.object_value[std::move(key)] = std::move(member);

      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& value, const std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Skip(1U);
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& out, std::string& error) {
    out.clear();
    Skip(1U);
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      Skip(1U);
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character inside string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (pos_ >= input_.size()) {
        break;
      }
      const char escape = input_[pos_];
      Skip(1U);
      switch (escape) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escape);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail(std::string("unknown escape '\\") + escape + "'", error);
      }
    }
    return Fail("string is not terminated", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ParseUnicodeEscape(std::string& out, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    std::uint32_t code = 0U;
    const char* first = input_.data() + pos_;
    const auto [end, ec] = std::from_chars(first, first + 4, code, 16);
    if (ec != std::errc{} || end != first + 4) {
      return Fail("\\u escape needs four hex digits", error);
    }
    if (code >= 0xD800U && code <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }
    Skip(4U);

    if (code < 0x80U) {
      out.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    TryConsume('-');
    if (!TryConsume('0') && ConsumeDigits() == 0U) {
      return Fail("number has no integer digits", error);
    }
    if (TryConsume('.') && ConsumeDigits() == 0U) {
      return Fail("number has no digits after '.'", error);
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        TryConsume('-');
      }
      if (ConsumeDigits() == 0U) {
        return Fail("number has an empty exponent", error);
      }
    }

    const char* first = input_.data() + start;
    const char* last = input_.data() + pos_;
    const auto [end, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || end != last) {
      return Fail("number '" + std::string(first, last) + "' is out of range", error);
    }
    return true;
  }

  std::size_t ConsumeDigits() {
    std::size_t count = 0U;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Skip(1U);
      ++count;
    }
    return count;
  }

  bool TryConsume(const char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Skip(1U);
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Skip(1U);
    }
  }

  void Skip(const std::size_t count) {
    for (std::size_t i = 0U; i < count && pos_ < input_.size(); ++i) {
      if (input_[pos_++] == '\n') {
        ++line_;
        column_ = 1U;
      } else {
        ++column_;
      }
    }
  }

  bool Fail(const std::string& message, std::string& error) const {
    error = "line " + std::to_string(line_) + ", column " + std::to_string(column_) + ": " +
            message;
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0U;
  std::size_t line_ = 1U;
  std::size_t column_ = 1U;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace camkit::core::json

#endif // CAMKIT_CORE_JSON_DOM_HPP_
