#ifndef WELLWATCH_CORE_JSON_DOM_HPP_
#define WELLWATCH_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wellwatch::core::json {

// Small STL-only JSON DOM shared by the pipeline config loader and the model
// coefficient loader.
struct Value {
  enum class Type {
    kNull,
    kBool,
    kNumber,
    kString,
    kArray,
    kObject,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  bool bool_value = false;
  double number_value = 0.0;
  std::string string_value;
  Array array_value;
  Object object_value;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }

  // Returns nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kNull:
    return "null";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kString:
    return "string";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kObject:
    return "object";
  }
  return "unknown";
}

// Recursive-descent parser. Diagnostics carry line/column so a bad config
// file points at the offending token.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    root = Value{};
    SkipSpace();
    if (!ParseAny(root, 0, error)) {
      return false;
    }
    SkipSpace();
    if (pos_ != input_.size()) {
      return Fail("trailing characters after JSON document", error);
    }
    return true;
  }

private:
  static constexpr int kMaxDepth = 64;

  bool ParseAny(Value& out, int depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input", error);
    }

    switch (input_[pos_]) {
    case '{':
      return ParseObject(out, depth, error);
    case '[':
      return ParseArray(out, depth, error);
    case '"':
      out.type = Value::Type::kString;
      return ParseString(out.string_value, error);
    case 't':
      return ParseLiteral("true", out, error);
    case 'f':
      return ParseLiteral("false", out, error);
    case 'n':
      return ParseLiteral("null", out, error);
    default:
      break;
    }

    if (input_[pos_] == '-' || std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      out.type = Value::Type::kNumber;
      return ParseNumber(out.number_value, error);
    }
    return Fail("unexpected character while reading a value", error);
  }

  bool ParseLiteral(std::string_view word, Value& out, std::string& error) {
    if (input_.substr(pos_, word.size()) != word) {
      return Fail("invalid literal", error);
    }
    Step(word.size());
    if (word == "null") {
      out.type = Value::Type::kNull;
    } else {
      out.type = Value::Type::kBool;
      out.bool_value = word == "true";
    }
    return true;
  }

  bool ParseObject(Value& out, int depth, std::string& error) {
    out.type = Value::Type::kObject;
    Step(1);
    SkipSpace();
    if (Accept('}')) {
      return true;
    }

    for (;;) {
      SkipSpace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("object keys must be strings", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipSpace();
      if (!Accept(':')) {
        return Fail("missing ':' after object key", error);
      }
      SkipSpace();
      Value member;
      if (!ParseAny(member, depth + 1, error)) {
        return false;
      }
      out.object_value.insert_or_assign(std::move(key), std::move(member));
      SkipSpace();
      if (Accept('}')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("missing ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value& out, int depth, std::string& error) {
    out.type = Value::Type::kArray;
    Step(1);
    SkipSpace();
    if (Accept(']')) {
      return true;
    }

    for (;;) {
      SkipSpace();
      Value item;
      if (!ParseAny(item, depth + 1, error)) {
        return false;
      }
      out.array_value.push_back(std::move(item));
      SkipSpace();
      if (Accept(']')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("missing ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& out, std::string& error) {
    out.clear();
    Step(1);
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      Step(1);
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
      const char esc = input_[pos_];
      Step(1);
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
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
        return Fail("unknown escape sequence", error);
      }
    }
    return Fail("string is not terminated", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ParseUnicodeEscape(std::string& out, std::string& error) {
    if (pos_ + 4 > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    unsigned int code = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = input_[pos_];
      Step(1);
      code <<= 4U;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned int>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned int>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned int>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code >= 0xD800U && code <= 0xDFFFU) {
      return Fail("surrogate pairs are not supported", error);
    }
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
    Accept('-');
    if (!Accept('0') && SkipDigits() == 0U) {
      return Fail("number has no digits", error);
    }
    if (Accept('.') && SkipDigits() == 0U) {
      return Fail("number has no digits after '.'", error);
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("number has an empty exponent", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      return Fail("malformed number", error);
    }
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t n = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step(1);
      ++n;
    }
    return n;
  }

  void SkipSpace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step(1);
    }
  }

  bool Accept(char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      Step(1);
      return true;
    }
    return false;
  }

  void Step(std::size_t count) {
    for (std::size_t i = 0; i < count && pos_ < input_.size(); ++i, ++pos_) {
      if (input_[pos_] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
    }
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "JSON parse error at line " + std::to_string(line_) + ", column " +
            std::to_string(column_) + ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t column_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace wellwatch::core::json

#endif // WELLWATCH_CORE_JSON_DOM_HPP_
