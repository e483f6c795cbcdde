// core/json.cpp - Minimal JSON value implementation
#include "json.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace safio {
namespace json {

Value Value::array() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

Value Value::object() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

bool Value::as_bool() const {
  if (type_ != Type::Bool)
    throw std::runtime_error("json: value is not a bool");
  return bool_;
}

int64_t Value::as_int() const {
  if (type_ != Type::Number)
    throw std::runtime_error("json: value is not a number");
  return static_cast<int64_t>(number_);
}

double Value::as_number() const {
  if (type_ != Type::Number)
    throw std::runtime_error("json: value is not a number");
  return number_;
}

const std::string &Value::as_string() const {
  if (type_ != Type::String)
    throw std::runtime_error("json: value is not a string");
  return string_;
}

const std::vector<Value> &Value::as_array() const {
  if (type_ != Type::Array)
    throw std::runtime_error("json: value is not an array");
  return array_;
}

const std::map<std::string, Value> &Value::as_object() const {
  if (type_ != Type::Object)
    throw std::runtime_error("json: value is not an object");
  return object_;
}

Value &Value::operator[](const std::string &key) {
  if (type_ == Type::Null) {
    type_ = Type::Object;
  }
  if (type_ != Type::Object)
    throw std::runtime_error("json: value is not an object");
  return object_[key];
}

const Value &Value::at(const std::string &key) const {
  const auto &obj = as_object();
  auto it = obj.find(key);
  if (it == obj.end())
    throw std::runtime_error("json: missing key '" + key + "'");
  return it->second;
}

bool Value::contains(const std::string &key) const {
  return type_ == Type::Object && object_.find(key) != object_.end();
}

const Value &Value::get(const std::string &key) const {
  static const Value null_value;
  if (type_ != Type::Object)
    return null_value;
  auto it = object_.find(key);
  return it == object_.end() ? null_value : it->second;
}

void Value::push_back(Value v) {
  if (type_ == Type::Null) {
    type_ = Type::Array;
  }
  if (type_ != Type::Array)
    throw std::runtime_error("json: value is not an array");
  array_.push_back(std::move(v));
}

size_t Value::size() const {
  switch (type_) {
  case Type::Array:
    return array_.size();
  case Type::Object:
    return object_.size();
  case Type::String:
    return string_.size();
  default:
    return 0;
  }
}

// Serialization

static std::string escape(const std::string &s) {
  std::ostringstream o;
  for (char c : s) {
    if (c == '"')
      o << "\\\"";
    else if (c == '\\')
      o << "\\\\";
    else if (c == '\b')
      o << "\\b";
    else if (c == '\f')
      o << "\\f";
    else if (c == '\n')
      o << "\\n";
    else if (c == '\r')
      o << "\\r";
    else if (c == '\t')
      o << "\\t";
    else if ((unsigned char)c < 0x20) {
      char buf[7];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      o << buf;
    } else
      o << c;
  }
  return o.str();
}

static void dump_to(std::ostringstream &out, const Value &v, int indent,
                    int depth) {
  auto newline = [&](int d) {
    if (indent >= 0) {
      out << "\n" << std::string(static_cast<size_t>(indent * d), ' ');
    }
  };

  switch (v.type()) {
  case Value::Type::Null:
    out << "null";
    break;
  case Value::Type::Bool:
    out << (v.as_bool() ? "true" : "false");
    break;
  case Value::Type::Number: {
    double n = v.as_number();
    if (std::floor(n) == n && std::fabs(n) < 9.0e15) {
      out << static_cast<int64_t>(n);
    } else {
      out << n;
    }
    break;
  }
  case Value::Type::String:
    out << "\"" << escape(v.as_string()) << "\"";
    break;
  case Value::Type::Array: {
    const auto &arr = v.as_array();
    out << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        out << ",";
      newline(depth + 1);
      dump_to(out, arr[i], indent, depth + 1);
    }
    if (!arr.empty())
      newline(depth);
    out << "]";
    break;
  }
  case Value::Type::Object: {
    const auto &obj = v.as_object();
    out << "{";
    bool first = true;
    for (const auto &[key, child] : obj) {
      if (!first)
        out << ",";
      first = false;
      newline(depth + 1);
      out << "\"" << escape(key) << "\":" << (indent >= 0 ? " " : "");
      dump_to(out, child, indent, depth + 1);
    }
    if (!obj.empty())
      newline(depth);
    out << "}";
    break;
  }
  }
}

std::string dump(const Value &value, int indent) {
  std::ostringstream out;
  dump_to(out, value, indent, 0);
  return out.str();
}

// Parsing

namespace {

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Value parse_document() {
    Value v = parse_value();
    skip_ws();
    if (pos_ != text_.size())
      fail("trailing characters");
    return v;
  }

private:
  const std::string &text_;
  size_t pos_ = 0;

  [[noreturn]] void fail(const std::string &what) {
    throw std::runtime_error("json: " + what + " at offset " +
                             std::to_string(pos_));
  }

  void skip_ws() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
            text_[pos_] == '\r'))
      ++pos_;
  }

  bool consume(const char *literal) {
    size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(pos_, len, literal) == 0) {
      pos_ += len;
      return true;
    }
    return false;
  }

  Value parse_value() {
    skip_ws();
    if (pos_ >= text_.size())
      fail("unexpected end of input");

    char c = text_[pos_];
    if (c == '{')
      return parse_object();
    if (c == '[')
      return parse_array();
    if (c == '"')
      return Value(parse_string());
    if (consume("true"))
      return Value(true);
    if (consume("false"))
      return Value(false);
    if (consume("null"))
      return Value();
    return parse_number();
  }

  Value parse_object() {
    Value obj = Value::object();
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return obj;
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"')
        fail("expected object key");
      std::string key = parse_string();
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':')
        fail("expected ':'");
      ++pos_;
      obj[key] = parse_value();
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == '}') {
        ++pos_;
        return obj;
      }
      fail("expected ',' or '}'");
    }
  }

  Value parse_array() {
    Value arr = Value::array();
    ++pos_;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return arr;
    }
    while (true) {
      arr.push_back(parse_value());
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == ']') {
        ++pos_;
        return arr;
      }
      fail("expected ',' or ']'");
    }
  }

  void append_utf8(std::string &out, unsigned cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  // Four hex digits after "\u"
  unsigned parse_hex4() {
    if (pos_ + 4 > text_.size())
      fail("truncated \\u escape");
    unsigned cp = 0;
    for (size_t i = 0; i < 4; ++i) {
      char c = text_[pos_ + i];
      cp <<= 4;
      if (c >= '0' && c <= '9')
        cp |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f')
        cp |= static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        cp |= static_cast<unsigned>(c - 'A' + 10);
      else
        fail("invalid \\u escape");
    }
    pos_ += 4;
    return cp;
  }

  std::string parse_string() {
    std::string out;
    ++pos_;
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"')
        return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= text_.size())
        break;
      char esc = text_[pos_++];
      switch (esc) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case '/':
        out.push_back('/');
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
      case 'u': {
        unsigned cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate must be followed by an escaped low surrogate
          if (pos_ + 2 > text_.size() || text_[pos_] != '\\' ||
              text_[pos_ + 1] != 'u')
            fail("unpaired surrogate in \\u escape");
          pos_ += 2;
          unsigned low = parse_hex4();
          if (low < 0xDC00 || low > 0xDFFF)
            fail("unpaired surrogate in \\u escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          fail("unpaired surrogate in \\u escape");
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail("invalid escape");
      }
    }
    fail("unterminated string");
  }

  Value parse_number() {
    size_t start = pos_;
    if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+'))
      ++pos_;
    while (pos_ < text_.size() &&
           (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
            text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E' ||
            text_[pos_] == '-' || text_[pos_] == '+'))
      ++pos_;
    if (start == pos_)
      fail("unexpected character");
    try {
      return Value(std::stod(text_.substr(start, pos_ - start)));
    } catch (const std::exception &) {
      fail("invalid number");
    }
  }
};

} // namespace

Value parse(const std::string &text) { return Parser(text).parse_document(); }

} // namespace json
} // namespace safio
