// core/json.hpp - Minimal JSON value used for bridge payloads
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace safio {
namespace json {

class Value {
public:
  enum class Type { Null, Bool, Number, String, Array, Object };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int n) : type_(Type::Number), number_(n) {}
  Value(int64_t n) : type_(Type::Number), number_(static_cast<double>(n)) {}
  Value(double n) : type_(Type::Number), number_(n) {}
  Value(const char *s) : type_(Type::String), string_(s) {}
  Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

  static Value array();
  static Value object();

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  // Typed accessors throw std::runtime_error on a type mismatch
  bool as_bool() const;
  int64_t as_int() const;
  double as_number() const;
  const std::string &as_string() const;
  const std::vector<Value> &as_array() const;
  const std::map<std::string, Value> &as_object() const;

  // Object access; operator[] converts a null value into an object
  Value &operator[](const std::string &key);
  const Value &at(const std::string &key) const;
  bool contains(const std::string &key) const;
  // Returns a shared null value when the key is missing
  const Value &get(const std::string &key) const;

  void push_back(Value v);
  size_t size() const;

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0;
  std::string string_;
  std::vector<Value> array_;
  std::map<std::string, Value> object_;
};

std::string dump(const Value &value, int indent = -1);
Value parse(const std::string &text);

} // namespace json
} // namespace safio
