#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace bodyroute {
namespace json {

class JsonValueImpl;

enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

// Value type hiding the underlying JSON library from the rest of the code.
// Accessors return copies; the value never aliases another value's storage.
class JsonValue {
 public:
  JsonValue();  // Creates null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(uint64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;

  ~JsonValue();

  // Type checking
  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isUnsigned() const;  // Non-negative integer
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;

  // Value getters (throw JsonException if wrong type)
  bool getBool() const;
  int64_t getInt64() const;
  uint64_t getUInt64() const;
  std::string getString() const;

  // Array operations
  size_t size() const;  // Array or object size
  JsonValue operator[](size_t index) const;
  void push_back(const JsonValue& value);

  // Object operations
  bool contains(const std::string& key) const;
  JsonValue at(const std::string& key) const;  // Throws if not found
  void set(const std::string& key, const JsonValue& value);
  std::vector<std::string> keys() const;

  std::string toString(bool pretty = false) const;

  static JsonValue null();
  static JsonValue array();
  static JsonValue object();

  // Throws JsonException on malformed input
  static JsonValue parse(const std::string& json_str);

 private:
  std::unique_ptr<JsonValueImpl> impl_;
};

class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, bool val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const std::string& val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const char* val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace bodyroute
