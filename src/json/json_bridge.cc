#include "bodyroute/json/json_bridge.h"

#include <nlohmann/json.hpp>

namespace bodyroute {
namespace json {

// Implementation class that wraps nlohmann::json
class JsonValueImpl {
 public:
  nlohmann::json json_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const nlohmann::json& j) : json_(j) {}
  explicit JsonValueImpl(nlohmann::json&& j) : json_(std::move(j)) {}
};

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(uint64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(std::string(value)))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(other.impl_->json_)) {}

JsonValue::JsonValue(JsonValue&& other) noexcept = default;

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    impl_ = std::make_unique<JsonValueImpl>(other.impl_->json_);
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
  impl_.swap(other.impl_);
  return *this;
}

JsonValue::~JsonValue() = default;

JsonType JsonValue::type() const {
  const auto& j = impl_->json_;
  if (j.is_null())
    return JsonType::Null;
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  return JsonType::Object;
}

bool JsonValue::isNull() const { return impl_->json_.is_null(); }
bool JsonValue::isBoolean() const { return impl_->json_.is_boolean(); }
bool JsonValue::isInteger() const { return impl_->json_.is_number_integer(); }
bool JsonValue::isUnsigned() const {
  const auto& j = impl_->json_;
  if (j.is_number_unsigned()) {
    return true;
  }
  return j.is_number_integer() && j.get<int64_t>() >= 0;
}
bool JsonValue::isFloat() const { return impl_->json_.is_number_float(); }
bool JsonValue::isNumber() const { return impl_->json_.is_number(); }
bool JsonValue::isString() const { return impl_->json_.is_string(); }
bool JsonValue::isArray() const { return impl_->json_.is_array(); }
bool JsonValue::isObject() const { return impl_->json_.is_object(); }

bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return impl_->json_.get<bool>();
}

int64_t JsonValue::getInt64() const {
  if (!isInteger()) {
    throw JsonException("Value is not an integer");
  }
  return impl_->json_.get<int64_t>();
}

uint64_t JsonValue::getUInt64() const {
  if (!isUnsigned()) {
    throw JsonException("Value is not a non-negative integer");
  }
  return impl_->json_.get<uint64_t>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return impl_->json_.get<std::string>();
}

size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return impl_->json_.size();
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  if (index >= impl_->json_.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  JsonValue val;
  val.impl_->json_ = impl_->json_[index];
  return val;
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    impl_->json_ = nlohmann::json::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  impl_->json_.push_back(value.impl_->json_);
}

bool JsonValue::contains(const std::string& key) const {
  if (!isObject()) {
    return false;
  }
  return impl_->json_.contains(key);
}

JsonValue JsonValue::at(const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto it = impl_->json_.find(key);
  if (it == impl_->json_.end()) {
    throw JsonException("Key not found: " + key);
  }
  JsonValue val;
  val.impl_->json_ = *it;
  return val;
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (isNull()) {
    impl_->json_ = nlohmann::json::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  impl_->json_[key] = value.impl_->json_;
}

std::vector<std::string> JsonValue::keys() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  for (auto& kv : impl_->json_.items()) {
    result.push_back(kv.key());
  }
  return result;
}

std::string JsonValue::toString(bool pretty) const {
  // Invalid UTF-8 in strings is replaced rather than thrown on
  return impl_->json_.dump(pretty ? 2 : -1, ' ', false,
                           nlohmann::json::error_handler_t::replace);
}

JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::array();
  return val;
}

JsonValue JsonValue::object() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::object();
  return val;
}

JsonValue JsonValue::parse(const std::string& json_str) {
  try {
    JsonValue val;
    val.impl_->json_ = nlohmann::json::parse(json_str);
    return val;
  } catch (const nlohmann::json::exception& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace bodyroute
