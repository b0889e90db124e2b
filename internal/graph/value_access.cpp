#include "internal/graph/value_access.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>

namespace pwaudit::graph {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

const Value* FindField(const Struct& object, std::string_view key) {
  const auto& fields = object.fields();
  auto        it     = fields.find(std::string(key));
  if (it == fields.end()) {
    return nullptr;
  }
  return &it->second;
}

const Struct* FindStruct(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (value == nullptr || value->kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

const ListValue* FindList(const Struct& object, std::string_view key) {
  const auto* value = FindField(object, key);
  if (value == nullptr || value->kind_case() != Value::kListValue) {
    return nullptr;
  }
  return &value->list_value();
}

std::optional<std::string> AsString(const Value* value) {
  if (value == nullptr || value->kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return value->string_value();
}

std::optional<std::int64_t> AsInteger(const Value* value) {
  const auto number = AsNumber(value);
  if (!number) {
    return std::nullopt;
  }

  const double n = *number;
  if (!std::isfinite(n) || std::trunc(n) != n) {
    return std::nullopt;
  }
  // 2^63 is exactly representable; anything at or above it overflows int64.
  if (n < -9223372036854775808.0 || n >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(n);
}

std::optional<double> AsNumber(const Value* value) {
  if (value == nullptr || value->kind_case() != Value::kNumberValue) {
    return std::nullopt;
  }
  return value->number_value();
}

std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    return "<unprintable>";
  }
  return json;
}

} // namespace pwaudit::graph
