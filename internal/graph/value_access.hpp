#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace pwaudit::graph {

/*
  Read-only accessors over google.protobuf.Value trees parsed from pw-dump.

  Every accessor is total: a missing key or a value of the wrong kind yields
  nullptr / std::nullopt, never an exception.
*/

const google::protobuf::Value* FindField(const google::protobuf::Struct& object, std::string_view key);

const google::protobuf::Struct* FindStruct(const google::protobuf::Struct& object, std::string_view key);

const google::protobuf::ListValue* FindList(const google::protobuf::Struct& object, std::string_view key);

// Strings only; numbers are not stringified.
std::optional<std::string> AsString(const google::protobuf::Value* value);

// JSON numbers with an exact integral value.
std::optional<std::int64_t> AsInteger(const google::protobuf::Value* value);

std::optional<double> AsNumber(const google::protobuf::Value* value);

// Compact JSON rendering for diagnostics.
std::string ToJson(const google::protobuf::Value& value);

} // namespace pwaudit::graph
