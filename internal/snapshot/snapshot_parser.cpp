#include "internal/snapshot/snapshot_parser.hpp"

#include <json/json.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace pwaudit::snapshot {

using pwaudit::util::SnapshotParseError;

namespace {

void JsonToProtoValue(const Json::Value& json, google::protobuf::Value* value) {
  switch (json.type()) {
    case Json::nullValue:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:
      value->set_number_value(json.asDouble());
      break;

    case Json::stringValue:
      value->set_string_value(json.asString());
      break;

    case Json::booleanValue:
      value->set_bool_value(json.asBool());
      break;

    case Json::arrayValue: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : json) {
        JsonToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case Json::objectValue: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (auto it = json.begin(); it != json.end(); ++it) {
        JsonToProtoValue(*it, &(*fields)[it.name()]);
      }
      break;
    }
  }
}

// jsoncpp reports "* Line L, Column C\n  Syntax error: ...\n"; keep the first error on one line.
std::string FirstError(const std::string& formatted) {
  std::string line;
  std::size_t parts = 0;
  std::size_t start = 0;
  while (start < formatted.size() && parts < 2) {
    auto end = formatted.find('\n', start);
    if (end == std::string::npos) {
      end = formatted.size();
    }
    auto       piece = formatted.substr(start, end - start);
    const auto first = piece.find_first_not_of(" \t*");
    start            = end + 1;
    if (first == std::string::npos) {
      continue;
    }
    piece = piece.substr(first);
    line += (parts == 0 ? "" : ": ") + piece;
    ++parts;
  }
  return line.empty() ? "malformed JSON" : line;
}

} // namespace

graph::GraphSnapshot ParseSnapshot(std::string_view json) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  // Repeated object keys are accepted; the last occurrence wins.
  builder.settings_["rejectDupKeys"] = false;

  Json::Value                             root;
  std::string                             errors;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
    throw SnapshotParseError("invalid pw-dump JSON: " + FirstError(errors));
  }

  // pw-dump always prints a top-level array; anything else is not a graph.
  if (!root.isArray()) {
    throw SnapshotParseError("invalid pw-dump JSON: expected a top-level array");
  }

  google::protobuf::Value value;
  JsonToProtoValue(root, &value);

  graph::GraphSnapshot snapshot;
  snapshot.Swap(value.mutable_list_value());
  return snapshot;
}

} // namespace pwaudit::snapshot
