#include "internal/attributes/attribute_resolver.hpp"

#include "internal/attributes/format_decoding.hpp"
#include "internal/graph/value_access.hpp"

namespace pwaudit::attributes {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Struct* FirstEntry(const Struct& params, std::string_view group) {
  const auto* entries = graph::FindList(params, group);
  if (entries == nullptr || entries->values_size() == 0) {
    return nullptr;
  }
  const auto& first = entries->values(0);
  if (first.kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &first.struct_value();
}

bool HasEntries(const Struct& params, std::string_view group) {
  const auto* entries = graph::FindList(params, group);
  return entries != nullptr && entries->values_size() > 0;
}

bool IsUnity(const Value& value) {
  const auto number = graph::AsNumber(&value);
  return number.has_value() && *number == kUnityVolume;
}

VolumeAssessment Failed(const graph::Node& node, std::string_view field, const Value& value) {
  VolumeAssessment assessment;
  assessment.at_unity        = false;
  assessment.node_name       = DescriptiveName(node);
  assessment.node_id         = node.id;
  assessment.field           = std::string(field);
  assessment.offending_value = graph::ToJson(value);
  return assessment;
}

} // namespace

// ------------------------------------------------------------
// Names
// ------------------------------------------------------------

std::string DescriptiveName(const graph::Node& node) {
  for (const char* key : {"node.description", "application.name", "node.name"}) {
    auto name = graph::AsString(graph::FindField(node.props, key));
    if (name && !name->empty()) {
      return *name;
    }
  }
  return std::string(kUnknownSourceName);
}

std::string InternalName(const graph::Node& node) {
  return graph::AsString(graph::FindField(node.props, "node.name")).value_or("");
}

// ------------------------------------------------------------
// Sample rate
// ------------------------------------------------------------

std::optional<std::uint32_t> SampleRate(const graph::Node& node) {
  if (HasEntries(node.params, kActiveFormatGroup)) {
    const auto* format = FirstEntry(node.params, kActiveFormatGroup);
    if (format == nullptr) {
      return std::nullopt;
    }
    return model::ResolveRate(DecodeFormatLocation(*format));
  }

  if (const auto* format = FirstEntry(node.params, kEnumFormatGroup)) {
    return model::ResolveRate(DecodeRateEncoding(graph::FindField(*format, "rate")));
  }

  return std::nullopt;
}

// ------------------------------------------------------------
// Volume
// ------------------------------------------------------------

VolumeAssessment AssessVolume(const graph::Node& node) {
  VolumeAssessment assessment;
  assessment.node_id = node.id;

  const auto* entries = graph::FindList(node.params, kPropsGroup);
  if (entries == nullptr) {
    return assessment;
  }

  for (const auto& entry : entries->values()) {
    if (entry.kind_case() != Value::kStructValue) {
      continue;
    }
    const auto& props = entry.struct_value();

    if (const auto* volume = graph::FindField(props, "volume"); volume != nullptr && !IsUnity(*volume)) {
      return Failed(node, "volume", *volume);
    }

    // A non-list channelVolumes is malformed and carries no evidence either way.
    const auto* channel_volumes = graph::FindField(props, "channelVolumes");
    if (channel_volumes == nullptr || channel_volumes->kind_case() != Value::kListValue) {
      continue;
    }
    const auto& channels = channel_volumes->list_value();
    for (int i = 0; i < channels.values_size(); ++i) {
      if (!IsUnity(channels.values(i))) {
        return Failed(node, "channelVolumes[" + std::to_string(i) + "]", channels.values(i));
      }
    }
  }

  return assessment;
}

} // namespace pwaudit::attributes
