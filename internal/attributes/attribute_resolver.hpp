#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/graph/graph_view.hpp"

namespace pwaudit::attributes {

inline constexpr std::string_view kUnknownSourceName = "Unknown Source";

inline constexpr std::string_view kActiveFormatGroup = "Format";
inline constexpr std::string_view kEnumFormatGroup   = "EnumFormat";
inline constexpr std::string_view kPropsGroup        = "Props";

inline constexpr double kUnityVolume = 1.0;

/*
  Outcome of checking a node's volume properties.

  When at_unity is false the remaining fields describe the first offending
  Props entry: which field failed and its JSON value.
*/
struct VolumeAssessment {
  bool         at_unity = true;
  std::string  node_name;
  std::int64_t node_id = 0;
  std::string  field;
  std::string  offending_value;

  explicit operator bool() const {
    return at_unity;
  }
};

// node.description, then application.name, then node.name, then kUnknownSourceName.
std::string DescriptiveName(const graph::Node& node);

// Raw internal node.name, empty when absent.
std::string InternalName(const graph::Node& node);

/*
  Effective sample rate.

  The first "Format" entry wins when that group is non-empty, even if it
  yields nothing. Only an absent or empty "Format" falls back to the first
  "EnumFormat" entry.
*/
std::optional<std::uint32_t> SampleRate(const graph::Node& node);

/*
  Exact comparison against 1.0 for "volume" and every "channelVolumes"
  element of every "Props" entry. No Props group means at unity.
*/
VolumeAssessment AssessVolume(const graph::Node& node);

} // namespace pwaudit::attributes
