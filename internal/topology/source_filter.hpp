#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/graph/graph_view.hpp"

namespace pwaudit::topology {

inline constexpr std::string_view kRunningState = "running";
inline constexpr std::string_view kNoState      = "<none>";

struct ExcludedSource {
  const graph::Node* node = nullptr;
  std::string        name;
  std::string        state;
};

struct FilterResult {
  std::vector<const graph::Node*> running;
  std::vector<ExcludedSource>     excluded;
};

// Stable partition on state == "running" (exact match).
FilterResult FilterRunning(const std::vector<const graph::Node*>& candidates);

} // namespace pwaudit::topology
