#include "internal/topology/source_filter.hpp"

#include "internal/attributes/attribute_resolver.hpp"

namespace pwaudit::topology {

FilterResult FilterRunning(const std::vector<const graph::Node*>& candidates) {
  FilterResult result;

  for (const auto* node : candidates) {
    if (node->state && *node->state == kRunningState) {
      result.running.push_back(node);
      continue;
    }

    ExcludedSource excluded;
    excluded.node  = node;
    excluded.name  = attributes::DescriptiveName(*node);
    excluded.state = node->state.value_or(std::string(kNoState));
    result.excluded.push_back(std::move(excluded));
  }

  return result;
}

} // namespace pwaudit::topology
