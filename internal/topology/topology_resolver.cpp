#include "internal/topology/topology_resolver.hpp"

#include <unordered_set>

namespace pwaudit::topology {

std::vector<const graph::Node*> ConnectedUpstreamNodes(const graph::GraphView& view, std::int64_t target_id) {
  std::vector<const graph::Node*> upstream;
  std::unordered_set<std::int64_t> seen;

  for (const auto& link : view.Links()) {
    if (!link.Actionable() || *link.input_node_id != target_id) {
      continue;
    }

    const auto source_id = *link.output_node_id;
    if (!seen.insert(source_id).second) {
      continue;
    }

    if (const auto* node = view.FindNode(source_id)) {
      upstream.push_back(node);
    }
  }

  return upstream;
}

} // namespace pwaudit::topology
