#pragma once

#include <cstdint>
#include <vector>

#include "internal/graph/graph_view.hpp"

namespace pwaudit::topology {

/*
  Distinct nodes feeding the target: every link whose input endpoint is
  target_id contributes its output endpoint. Endpoints with no node in the
  view are dropped. Order follows the first link that names each node.

  The returned pointers borrow from view.
*/
std::vector<const graph::Node*> ConnectedUpstreamNodes(const graph::GraphView& view, std::int64_t target_id);

} // namespace pwaudit::topology
