#include "internal/topology/topology_resolver.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "tests/support/pw_dump_fixtures.hpp"

namespace {

using namespace pwaudit::testing;
using pwaudit::topology::ConnectedUpstreamNodes;

std::vector<std::int64_t> Ids(const std::vector<const pwaudit::graph::Node*>& nodes) {
  std::vector<std::int64_t> ids;
  for (const auto* node : nodes) {
    ids.push_back(node->id);
  }
  return ids;
}

void TestCollectsDistinctUpstreamNodes() {
  // Stereo streams carry one link per channel.
  const auto view = ViewOf(Dump({
      NodeJson(40, "sink", "running"),
      NodeJson(41, "firefox", "running"),
      NodeJson(42, "mpv", "idle"),
      NodeJson(43, "unrelated", "running"),
      LinkJson(100, 41, 40),
      LinkJson(101, 41, 40),
      LinkJson(102, 42, 40),
      LinkJson(103, 43, 99),
      LinkJson(104, 40, 43),
  }));

  const auto ids = Ids(ConnectedUpstreamNodes(view, 40));
  assert((ids == std::vector<std::int64_t>{41, 42}));
}

void TestDanglingOutputEndpointIsDropped() {
  const auto view = ViewOf(Dump({
      NodeJson(40, "sink", "running"),
      LinkJson(100, 77, 40),
  }));

  assert(ConnectedUpstreamNodes(view, 40).empty());
}

void TestTargetWithoutInboundLinksHasNoUpstream() {
  const auto view = ViewOf(Dump({
      NodeJson(40, "sink", "running"),
      NodeJson(41, "firefox", "running"),
      LinkJson(100, 40, 41),
  }));

  assert(ConnectedUpstreamNodes(view, 40).empty());
}

void TestLinksMissingEndpointsAreIgnored() {
  const auto view = ViewOf(Dump({
      NodeJson(40, "sink", "running"),
      NodeJson(41, "firefox", "running"),
      R"({"id":100,"type":"PipeWire:Interface:Link","info":{"input-node-id":40}})",
      R"({"id":101,"type":"PipeWire:Interface:Link","info":{"output-node-id":41}})",
  }));

  assert(ConnectedUpstreamNodes(view, 40).empty());
}

} // namespace

int main() {
  TestCollectsDistinctUpstreamNodes();
  TestDanglingOutputEndpointIsDropped();
  TestTargetWithoutInboundLinksHasNoUpstream();
  TestLinksMissingEndpointsAreIgnored();

  std::cout << "pwaudit_unit_topology_resolver: pass\n";
  return 0;
}
