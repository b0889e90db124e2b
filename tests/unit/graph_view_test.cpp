#include "internal/graph/graph_view.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "tests/support/pw_dump_fixtures.hpp"

namespace {

using namespace pwaudit::testing;
using pwaudit::graph::GraphSnapshot;
using pwaudit::graph::GraphView;

void TestPartitionsNodesAndLinksByTypeSubstring() {
  const auto view = ViewOf(Dump({
      NodeJson(40, "alsa_output.usb-dac", "running"),
      R"({"id":1,"type":"PipeWire:Interface:Core","info":{}})",
      LinkJson(90, 41, 40),
      NodeJson(41, "firefox", "running"),
      R"({"id":2,"type":"PipeWire:Interface:Module","info":{}})",
  }));

  assert(view.Nodes().size() == 2);
  assert(view.Links().size() == 1);
  assert(view.Nodes()[0].id == 40);
  assert(view.Nodes()[1].id == 41);
  assert(view.FindNode(41) != nullptr);
  assert(view.FindNode(1) == nullptr);
  assert(view.FindNode(90) == nullptr);
  assert(view.FindLink(90) != nullptr);
  assert(view.FindLink(90)->output_node_id == 41);
  assert(view.FindLink(90)->input_node_id == 40);
}

void TestCompoundDiscriminatorIsClassifiedOnce() {
  const auto view = ViewOf(R"([{"id":7,"type":"Custom:NodeLink","info":{}}])");

  assert(view.Nodes().size() == 1);
  assert(view.Links().empty());
}

void TestEmptySnapshotYieldsEmptyIndices() {
  const auto view = GraphView::Build(GraphSnapshot{});

  assert(view.Empty());
  assert(view.Nodes().empty());
  assert(view.Links().empty());
}

void TestMalformedElementsAreDropped() {
  const auto view = ViewOf(R"([
    42,
    "text",
    null,
    {"type":"PipeWire:Interface:Node","info":{}},
    {"id":"12","type":"PipeWire:Interface:Node"},
    {"id":3.5,"type":"PipeWire:Interface:Link"},
    {"id":5},
    {"id":6,"type":17},
    {"id":8,"type":"PipeWire:Interface:Node","info":"broken"}
  ])");

  assert(view.Nodes().size() == 1);
  assert(view.Nodes()[0].id == 8);
  assert(view.Nodes()[0].props.fields().empty());
  assert(!view.Nodes()[0].state.has_value());
  assert(view.Links().empty());
}

void TestLinkWithoutEndpointsIsNotActionable() {
  const auto view = ViewOf(R"([
    {"id":1,"type":"PipeWire:Interface:Link","info":{"output-node-id":4}},
    {"id":2,"type":"PipeWire:Interface:Link"}
  ])");

  assert(view.Links().size() == 2);
  assert(!view.FindLink(1)->Actionable());
  assert(!view.FindLink(2)->Actionable());
}

void TestDuplicateIdReplacesDataButKeepsPosition() {
  const auto view = ViewOf(Dump({
      NodeJson(10, "first", "idle"),
      NodeJson(11, "other", "idle"),
      NodeJson(10, "second", "running"),
  }));

  assert(view.Nodes().size() == 2);
  assert(view.Nodes()[0].id == 10);
  assert(view.Nodes()[0].state == std::string("running"));
  assert(view.FindNode(10) == &view.Nodes()[0]);
}

} // namespace

int main() {
  TestPartitionsNodesAndLinksByTypeSubstring();
  TestCompoundDiscriminatorIsClassifiedOnce();
  TestEmptySnapshotYieldsEmptyIndices();
  TestMalformedElementsAreDropped();
  TestLinkWithoutEndpointsIsNotActionable();
  TestDuplicateIdReplacesDataButKeepsPosition();

  std::cout << "pwaudit_unit_graph_view: pass\n";
  return 0;
}
