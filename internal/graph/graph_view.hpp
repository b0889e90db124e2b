#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace pwaudit::graph {

/*
  One pw-dump invocation's output: a JSON array of heterogeneous objects,
  each tagged with "type" and "id".
*/
using GraphSnapshot = google::protobuf::ListValue;

struct Node {
  std::int64_t id = 0;

  // info.props: node.name, node.description, application.name, ...
  google::protobuf::Struct props;

  // info.state: "running", "suspended", "idle", ... Absent when not reported.
  std::optional<std::string> state;

  // info.params: parameter groups ("Format", "EnumFormat", "Props", ...).
  google::protobuf::Struct params;
};

struct Link {
  std::int64_t id = 0;

  std::optional<std::int64_t> output_node_id;
  std::optional<std::int64_t> input_node_id;

  bool Actionable() const {
    return output_node_id.has_value() && input_node_id.has_value();
  }
};

/*
  Read-only index over a GraphSnapshot.

  Elements whose type contains "Node" land in the node index, otherwise those
  containing "Link" land in the link index; everything else is dropped.
  A repeated id replaces the earlier element's data but keeps its position.
  The view copies what it needs, so it does not borrow from the snapshot.
*/
class GraphView {
 public:
  static GraphView Build(const GraphSnapshot& snapshot);

  // Snapshot order.
  const std::vector<Node>& Nodes() const {
    return nodes_;
  }
  const std::vector<Link>& Links() const {
    return links_;
  }

  const Node* FindNode(std::int64_t id) const;
  const Link* FindLink(std::int64_t id) const;

  bool Empty() const {
    return nodes_.empty() && links_.empty();
  }

 private:
  void AddNode(Node node);
  void AddLink(Link link);

  std::vector<Node> nodes_;
  std::vector<Link> links_;
  std::unordered_map<std::int64_t, std::size_t> node_index_;
  std::unordered_map<std::int64_t, std::size_t> link_index_;
};

} // namespace pwaudit::graph
