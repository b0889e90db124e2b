#include "internal/graph/graph_view.hpp"

#include "internal/graph/value_access.hpp"

namespace pwaudit::graph {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

enum class ElementKind { kNode, kLink, kOther };

ElementKind Classify(const Struct& element) {
  const auto type = AsString(FindField(element, "type")).value_or("");
  if (type.find("Node") != std::string::npos) {
    return ElementKind::kNode;
  }
  if (type.find("Link") != std::string::npos) {
    return ElementKind::kLink;
  }
  return ElementKind::kOther;
}

Node DecodeNode(std::int64_t id, const Struct& element) {
  Node node;
  node.id = id;

  const auto* info = FindStruct(element, "info");
  if (info == nullptr) {
    return node;
  }

  if (const auto* props = FindStruct(*info, "props")) {
    node.props = *props;
  }
  if (const auto* params = FindStruct(*info, "params")) {
    node.params = *params;
  }
  node.state = AsString(FindField(*info, "state"));
  return node;
}

Link DecodeLink(std::int64_t id, const Struct& element) {
  Link link;
  link.id = id;

  const auto* info = FindStruct(element, "info");
  if (info == nullptr) {
    return link;
  }

  link.output_node_id = AsInteger(FindField(*info, "output-node-id"));
  link.input_node_id  = AsInteger(FindField(*info, "input-node-id"));
  return link;
}

} // namespace

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

GraphView GraphView::Build(const GraphSnapshot& snapshot) {
  GraphView view;

  for (const auto& value : snapshot.values()) {
    if (value.kind_case() != Value::kStructValue) {
      continue;
    }

    const auto& element = value.struct_value();
    const auto  id      = AsInteger(FindField(element, "id"));
    if (!id) {
      continue;
    }

    switch (Classify(element)) {
      case ElementKind::kNode:
        view.AddNode(DecodeNode(*id, element));
        break;
      case ElementKind::kLink:
        view.AddLink(DecodeLink(*id, element));
        break;
      case ElementKind::kOther:
        break;
    }
  }

  return view;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

const Node* GraphView::FindNode(std::int64_t id) const {
  auto it = node_index_.find(id);
  if (it == node_index_.end()) {
    return nullptr;
  }
  return &nodes_[it->second];
}

const Link* GraphView::FindLink(std::int64_t id) const {
  auto it = link_index_.find(id);
  if (it == link_index_.end()) {
    return nullptr;
  }
  return &links_[it->second];
}

void GraphView::AddNode(Node node) {
  auto [it, inserted] = node_index_.try_emplace(node.id, nodes_.size());
  if (!inserted) {
    nodes_[it->second] = std::move(node);
    return;
  }
  nodes_.push_back(std::move(node));
}

void GraphView::AddLink(Link link) {
  auto [it, inserted] = link_index_.try_emplace(link.id, links_.size());
  if (!inserted) {
    links_[it->second] = std::move(link);
    return;
  }
  links_.push_back(std::move(link));
}

} // namespace pwaudit::graph
