#include "trigraph/memory_graph.hpp"

#include "trigraph/graph_metadata.hpp"

#include <unordered_set>

namespace trigraph {

int64_t MemoryGraph::add_node(std::optional<Payload> data) {
  int64_t id = static_cast<int64_t>(nodes_.size()) + 1;
  nodes_.push_back(MemoryNode{id, std::move(data)});
  return id;
}

Status MemoryGraph::add_edge(int64_t from, int64_t to,
                             std::optional<Payload> data) {
  if (!contains(from))
    return fail(ErrorCode::NotFound, "edge source node " + std::to_string(from));
  if (!contains(to))
    return fail(ErrorCode::NotFound, "edge target node " + std::to_string(to));
  edges_.push_back(MemoryEdge{from, to, std::move(data)});
  return {};
}

Status MemoryGraph::set_root(int64_t id) {
  if (!contains(id))
    return fail(ErrorCode::NotFound, "root node " + std::to_string(id));
  root_ = id;
  return {};
}

std::optional<int64_t> MemoryGraph::derive_root() const {
  std::unordered_set<int64_t> targets;
  for (const MemoryEdge &e : edges_)
    targets.insert(e.to);
  for (const MemoryNode &n : nodes_) {
    if (!targets.count(n.id))
      return n.id;
  }
  return std::nullopt;
}

Status MemoryGraph::set_node_op(int64_t id, std::string name) {
  if (!contains(id))
    return fail(ErrorCode::NotFound, "node " + std::to_string(id));
  node_ops_[id] = std::move(name);
  return {};
}

Status MemoryGraph::set_edge_op(int64_t from, int64_t to, std::string name) {
  for (const MemoryEdge &e : edges_) {
    if (e.from == from && e.to == to) {
      edge_ops_[{from, to}] = std::move(name);
      return {};
    }
  }
  return fail(ErrorCode::NotFound, "edge " + std::to_string(from) + " -> " +
                                       std::to_string(to));
}

pb::GraphMetadata MemoryGraph::metadata() const {
  pb::GraphMetadata meta;
  meta.set_kind(to_proto(kind_));

  std::optional<int64_t> root = root_;
  if (!root && kind_ != GraphKind::Generic)
    root = derive_root();
  if (root)
    meta.set_root_id(*root);
  if (tree_type_)
    meta.set_tree_type(*tree_type_);

  if (kind_ == GraphKind::DecisionTree) {
    pb::DecisionOps *wiring = meta.mutable_decision();
    for (const auto &[id, name] : node_ops_)
      (*wiring->mutable_node_ops())[id] = name;
    for (const auto &[endpoints, name] : edge_ops_) {
      pb::EdgeOp *op = wiring->add_edge_ops();
      op->set_parent_id(endpoints.first);
      op->set_child_id(endpoints.second);
      op->set_op_name(name);
    }
  } else if (kind_ == GraphKind::ExpressionGraph) {
    pb::ExpressionOps *wiring = meta.mutable_expression();
    for (const auto &[id, name] : node_ops_)
      (*wiring->mutable_node_ops())[id] = name;
    if (root)
      wiring->set_root_id(*root);
  }
  return meta;
}

} // namespace trigraph
