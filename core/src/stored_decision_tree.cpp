#include "trigraph/stored_decision_tree.hpp"

#include "trigraph/graph_metadata.hpp"
#include "trigraph/log.hpp"

namespace trigraph {

Result<StoredDecisionTree>
StoredDecisionTree::open(std::shared_ptr<StoredGraph> graph,
                         const OpsRegistry &ops) {
  auto meta = require_metadata(*graph);
  if (!meta)
    return std::unexpected(meta.error());
  if (from_proto(meta->kind()) != GraphKind::DecisionTree)
    return fail(ErrorCode::InvalidArgument,
                std::string("store holds a ") +
                    to_string(from_proto(meta->kind())) +
                    " graph, not a decision tree");

  auto tree = StoredTree::open(std::move(graph));
  if (!tree)
    return std::unexpected(tree.error());
  StoredDecisionTree view(std::move(*tree));

  const pb::DecisionOps &wiring = meta->decision();
  for (const auto &[id, name] : wiring.node_ops()) {
    const DecisionNodeOp *op = ops.decision_node(name);
    if (!op) {
      log::warn("view", "decision node op \"" + name + "\" is not registered");
      return fail(ErrorCode::UnregisteredOperation, name);
    }
    view.node_ops_.emplace(id, *op);
  }
  for (const pb::EdgeOp &edge : wiring.edge_ops()) {
    const DecisionEdgeOp *op = ops.decision_edge(edge.op_name());
    if (!op) {
      log::warn("view", "decision edge op \"" + edge.op_name() +
                            "\" is not registered");
      return fail(ErrorCode::UnregisteredOperation, edge.op_name());
    }
    view.edge_ops_.emplace(std::make_pair(edge.parent_id(), edge.child_id()),
                           *op);
  }
  return view;
}

Result<std::vector<std::any>>
StoredDecisionTree::decide(const std::vector<std::any> &inputs,
                           std::optional<int64_t> start) const {
  int64_t from = start.value_or(root_);
  std::vector<std::any> out;
  out.reserve(inputs.size());
  for (size_t i = 0; i < inputs.size(); ++i) {
    std::unordered_set<int64_t> on_path;
    auto answer = decide_from(inputs[i], from, on_path);
    if (!answer)
      return fail(answer.error(), "input " + std::to_string(i));
    out.push_back(std::move(*answer));
  }
  return out;
}

Result<std::any>
StoredDecisionTree::decide_from(const std::any &input, int64_t node,
                                std::unordered_set<int64_t> &on_path) const {
  if (!graph_->node_by_id(node))
    return fail(ErrorCode::NotFound, "node " + std::to_string(node));
  if (!on_path.insert(node).second)
    return fail(ErrorCode::InconsistentState,
                "decision path revisits node " + std::to_string(node));

  if (auto it = node_ops_.find(node); it != node_ops_.end()) {
    auto result = trigraph::invoke(it->second, input);
    if (!result)
      return std::unexpected(result.error());
    if (result->second) {
      on_path.erase(node);
      return std::move(result->first);
    }
  }

  for (const EdgeHandle &edge : graph_->out_edges(node)) {
    if (auto it = edge_ops_.find({edge.from_id, edge.to_id});
        it != edge_ops_.end()) {
      auto accepted = trigraph::invoke(it->second, input);
      if (!accepted)
        return std::unexpected(accepted.error());
      if (!*accepted)
        continue;
    }
    auto answer = decide_from(input, edge.to_id, on_path);
    if (answer) {
      on_path.erase(node);
      return answer;
    }
    // A dead end below only rules out this branch.
    if (answer.error().code != ErrorCode::NoPath)
      return answer;
  }

  on_path.erase(node);
  return fail(ErrorCode::NoPath,
              "no path below node " + std::to_string(node) + " answers the input");
}

} // namespace trigraph
