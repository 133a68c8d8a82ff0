#include "trigraph/stored_expression_graph.hpp"

#include "trigraph/graph_metadata.hpp"
#include "trigraph/log.hpp"
#include "trigraph/stored_tree.hpp"

#include <deque>
#include <map>
#include <unordered_set>

namespace trigraph {

Result<StoredExpressionGraph>
StoredExpressionGraph::open(std::shared_ptr<StoredGraph> graph,
                            const OpsRegistry &ops) {
  auto meta = require_metadata(*graph);
  if (!meta)
    return std::unexpected(meta.error());
  if (from_proto(meta->kind()) != GraphKind::ExpressionGraph)
    return fail(ErrorCode::InvalidArgument,
                std::string("store holds a ") +
                    to_string(from_proto(meta->kind())) +
                    " graph, not an expression graph");
  auto root = require_root(*graph, *meta);
  if (!root)
    return std::unexpected(root.error());

  StoredExpressionGraph view(std::move(graph), *root);
  for (const auto &[id, name] : meta->expression().node_ops()) {
    const ExpressionOp *op = ops.expression(name);
    if (!op) {
      log::warn("view", "expression op \"" + name + "\" is not registered");
      return fail(ErrorCode::UnregisteredOperation, name);
    }
    view.ops_.emplace(id, *op);
  }
  return view;
}

Result<StoredExpressionGraph::Schedule>
StoredExpressionGraph::schedule(int64_t start) const {
  if (!graph_->node_by_id(start))
    return fail(ErrorCode::NotFound, "node " + std::to_string(start));

  Schedule s;
  std::unordered_map<int64_t, std::vector<int64_t>> parents;
  std::unordered_map<int64_t, size_t> waiting;

  // Reachable subgraph with distinct children per node.
  std::vector<int64_t> frontier{start};
  s.children[start];
  while (!frontier.empty()) {
    int64_t id = frontier.back();
    frontier.pop_back();
    std::unordered_set<int64_t> seen;
    for (const NodeHandle &child : graph_->neighbors(id)) {
      if (!seen.insert(child.id).second)
        continue;
      s.children[id].push_back(child.id);
      parents[child.id].push_back(id);
      if (s.children.emplace(child.id, std::vector<int64_t>{}).second)
        frontier.push_back(child.id);
    }
  }

  // Kahn's algorithm, leaves first.
  std::deque<int64_t> ready;
  for (const auto &[id, kids] : s.children) {
    waiting[id] = kids.size();
    if (kids.empty())
      ready.push_back(id);
  }
  while (!ready.empty()) {
    int64_t id = ready.front();
    ready.pop_front();
    s.order.push_back(id);
    for (int64_t parent : parents[id]) {
      if (--waiting[parent] == 0)
        ready.push_back(parent);
    }
  }
  if (s.order.size() != s.children.size())
    return fail(ErrorCode::InconsistentState,
                "expression graph below node " + std::to_string(start) +
                    " contains a cycle");
  return s;
}

Result<std::vector<std::any>>
StoredExpressionGraph::compute(const std::vector<std::any> &inputs,
                               std::optional<int64_t> start) const {
  int64_t from = start.value_or(root_);
  auto plan = schedule(from);
  if (!plan)
    return std::unexpected(plan.error());

  std::vector<std::any> out;
  out.reserve(inputs.size());
  for (const std::any &input : inputs) {
    std::unordered_map<int64_t, std::any> values;
    for (int64_t id : plan->order) {
      auto op = ops_.find(id);
      if (op == ops_.end())
        return fail(ErrorCode::UnregisteredOperation,
                    "node " + std::to_string(id) + " has no operation");

      std::map<int64_t, std::any> args;
      for (int64_t child : plan->children.at(id))
        args.emplace(child, values.at(child));

      auto result = trigraph::invoke(op->second, input, args);
      if (!result)
        return std::unexpected(result.error());
      if (!result->second)
        return fail(ErrorCode::OperationFailed,
                    "operation at node " + std::to_string(id) + " failed");
      values[id] = std::move(result->first);
    }
    out.push_back(std::move(values.at(from)));
  }
  return out;
}

} // namespace trigraph
