#pragma once

#include "trigraph/ops_registry.hpp"
#include "trigraph/stored_tree.hpp"

#include <any>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trigraph {

/**
 * @brief Tree whose nodes and edges carry named decision operations.
 *
 * Operations are bound from the registry when the view opens; the view
 * keeps its own copies, so the registry need not outlive it.
 */
class StoredDecisionTree : public StoredTree {
public:
  /// UnregisteredOperation naming the first op the registry lacks.
  static Result<StoredDecisionTree> open(std::shared_ptr<StoredGraph> graph,
                                         const OpsRegistry &ops);

  /**
   * @brief Walks from `start` (default: root) once per input.
   *
   * Depth-first: at each node the node op may answer. Otherwise every
   * outgoing edge (record order) whose op accepts the input is tried in
   * turn, and the first subtree that answers wins; an edge without an op
   * accepts everything. NoPath when no accepting path answers. Op errors
   * abort the search.
   */
  Result<std::vector<std::any>>
  decide(const std::vector<std::any> &inputs,
         std::optional<int64_t> start = std::nullopt) const;

  size_t node_op_count() const noexcept { return node_ops_.size(); }
  size_t edge_op_count() const noexcept { return edge_ops_.size(); }

private:
  StoredDecisionTree(StoredTree tree) : StoredTree(std::move(tree)) {}

  Result<std::any> decide_from(const std::any &input, int64_t node,
                               std::unordered_set<int64_t> &on_path) const;

  std::unordered_map<int64_t, DecisionNodeOp> node_ops_;
  std::map<std::pair<int64_t, int64_t>, DecisionEdgeOp> edge_ops_;
};

} // namespace trigraph
