#pragma once

#include "trigraph/ops_registry.hpp"
#include "trigraph/stored_graph.hpp"

#include <any>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace trigraph {

/**
 * @brief Rooted DAG evaluated bottom-up with named expression operations.
 *
 * compute() evaluates the subgraph reachable from the start node in
 * topological order (children first). Each op receives the input and its
 * children's outputs keyed by child id.
 *
 * Errors: UnregisteredOperation for a reachable node without an op,
 * OperationFailed when an op reports failure, InconsistentState on a cycle.
 */
class StoredExpressionGraph {
public:
  static Result<StoredExpressionGraph> open(std::shared_ptr<StoredGraph> graph,
                                            const OpsRegistry &ops);

  Result<std::vector<std::any>>
  compute(const std::vector<std::any> &inputs,
          std::optional<int64_t> start = std::nullopt) const;

  int64_t root() const noexcept { return root_; }
  size_t op_count() const noexcept { return ops_.size(); }
  const std::shared_ptr<StoredGraph> &graph() const noexcept { return graph_; }

private:
  StoredExpressionGraph(std::shared_ptr<StoredGraph> graph, int64_t root)
      : graph_(std::move(graph)), root_(root) {}

  struct Schedule {
    std::vector<int64_t> order; ///< Children before parents
    std::unordered_map<int64_t, std::vector<int64_t>> children;
  };

  Result<Schedule> schedule(int64_t start) const;

  std::shared_ptr<StoredGraph> graph_;
  int64_t root_ = 0;
  std::unordered_map<int64_t, ExpressionOp> ops_;
};

} // namespace trigraph
