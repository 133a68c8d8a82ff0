#pragma once

#include "trigraph/ops_registry.hpp"
#include "trigraph/stored_decision_tree.hpp"
#include "trigraph/stored_expression_graph.hpp"
#include "trigraph/stored_graph.hpp"
#include "trigraph/stored_tree.hpp"

#include <memory>
#include <variant>

namespace trigraph {

using GraphView = std::variant<std::shared_ptr<StoredGraph>, StoredTree,
                               StoredDecisionTree, StoredExpressionGraph>;

/**
 * @brief The view matching the store's recorded kind.
 *
 * Generic stores (and stores without metadata) yield the StoredGraph
 * itself. `ops` may be null when no operations are registered.
 */
Result<GraphView> open_view(std::shared_ptr<StoredGraph> graph,
                            const OpsRegistry *ops = nullptr);

} // namespace trigraph
