#include "trigraph/graph_view.hpp"

namespace trigraph {

Result<GraphView> open_view(std::shared_ptr<StoredGraph> graph,
                            const OpsRegistry *ops) {
  static const OpsRegistry empty;
  const OpsRegistry &registry = ops ? *ops : empty;

  switch (graph->kind()) {
  case GraphKind::Tree: {
    auto tree = StoredTree::open(std::move(graph));
    if (!tree)
      return std::unexpected(tree.error());
    return GraphView(std::in_place_type<StoredTree>, std::move(*tree));
  }
  case GraphKind::DecisionTree: {
    auto tree = StoredDecisionTree::open(std::move(graph), registry);
    if (!tree)
      return std::unexpected(tree.error());
    return GraphView(std::in_place_type<StoredDecisionTree>, std::move(*tree));
  }
  case GraphKind::ExpressionGraph: {
    auto expr = StoredExpressionGraph::open(std::move(graph), registry);
    if (!expr)
      return std::unexpected(expr.error());
    return GraphView(std::in_place_type<StoredExpressionGraph>,
                     std::move(*expr));
  }
  case GraphKind::Generic:
    break;
  }
  return GraphView(std::move(graph));
}

} // namespace trigraph
