#include "trigraph/ops_registry.hpp"

#include <typeinfo>

namespace trigraph {

namespace {

template <typename Map>
auto find_op(const Map &ops, std::string_view name)
    -> const typename Map::mapped_type * {
  auto it = ops.find(name);
  return it == ops.end() ? nullptr : &it->second;
}

std::unexpected<Error> bad_input(const std::bad_any_cast &e) {
  return fail(ErrorCode::InvalidArgument,
              std::string("operation input has the wrong type: ") + e.what());
}

} // namespace

void OpsRegistry::add_decision_node(std::string name, DecisionNodeOp op) {
  decision_nodes_.insert_or_assign(std::move(name), std::move(op));
}

void OpsRegistry::add_decision_edge(std::string name, DecisionEdgeOp op) {
  decision_edges_.insert_or_assign(std::move(name), std::move(op));
}

void OpsRegistry::add_expression(std::string name, ExpressionOp op) {
  expressions_.insert_or_assign(std::move(name), std::move(op));
}

const DecisionNodeOp *OpsRegistry::decision_node(std::string_view name) const {
  return find_op(decision_nodes_, name);
}

const DecisionEdgeOp *OpsRegistry::decision_edge(std::string_view name) const {
  return find_op(decision_edges_, name);
}

const ExpressionOp *OpsRegistry::expression(std::string_view name) const {
  return find_op(expressions_, name);
}

bool OpsRegistry::contains(std::string_view name) const {
  return decision_node(name) || decision_edge(name) || expression(name);
}

Result<std::pair<std::any, bool>> invoke(const DecisionNodeOp &op,
                                         const std::any &input) {
  try {
    return op(input);
  } catch (const std::bad_any_cast &e) {
    return bad_input(e);
  }
}

Result<bool> invoke(const DecisionEdgeOp &op, const std::any &input) {
  try {
    return op(input);
  } catch (const std::bad_any_cast &e) {
    return bad_input(e);
  }
}

Result<std::pair<std::any, bool>>
invoke(const ExpressionOp &op, const std::any &input,
       const std::map<int64_t, std::any> &children) {
  try {
    return op(input, children);
  } catch (const std::bad_any_cast &e) {
    return bad_input(e);
  }
}

} // namespace trigraph
