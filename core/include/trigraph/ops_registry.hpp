#pragma once

/**
 * @file ops_registry.hpp
 * @brief Name -> operation table resolved when a specialized view opens.
 *
 * The store persists operation names only. Callers register the callables
 * under those names; views bind them eagerly and fail with
 * UnregisteredOperation for any name the registry lacks.
 *
 * Operations exchange std::any values. The typed adapters below unwrap
 * inputs with std::any_cast; a mismatched input surfaces from the view as
 * InvalidArgument.
 */

#include "trigraph/error.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace trigraph {

/// (value, true) answers the input; (_, false) defers to the edges.
using DecisionNodeOp = std::function<std::pair<std::any, bool>(const std::any &)>;

/// True when the edge accepts the input.
using DecisionEdgeOp = std::function<bool(const std::any &)>;

/// Receives the input and each child's output keyed by child id.
using ExpressionOp = std::function<std::pair<std::any, bool>(
    const std::any &, const std::map<int64_t, std::any> &)>;

class OpsRegistry {
public:
  void add_decision_node(std::string name, DecisionNodeOp op);
  void add_decision_edge(std::string name, DecisionEdgeOp op);
  void add_expression(std::string name, ExpressionOp op);

  const DecisionNodeOp *decision_node(std::string_view name) const;
  const DecisionEdgeOp *decision_edge(std::string_view name) const;
  const ExpressionOp *expression(std::string_view name) const;

  bool contains(std::string_view name) const;
  size_t size() const noexcept {
    return decision_nodes_.size() + decision_edges_.size() + expressions_.size();
  }

  // --- Typed adapters ---

  /// `fn(const In&) -> std::optional<Out>`
  template <typename In, typename Out, typename F>
  static DecisionNodeOp typed_decision_node(F fn) {
    return [fn = std::move(fn)](const std::any &in) -> std::pair<std::any, bool> {
      std::optional<Out> out = fn(std::any_cast<const In &>(in));
      if (!out)
        return {std::any{}, false};
      return {std::any(std::move(*out)), true};
    };
  }

  /// `fn(const In&) -> bool`
  template <typename In, typename F> static DecisionEdgeOp typed_decision_edge(F fn) {
    return [fn = std::move(fn)](const std::any &in) -> bool {
      return fn(std::any_cast<const In &>(in));
    };
  }

  /// `fn(const In&, const std::map<int64_t, Out>&) -> std::optional<Out>`
  template <typename In, typename Out, typename F>
  static ExpressionOp typed_expression(F fn) {
    return [fn = std::move(fn)](const std::any &in,
                                const std::map<int64_t, std::any> &children)
               -> std::pair<std::any, bool> {
      std::map<int64_t, Out> typed;
      for (const auto &[id, value] : children)
        typed.emplace(id, std::any_cast<const Out &>(value));
      std::optional<Out> out = fn(std::any_cast<const In &>(in), typed);
      if (!out)
        return {std::any{}, false};
      return {std::any(std::move(*out)), true};
    };
  }

private:
  std::map<std::string, DecisionNodeOp, std::less<>> decision_nodes_;
  std::map<std::string, DecisionEdgeOp, std::less<>> decision_edges_;
  std::map<std::string, ExpressionOp, std::less<>> expressions_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Invocation with std::bad_any_cast mapped to InvalidArgument
// ═══════════════════════════════════════════════════════════════════════════

Result<std::pair<std::any, bool>> invoke(const DecisionNodeOp &op,
                                         const std::any &input);
Result<bool> invoke(const DecisionEdgeOp &op, const std::any &input);
Result<std::pair<std::any, bool>>
invoke(const ExpressionOp &op, const std::any &input,
       const std::map<int64_t, std::any> &children);

} // namespace trigraph
