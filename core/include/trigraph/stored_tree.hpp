#pragma once

#include "trigraph/error.hpp"
#include "trigraph/stored_graph.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trigraph {

/**
 * @brief Rooted view over a store whose metadata records a root id.
 *
 * Acyclicity is not enforced; the metadata is trusted. Also the base of
 * StoredDecisionTree.
 */
class StoredTree {
public:
  /// InvalidArgument unless the kind is tree or decision tree;
  /// InconsistentState when the root is missing or not a live node.
  static Result<StoredTree> open(std::shared_ptr<StoredGraph> graph);

  int64_t root() const noexcept { return root_; }

  /// Longest edge path from the root. Edges back into the current path are
  /// ignored.
  uint64_t height() const;

  uint64_t node_count() const { return graph_->node_count(); }

  std::vector<int64_t> children(int64_t id) const;

  /// Empty when the metadata carries none.
  const std::string &tree_type() const noexcept { return tree_type_; }

  const std::shared_ptr<StoredGraph> &graph() const noexcept { return graph_; }

protected:
  StoredTree(std::shared_ptr<StoredGraph> graph, int64_t root,
             std::string tree_type)
      : graph_(std::move(graph)), root_(root), tree_type_(std::move(tree_type)) {}

  std::shared_ptr<StoredGraph> graph_;
  int64_t root_ = 0;
  std::string tree_type_;
};

/// Metadata and root lookups shared by the rooted views.
Result<pb::GraphMetadata> require_metadata(const StoredGraph &graph);
Result<int64_t> require_root(const StoredGraph &graph,
                             const pb::GraphMetadata &meta);

} // namespace trigraph
