#pragma once

/**
 * @file marshaller.hpp
 * @brief Writes a MemoryGraph into a fresh store and reopens stores as views.
 */

#include "trigraph/graph_view.hpp"
#include "trigraph/mapped_storage.hpp"
#include "trigraph/memory_graph.hpp"
#include "trigraph/ops_registry.hpp"
#include "trigraph/stored_graph.hpp"

#include <memory>
#include <string>

namespace trigraph {

struct MarshalOptions {
  std::string node_path = "graph.nodes.graph";
  std::string edge_path; ///< Derived from node_path when empty
  std::string data_path; ///< Derived from node_path when empty

  std::shared_ptr<StorageProvider> provider; ///< FileStorageProvider if null
  std::shared_ptr<const OpsRegistry> ops;    ///< Checked on marshal, bound on unmarshal
  StoreOptions store;                        ///< Type registry, callbacks, read_only

  StorePaths paths() const;
};

class Marshaller {
public:
  explicit Marshaller(MarshalOptions options = {});

  /**
   * @brief Creates (or truncates) the three files and writes every node,
   * edge and the metadata entry in one transaction.
   *
   * With a registry configured, every op name must resolve in it first
   * (UnregisteredOperation otherwise).
   */
  Result<std::shared_ptr<StoredGraph>> marshal(const MemoryGraph &graph) const;

  const MarshalOptions &options() const noexcept { return options_; }

private:
  Status check_ops(const MemoryGraph &graph) const;

  MarshalOptions options_;
};

class Unmarshaller {
public:
  explicit Unmarshaller(MarshalOptions options = {});

  Result<std::shared_ptr<StoredGraph>> unmarshal() const;
  Result<StoredTree> unmarshal_tree() const;
  Result<StoredDecisionTree> unmarshal_decision_tree() const;
  Result<StoredExpressionGraph> unmarshal_expression_graph() const;

  /// Whichever view the stored kind calls for.
  Result<GraphView> unmarshal_view() const;

  const MarshalOptions &options() const noexcept { return options_; }

private:
  const OpsRegistry &ops() const;

  MarshalOptions options_;
};

} // namespace trigraph
