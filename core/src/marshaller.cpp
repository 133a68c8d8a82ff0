#include "trigraph/marshaller.hpp"

#include "trigraph/file_storage.hpp"
#include "trigraph/log.hpp"
#include "trigraph/transaction.hpp"

namespace trigraph {

namespace {

std::shared_ptr<StorageProvider>
provider_or_default(const std::shared_ptr<StorageProvider> &provider) {
  if (provider)
    return provider;
  return std::make_shared<FileStorageProvider>();
}

} // namespace

StorePaths MarshalOptions::paths() const {
  StorePaths p = StorePaths::from_node_path(node_path);
  if (!edge_path.empty())
    p.edges = edge_path;
  if (!data_path.empty())
    p.data = data_path;
  return p;
}

// ═══════════════════════════════════════════════════════════════════════════
// Marshaller
// ═══════════════════════════════════════════════════════════════════════════

Marshaller::Marshaller(MarshalOptions options) : options_(std::move(options)) {}

Status Marshaller::check_ops(const MemoryGraph &graph) const {
  if (!options_.ops)
    return {};
  const OpsRegistry &ops = *options_.ops;

  if (graph.kind() == GraphKind::DecisionTree) {
    for (const auto &[id, name] : graph.node_ops()) {
      if (!ops.decision_node(name))
        return fail(ErrorCode::UnregisteredOperation, name);
    }
    for (const auto &[endpoints, name] : graph.edge_ops()) {
      if (!ops.decision_edge(name))
        return fail(ErrorCode::UnregisteredOperation, name);
    }
  } else if (graph.kind() == GraphKind::ExpressionGraph) {
    for (const auto &[id, name] : graph.node_ops()) {
      if (!ops.expression(name))
        return fail(ErrorCode::UnregisteredOperation, name);
    }
  }
  return {};
}

Result<std::shared_ptr<StoredGraph>>
Marshaller::marshal(const MemoryGraph &graph) const {
  if (auto r = check_ops(graph); !r)
    return std::unexpected(r.error());

  StoreOptions store = options_.store;
  store.read_only = false;
  auto stored = StoredGraph::create(provider_or_default(options_.provider),
                                    options_.paths(), std::move(store),
                                    graph.kind());
  if (!stored)
    return std::unexpected(stored.error());

  auto txn = (*stored)->begin_transaction();
  if (!txn)
    return std::unexpected(txn.error());

  for (const MemoryNode &node : graph.nodes()) {
    auto id = txn->add_node(node.data);
    if (!id)
      return std::unexpected(id.error());
    if (*id != node.id)
      return fail(ErrorCode::InconsistentState,
                  "fresh store minted id " + std::to_string(*id) +
                      " for node " + std::to_string(node.id));
  }
  for (const MemoryEdge &edge : graph.edges()) {
    if (auto r = txn->add_edge(edge.from, edge.to, edge.data); !r)
      return std::unexpected(r.error());
  }
  if (auto r = txn->set_metadata(graph.metadata()); !r)
    return std::unexpected(r.error());
  if (auto r = txn->commit(); !r)
    return std::unexpected(r.error());

  log::info("marshal", "wrote " + std::to_string(graph.nodes().size()) +
                           " nodes and " + std::to_string(graph.edges().size()) +
                           " edges to " + options_.node_path);
  return stored;
}

// ═══════════════════════════════════════════════════════════════════════════
// Unmarshaller
// ═══════════════════════════════════════════════════════════════════════════

Unmarshaller::Unmarshaller(MarshalOptions options)
    : options_(std::move(options)) {}

const OpsRegistry &Unmarshaller::ops() const {
  static const OpsRegistry empty;
  return options_.ops ? *options_.ops : empty;
}

Result<std::shared_ptr<StoredGraph>> Unmarshaller::unmarshal() const {
  return StoredGraph::open(provider_or_default(options_.provider),
                           options_.paths(), options_.store);
}

Result<StoredTree> Unmarshaller::unmarshal_tree() const {
  auto graph = unmarshal();
  if (!graph)
    return std::unexpected(graph.error());
  return StoredTree::open(std::move(*graph));
}

Result<StoredDecisionTree> Unmarshaller::unmarshal_decision_tree() const {
  auto graph = unmarshal();
  if (!graph)
    return std::unexpected(graph.error());
  return StoredDecisionTree::open(std::move(*graph), ops());
}

Result<StoredExpressionGraph> Unmarshaller::unmarshal_expression_graph() const {
  auto graph = unmarshal();
  if (!graph)
    return std::unexpected(graph.error());
  return StoredExpressionGraph::open(std::move(*graph), ops());
}

Result<GraphView> Unmarshaller::unmarshal_view() const {
  auto graph = unmarshal();
  if (!graph)
    return std::unexpected(graph.error());
  return open_view(std::move(*graph), options_.ops.get());
}

} // namespace trigraph
