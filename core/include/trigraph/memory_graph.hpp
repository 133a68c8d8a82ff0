#pragma once

/**
 * @file memory_graph.hpp
 * @brief Heap-resident graph description handed to the Marshaller.
 *
 * Node ids are assigned sequentially from 1, which is also the order a
 * freshly created store mints them in.
 */

#include "trigraph/codec.hpp"
#include "trigraph/error.hpp"
#include "trigraph/payload.hpp"

#include "graph_metadata.pb.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trigraph {

struct MemoryNode {
  int64_t id = 0;
  std::optional<Payload> data;
};

struct MemoryEdge {
  int64_t from = 0;
  int64_t to = 0;
  std::optional<Payload> data;
};

class MemoryGraph {
public:
  explicit MemoryGraph(GraphKind kind = GraphKind::Generic) : kind_(kind) {}

  int64_t add_node(std::optional<Payload> data = std::nullopt);

  /// NotFound unless both endpoints were added.
  Status add_edge(int64_t from, int64_t to,
                  std::optional<Payload> data = std::nullopt);

  bool contains(int64_t id) const noexcept {
    return id >= 1 && static_cast<size_t>(id) <= nodes_.size();
  }

  GraphKind kind() const noexcept { return kind_; }
  void set_kind(GraphKind kind) noexcept { kind_ = kind; }

  Status set_root(int64_t id);
  std::optional<int64_t> root() const noexcept { return root_; }

  /// First node without incoming edges, in id order.
  std::optional<int64_t> derive_root() const;

  void set_tree_type(std::string type) { tree_type_ = std::move(type); }
  const std::optional<std::string> &tree_type() const noexcept {
    return tree_type_;
  }

  /// Decision-node or expression op name, depending on the kind.
  Status set_node_op(int64_t id, std::string name);
  Status set_edge_op(int64_t from, int64_t to, std::string name);

  const std::vector<MemoryNode> &nodes() const noexcept { return nodes_; }
  const std::vector<MemoryEdge> &edges() const noexcept { return edges_; }
  const std::map<int64_t, std::string> &node_ops() const noexcept {
    return node_ops_;
  }
  const std::map<std::pair<int64_t, int64_t>, std::string> &edge_ops() const noexcept {
    return edge_ops_;
  }

  /// Metadata message for the stored form. Tree kinds without an explicit
  /// root record the derived one.
  pb::GraphMetadata metadata() const;

private:
  GraphKind kind_;
  std::vector<MemoryNode> nodes_;
  std::vector<MemoryEdge> edges_;
  std::optional<int64_t> root_;
  std::optional<std::string> tree_type_;
  std::map<int64_t, std::string> node_ops_;
  std::map<std::pair<int64_t, int64_t>, std::string> edge_ops_;
};

} // namespace trigraph
