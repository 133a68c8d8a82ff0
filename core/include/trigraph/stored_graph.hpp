#pragma once

/**
 * @file stored_graph.hpp
 * @brief Graph view served directly from the three mapped store files.
 *
 * Nothing is materialized on the heap except two id-keyed indexes:
 *   - node id       -> node record index
 *   - source / target node id -> edge record indexes (record order)
 * Records and payloads are decoded from the mapped regions on demand.
 *
 * Concurrency: one writer (Transaction or defragment) and any number of
 * readers. Readers take the shared lock per call; a commit publishes under
 * the exclusive lock. A NeighborRange is not locked and must not be held
 * across a commit.
 */

#include "trigraph/codec.hpp"
#include "trigraph/data_section.hpp"
#include "trigraph/error.hpp"
#include "trigraph/format.hpp"
#include "trigraph/mapped_storage.hpp"
#include "trigraph/payload.hpp"

#include "graph_metadata.pb.h"

#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace trigraph {

class Transaction;

// ═══════════════════════════════════════════════════════════════════════════
// Paths, handles, callbacks, options
// ═══════════════════════════════════════════════════════════════════════════

struct StorePaths {
  std::string nodes;
  std::string edges;
  std::string data;

  /// "<base>.nodes.graph" -> "<base>.edges.graph", "<base>.data.graph".
  /// A node path without that suffix is used as the base itself.
  static StorePaths from_node_path(const std::string &node_path);
};

/// Snapshot of one node record.
struct NodeHandle {
  int64_t id = 0;
  uint64_t index = 0;
  uint64_t data_offset = 0;
  uint8_t flags = 0;
};

/// Snapshot of one edge record. Edge ids are 1-based record indexes.
struct EdgeHandle {
  uint64_t index = 0;
  int64_t from_id = 0;
  int64_t to_id = 0;
  uint32_t data_offset = 0;
  uint8_t flags = 0;

  uint64_t id() const noexcept { return index + 1; }
};

using EqualFn = std::function<bool(const NodeHandle &, const NodeHandle &)>;
using CompareFn = std::function<int(const NodeHandle &, const NodeHandle &)>;
using CostFn = std::function<float(const NodeHandle &, const NodeHandle &)>;

struct StoreOptions {
  std::shared_ptr<const TypeRegistry> types; ///< Protobuf payload prototypes
  EqualFn equal;     ///< Default: id equality
  CompareFn compare; ///< Default: id ordering (-1 / 0 / 1)
  CostFn cost;       ///< Default: numeric or protobuf "cost" edge payload
  bool read_only = false;
  bool validate_types = false; ///< Reject unregistered protobuf payloads
};

class StoredGraph;

// ═══════════════════════════════════════════════════════════════════════════
// NeighborRange: lazy, non-allocating, single pass
// ═══════════════════════════════════════════════════════════════════════════

class NeighborRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = NodeHandle;
    using difference_type = std::ptrdiff_t;
    using pointer = const NodeHandle *;
    using reference = const NodeHandle &;

    iterator() = default;
    iterator(const StoredGraph *g, const uint64_t *cur, const uint64_t *end)
        : graph_(g), cur_(cur), end_(end) {
      settle();
    }

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++() {
      ++cur_;
      settle();
      return *this;
    }
    void operator++(int) { ++*this; }
    bool operator==(const iterator &o) const { return cur_ == o.cur_; }

  private:
    void settle();

    const StoredGraph *graph_ = nullptr;
    const uint64_t *cur_ = nullptr;
    const uint64_t *end_ = nullptr;
    NodeHandle current_{};
  };

  NeighborRange() = default;
  NeighborRange(const StoredGraph *g, const uint64_t *first, const uint64_t *last)
      : graph_(g), first_(first), last_(last) {}

  iterator begin() const { return iterator(graph_, first_, last_); }
  iterator end() const { return iterator(graph_, last_, last_); }

private:
  const StoredGraph *graph_ = nullptr;
  const uint64_t *first_ = nullptr;
  const uint64_t *last_ = nullptr;
};

// ═══════════════════════════════════════════════════════════════════════════
// StoredGraph
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Always owned through `std::shared_ptr`; transactions and views share that
 * ownership, so the store outlives every handle taken from it.
 */
class StoredGraph : public std::enable_shared_from_this<StoredGraph> {
public:
  /**
   * @brief Opens an existing store.
   *
   * Finishes an interrupted defragmentation swap first (writable opens
   * only). Fails with Format on bad magic, version or checksum and with
   * InconsistentState when counts or edge endpoints disagree with the
   * records. Nothing stays mapped on failure.
   */
  static Result<std::shared_ptr<StoredGraph>>
  open(std::shared_ptr<StorageProvider> provider, StorePaths paths,
       StoreOptions options = {});

  /// Creates (or truncates) an empty store and opens it.
  static Result<std::shared_ptr<StoredGraph>>
  create(std::shared_ptr<StorageProvider> provider, StorePaths paths,
         StoreOptions options = {}, GraphKind kind = GraphKind::Generic);

  ~StoredGraph();

  StoredGraph(const StoredGraph &) = delete;
  StoredGraph &operator=(const StoredGraph &) = delete;

  // --- Lookup & traversal ---

  /// None when the id is absent or soft-deleted.
  std::optional<NodeHandle> node_by_id(int64_t id) const;

  /// Targets of live edges sourced at `id`, in edge-record order. Edges
  /// whose target is soft-deleted are skipped.
  NeighborRange neighbors(int64_t id) const;

  std::vector<EdgeHandle> out_edges(int64_t id) const;
  std::vector<EdgeHandle> in_edges(int64_t id) const;

  /// First live edge from -> to in record order.
  std::optional<EdgeHandle> find_edge(int64_t from, int64_t to) const;

  /// Live edge at a 0-based record index.
  std::optional<EdgeHandle> edge_at(uint64_t index) const;

  std::vector<NodeHandle> nodes() const;
  std::vector<EdgeHandle> edges() const;

  uint64_t node_count() const;
  uint64_t edge_count() const;

  // --- Payloads ---

  /// NotFound for an absent node; none when the node has no payload.
  Result<std::optional<Payload>> node_data(int64_t id) const;
  Result<std::optional<Payload>> edge_data(uint64_t edge_index) const;

  /// Raw entry under a node's offset, without protobuf decoding.
  Result<std::optional<DataEntry>> node_entry(int64_t id) const;

  // --- Injected semantics ---

  /**
   * @brief Cost of travelling from -> to.
   *
   * Uses the cost callback if one was supplied. Otherwise reads the first
   * live edge's payload: numeric tags convert directly, protobuf messages
   * contribute a numeric field named "cost", anything else costs 0.
   */
  Result<float> cost(int64_t from, int64_t to) const;

  bool equal(const NodeHandle &a, const NodeHandle &b) const;
  int compare(const NodeHandle &a, const NodeHandle &b) const;

  // --- Metadata & headers ---

  GraphKind kind() const;
  std::optional<pb::GraphMetadata> metadata() const;
  NodeHeader node_header() const;
  EdgeHeader edge_header() const;
  DataHeader data_header() const;
  uint64_t data_size() const;

  const StorePaths &paths() const noexcept { return paths_; }
  const StoreOptions &options() const noexcept { return options_; }
  bool read_only() const noexcept { return options_.read_only; }
  bool closed() const;

  // --- Mutation ---

  /// InvalidArgument while another transaction is open; ReadOnly on
  /// read-only stores.
  Result<Transaction> begin_transaction();

  /**
   * @brief Rewrites the three files without soft-deleted records or holes.
   *
   * Node ids and MaxID are preserved; live entries keep their relative
   * order and the metadata entry moves to the end. Compacted images are
   * staged as "<path>.compact" siblings, a "<nodes>.compact-commit" marker
   * is written, then all three are renamed into place. A crash after the
   * marker is rolled forward by the next open.
   */
  Status defragment();

  /// Releases the three mappings (data, edges, nodes). Idempotent.
  void close();

private:
  friend class Transaction;
  friend class NeighborRange::iterator;

  StoredGraph(std::shared_ptr<StorageProvider> provider, StorePaths paths,
              StoreOptions options)
      : provider_(std::move(provider)), paths_(std::move(paths)),
        options_(std::move(options)) {}

  static std::string compact_path(const std::string &path);
  static std::string compact_marker(const StorePaths &paths);
  static Status recover_compaction(StorageProvider &provider,
                                   const StorePaths &paths, bool read_only);

  Status open_storages();
  void close_storages() noexcept;
  Status load();
  Status refresh(uint64_t old_node_records, uint64_t old_edge_records);
  void index_node(uint64_t index, const NodeRecord &rec);
  void index_edge(uint64_t index, const EdgeRecord &rec);
  Status load_metadata();
  Status validate_types() const;

  // Unlocked helpers; callers hold mu_.
  std::optional<NodeHandle> node_unlocked(int64_t id) const;
  std::optional<EdgeRecord> edge_record(uint64_t index) const;
  std::optional<uint64_t> node_index_of(int64_t id) const;
  Result<std::optional<DataEntry>> entry_at(uint64_t offset) const;
  Result<std::optional<Payload>> payload_at(uint64_t offset) const;

  std::shared_ptr<StorageProvider> provider_;
  StorePaths paths_;
  StoreOptions options_;

  std::unique_ptr<MappedStorage> node_store_;
  std::unique_ptr<MappedStorage> edge_store_;
  std::unique_ptr<MappedStorage> data_store_;

  NodeFile node_file_;
  EdgeFile edge_file_;
  DataFile data_file_;
  MappedRegion data_region_;

  std::unordered_map<int64_t, uint64_t> node_index_;
  std::unordered_map<int64_t, std::vector<uint64_t>> out_index_;
  std::unordered_map<int64_t, std::vector<uint64_t>> in_index_;
  std::optional<pb::GraphMetadata> metadata_;

  mutable std::shared_mutex mu_; ///< Readers shared, publish exclusive
  std::mutex writer_mu_;         ///< Held by the open transaction
  bool closed_ = false;
};

} // namespace trigraph
