#pragma once

/**
 * @file transaction.hpp
 * @brief Staged mutations of a StoredGraph, applied atomically on commit.
 *
 * Commit protocol:
 *   prepare  - lay out every appended record and data entry past the
 *              committed tails, write them, sync. Nothing published yet.
 *   publish  - under the store's exclusive lock: in-place record and entry
 *              rewrites, sync, then one 64-byte header write per file in
 *              the order data, edge, node (each synced).
 *
 * A crash before publish leaves unreferenced tails that the next open
 * ignores. Rollback after prepare truncates the tails away.
 *
 * Publish is not atomic across the three files. A crash after the in-place
 * record rewrites (delete flags, repointed offsets) but before the node
 * header lands leaves records that disagree with the header counts; the
 * next open refuses the store with InconsistentState rather than serving a
 * mix of old and new state. In-place entry rewrites in the same window are
 * visible through records that still point at them.
 *
 * A Transaction keeps its StoredGraph alive; dropping every other reference
 * to the store while a transaction is open is safe.
 */

#include "trigraph/codec.hpp"
#include "trigraph/error.hpp"
#include "trigraph/payload.hpp"

#include "graph_metadata.pb.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace trigraph {

class StoredGraph;

class Transaction {
public:
  enum class State { Open, Prepared, Committed, RolledBack };

  Transaction(Transaction &&other) noexcept;
  Transaction &operator=(Transaction &&) = delete;
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  /// Rolls back unless committed. Rollback failures are logged.
  ~Transaction();

  // --- Staging ---

  /// Returns the id the node will carry once committed.
  Result<int64_t> add_node(std::optional<Payload> data = std::nullopt);

  /// Returns the 1-based edge id. Both endpoints must be live.
  Result<uint64_t> add_edge(int64_t from, int64_t to,
                            std::optional<Payload> data = std::nullopt);

  /// Soft-deletes the node and every live edge touching it.
  Status delete_node(int64_t id);

  /// Soft-deletes the first live from -> to edge in record order.
  Status delete_edge(int64_t from, int64_t to);

  /// `std::nullopt` clears the payload (data offset 0).
  Status update_node(int64_t id, std::optional<Payload> data);
  Status update_edge(int64_t from, int64_t to, std::optional<Payload> data);
  Status update_edge_at(uint64_t edge_index, std::optional<Payload> data);

  /// Appends a new metadata entry and repoints both headers at it.
  Status set_metadata(const pb::GraphMetadata &meta);

  // --- Completion ---

  Status prepare();
  Status commit();
  Status rollback();

  State state() const noexcept { return state_; }
  bool closed() const noexcept {
    return state_ == State::Committed || state_ == State::RolledBack;
  }

  /// Number of staged operations.
  size_t size() const noexcept { return ops_; }

private:
  friend class StoredGraph;

  Transaction(std::shared_ptr<StoredGraph> graph,
              std::unique_lock<std::mutex> writer);

  struct Staged {
    std::optional<Payload> data;
    uint64_t seq = 0;
  };

  struct RecordChange {
    bool deleted = false;
    std::optional<Staged> update;
  };

  struct NewNode {
    int64_t id = 0;
    Staged data;
    bool deleted = false;
  };

  struct NewEdge {
    int64_t from = 0;
    int64_t to = 0;
    Staged data;
    bool deleted = false;
  };

  struct EntryWrite {
    uint64_t offset = 0;
    const Payload *payload = nullptr;
  };

  struct Plan {
    uint64_t node_records = 0; ///< Committed counts before this commit
    uint64_t edge_records = 0;
    uint64_t node_size = 0; ///< File sizes before prepare
    uint64_t edge_size = 0;
    uint64_t data_size = 0;
    uint64_t data_tail = 0; ///< Data file size after prepare

    std::vector<RecordBytes> node_appends;
    std::vector<RecordBytes> edge_appends;
    std::vector<EntryWrite> appends;
    std::vector<EntryWrite> in_place;
    std::vector<std::pair<uint64_t, RecordBytes>> node_rewrites;
    std::vector<std::pair<uint64_t, RecordBytes>> edge_rewrites;

    NodeHeader node_header;
    EdgeHeader edge_header;
    DataHeader data_header;
  };

  Status check_open() const;
  Status check_payload(const std::optional<Payload> &data) const;

  // Liveness as seen through the staged changes.
  bool committed_node_live(uint64_t index) const;
  bool committed_edge_live(uint64_t index) const;
  NewNode *staged_node(int64_t id);
  bool node_live(int64_t id) const;

  /// Committed edge index or (new edge position | NEW_EDGE_BIT).
  std::optional<uint64_t> find_live_edge(int64_t from, int64_t to) const;
  Status stage_edge_update(uint64_t ref, std::optional<Payload> data);

  Result<Plan> plan() const;
  Status write_tails(const Plan &plan);
  Status publish();
  Status truncate_tails();

  static constexpr uint64_t NEW_EDGE_BIT = 1ull << 63;

  // Declared before writer_: the writer lock is released before the last
  // reference to the store (and its mutex) can go away.
  std::shared_ptr<StoredGraph> graph_;
  std::unique_lock<std::mutex> writer_;
  State state_ = State::Open;

  int64_t base_max_id_ = 0;
  uint64_t base_edge_records_ = 0;
  uint64_t seq_ = 0;
  size_t ops_ = 0;

  std::map<uint64_t, RecordChange> node_changes_;
  std::map<uint64_t, RecordChange> edge_changes_;
  std::vector<NewNode> new_nodes_;
  std::vector<NewEdge> new_edges_;
  std::unordered_map<int64_t, size_t> new_node_index_;
  std::unique_ptr<Staged> metadata_; ///< Address stays put; plans point into it
  GraphKind metadata_kind_ = GraphKind::Generic;

  std::optional<Plan> plan_; ///< Set once prepared
};

const char *to_string(Transaction::State state) noexcept;

} // namespace trigraph
