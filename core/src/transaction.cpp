#include "trigraph/transaction.hpp"

#include "trigraph/data_section.hpp"
#include "trigraph/format.hpp"
#include "trigraph/graph_metadata.hpp"
#include "trigraph/log.hpp"
#include "trigraph/stored_graph.hpp"

#include <algorithm>
#include <limits>

namespace trigraph {

namespace {

constexpr uint8_t deleted_flags(uint8_t flags) noexcept {
  return static_cast<uint8_t>((flags | FLAG_DELETED) & ~FLAG_ACTIVE);
}

Status resize_to(MappedStorage &storage, uint64_t size) {
  if (storage.size() < size)
    return storage.grow(size);
  if (storage.size() > size)
    return storage.truncate(size);
  return {};
}

uint64_t payload_extent(const Payload &p) noexcept {
  return entry_size(p.type_name().size(), p.size());
}

} // namespace

const char *to_string(Transaction::State state) noexcept {
  switch (state) {
  case Transaction::State::Open:
    return "open";
  case Transaction::State::Prepared:
    return "prepared";
  case Transaction::State::Committed:
    return "committed";
  case Transaction::State::RolledBack:
    return "rolled back";
  }
  return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

Transaction::Transaction(std::shared_ptr<StoredGraph> graph,
                         std::unique_lock<std::mutex> writer)
    : graph_(std::move(graph)), writer_(std::move(writer)),
      base_max_id_(graph_->node_file_.header.max_id),
      base_edge_records_(graph_->edge_file_.record_count) {}

Transaction::Transaction(Transaction &&other) noexcept
    : graph_(std::move(other.graph_)), writer_(std::move(other.writer_)),
      state_(other.state_), base_max_id_(other.base_max_id_),
      base_edge_records_(other.base_edge_records_), seq_(other.seq_),
      ops_(other.ops_), node_changes_(std::move(other.node_changes_)),
      edge_changes_(std::move(other.edge_changes_)),
      new_nodes_(std::move(other.new_nodes_)),
      new_edges_(std::move(other.new_edges_)),
      new_node_index_(std::move(other.new_node_index_)),
      metadata_(std::move(other.metadata_)),
      metadata_kind_(other.metadata_kind_), plan_(std::move(other.plan_)) {
  other.state_ = State::RolledBack;
}

Transaction::~Transaction() {
  if (!graph_ || closed())
    return;
  if (auto r = rollback(); !r)
    log::error("txn", "rollback on drop failed: " + r.error().describe());
}

Status Transaction::check_open() const {
  if (state_ != State::Open)
    return fail(ErrorCode::ClosedTransaction,
                std::string("transaction is ") + to_string(state_));
  return {};
}

Status Transaction::check_payload(const std::optional<Payload> &data) const {
  if (!data)
    return {};
  return validate_entry(data->type_name(), data->size());
}

// ═══════════════════════════════════════════════════════════════════════════
// Liveness through the staged changes
// ═══════════════════════════════════════════════════════════════════════════

bool Transaction::committed_node_live(uint64_t index) const {
  auto rec = read_node_record(graph_->node_file_.records, index);
  if (!rec || !rec->active())
    return false;
  auto it = node_changes_.find(index);
  return it == node_changes_.end() || !it->second.deleted;
}

bool Transaction::committed_edge_live(uint64_t index) const {
  auto rec = graph_->edge_record(index);
  if (!rec || !rec->active())
    return false;
  auto it = edge_changes_.find(index);
  return it == edge_changes_.end() || !it->second.deleted;
}

Transaction::NewNode *Transaction::staged_node(int64_t id) {
  auto it = new_node_index_.find(id);
  if (it == new_node_index_.end() || new_nodes_[it->second].deleted)
    return nullptr;
  return &new_nodes_[it->second];
}

bool Transaction::node_live(int64_t id) const {
  if (auto index = graph_->node_index_of(id))
    return committed_node_live(*index);
  auto it = new_node_index_.find(id);
  return it != new_node_index_.end() && !new_nodes_[it->second].deleted;
}

std::optional<uint64_t> Transaction::find_live_edge(int64_t from,
                                                    int64_t to) const {
  auto it = graph_->out_index_.find(from);
  if (it != graph_->out_index_.end()) {
    for (uint64_t index : it->second) {
      auto rec = graph_->edge_record(index);
      if (rec && rec->to_id == to && committed_edge_live(index))
        return index;
    }
  }
  for (size_t i = 0; i < new_edges_.size(); ++i) {
    const NewEdge &e = new_edges_[i];
    if (!e.deleted && e.from == from && e.to == to)
      return static_cast<uint64_t>(i) | NEW_EDGE_BIT;
  }
  return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Staging
// ═══════════════════════════════════════════════════════════════════════════

Result<int64_t> Transaction::add_node(std::optional<Payload> data) {
  if (auto r = check_open(); !r)
    return std::unexpected(r.error());
  if (auto r = check_payload(data); !r)
    return std::unexpected(r.error());

  int64_t id = base_max_id_ + static_cast<int64_t>(new_nodes_.size()) + 1;
  new_node_index_[id] = new_nodes_.size();
  new_nodes_.push_back(NewNode{id, Staged{std::move(data), ++seq_}, false});
  ++ops_;
  return id;
}

Result<uint64_t> Transaction::add_edge(int64_t from, int64_t to,
                                       std::optional<Payload> data) {
  if (auto r = check_open(); !r)
    return std::unexpected(r.error());
  if (auto r = check_payload(data); !r)
    return std::unexpected(r.error());
  if (!node_live(from))
    return fail(ErrorCode::NotFound, "edge source node " + std::to_string(from));
  if (!node_live(to))
    return fail(ErrorCode::NotFound, "edge target node " + std::to_string(to));

  new_edges_.push_back(NewEdge{from, to, Staged{std::move(data), ++seq_}, false});
  ++ops_;
  return base_edge_records_ + new_edges_.size();
}

Status Transaction::delete_node(int64_t id) {
  if (auto r = check_open(); !r)
    return r;

  auto index = graph_->node_index_of(id);
  if (index && committed_node_live(*index)) {
    node_changes_[*index].deleted = true;
    for (const auto *adjacency : {&graph_->out_index_, &graph_->in_index_}) {
      auto it = adjacency->find(id);
      if (it == adjacency->end())
        continue;
      for (uint64_t e : it->second) {
        if (committed_edge_live(e))
          edge_changes_[e].deleted = true;
      }
    }
  } else if (NewNode *node = staged_node(id)) {
    node->deleted = true;
  } else {
    return fail(ErrorCode::NotFound, "node " + std::to_string(id));
  }

  for (NewEdge &e : new_edges_) {
    if (e.from == id || e.to == id)
      e.deleted = true;
  }
  ++ops_;
  return {};
}

Status Transaction::delete_edge(int64_t from, int64_t to) {
  if (auto r = check_open(); !r)
    return r;
  auto ref = find_live_edge(from, to);
  if (!ref)
    return fail(ErrorCode::NotFound, "edge " + std::to_string(from) + " -> " +
                                         std::to_string(to));
  if (*ref & NEW_EDGE_BIT)
    new_edges_[*ref & ~NEW_EDGE_BIT].deleted = true;
  else
    edge_changes_[*ref].deleted = true;
  ++ops_;
  return {};
}

Status Transaction::update_node(int64_t id, std::optional<Payload> data) {
  if (auto r = check_open(); !r)
    return r;
  if (auto r = check_payload(data); !r)
    return r;

  auto index = graph_->node_index_of(id);
  if (index && committed_node_live(*index))
    node_changes_[*index].update = Staged{std::move(data), ++seq_};
  else if (NewNode *node = staged_node(id))
    node->data = Staged{std::move(data), ++seq_};
  else
    return fail(ErrorCode::NotFound, "node " + std::to_string(id));
  ++ops_;
  return {};
}

Status Transaction::stage_edge_update(uint64_t ref,
                                      std::optional<Payload> data) {
  if (ref & NEW_EDGE_BIT)
    new_edges_[ref & ~NEW_EDGE_BIT].data = Staged{std::move(data), ++seq_};
  else
    edge_changes_[ref].update = Staged{std::move(data), ++seq_};
  ++ops_;
  return {};
}

Status Transaction::update_edge(int64_t from, int64_t to,
                                std::optional<Payload> data) {
  if (auto r = check_open(); !r)
    return r;
  if (auto r = check_payload(data); !r)
    return r;
  auto ref = find_live_edge(from, to);
  if (!ref)
    return fail(ErrorCode::NotFound, "edge " + std::to_string(from) + " -> " +
                                         std::to_string(to));
  return stage_edge_update(*ref, std::move(data));
}

Status Transaction::update_edge_at(uint64_t edge_index,
                                   std::optional<Payload> data) {
  if (auto r = check_open(); !r)
    return r;
  if (auto r = check_payload(data); !r)
    return r;

  if (edge_index < base_edge_records_) {
    if (!committed_edge_live(edge_index))
      return fail(ErrorCode::NotFound, "edge record " + std::to_string(edge_index));
    return stage_edge_update(edge_index, std::move(data));
  }
  uint64_t pos = edge_index - base_edge_records_;
  if (pos >= new_edges_.size() || new_edges_[pos].deleted)
    return fail(ErrorCode::NotFound, "edge record " + std::to_string(edge_index));
  return stage_edge_update(pos | NEW_EDGE_BIT, std::move(data));
}

Status Transaction::set_metadata(const pb::GraphMetadata &meta) {
  if (auto r = check_open(); !r)
    return r;
  auto bytes = encode_metadata(meta);
  if (!bytes)
    return std::unexpected(bytes.error());
  metadata_ = std::make_unique<Staged>(
      Staged{Payload(DataType::Protobuf, std::string(METADATA_TYPE_NAME),
                     std::move(*bytes)),
             ++seq_});
  metadata_kind_ = from_proto(meta.kind());
  ++ops_;
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Planning
// ═══════════════════════════════════════════════════════════════════════════

Result<Transaction::Plan> Transaction::plan() const {
  const StoredGraph &g = *graph_;
  Plan p;
  p.node_records = g.node_file_.record_count;
  p.edge_records = g.edge_file_.record_count;
  p.node_size = g.node_store_->size();
  p.edge_size = g.edge_store_->size();
  p.data_size = g.data_store_->size();

  // Appended entries are laid out in staging order.
  enum class Target { CommittedNode, CommittedEdge, NewNode, NewEdge, Metadata };
  struct Pending {
    uint64_t seq;
    const Payload *payload;
    Target target;
    uint64_t key;
  };
  std::vector<Pending> pending;

  std::map<uint64_t, NodeRecord> node_finals;
  std::map<uint64_t, EdgeRecord> edge_finals;
  uint64_t deleted_nodes = 0;
  uint64_t deleted_edges = 0;

  auto decide = [&](uint64_t old_offset, const Staged &staged, Target target,
                    uint64_t key, uint64_t &offset_out) -> Status {
    if (!staged.data) {
      offset_out = 0;
      return {};
    }
    if (old_offset != 0) {
      auto extent = entry_extent(g.data_region_.bytes(), old_offset);
      if (!extent)
        return std::unexpected(extent.error());
      if (payload_extent(*staged.data) <= *extent) {
        p.in_place.push_back(EntryWrite{old_offset, &*staged.data});
        offset_out = old_offset;
        return {};
      }
    }
    pending.push_back(Pending{staged.seq, &*staged.data, target, key});
    return {};
  };

  for (const auto &[index, change] : node_changes_) {
    auto rec = read_node_record(g.node_file_.records, index);
    if (!rec)
      return std::unexpected(rec.error());
    NodeRecord &out = node_finals[index] = *rec;
    if (change.deleted) {
      out.flags = deleted_flags(out.flags);
      ++deleted_nodes;
    } else if (change.update) {
      uint64_t offset = out.data_offset;
      if (auto r = decide(rec->data_offset, *change.update,
                          Target::CommittedNode, index, offset);
          !r)
        return std::unexpected(r.error());
      out.data_offset = offset;
    }
  }

  for (const auto &[index, change] : edge_changes_) {
    auto rec = read_edge_record(g.edge_file_.records, index);
    if (!rec)
      return std::unexpected(rec.error());
    EdgeRecord &out = edge_finals[index] = *rec;
    if (change.deleted) {
      out.flags = deleted_flags(out.flags);
      ++deleted_edges;
    } else if (change.update) {
      uint64_t offset = out.data_offset;
      if (auto r = decide(rec->data_offset, *change.update,
                          Target::CommittedEdge, index, offset);
          !r)
        return std::unexpected(r.error());
      out.data_offset = static_cast<uint32_t>(offset);
    }
  }

  std::vector<NodeRecord> new_node_records(new_nodes_.size());
  uint64_t added_nodes = 0;
  for (size_t i = 0; i < new_nodes_.size(); ++i) {
    const NewNode &n = new_nodes_[i];
    new_node_records[i].id = n.id;
    if (n.deleted) {
      new_node_records[i].flags = deleted_flags(FLAG_ACTIVE);
      continue;
    }
    ++added_nodes;
    if (n.data.data)
      pending.push_back(Pending{n.data.seq, &*n.data.data, Target::NewNode, i});
  }

  std::vector<EdgeRecord> new_edge_records(new_edges_.size());
  uint64_t added_edges = 0;
  for (size_t i = 0; i < new_edges_.size(); ++i) {
    const NewEdge &e = new_edges_[i];
    new_edge_records[i].from_id = e.from;
    new_edge_records[i].to_id = e.to;
    if (e.deleted) {
      new_edge_records[i].flags = deleted_flags(FLAG_ACTIVE);
      continue;
    }
    ++added_edges;
    if (e.data.data)
      pending.push_back(Pending{e.data.seq, &*e.data.data, Target::NewEdge, i});
  }

  if (metadata_)
    pending.push_back(
        Pending{metadata_->seq, &*metadata_->data, Target::Metadata, 0});

  std::sort(pending.begin(), pending.end(),
            [](const Pending &a, const Pending &b) { return a.seq < b.seq; });

  uint64_t tail = p.data_size;
  uint64_t metadata_offset = 0;
  for (const Pending &item : pending) {
    uint64_t offset = tail;
    tail += payload_extent(*item.payload);
    bool edge_target =
        item.target == Target::CommittedEdge || item.target == Target::NewEdge;
    if (edge_target && offset > std::numeric_limits<uint32_t>::max())
      return fail(ErrorCode::InvalidArgument,
                  "edge entry offset " + std::to_string(offset) +
                      " does not fit the 32-bit record field");
    p.appends.push_back(EntryWrite{offset, item.payload});

    switch (item.target) {
    case Target::CommittedNode:
      node_finals[item.key].data_offset = offset;
      break;
    case Target::CommittedEdge:
      edge_finals[item.key].data_offset = static_cast<uint32_t>(offset);
      break;
    case Target::NewNode:
      new_node_records[item.key].data_offset = offset;
      break;
    case Target::NewEdge:
      new_edge_records[item.key].data_offset = static_cast<uint32_t>(offset);
      break;
    case Target::Metadata:
      metadata_offset = offset;
      break;
    }
  }
  p.data_tail = tail;

  for (const auto &[index, rec] : node_finals)
    p.node_rewrites.emplace_back(index, encode_node_record(rec));
  for (const auto &[index, rec] : edge_finals)
    p.edge_rewrites.emplace_back(index, encode_edge_record(rec));
  for (const NodeRecord &rec : new_node_records)
    p.node_appends.push_back(encode_node_record(rec));
  for (const EdgeRecord &rec : new_edge_records)
    p.edge_appends.push_back(encode_edge_record(rec));

  p.node_header = g.node_file_.header;
  p.node_header.max_id = base_max_id_ + static_cast<int64_t>(new_nodes_.size());
  p.node_header.node_count = p.node_header.node_count + added_nodes - deleted_nodes;

  p.edge_header = g.edge_file_.header;
  p.edge_header.max_id = static_cast<int64_t>(p.edge_records + new_edges_.size());
  p.edge_header.edge_count = p.edge_header.edge_count + added_edges - deleted_edges;

  if (metadata_) {
    p.node_header.data_file_offset = metadata_offset;
    p.edge_header.data_file_offset = metadata_offset;
    p.node_header.set_kind(metadata_kind_);
    p.edge_header.set_kind(metadata_kind_);
  }

  p.data_header = g.data_file_.header;
  p.data_header.entry_count += p.appends.size();
  return p;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commit protocol
// ═══════════════════════════════════════════════════════════════════════════

Status Transaction::write_tails(const Plan &p) {
  StoredGraph &g = *graph_;

  if (auto r = resize_to(*g.node_store_,
                         record_position(p.node_records + p.node_appends.size()));
      !r)
    return r;
  for (size_t i = 0; i < p.node_appends.size(); ++i) {
    if (auto r = write_record(*g.node_store_, p.node_records + i, p.node_appends[i]); !r)
      return r;
  }

  if (auto r = resize_to(*g.edge_store_,
                         record_position(p.edge_records + p.edge_appends.size()));
      !r)
    return r;
  for (size_t i = 0; i < p.edge_appends.size(); ++i) {
    if (auto r = write_record(*g.edge_store_, p.edge_records + i, p.edge_appends[i]); !r)
      return r;
  }

  if (auto r = resize_to(*g.data_store_, p.data_tail); !r)
    return r;
  for (const EntryWrite &w : p.appends) {
    if (auto r = g.data_store_->write(w.offset, encode_entry(*w.payload)); !r)
      return r;
  }

  for (MappedStorage *s : {g.node_store_.get(), g.edge_store_.get(),
                           g.data_store_.get()}) {
    if (auto r = s->sync(); !r)
      return r;
  }
  return {};
}

Status Transaction::truncate_tails() {
  const Plan &p = *plan_;
  StoredGraph &g = *graph_;
  Status result;
  auto restore = [&](MappedStorage &s, uint64_t size) {
    if (s.size() <= size)
      return;
    if (auto r = s.truncate(size); !r && result)
      result = r;
  };
  restore(*g.node_store_, p.node_size);
  restore(*g.edge_store_, p.edge_size);
  restore(*g.data_store_, p.data_size);
  return result;
}

Status Transaction::prepare() {
  if (auto r = check_open(); !r)
    return r;
  if (graph_->closed())
    return fail(ErrorCode::InvalidArgument, "store is closed");

  auto p = plan();
  if (!p) {
    state_ = State::RolledBack;
    writer_.unlock();
    return std::unexpected(p.error());
  }
  plan_ = std::move(*p);
  state_ = State::Prepared;

  if (auto r = write_tails(*plan_); !r) {
    log::error("txn", "prepare failed on " + graph_->paths_.nodes + ": " +
                          r.error().describe());
    if (auto t = truncate_tails(); !t)
      log::error("txn", "tail truncation failed: " + t.error().describe());
    state_ = State::RolledBack;
    writer_.unlock();
    return r;
  }
  return {};
}

Status Transaction::publish() {
  StoredGraph &g = *graph_;
  const Plan &p = *plan_;
  std::unique_lock lock(g.mu_);

  for (const auto &[index, bytes] : p.node_rewrites) {
    if (auto r = write_record(*g.node_store_, index, bytes); !r)
      return r;
  }
  for (const auto &[index, bytes] : p.edge_rewrites) {
    if (auto r = write_record(*g.edge_store_, index, bytes); !r)
      return r;
  }
  for (const EntryWrite &w : p.in_place) {
    if (auto r = overwrite_entry(*g.data_store_, w.offset, w.payload->type(),
                                 w.payload->type_name(), w.payload->bytes());
        !r)
      return r;
  }
  for (MappedStorage *s : {g.node_store_.get(), g.edge_store_.get(),
                           g.data_store_.get()}) {
    if (auto r = s->sync(); !r)
      return r;
  }

  if (auto r = write_header(*g.data_store_, encode_data_header(p.data_header)); !r)
    return r;
  if (auto r = write_header(*g.edge_store_, encode_edge_header(p.edge_header)); !r)
    return r;
  if (auto r = write_header(*g.node_store_, encode_node_header(p.node_header)); !r)
    return r;

  return g.refresh(p.node_records, p.edge_records);
}

Status Transaction::commit() {
  if (state_ == State::Open) {
    if (auto r = prepare(); !r)
      return r;
  }
  if (state_ != State::Prepared)
    return fail(ErrorCode::ClosedTransaction,
                std::string("transaction is ") + to_string(state_));

  auto r = publish();
  state_ = r ? State::Committed : State::RolledBack;
  writer_.unlock();
  if (!r) {
    log::error("txn", "commit failed on " + graph_->paths_.nodes + ": " +
                          r.error().describe());
    return r;
  }

  const Plan &p = *plan_;
  log::info("txn", "committed " + std::to_string(ops_) + " ops on " +
                       graph_->paths_.nodes + ": " +
                       std::to_string(p.node_appends.size()) + " node records, " +
                       std::to_string(p.edge_appends.size()) + " edge records, " +
                       std::to_string(p.appends.size()) + " entries appended, " +
                       std::to_string(p.in_place.size()) + " rewritten in place");
  return {};
}

Status Transaction::rollback() {
  if (closed())
    return fail(ErrorCode::ClosedTransaction,
                std::string("transaction is ") + to_string(state_));

  Status result;
  if (state_ == State::Prepared)
    result = truncate_tails();
  state_ = State::RolledBack;
  node_changes_.clear();
  edge_changes_.clear();
  new_nodes_.clear();
  new_edges_.clear();
  new_node_index_.clear();
  metadata_.reset();
  plan_.reset();
  writer_.unlock();
  log::trace("txn", "rolled back " + std::to_string(ops_) + " ops");
  return result;
}

} // namespace trigraph
