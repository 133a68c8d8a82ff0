#include "trigraph/stored_graph.hpp"

#include "trigraph/file_storage.hpp"
#include "trigraph/graph_metadata.hpp"
#include "trigraph/log.hpp"
#include "trigraph/transaction.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

namespace trigraph {

namespace {

constexpr std::string_view NODE_SUFFIX = ".nodes.graph";

const std::vector<uint64_t> &empty_list() {
  static const std::vector<uint64_t> empty;
  return empty;
}

NodeHandle to_handle(uint64_t index, const NodeRecord &rec) {
  return NodeHandle{rec.id, index, rec.data_offset, rec.flags};
}

EdgeHandle to_handle(uint64_t index, const EdgeRecord &rec) {
  return EdgeHandle{index, rec.from_id, rec.to_id, rec.data_offset, rec.flags};
}

float message_cost(const google::protobuf::Message &msg) {
  using google::protobuf::FieldDescriptor;
  const FieldDescriptor *field = msg.GetDescriptor()->FindFieldByName("cost");
  if (!field || field->is_repeated())
    return 0.0f;
  const auto *refl = msg.GetReflection();
  switch (field->cpp_type()) {
  case FieldDescriptor::CPPTYPE_FLOAT:
    return refl->GetFloat(msg, field);
  case FieldDescriptor::CPPTYPE_DOUBLE:
    return static_cast<float>(refl->GetDouble(msg, field));
  case FieldDescriptor::CPPTYPE_INT32:
    return static_cast<float>(refl->GetInt32(msg, field));
  case FieldDescriptor::CPPTYPE_INT64:
    return static_cast<float>(refl->GetInt64(msg, field));
  case FieldDescriptor::CPPTYPE_UINT32:
    return static_cast<float>(refl->GetUInt32(msg, field));
  case FieldDescriptor::CPPTYPE_UINT64:
    return static_cast<float>(refl->GetUInt64(msg, field));
  default:
    return 0.0f;
  }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// StorePaths
// ═══════════════════════════════════════════════════════════════════════════

StorePaths StorePaths::from_node_path(const std::string &node_path) {
  std::string base = node_path;
  if (base.size() > NODE_SUFFIX.size() && base.ends_with(NODE_SUFFIX))
    base.resize(base.size() - NODE_SUFFIX.size());
  return StorePaths{node_path, base + ".edges.graph", base + ".data.graph"};
}

// ═══════════════════════════════════════════════════════════════════════════
// NeighborRange
// ═══════════════════════════════════════════════════════════════════════════

void NeighborRange::iterator::settle() {
  for (; cur_ != end_; ++cur_) {
    auto edge = graph_->edge_record(*cur_);
    if (!edge || !edge->active())
      continue;
    if (auto target = graph_->node_unlocked(edge->to_id)) {
      current_ = *target;
      return;
    }
  }
}

// ═══════════════════════════════════════════════════════════════════════════
// Open / create / close
// ═══════════════════════════════════════════════════════════════════════════

Result<std::shared_ptr<StoredGraph>>
StoredGraph::open(std::shared_ptr<StorageProvider> provider, StorePaths paths,
                  StoreOptions options) {
  if (!provider)
    provider = std::make_shared<FileStorageProvider>();

  if (auto r = recover_compaction(*provider, paths, options.read_only); !r)
    return std::unexpected(r.error());

  std::shared_ptr<StoredGraph> graph(
      new StoredGraph(std::move(provider), std::move(paths), std::move(options)));
  if (auto r = graph->open_storages(); !r)
    return std::unexpected(r.error());
  if (auto r = graph->load(); !r) {
    log::warn("store", "rejected " + graph->paths_.nodes + ": " +
                           r.error().describe());
    graph->close();
    return std::unexpected(r.error());
  }

  log::info("store", "opened " + graph->paths_.nodes + " (" +
                         std::to_string(graph->node_file_.header.node_count) +
                         " nodes, " +
                         std::to_string(graph->edge_file_.header.edge_count) +
                         " edges, kind " + to_string(graph->kind()) + ")");
  return graph;
}

Result<std::shared_ptr<StoredGraph>>
StoredGraph::create(std::shared_ptr<StorageProvider> provider, StorePaths paths,
                    StoreOptions options, GraphKind kind) {
  if (!provider)
    provider = std::make_shared<FileStorageProvider>();
  if (options.read_only)
    return fail(ErrorCode::ReadOnly, "cannot create a read-only store");

  {
    auto nodes = provider->open(paths.nodes, OpenMode::Create);
    if (!nodes)
      return std::unexpected(nodes.error());
    auto edges = provider->open(paths.edges, OpenMode::Create);
    if (!edges)
      return std::unexpected(edges.error());
    auto data = provider->open(paths.data, OpenMode::Create);
    if (!data)
      return std::unexpected(data.error());
    if (auto r = initialize_files(**nodes, **edges, **data, kind); !r)
      return std::unexpected(r.error());
  }

  // A fresh store must not inherit a half-finished swap.
  for (const std::string &p :
       {compact_marker(paths), compact_path(paths.nodes),
        compact_path(paths.edges), compact_path(paths.data)}) {
    if (provider->exists(p)) {
      if (auto r = provider->remove(p); !r)
        return std::unexpected(r.error());
    }
  }

  return open(std::move(provider), std::move(paths), std::move(options));
}

StoredGraph::~StoredGraph() { close(); }

Status StoredGraph::open_storages() {
  OpenMode mode = options_.read_only ? OpenMode::ReadOnly : OpenMode::ReadWrite;
  auto nodes = provider_->open(paths_.nodes, mode);
  if (!nodes)
    return std::unexpected(nodes.error());
  auto edges = provider_->open(paths_.edges, mode);
  if (!edges)
    return std::unexpected(edges.error());
  auto data = provider_->open(paths_.data, mode);
  if (!data)
    return std::unexpected(data.error());
  node_store_ = std::move(*nodes);
  edge_store_ = std::move(*edges);
  data_store_ = std::move(*data);
  closed_ = false;
  return {};
}

void StoredGraph::close_storages() noexcept {
  data_region_.unmap();
  edge_file_.records.unmap();
  node_file_.records.unmap();
  for (auto *store : {&data_store_, &edge_store_, &node_store_}) {
    if (*store) {
      (*store)->close();
      store->reset();
    }
  }
}

void StoredGraph::close() {
  std::unique_lock lock(mu_);
  if (closed_)
    return;
  close_storages();
  node_index_.clear();
  out_index_.clear();
  in_index_.clear();
  closed_ = true;
  log::info("store", "closed " + paths_.nodes);
}

bool StoredGraph::closed() const {
  std::shared_lock lock(mu_);
  return closed_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Loading & index maintenance
// ═══════════════════════════════════════════════════════════════════════════

void StoredGraph::index_node(uint64_t index, const NodeRecord &rec) {
  node_index_[rec.id] = index;
}

void StoredGraph::index_edge(uint64_t index, const EdgeRecord &rec) {
  out_index_[rec.from_id].push_back(index);
  in_index_[rec.to_id].push_back(index);
}

Status StoredGraph::load() {
  auto nodes = open_node_file(*node_store_);
  if (!nodes)
    return std::unexpected(nodes.error());
  auto edges = open_edge_file(*edge_store_);
  if (!edges)
    return std::unexpected(edges.error());
  auto data = open_data_file(*data_store_);
  if (!data)
    return std::unexpected(data.error());
  auto region = data_store_->map(0, 0);
  if (!region)
    return std::unexpected(region.error());

  node_file_ = std::move(*nodes);
  edge_file_ = std::move(*edges);
  data_file_ = *data;
  data_region_ = std::move(*region);
  node_index_.clear();
  out_index_.clear();
  in_index_.clear();

  uint64_t active_nodes = 0;
  for (uint64_t i = 0; i < node_file_.record_count; ++i) {
    auto rec = read_node_record(node_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    index_node(i, *rec);
    if (rec->active())
      ++active_nodes;
  }
  if (active_nodes != node_file_.header.node_count)
    return fail(ErrorCode::InconsistentState,
                "node header counts " +
                    std::to_string(node_file_.header.node_count) +
                    " nodes but " + std::to_string(active_nodes) +
                    " records are active");

  uint64_t active_edges = 0;
  for (uint64_t i = 0; i < edge_file_.record_count; ++i) {
    auto rec = read_edge_record(edge_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    index_edge(i, *rec);
    if (!rec->active())
      continue;
    ++active_edges;
    if (!node_unlocked(rec->from_id) || !node_unlocked(rec->to_id))
      return fail(ErrorCode::InconsistentState,
                  "edge " + std::to_string(i + 1) + " (" +
                      std::to_string(rec->from_id) + " -> " +
                      std::to_string(rec->to_id) +
                      ") references a missing or deleted node");
  }
  if (active_edges != edge_file_.header.edge_count)
    return fail(ErrorCode::InconsistentState,
                "edge header counts " +
                    std::to_string(edge_file_.header.edge_count) +
                    " edges but " + std::to_string(active_edges) +
                    " records are active");

  if (auto r = load_metadata(); !r)
    return r;
  if (options_.validate_types)
    return validate_types();
  return {};
}

Status StoredGraph::load_metadata() {
  metadata_.reset();
  uint64_t offset = node_file_.header.data_file_offset;
  if (offset != edge_file_.header.data_file_offset)
    return fail(ErrorCode::InconsistentState,
                "node and edge headers disagree on the metadata offset");
  if (offset == 0)
    return {};
  auto entry = read_entry(data_region_.bytes(), offset);
  if (!entry)
    return fail(entry.error(), "graph metadata");
  auto meta = decode_metadata(*entry);
  if (!meta)
    return std::unexpected(meta.error());
  metadata_ = std::move(*meta);
  return {};
}

Status StoredGraph::validate_types() const {
  auto check = [&](uint64_t offset) -> Status {
    if (offset == 0)
      return {};
    auto entry = read_entry(data_region_.bytes(), offset);
    if (!entry)
      return std::unexpected(entry.error());
    if (entry->type == DataType::Protobuf &&
        entry->type_name != METADATA_TYPE_NAME &&
        (!options_.types || !options_.types->contains(entry->type_name)))
      return fail(ErrorCode::NotFound, "protobuf type \"" + entry->type_name +
                                           "\" not registered");
    return {};
  };

  for (uint64_t i = 0; i < node_file_.record_count; ++i) {
    auto rec = read_node_record(node_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    if (rec->active()) {
      if (auto r = check(rec->data_offset); !r)
        return r;
    }
  }
  for (uint64_t i = 0; i < edge_file_.record_count; ++i) {
    auto rec = read_edge_record(edge_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    if (rec->active()) {
      if (auto r = check(rec->data_offset); !r)
        return r;
    }
  }
  return {};
}

Status StoredGraph::refresh(uint64_t old_node_records,
                            uint64_t old_edge_records) {
  auto nodes = open_node_file(*node_store_);
  if (!nodes)
    return std::unexpected(nodes.error());
  auto edges = open_edge_file(*edge_store_);
  if (!edges)
    return std::unexpected(edges.error());
  auto data = open_data_file(*data_store_);
  if (!data)
    return std::unexpected(data.error());
  auto region = data_store_->map(0, 0);
  if (!region)
    return std::unexpected(region.error());

  node_file_ = std::move(*nodes);
  edge_file_ = std::move(*edges);
  data_file_ = *data;
  data_region_ = std::move(*region);

  for (uint64_t i = old_node_records; i < node_file_.record_count; ++i) {
    auto rec = read_node_record(node_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    index_node(i, *rec);
  }
  for (uint64_t i = old_edge_records; i < edge_file_.record_count; ++i) {
    auto rec = read_edge_record(edge_file_.records, i);
    if (!rec)
      return std::unexpected(rec.error());
    index_edge(i, *rec);
  }
  return load_metadata();
}

// ═══════════════════════════════════════════════════════════════════════════
// Unlocked helpers
// ═══════════════════════════════════════════════════════════════════════════

std::optional<uint64_t> StoredGraph::node_index_of(int64_t id) const {
  auto it = node_index_.find(id);
  if (it == node_index_.end())
    return std::nullopt;
  return it->second;
}

std::optional<NodeHandle> StoredGraph::node_unlocked(int64_t id) const {
  auto index = node_index_of(id);
  if (!index)
    return std::nullopt;
  auto rec = read_node_record(node_file_.records, *index);
  if (!rec || !rec->active())
    return std::nullopt;
  return to_handle(*index, *rec);
}

std::optional<EdgeRecord> StoredGraph::edge_record(uint64_t index) const {
  auto rec = read_edge_record(edge_file_.records, index);
  if (!rec)
    return std::nullopt;
  return *rec;
}

Result<std::optional<DataEntry>> StoredGraph::entry_at(uint64_t offset) const {
  if (offset == 0)
    return std::optional<DataEntry>{};
  auto entry = read_entry(data_region_.bytes(), offset);
  if (!entry)
    return std::unexpected(entry.error());
  return std::optional<DataEntry>(std::move(*entry));
}

Result<std::optional<Payload>> StoredGraph::payload_at(uint64_t offset) const {
  auto entry = entry_at(offset);
  if (!entry)
    return std::unexpected(entry.error());
  if (!*entry)
    return std::optional<Payload>{};
  auto payload = decode_payload(std::move(**entry), options_.types.get());
  if (!payload)
    return std::unexpected(payload.error());
  return std::optional<Payload>(std::move(*payload));
}

// ═══════════════════════════════════════════════════════════════════════════
// Lookup & traversal
// ═══════════════════════════════════════════════════════════════════════════

std::optional<NodeHandle> StoredGraph::node_by_id(int64_t id) const {
  std::shared_lock lock(mu_);
  return node_unlocked(id);
}

NeighborRange StoredGraph::neighbors(int64_t id) const {
  std::shared_lock lock(mu_);
  auto it = out_index_.find(id);
  const auto &list = it == out_index_.end() ? empty_list() : it->second;
  if (!node_unlocked(id) || list.empty())
    return NeighborRange(this, nullptr, nullptr);
  return NeighborRange(this, list.data(), list.data() + list.size());
}

std::vector<EdgeHandle> StoredGraph::out_edges(int64_t id) const {
  std::shared_lock lock(mu_);
  std::vector<EdgeHandle> out;
  auto it = out_index_.find(id);
  if (it == out_index_.end())
    return out;
  for (uint64_t index : it->second) {
    auto rec = edge_record(index);
    if (rec && rec->active() && node_unlocked(rec->to_id))
      out.push_back(to_handle(index, *rec));
  }
  return out;
}

std::vector<EdgeHandle> StoredGraph::in_edges(int64_t id) const {
  std::shared_lock lock(mu_);
  std::vector<EdgeHandle> out;
  auto it = in_index_.find(id);
  if (it == in_index_.end())
    return out;
  for (uint64_t index : it->second) {
    auto rec = edge_record(index);
    if (rec && rec->active() && node_unlocked(rec->from_id))
      out.push_back(to_handle(index, *rec));
  }
  return out;
}

std::optional<EdgeHandle> StoredGraph::find_edge(int64_t from,
                                                 int64_t to) const {
  std::shared_lock lock(mu_);
  auto it = out_index_.find(from);
  if (it == out_index_.end())
    return std::nullopt;
  for (uint64_t index : it->second) {
    auto rec = edge_record(index);
    if (rec && rec->active() && rec->to_id == to)
      return to_handle(index, *rec);
  }
  return std::nullopt;
}

std::optional<EdgeHandle> StoredGraph::edge_at(uint64_t index) const {
  std::shared_lock lock(mu_);
  auto rec = edge_record(index);
  if (!rec || !rec->active())
    return std::nullopt;
  return to_handle(index, *rec);
}

std::vector<NodeHandle> StoredGraph::nodes() const {
  std::shared_lock lock(mu_);
  std::vector<NodeHandle> out;
  out.reserve(node_file_.header.node_count);
  for (uint64_t i = 0; i < node_file_.record_count; ++i) {
    auto rec = read_node_record(node_file_.records, i);
    if (rec && rec->active())
      out.push_back(to_handle(i, *rec));
  }
  return out;
}

std::vector<EdgeHandle> StoredGraph::edges() const {
  std::shared_lock lock(mu_);
  std::vector<EdgeHandle> out;
  out.reserve(edge_file_.header.edge_count);
  for (uint64_t i = 0; i < edge_file_.record_count; ++i) {
    auto rec = read_edge_record(edge_file_.records, i);
    if (rec && rec->active())
      out.push_back(to_handle(i, *rec));
  }
  return out;
}

uint64_t StoredGraph::node_count() const {
  std::shared_lock lock(mu_);
  return node_file_.header.node_count;
}

uint64_t StoredGraph::edge_count() const {
  std::shared_lock lock(mu_);
  return edge_file_.header.edge_count;
}

// ═══════════════════════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════════════════════

Result<std::optional<Payload>> StoredGraph::node_data(int64_t id) const {
  std::shared_lock lock(mu_);
  auto node = node_unlocked(id);
  if (!node)
    return fail(ErrorCode::NotFound, "node " + std::to_string(id));
  return payload_at(node->data_offset);
}

Result<std::optional<DataEntry>> StoredGraph::node_entry(int64_t id) const {
  std::shared_lock lock(mu_);
  auto node = node_unlocked(id);
  if (!node)
    return fail(ErrorCode::NotFound, "node " + std::to_string(id));
  return entry_at(node->data_offset);
}

Result<std::optional<Payload>> StoredGraph::edge_data(uint64_t index) const {
  std::shared_lock lock(mu_);
  auto rec = edge_record(index);
  if (!rec || !rec->active())
    return fail(ErrorCode::NotFound, "edge record " + std::to_string(index));
  return payload_at(rec->data_offset);
}

// ═══════════════════════════════════════════════════════════════════════════
// Injected semantics
// ═══════════════════════════════════════════════════════════════════════════

Result<float> StoredGraph::cost(int64_t from, int64_t to) const {
  std::shared_lock lock(mu_);
  auto a = node_unlocked(from);
  if (!a)
    return fail(ErrorCode::NotFound, "node " + std::to_string(from));
  auto b = node_unlocked(to);
  if (!b)
    return fail(ErrorCode::NotFound, "node " + std::to_string(to));
  if (options_.cost)
    return options_.cost(*a, *b);

  auto it = out_index_.find(from);
  if (it == out_index_.end())
    return fail(ErrorCode::NotFound, "no edge " + std::to_string(from) +
                                         " -> " + std::to_string(to));
  for (uint64_t index : it->second) {
    auto rec = edge_record(index);
    if (!rec || !rec->active() || rec->to_id != to)
      continue;
    auto payload = payload_at(rec->data_offset);
    if (!payload)
      return std::unexpected(payload.error());
    if (!*payload)
      return 0.0f;
    if (const auto *msg = (*payload)->message())
      return message_cost(*msg);
    if (fixed_width((*payload)->type()) != 0) {
      auto n = (*payload)->as_number();
      if (!n)
        return std::unexpected(n.error());
      return static_cast<float>(*n);
    }
    return 0.0f;
  }
  return fail(ErrorCode::NotFound, "no edge " + std::to_string(from) +
                                       " -> " + std::to_string(to));
}

bool StoredGraph::equal(const NodeHandle &a, const NodeHandle &b) const {
  if (options_.equal)
    return options_.equal(a, b);
  return a.id == b.id;
}

int StoredGraph::compare(const NodeHandle &a, const NodeHandle &b) const {
  if (options_.compare)
    return options_.compare(a, b);
  return a.id < b.id ? -1 : (a.id > b.id ? 1 : 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Metadata & headers
// ═══════════════════════════════════════════════════════════════════════════

GraphKind StoredGraph::kind() const {
  std::shared_lock lock(mu_);
  if (metadata_)
    return from_proto(metadata_->kind());
  return node_file_.header.kind();
}

std::optional<pb::GraphMetadata> StoredGraph::metadata() const {
  std::shared_lock lock(mu_);
  return metadata_;
}

NodeHeader StoredGraph::node_header() const {
  std::shared_lock lock(mu_);
  return node_file_.header;
}

EdgeHeader StoredGraph::edge_header() const {
  std::shared_lock lock(mu_);
  return edge_file_.header;
}

DataHeader StoredGraph::data_header() const {
  std::shared_lock lock(mu_);
  return data_file_.header;
}

uint64_t StoredGraph::data_size() const {
  std::shared_lock lock(mu_);
  return data_file_.size;
}

// ═══════════════════════════════════════════════════════════════════════════
// Transactions
// ═══════════════════════════════════════════════════════════════════════════

Result<Transaction> StoredGraph::begin_transaction() {
  if (options_.read_only)
    return fail(ErrorCode::ReadOnly, "store " + paths_.nodes + " is read-only");
  std::unique_lock<std::mutex> writer(writer_mu_, std::try_to_lock);
  if (!writer.owns_lock())
    return fail(ErrorCode::InvalidArgument,
                "a transaction is already open on " + paths_.nodes);
  std::shared_lock lock(mu_);
  if (closed_)
    return fail(ErrorCode::InvalidArgument, "store " + paths_.nodes + " is closed");
  return Transaction(shared_from_this(), std::move(writer));
}

} // namespace trigraph
