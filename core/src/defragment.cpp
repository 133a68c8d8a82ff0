#include "trigraph/stored_graph.hpp"

#include "trigraph/log.hpp"

#include <algorithm>
#include <map>

namespace trigraph {

namespace {

struct Images {
  std::vector<uint8_t> nodes;
  std::vector<uint8_t> edges;
  std::vector<uint8_t> data;
  uint64_t live_nodes = 0;
  uint64_t live_edges = 0;
  uint64_t live_entries = 0;
};

void put(std::vector<uint8_t> &image, std::span<const uint8_t> bytes) {
  image.insert(image.end(), bytes.begin(), bytes.end());
}

void put_header(std::vector<uint8_t> &image, const HeaderBytes &header) {
  std::copy(header.begin(), header.end(), image.begin());
}

Status write_image(StorageProvider &provider, const std::string &path,
                   std::span<const uint8_t> image) {
  auto storage = provider.open(path, OpenMode::Create);
  if (!storage)
    return std::unexpected(storage.error());
  if (auto r = (*storage)->grow(image.size()); !r)
    return r;
  if (auto r = (*storage)->write(0, image); !r)
    return r;
  if (auto r = (*storage)->sync(); !r)
    return r;
  (*storage)->close();
  return {};
}

} // namespace

std::string StoredGraph::compact_path(const std::string &path) {
  return path + ".compact";
}

std::string StoredGraph::compact_marker(const StorePaths &paths) {
  return paths.nodes + ".compact-commit";
}

// ═══════════════════════════════════════════════════════════════════════════
// Recovery of an interrupted swap
// ═══════════════════════════════════════════════════════════════════════════

Status StoredGraph::recover_compaction(StorageProvider &provider,
                                       const StorePaths &paths,
                                       bool read_only) {
  const std::string marker = compact_marker(paths);
  const std::string *targets[] = {&paths.nodes, &paths.edges, &paths.data};

  if (provider.exists(marker)) {
    if (read_only)
      return fail(ErrorCode::InconsistentState,
                  "interrupted defragmentation of " + paths.nodes +
                      " must be finished by a writable open");
    // A staged file that is already gone was renamed before the crash.
    for (const std::string *target : targets) {
      std::string staged = compact_path(*target);
      if (!provider.exists(staged))
        continue;
      if (auto r = provider.rename(staged, *target); !r)
        return r;
    }
    if (auto r = provider.remove(marker); !r)
      return r;
    log::warn("defrag", "rolled forward interrupted compaction of " +
                            paths.nodes);
    return {};
  }

  if (read_only)
    return {};
  for (const std::string *target : targets) {
    std::string staged = compact_path(*target);
    if (!provider.exists(staged))
      continue;
    if (auto r = provider.remove(staged); !r)
      return r;
    log::info("defrag", "discarded unfinished staging file " + staged);
  }
  return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Defragment
// ═══════════════════════════════════════════════════════════════════════════

Status StoredGraph::defragment() {
  if (options_.read_only)
    return fail(ErrorCode::ReadOnly, "store " + paths_.nodes + " is read-only");
  std::unique_lock<std::mutex> writer(writer_mu_, std::try_to_lock);
  if (!writer.owns_lock())
    return fail(ErrorCode::InvalidArgument,
                "cannot defragment " + paths_.nodes +
                    " while a transaction is open");

  Images img;
  uint64_t old_size = 0;
  {
    std::shared_lock lock(mu_);
    if (closed_)
      return fail(ErrorCode::InvalidArgument, "store " + paths_.nodes + " is closed");
    old_size = node_store_->size() + edge_store_->size() + data_store_->size();

    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
    for (uint64_t i = 0; i < node_file_.record_count; ++i) {
      auto rec = read_node_record(node_file_.records, i);
      if (!rec)
        return std::unexpected(rec.error());
      if (rec->active())
        nodes.push_back(*rec);
    }
    for (uint64_t i = 0; i < edge_file_.record_count; ++i) {
      auto rec = read_edge_record(edge_file_.records, i);
      if (!rec)
        return std::unexpected(rec.error());
      if (rec->active())
        edges.push_back(*rec);
    }

    // Live entries in old-offset order; metadata is re-appended last.
    std::map<uint64_t, uint64_t> relocated;
    for (const NodeRecord &n : nodes) {
      if (n.data_offset != 0)
        relocated.emplace(n.data_offset, 0);
    }
    for (const EdgeRecord &e : edges) {
      if (e.data_offset != 0)
        relocated.emplace(e.data_offset, 0);
    }

    auto data = data_region_.bytes();
    img.data.resize(HEADER_SIZE);
    for (auto &[old_offset, new_offset] : relocated) {
      auto extent = entry_extent(data, old_offset);
      if (!extent)
        return std::unexpected(extent.error());
      new_offset = img.data.size();
      put(img.data, data.subspan(old_offset, *extent));
    }
    img.live_entries = relocated.size();

    uint64_t metadata_offset = 0;
    if (uint64_t old_meta = node_file_.header.data_file_offset; old_meta != 0) {
      auto extent = entry_extent(data, old_meta);
      if (!extent)
        return std::unexpected(extent.error());
      metadata_offset = img.data.size();
      put(img.data, data.subspan(old_meta, *extent));
      ++img.live_entries;
    }

    img.nodes.resize(HEADER_SIZE);
    for (NodeRecord n : nodes) {
      if (n.data_offset != 0)
        n.data_offset = relocated.at(n.data_offset);
      put(img.nodes, encode_node_record(n));
    }
    img.edges.resize(HEADER_SIZE);
    for (EdgeRecord e : edges) {
      if (e.data_offset != 0)
        e.data_offset = static_cast<uint32_t>(relocated.at(e.data_offset));
      put(img.edges, encode_edge_record(e));
    }
    img.live_nodes = nodes.size();
    img.live_edges = edges.size();

    NodeHeader nh = node_file_.header;
    nh.node_count = img.live_nodes;
    nh.data_file_offset = metadata_offset;
    EdgeHeader eh = edge_file_.header;
    eh.max_id = static_cast<int64_t>(img.live_edges);
    eh.edge_count = img.live_edges;
    eh.data_file_offset = metadata_offset;
    DataHeader dh = data_file_.header;
    dh.entry_count = img.live_entries;

    put_header(img.nodes, encode_node_header(nh));
    put_header(img.edges, encode_edge_header(eh));
    put_header(img.data, encode_data_header(dh));
  }

  // Stage, mark, swap.
  if (auto r = write_image(*provider_, compact_path(paths_.nodes), img.nodes); !r)
    return r;
  if (auto r = write_image(*provider_, compact_path(paths_.edges), img.edges); !r)
    return r;
  if (auto r = write_image(*provider_, compact_path(paths_.data), img.data); !r)
    return r;

  const std::string marker = compact_marker(paths_);
  if (auto r = write_image(*provider_, marker, {}); !r)
    return r;

  std::unique_lock lock(mu_);
  close_storages();
  closed_ = true;
  for (const std::string *target : {&paths_.nodes, &paths_.edges, &paths_.data}) {
    if (auto r = provider_->rename(compact_path(*target), *target); !r)
      return r;
  }
  if (auto r = provider_->remove(marker); !r)
    return r;

  if (auto r = open_storages(); !r)
    return r;
  if (auto r = load(); !r) {
    close_storages();
    closed_ = true;
    return r;
  }

  uint64_t new_size = img.nodes.size() + img.edges.size() + img.data.size();
  log::info("defrag", "compacted " + paths_.nodes + ": " +
                          std::to_string(img.live_nodes) + " nodes, " +
                          std::to_string(img.live_edges) + " edges, " +
                          std::to_string(img.live_entries) + " entries, " +
                          std::to_string(old_size) + " -> " +
                          std::to_string(new_size) + " bytes");
  return {};
}

} // namespace trigraph
