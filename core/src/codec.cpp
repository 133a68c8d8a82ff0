#include "trigraph/codec.hpp"

#include <algorithm>

namespace trigraph {

namespace {

constexpr size_t VERSION_OFFSET = 8;
constexpr size_t MAX_ID_OFFSET = 12;
constexpr size_t COUNT_OFFSET = 20;
constexpr size_t DATA_OFFSET_OFFSET = 28;
constexpr size_t RESERVED_OFFSET = 44;
constexpr size_t DATA_RESERVED_OFFSET = 20;

// Shared shape of node and edge headers; only the magic and the meaning of
// `count` differ.
HeaderBytes encode_graph_header(const Magic &magic, int64_t max_id,
                                uint64_t count, uint64_t data_offset,
                                const std::array<uint8_t, 20> &reserved) {
  HeaderBytes out{};
  std::copy(magic.begin(), magic.end(), out.begin());
  store_le<uint32_t>(out.data() + VERSION_OFFSET, FORMAT_VERSION);
  store_le<int64_t>(out.data() + MAX_ID_OFFSET, max_id);
  store_le<uint64_t>(out.data() + COUNT_OFFSET, count);
  store_le<uint64_t>(out.data() + DATA_OFFSET_OFFSET, data_offset);
  std::copy(reserved.begin(), reserved.end(), out.begin() + RESERVED_OFFSET);
  store_le<uint64_t>(out.data() + CHECKSUM_OFFSET, header_checksum(out));
  return out;
}

Status check_prefix(std::span<const uint8_t> in, const Magic &magic) {
  if (in.size() < HEADER_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  if (!std::equal(magic.begin(), magic.end(), in.begin()))
    return fail(ErrorCode::Format, "bad magic");
  if (load_le<uint32_t>(in.data() + VERSION_OFFSET) != FORMAT_VERSION)
    return fail(ErrorCode::Format, "unsupported version");
  return {};
}

template <typename Header>
Result<Header> decode_graph_header(std::span<const uint8_t> in,
                                   const Magic &magic) {
  if (auto r = check_prefix(in, magic); !r)
    return std::unexpected(r.error());
  Header h;
  h.max_id = load_le<int64_t>(in.data() + MAX_ID_OFFSET);
  uint64_t count = load_le<uint64_t>(in.data() + COUNT_OFFSET);
  if constexpr (std::is_same_v<Header, NodeHeader>)
    h.node_count = count;
  else
    h.edge_count = count;
  h.data_file_offset = load_le<uint64_t>(in.data() + DATA_OFFSET_OFFSET);
  h.checksum = load_le<uint64_t>(in.data() + CHECKSUM_OFFSET);
  std::copy_n(in.begin() + RESERVED_OFFSET, h.reserved.size(),
              h.reserved.begin());
  return h;
}

} // namespace

const char *to_string(GraphKind kind) noexcept {
  switch (kind) {
  case GraphKind::Generic:
    return "generic";
  case GraphKind::Tree:
    return "tree";
  case GraphKind::DecisionTree:
    return "decision_tree";
  case GraphKind::ExpressionGraph:
    return "expression_graph";
  }
  return "generic";
}

uint64_t header_checksum(std::span<const uint8_t> header) noexcept {
  uint64_t sum = 0;
  size_t n = std::min(header.size(), HEADER_SIZE);
  for (size_t i = 0; i < n; ++i) {
    if (i >= CHECKSUM_OFFSET && i < CHECKSUM_OFFSET + 8)
      continue;
    sum += header[i];
  }
  return sum;
}

Status verify_checksum(std::span<const uint8_t> header) {
  if (header.size() < HEADER_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  if (load_le<uint64_t>(header.data() + CHECKSUM_OFFSET) !=
      header_checksum(header))
    return fail(ErrorCode::Format, "checksum mismatch");
  return {};
}

HeaderBytes encode_node_header(const NodeHeader &h) noexcept {
  return encode_graph_header(NODE_MAGIC, h.max_id, h.node_count,
                             h.data_file_offset, h.reserved);
}

HeaderBytes encode_edge_header(const EdgeHeader &h) noexcept {
  return encode_graph_header(EDGE_MAGIC, h.max_id, h.edge_count,
                             h.data_file_offset, h.reserved);
}

HeaderBytes encode_data_header(const DataHeader &h) noexcept {
  HeaderBytes out{};
  std::copy(DATA_MAGIC.begin(), DATA_MAGIC.end(), out.begin());
  store_le<uint32_t>(out.data() + VERSION_OFFSET, FORMAT_VERSION);
  store_le<uint64_t>(out.data() + 12, h.entry_count);
  std::copy(h.reserved.begin(), h.reserved.end(),
            out.begin() + DATA_RESERVED_OFFSET);
  return out;
}

RecordBytes encode_node_record(const NodeRecord &r) noexcept {
  RecordBytes out{};
  store_le<int64_t>(out.data(), r.id);
  store_le<uint64_t>(out.data() + 8, r.data_offset);
  out[16] = r.flags;
  std::copy(r.reserved.begin(), r.reserved.end(), out.begin() + 17);
  return out;
}

RecordBytes encode_edge_record(const EdgeRecord &r) noexcept {
  RecordBytes out{};
  store_le<int64_t>(out.data(), r.from_id);
  store_le<int64_t>(out.data() + 8, r.to_id);
  store_le<uint32_t>(out.data() + 16, r.data_offset);
  out[20] = r.flags;
  std::copy(r.reserved.begin(), r.reserved.end(), out.begin() + 21);
  return out;
}

Result<NodeHeader> decode_node_header(std::span<const uint8_t> in) {
  return decode_graph_header<NodeHeader>(in, NODE_MAGIC);
}

Result<EdgeHeader> decode_edge_header(std::span<const uint8_t> in) {
  return decode_graph_header<EdgeHeader>(in, EDGE_MAGIC);
}

Result<DataHeader> decode_data_header(std::span<const uint8_t> in) {
  if (auto r = check_prefix(in, DATA_MAGIC); !r)
    return std::unexpected(r.error());
  DataHeader h;
  h.entry_count = load_le<uint64_t>(in.data() + 12);
  std::copy_n(in.begin() + DATA_RESERVED_OFFSET, h.reserved.size(),
              h.reserved.begin());
  return h;
}

Result<NodeRecord> decode_node_record(std::span<const uint8_t> in) {
  if (in.size() < RECORD_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  NodeRecord r;
  r.id = load_le<int64_t>(in.data());
  r.data_offset = load_le<uint64_t>(in.data() + 8);
  r.flags = in[16];
  std::copy_n(in.begin() + 17, r.reserved.size(), r.reserved.begin());
  return r;
}

Result<EdgeRecord> decode_edge_record(std::span<const uint8_t> in) {
  if (in.size() < RECORD_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  EdgeRecord r;
  r.from_id = load_le<int64_t>(in.data());
  r.to_id = load_le<int64_t>(in.data() + 8);
  r.data_offset = load_le<uint32_t>(in.data() + 16);
  r.flags = in[20];
  std::copy_n(in.begin() + 21, r.reserved.size(), r.reserved.begin());
  return r;
}

} // namespace trigraph
