#pragma once

/**
 * @file codec.hpp
 * @brief Bit-exact encode/decode of the fixed-width headers and records.
 *
 * Layouts (all integers little-endian, fields unaligned):
 *
 *   Node / edge header (64 B):
 *     0 magic[8] | 8 version u32 | 12 MaxID i64 | 20 count u64 |
 *     28 DataFileOffset u64 | 36 checksum u64 | 44 reserved[20]
 *     reserved[0] = graph kind
 *
 *   Data header (64 B):
 *     0 magic[8] | 8 version u32 | 12 EntryCount u64 | 20 reserved[44]
 *
 *   Node record (32 B): 0 id i64 | 8 data_offset u64 | 16 flags u8 |
 *                       17 reserved[15]
 *   Edge record (32 B): 0 from i64 | 8 to i64 | 16 data_offset u32 |
 *                       20 flags u8 | 21 reserved[11]
 *
 * No I/O happens here. Structs keep their reserved bytes so a
 * read-modify-write cycle preserves them verbatim.
 */

#include "trigraph/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>

namespace trigraph {

// ═══════════════════════════════════════════════════════════════════════════
// Magic, Version & Sizes
// ═══════════════════════════════════════════════════════════════════════════

using Magic = std::array<uint8_t, 8>;

inline constexpr Magic NODE_MAGIC = {'G', 'R', 'A', 'P', 'H', 'N', 'D', '1'};
inline constexpr Magic EDGE_MAGIC = {'G', 'R', 'A', 'P', 'H', 'E', 'D', '1'};
inline constexpr Magic DATA_MAGIC = {'G', 'R', 'A', 'P', 'H', 'D', 'T', '1'};

inline constexpr uint32_t FORMAT_VERSION = 1;

inline constexpr size_t HEADER_SIZE = 64;
inline constexpr size_t RECORD_SIZE = 32;

/// Byte position of the checksum inside node and edge headers.
inline constexpr size_t CHECKSUM_OFFSET = 36;

// ═══════════════════════════════════════════════════════════════════════════
// Record Flags
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint8_t FLAG_DELETED = 1 << 0;
inline constexpr uint8_t FLAG_ACTIVE = 1 << 1;

/// A record is live unless its deleted bit is set. Records with neither
/// bit set predate the active bit and count as live.
constexpr bool is_active(uint8_t flags) noexcept {
  return (flags & FLAG_DELETED) == 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph Kind
// ═══════════════════════════════════════════════════════════════════════════

enum class GraphKind : uint8_t {
  Generic = 0,
  Tree = 1,
  DecisionTree = 2,
  ExpressionGraph = 3,
};

/// Unknown values fall back to Generic.
constexpr GraphKind graph_kind_from_byte(uint8_t b) noexcept {
  return b <= 3 ? static_cast<GraphKind>(b) : GraphKind::Generic;
}

const char *to_string(GraphKind kind) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Little-endian primitives
// ═══════════════════════════════════════════════════════════════════════════

template <typename T> inline void store_le(uint8_t *out, T value) noexcept {
  static_assert(std::is_integral_v<T>);
  using U = std::make_unsigned_t<T>;
  U v = static_cast<U>(value);
  for (size_t i = 0; i < sizeof(T); ++i)
    out[i] = static_cast<uint8_t>(v >> (8 * i));
}

template <typename T> inline T load_le(const uint8_t *in) noexcept {
  static_assert(std::is_integral_v<T>);
  using U = std::make_unsigned_t<T>;
  U v = 0;
  for (size_t i = 0; i < sizeof(T); ++i)
    v |= static_cast<U>(static_cast<U>(in[i]) << (8 * i));
  return static_cast<T>(v);
}

// ═══════════════════════════════════════════════════════════════════════════
// Headers & Records
// ═══════════════════════════════════════════════════════════════════════════

struct NodeHeader {
  int64_t max_id = 0;
  uint64_t node_count = 0;
  uint64_t data_file_offset = 0;
  uint64_t checksum = 0; ///< As decoded; recomputed on encode
  std::array<uint8_t, 20> reserved{};

  GraphKind kind() const noexcept { return graph_kind_from_byte(reserved[0]); }
  void set_kind(GraphKind k) noexcept { reserved[0] = static_cast<uint8_t>(k); }
};

struct EdgeHeader {
  int64_t max_id = 0; ///< Equals the committed edge record count
  uint64_t edge_count = 0;
  uint64_t data_file_offset = 0;
  uint64_t checksum = 0;
  std::array<uint8_t, 20> reserved{};

  GraphKind kind() const noexcept { return graph_kind_from_byte(reserved[0]); }
  void set_kind(GraphKind k) noexcept { reserved[0] = static_cast<uint8_t>(k); }
};

struct DataHeader {
  uint64_t entry_count = 0;
  std::array<uint8_t, 44> reserved{};
};

struct NodeRecord {
  int64_t id = 0;
  uint64_t data_offset = 0;
  uint8_t flags = FLAG_ACTIVE;
  std::array<uint8_t, 15> reserved{};

  bool active() const noexcept { return is_active(flags); }
};

struct EdgeRecord {
  int64_t from_id = 0;
  int64_t to_id = 0;
  uint32_t data_offset = 0;
  uint8_t flags = FLAG_ACTIVE;
  std::array<uint8_t, 11> reserved{};

  bool active() const noexcept { return is_active(flags); }
};

using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;
using RecordBytes = std::array<uint8_t, RECORD_SIZE>;

/// 64-bit wrapping byte sum of a 64-byte header, checksum field read as zero.
uint64_t header_checksum(std::span<const uint8_t> header) noexcept;

/// Encoders write the current FORMAT_VERSION and a freshly computed checksum.
HeaderBytes encode_node_header(const NodeHeader &h) noexcept;
HeaderBytes encode_edge_header(const EdgeHeader &h) noexcept;
HeaderBytes encode_data_header(const DataHeader &h) noexcept;
RecordBytes encode_node_record(const NodeRecord &r) noexcept;
RecordBytes encode_edge_record(const EdgeRecord &r) noexcept;

/**
 * Decoders fail with ErrorCode::Format and reason "short buffer",
 * "bad magic" or "unsupported version". Checksum verification is the
 * caller's policy (see verify_checksum).
 */
Result<NodeHeader> decode_node_header(std::span<const uint8_t> in);
Result<EdgeHeader> decode_edge_header(std::span<const uint8_t> in);
Result<DataHeader> decode_data_header(std::span<const uint8_t> in);
Result<NodeRecord> decode_node_record(std::span<const uint8_t> in);
Result<EdgeRecord> decode_edge_record(std::span<const uint8_t> in);

/// Format error "checksum mismatch" when the stored checksum is wrong.
Status verify_checksum(std::span<const uint8_t> header);

} // namespace trigraph
