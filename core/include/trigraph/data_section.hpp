#pragma once

/**
 * @file data_section.hpp
 * @brief Variable-length entries in the data file.
 *
 * Entry layout, starting at its byte offset:
 *
 *   0 payload_len u32 | 4 tag u8 | 5 name_len u16 | 7 name | payload
 *
 * Offset 0 is never an entry (it is the data header) and means "no payload"
 * in node and edge records.
 */

#include "trigraph/mapped_storage.hpp"
#include "trigraph/payload.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trigraph {

inline constexpr size_t ENTRY_HEADER_SIZE = 7;
inline constexpr size_t MAX_TYPE_NAME_LEN = 0xFFFF;
inline constexpr uint64_t MAX_PAYLOAD_LEN = 0xFFFFFFFFull;

/// Type name of the single graph metadata entry.
inline constexpr std::string_view METADATA_TYPE_NAME = "__graph_metadata__";

struct DataEntry {
  DataType type = DataType::Bytes;
  std::string type_name;
  std::vector<uint8_t> payload;

  uint64_t total_size() const noexcept {
    return ENTRY_HEADER_SIZE + type_name.size() + payload.size();
  }
};

constexpr uint64_t entry_size(size_t name_len, uint64_t payload_len) noexcept {
  return ENTRY_HEADER_SIZE + name_len + payload_len;
}

/// InvalidArgument for a name of 65536+ bytes or a payload over u32 max.
Status validate_entry(std::string_view type_name, uint64_t payload_len);

std::vector<uint8_t> encode_entry(DataType type, std::string_view type_name,
                                  std::span<const uint8_t> payload);

inline std::vector<uint8_t> encode_entry(const Payload &p) {
  return encode_entry(p.type(), p.type_name(), p.bytes());
}

/// Total size of the entry at `offset`, bounds-checked against `file`.
Result<uint64_t> entry_extent(std::span<const uint8_t> file, uint64_t offset);

/// Parses and copies out the entry at `offset` of the mapped data file.
Result<DataEntry> read_entry(std::span<const uint8_t> file, uint64_t offset);

/// Grows `data` and writes the entry at the prior tail; returns that tail.
/// The header EntryCount is the caller's to publish.
Result<uint64_t> append_entry(MappedStorage &data, DataType type,
                              std::string_view type_name,
                              std::span<const uint8_t> payload);

/// In-place rewrite; fails unless the new entry fits in the old one.
/// Leftover bytes of the old entry stay as padding.
Status overwrite_entry(MappedStorage &data, uint64_t offset, DataType type,
                       std::string_view type_name,
                       std::span<const uint8_t> payload);

/// Converts an entry into a Payload, parsing protobuf through `types`.
Result<Payload> decode_payload(DataEntry entry, const TypeRegistry *types);

} // namespace trigraph
