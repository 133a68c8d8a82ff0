#pragma once

/**
 * @file format.hpp
 * @brief The three store files as typed headers plus record arrays.
 *
 * Purely mechanical: nothing here interprets flags or data offsets.
 *
 * Committed record-array length:
 *   - edge file: EdgeHeader::max_id (edge ids are 1-based record indexes);
 *   - node file: the leading run of records whose ids strictly increase and
 *     do not exceed NodeHeader::max_id.
 * Bytes past the committed arrays are unpublished tails of an interrupted
 * commit and are ignored.
 */

#include "trigraph/codec.hpp"
#include "trigraph/mapped_storage.hpp"

namespace trigraph {

struct NodeFile {
  NodeHeader header;
  uint64_t record_count = 0;
  MappedRegion records; ///< Exactly record_count * RECORD_SIZE bytes
};

struct EdgeFile {
  EdgeHeader header;
  uint64_t record_count = 0;
  MappedRegion records;
};

struct DataFile {
  DataHeader header;
  uint64_t size = 0;
};

constexpr uint64_t record_position(uint64_t index) noexcept {
  return HEADER_SIZE + index * RECORD_SIZE;
}

/// Validate magic, version and checksum; map the committed record array.
Result<NodeFile> open_node_file(MappedStorage &storage);
Result<EdgeFile> open_edge_file(MappedStorage &storage);
Result<DataFile> open_data_file(MappedStorage &storage);

/// O(1) access at HEADER_SIZE + index * RECORD_SIZE of the file.
Result<NodeRecord> read_node_record(const MappedRegion &records,
                                    uint64_t index);
Result<EdgeRecord> read_edge_record(const MappedRegion &records,
                                    uint64_t index);

/// One 64-byte write into the header prefix, then sync.
Status write_header(MappedStorage &storage, const HeaderBytes &header);

/// Grows the storage by RECORD_SIZE and writes at the new tail.
Status append_record(MappedStorage &storage, const RecordBytes &record);

/// In-place rewrite of the record at `index`.
Status write_record(MappedStorage &storage, uint64_t index,
                    const RecordBytes &record);

/// Truncates the three storages and writes empty headers.
Status initialize_files(MappedStorage &nodes, MappedStorage &edges,
                        MappedStorage &data, GraphKind kind);

} // namespace trigraph
