#include "trigraph/format.hpp"

namespace trigraph {

namespace {

Result<MappedRegion> map_header(MappedStorage &storage) {
  if (storage.size() < HEADER_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  return storage.map(0, HEADER_SIZE);
}

uint64_t available_records(const MappedStorage &storage) {
  uint64_t size = storage.size();
  return size < HEADER_SIZE ? 0 : (size - HEADER_SIZE) / RECORD_SIZE;
}

Result<MappedRegion> map_records(MappedStorage &storage, uint64_t count) {
  if (count == 0)
    return MappedRegion{};
  return storage.map(HEADER_SIZE, count * RECORD_SIZE);
}

} // namespace

Result<NodeFile> open_node_file(MappedStorage &storage) {
  auto head = map_header(storage);
  if (!head)
    return fail(head.error(), "node file " + storage.path());
  auto header = decode_node_header(head->bytes());
  if (!header)
    return fail(header.error(), "node file " + storage.path());
  if (auto ok = verify_checksum(head->bytes()); !ok)
    return fail(ok.error(), "node file " + storage.path());

  NodeFile file;
  file.header = *header;

  uint64_t available = available_records(storage);
  if (available > 0) {
    auto scan = storage.map(HEADER_SIZE, available * RECORD_SIZE);
    if (!scan)
      return std::unexpected(scan.error());
    int64_t prev = 0;
    const uint8_t *p = scan->data();
    for (uint64_t i = 0; i < available; ++i, p += RECORD_SIZE) {
      int64_t id = load_le<int64_t>(p);
      if (id <= prev || id > file.header.max_id)
        break;
      prev = id;
      ++file.record_count;
    }
  }

  auto records = map_records(storage, file.record_count);
  if (!records)
    return std::unexpected(records.error());
  file.records = std::move(*records);
  return file;
}

Result<EdgeFile> open_edge_file(MappedStorage &storage) {
  auto head = map_header(storage);
  if (!head)
    return fail(head.error(), "edge file " + storage.path());
  auto header = decode_edge_header(head->bytes());
  if (!header)
    return fail(header.error(), "edge file " + storage.path());
  if (auto ok = verify_checksum(head->bytes()); !ok)
    return fail(ok.error(), "edge file " + storage.path());

  EdgeFile file;
  file.header = *header;
  if (file.header.max_id < 0 ||
      static_cast<uint64_t>(file.header.max_id) > available_records(storage))
    return fail(ErrorCode::Format,
                "edge file " + storage.path() + ": truncated record array (" +
                    std::to_string(file.header.max_id) + " records declared)");
  file.record_count = static_cast<uint64_t>(file.header.max_id);

  auto records = map_records(storage, file.record_count);
  if (!records)
    return std::unexpected(records.error());
  file.records = std::move(*records);
  return file;
}

Result<DataFile> open_data_file(MappedStorage &storage) {
  auto head = map_header(storage);
  if (!head)
    return fail(head.error(), "data file " + storage.path());
  auto header = decode_data_header(head->bytes());
  if (!header)
    return fail(header.error(), "data file " + storage.path());
  return DataFile{*header, storage.size()};
}

Result<NodeRecord> read_node_record(const MappedRegion &records,
                                    uint64_t index) {
  if (index >= records.size() / RECORD_SIZE)
    return fail(ErrorCode::Format,
                "node record " + std::to_string(index) + " out of range");
  return decode_node_record(records.bytes().subspan(index * RECORD_SIZE,
                                                    RECORD_SIZE));
}

Result<EdgeRecord> read_edge_record(const MappedRegion &records,
                                    uint64_t index) {
  if (index >= records.size() / RECORD_SIZE)
    return fail(ErrorCode::Format,
                "edge record " + std::to_string(index) + " out of range");
  return decode_edge_record(records.bytes().subspan(index * RECORD_SIZE,
                                                    RECORD_SIZE));
}

Status write_header(MappedStorage &storage, const HeaderBytes &header) {
  if (storage.size() < HEADER_SIZE)
    return fail(ErrorCode::Format, "short buffer");
  if (auto r = storage.write(0, header); !r)
    return r;
  return storage.sync();
}

Status append_record(MappedStorage &storage, const RecordBytes &record) {
  uint64_t tail = storage.size();
  if (auto r = storage.grow(tail + RECORD_SIZE); !r)
    return r;
  return storage.write(tail, record);
}

Status write_record(MappedStorage &storage, uint64_t index,
                    const RecordBytes &record) {
  return storage.write(record_position(index), record);
}

Status initialize_files(MappedStorage &nodes, MappedStorage &edges,
                        MappedStorage &data, GraphKind kind) {
  NodeHeader nh;
  nh.set_kind(kind);
  EdgeHeader eh;
  eh.set_kind(kind);
  DataHeader dh;

  for (MappedStorage *s : {&nodes, &edges, &data}) {
    if (auto r = s->truncate(0); !r)
      return r;
    if (auto r = s->grow(HEADER_SIZE); !r)
      return r;
  }
  if (auto r = write_header(data, encode_data_header(dh)); !r)
    return r;
  if (auto r = write_header(edges, encode_edge_header(eh)); !r)
    return r;
  return write_header(nodes, encode_node_header(nh));
}

} // namespace trigraph
