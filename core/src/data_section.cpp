#include "trigraph/data_section.hpp"

#include <algorithm>

namespace trigraph {

Status validate_entry(std::string_view type_name, uint64_t payload_len) {
  if (type_name.size() > MAX_TYPE_NAME_LEN)
    return fail(ErrorCode::InvalidArgument,
                "type name of " + std::to_string(type_name.size()) +
                    " bytes exceeds 65535");
  if (payload_len > MAX_PAYLOAD_LEN)
    return fail(ErrorCode::InvalidArgument,
                "payload of " + std::to_string(payload_len) +
                    " bytes exceeds the 32-bit length field");
  return {};
}

std::vector<uint8_t> encode_entry(DataType type, std::string_view type_name,
                                  std::span<const uint8_t> payload) {
  std::vector<uint8_t> out(entry_size(type_name.size(), payload.size()));
  store_le<uint32_t>(out.data(), static_cast<uint32_t>(payload.size()));
  out[4] = static_cast<uint8_t>(type);
  store_le<uint16_t>(out.data() + 5, static_cast<uint16_t>(type_name.size()));
  std::copy(type_name.begin(), type_name.end(),
            out.begin() + ENTRY_HEADER_SIZE);
  std::copy(payload.begin(), payload.end(),
            out.begin() + ENTRY_HEADER_SIZE + type_name.size());
  return out;
}

Result<uint64_t> entry_extent(std::span<const uint8_t> file, uint64_t offset) {
  if (offset < HEADER_SIZE)
    return fail(ErrorCode::Format,
                "entry offset " + std::to_string(offset) +
                    " inside the data header");
  if (offset > file.size() || file.size() - offset < ENTRY_HEADER_SIZE)
    return fail(ErrorCode::Format, "entry offset " + std::to_string(offset) +
                                       " beyond data file size " +
                                       std::to_string(file.size()));
  const uint8_t *p = file.data() + offset;
  uint64_t payload_len = load_le<uint32_t>(p);
  uint64_t name_len = load_le<uint16_t>(p + 5);
  uint64_t total = entry_size(name_len, payload_len);
  if (total > file.size() - offset)
    return fail(ErrorCode::Format, "truncated entry at offset " +
                                       std::to_string(offset));
  if (p[4] > DATA_TYPE_MAX)
    return fail(ErrorCode::Format, "unknown data type tag " +
                                       std::to_string(p[4]) + " at offset " +
                                       std::to_string(offset));
  return total;
}

Result<DataEntry> read_entry(std::span<const uint8_t> file, uint64_t offset) {
  auto total = entry_extent(file, offset);
  if (!total)
    return std::unexpected(total.error());

  const uint8_t *p = file.data() + offset;
  uint32_t payload_len = load_le<uint32_t>(p);
  uint16_t name_len = load_le<uint16_t>(p + 5);
  const uint8_t *name = p + ENTRY_HEADER_SIZE;
  const uint8_t *body = name + name_len;

  DataEntry e;
  e.type = static_cast<DataType>(p[4]);
  e.type_name.assign(reinterpret_cast<const char *>(name), name_len);
  e.payload.assign(body, body + payload_len);
  return e;
}

Result<uint64_t> append_entry(MappedStorage &data, DataType type,
                              std::string_view type_name,
                              std::span<const uint8_t> payload) {
  if (auto ok = validate_entry(type_name, payload.size()); !ok)
    return std::unexpected(ok.error());
  auto bytes = encode_entry(type, type_name, payload);
  uint64_t tail = data.size();
  if (auto r = data.grow(tail + bytes.size()); !r)
    return std::unexpected(r.error());
  if (auto r = data.write(tail, bytes); !r)
    return std::unexpected(r.error());
  return tail;
}

Status overwrite_entry(MappedStorage &data, uint64_t offset, DataType type,
                       std::string_view type_name,
                       std::span<const uint8_t> payload) {
  if (auto ok = validate_entry(type_name, payload.size()); !ok)
    return ok;
  auto file = data.map(0, 0);
  if (!file)
    return std::unexpected(file.error());
  auto existing = entry_extent(file->bytes(), offset);
  if (!existing)
    return std::unexpected(existing.error());
  uint64_t needed = entry_size(type_name.size(), payload.size());
  if (needed > *existing)
    return fail(ErrorCode::InvalidArgument,
                "entry of " + std::to_string(needed) +
                    " bytes does not fit in place of " +
                    std::to_string(*existing) + " bytes");
  return data.write(offset, encode_entry(type, type_name, payload));
}

Result<Payload> decode_payload(DataEntry entry, const TypeRegistry *types) {
  Payload p(entry.type, std::move(entry.type_name), std::move(entry.payload));
  if (p.type() != DataType::Protobuf || p.type_name() == METADATA_TYPE_NAME)
    return p;
  if (!types)
    return fail(ErrorCode::NotFound, "protobuf type \"" + p.type_name() +
                                         "\" not registered");
  auto msg = types->parse(p.type_name(), p.bytes());
  if (!msg)
    return std::unexpected(msg.error());
  p.set_message(std::move(*msg));
  return p;
}

} // namespace trigraph
