#include "trigraph/mapped_storage.hpp"

#include <cstring>

namespace trigraph {

Status MappedStorage::write(uint64_t offset, std::span<const uint8_t> bytes) {
  if (read_only())
    return fail(ErrorCode::ReadOnly, "write to read-only storage " + path());
  if (bytes.empty())
    return {};

  auto region = map(offset, bytes.size());
  if (!region)
    return std::unexpected(region.error());
  auto out = region->writable_bytes();
  if (out.size() < bytes.size())
    return fail(ErrorCode::ReadOnly, "region not writable in " + path());
  std::memcpy(out.data(), bytes.data(), bytes.size());
  return {};
}

Result<std::vector<uint8_t>> MappedStorage::read(uint64_t offset,
                                                 uint64_t length) {
  if (length == 0)
    return std::vector<uint8_t>{};
  auto region = map(offset, length);
  if (!region)
    return std::unexpected(region.error());
  auto in = region->bytes();
  return std::vector<uint8_t>(in.begin(), in.end());
}

} // namespace trigraph
