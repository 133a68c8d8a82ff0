#include "trigraph/archive_storage.hpp"

#include "trigraph/file_storage.hpp"
#include "trigraph/log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <zlib.h>

namespace trigraph {

namespace fs = std::filesystem;

namespace {

constexpr size_t TAR_BLOCK = 512;
constexpr size_t TAR_NAME_OFFSET = 0;
constexpr size_t TAR_NAME_LEN = 100;
constexpr size_t TAR_SIZE_OFFSET = 124;
constexpr size_t TAR_SIZE_LEN = 12;
constexpr size_t TAR_CHKSUM_OFFSET = 148;
constexpr size_t TAR_CHKSUM_LEN = 8;
constexpr size_t TAR_TYPE_OFFSET = 156;
constexpr size_t TAR_MAGIC_OFFSET = 257;
constexpr size_t TAR_PREFIX_OFFSET = 345;
constexpr size_t TAR_PREFIX_LEN = 155;

std::string field_string(const uint8_t *p, size_t len) {
  size_t n = 0;
  while (n < len && p[n] != 0)
    ++n;
  return std::string(reinterpret_cast<const char *>(p), n);
}

// Octal, space/NUL padded. GNU base-256 when the high bit of byte 0 is set.
uint64_t field_number(const uint8_t *p, size_t len) {
  uint64_t v = 0;
  if (p[0] & 0x80) {
    v = p[0] & 0x7f;
    for (size_t i = 1; i < len; ++i)
      v = (v << 8) | p[i];
    return v;
  }
  for (size_t i = 0; i < len; ++i) {
    if (p[i] >= '0' && p[i] <= '7')
      v = (v << 3) | uint64_t(p[i] - '0');
    else if (p[i] != ' ' && p[i] != 0)
      break;
  }
  return v;
}

bool header_checksum_ok(const uint8_t *h) {
  uint64_t sum = 0;
  for (size_t i = 0; i < TAR_BLOCK; ++i) {
    bool in_field = i >= TAR_CHKSUM_OFFSET && i < TAR_CHKSUM_OFFSET + TAR_CHKSUM_LEN;
    sum += in_field ? uint8_t(' ') : h[i];
  }
  return sum == field_number(h + TAR_CHKSUM_OFFSET, TAR_CHKSUM_LEN);
}

bool all_zero(const uint8_t *p, size_t len) {
  return std::all_of(p, p + len, [](uint8_t b) { return b == 0; });
}

std::string normalize(std::string path) {
  std::replace(path.begin(), path.end(), '\\', '/');
  for (;;) {
    if (path.starts_with("./"))
      path.erase(0, 2);
    else if (path.starts_with("/"))
      path.erase(0, 1);
    else
      break;
  }
  return path;
}

Result<std::vector<uint8_t>> gunzip(std::span<const uint8_t> in,
                                    const std::string &path) {
  z_stream zs{};
  if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK)
    return storage_error("inflateInit2", path, "zlib initialization failed");

  std::vector<uint8_t> out(std::max<size_t>(in.size() * 4, 64 * 1024));
  zs.next_in = const_cast<Bytef *>(in.data());
  zs.avail_in = static_cast<uInt>(in.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.total_out == out.size())
      out.resize(out.size() * 2);
    zs.next_out = out.data() + zs.total_out;
    zs.avail_out = static_cast<uInt>(out.size() - zs.total_out);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
      inflateEnd(&zs);
      return fail(ErrorCode::Format, "truncated gzip stream in " + path);
    }
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
      std::string msg = zs.msg ? zs.msg : "inflate failed";
      inflateEnd(&zs);
      return fail(ErrorCode::Format, "corrupt gzip stream in " + path + ": " + msg);
    }
  }
  out.resize(zs.total_out);
  inflateEnd(&zs);
  return out;
}

/// Immutable view over one archive entry.
class ArchiveStorage final : public MappedStorage {
public:
  ArchiveStorage(std::string path, std::shared_ptr<const void> owner,
                 const uint8_t *data, size_t size)
      : path_(std::move(path)), owner_(std::move(owner)), data_(data),
        size_(size) {}

  Result<MappedRegion> map(uint64_t offset, uint64_t length) override {
    if (!owner_)
      return storage_error("map", path_, "storage is closed");
    if (offset > size_)
      return storage_error("map", path_, "offset beyond entry size");
    if (length == 0)
      length = size_ - offset;
    if (length > size_ - offset)
      return storage_error("map", path_,
                           "range [" + std::to_string(offset) + ", +" +
                               std::to_string(length) + ") exceeds size " +
                               std::to_string(size_));
    return MappedRegion(owner_, const_cast<uint8_t *>(data_) + offset,
                        static_cast<size_t>(length), false);
  }

  uint64_t size() const override { return owner_ ? size_ : 0; }

  Status grow(uint64_t) override {
    return fail(ErrorCode::ReadOnly, "grow on archive entry " + path_);
  }
  Status truncate(uint64_t) override {
    return fail(ErrorCode::ReadOnly, "truncate on archive entry " + path_);
  }
  Status sync() override {
    return fail(ErrorCode::ReadOnly, "sync on archive entry " + path_);
  }

  void close() override { owner_.reset(); }
  bool read_only() const override { return true; }
  const std::string &path() const override { return path_; }

private:
  std::string path_;
  std::shared_ptr<const void> owner_;
  const uint8_t *data_;
  size_t size_;
};

} // namespace

Result<std::shared_ptr<ArchiveStorageProvider>>
ArchiveStorageProvider::load(const std::string &archive_path) {
  auto file = FileStorage::open(archive_path, OpenMode::ReadOnly);
  if (!file)
    return std::unexpected(file.error());
  auto region = (*file)->map(0, 0);
  if (!region)
    return std::unexpected(region.error());

  std::shared_ptr<ArchiveStorageProvider> provider(new ArchiveStorageProvider());
  provider->archive_path_ = archive_path;

  auto raw = region->bytes();
  if (raw.size() >= 2 && raw[0] == 0x1f && raw[1] == 0x8b) {
    auto inflated = gunzip(raw, archive_path);
    if (!inflated)
      return std::unexpected(inflated.error());
    auto buf = std::make_shared<const std::vector<uint8_t>>(std::move(*inflated));
    provider->base_ = buf->data();
    provider->size_ = buf->size();
    provider->owner_ = buf;
    provider->compressed_ = true;
  } else {
    provider->base_ = raw.data();
    provider->size_ = raw.size();
    provider->owner_ = std::make_shared<const MappedRegion>(std::move(*region));
  }

  if (auto r = provider->index_entries(); !r)
    return std::unexpected(r.error());

  log::info("archive", "loaded " + archive_path + " (" +
                           std::to_string(provider->order_.size()) +
                           " entries" +
                           (provider->compressed_ ? ", gzip)" : ")"));
  return provider;
}

Status ArchiveStorageProvider::index_entries() {
  std::string long_name;
  size_t pos = 0;
  while (pos + TAR_BLOCK <= size_) {
    const uint8_t *h = base_ + pos;
    if (all_zero(h, TAR_BLOCK))
      break;
    if (!header_checksum_ok(h))
      return fail(ErrorCode::Format, "bad tar header checksum at offset " +
                                         std::to_string(pos) + " in " +
                                         archive_path_);

    uint64_t size = field_number(h + TAR_SIZE_OFFSET, TAR_SIZE_LEN);
    uint64_t data = pos + TAR_BLOCK;
    if (size > size_ - data)
      return fail(ErrorCode::Format, "truncated tar entry at offset " +
                                         std::to_string(pos) + " in " +
                                         archive_path_);

    char type = static_cast<char>(h[TAR_TYPE_OFFSET]);
    if (type == 'L') {
      long_name = field_string(base_ + data, size);
    } else if (type == '0' || type == '\0') {
      std::string name;
      if (!long_name.empty()) {
        name = std::move(long_name);
        long_name.clear();
      } else {
        name = field_string(h + TAR_NAME_OFFSET, TAR_NAME_LEN);
        bool ustar = std::equal(h + TAR_MAGIC_OFFSET, h + TAR_MAGIC_OFFSET + 5,
                                "ustar");
        std::string prefix =
            ustar ? field_string(h + TAR_PREFIX_OFFSET, TAR_PREFIX_LEN) : "";
        if (!prefix.empty())
          name = prefix + "/" + name;
      }
      name = normalize(std::move(name));
      if (!index_.contains(name))
        order_.push_back(name);
      index_[name] = Entry{data, size};
    } else {
      long_name.clear();
    }

    pos = data + ((size + TAR_BLOCK - 1) / TAR_BLOCK) * TAR_BLOCK;
  }
  return {};
}

const ArchiveStorageProvider::Entry *
ArchiveStorageProvider::resolve(const std::string &path) const {
  std::string key = normalize(path);
  if (auto it = index_.find(key); it != index_.end())
    return &it->second;
  auto slash = key.find_last_of('/');
  if (slash != std::string::npos) {
    if (auto it = index_.find(key.substr(slash + 1)); it != index_.end())
      return &it->second;
  }
  return nullptr;
}

Result<std::unique_ptr<MappedStorage>>
ArchiveStorageProvider::open(const std::string &path, OpenMode mode) {
  if (mode != OpenMode::ReadOnly)
    return fail(ErrorCode::ReadOnly,
                "archive " + archive_path_ + " is read-only (" + path + ")");

  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    auto file = FileStorage::open(path, OpenMode::ReadOnly);
    if (!file)
      return std::unexpected(file.error());
    return std::unique_ptr<MappedStorage>(std::move(*file));
  }

  const Entry *entry = resolve(path);
  if (!entry)
    return fail(ErrorCode::NotFound,
                "entry " + path + " not found in " + archive_path_);
  return std::unique_ptr<MappedStorage>(std::make_unique<ArchiveStorage>(
      path, owner_, base_ + entry->offset, static_cast<size_t>(entry->size)));
}

bool ArchiveStorageProvider::exists(const std::string &path) const {
  std::error_code ec;
  return fs::is_regular_file(path, ec) || resolve(path) != nullptr;
}

Status ArchiveStorageProvider::rename(const std::string &from,
                                      const std::string &) {
  return fail(ErrorCode::ReadOnly, "rename " + from + " inside archive " +
                                       archive_path_);
}

Status ArchiveStorageProvider::remove(const std::string &path) {
  return fail(ErrorCode::ReadOnly,
              "remove " + path + " inside archive " + archive_path_);
}

} // namespace trigraph
