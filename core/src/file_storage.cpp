#include "trigraph/file_storage.hpp"

#include <filesystem>
#include <system_error>

namespace trigraph {

namespace fs = std::filesystem;

// ═══════════════════════════════════════════════════════════════════════════
// FileStorage
// ═══════════════════════════════════════════════════════════════════════════

Result<std::unique_ptr<FileStorage>> FileStorage::open(const std::string &path,
                                                       OpenMode mode) {
  platform::FileAccess access = platform::FileAccess::read_write;
  if (mode == OpenMode::ReadOnly)
    access = platform::FileAccess::read;
  else if (mode == OpenMode::Create)
    access = platform::FileAccess::create;

  platform::FileHandle h = platform::file_open(path.c_str(), access);
  if (h == platform::INVALID_FILE_HANDLE)
    return storage_error("open", path, platform::last_error());

  std::unique_ptr<FileStorage> storage(
      new FileStorage(path, h, mode == OpenMode::ReadOnly));

  uint64_t sz = 0;
  if (!platform::file_size(h, sz))
    return storage_error("stat", path, platform::last_error());

  std::lock_guard lock(storage->mu_);
  if (auto r = storage->remap(sz); !r)
    return std::unexpected(r.error());
  return storage;
}

Status FileStorage::remap(uint64_t new_size) {
  auto fresh = std::make_shared<Mapping>();
  if (new_size > 0) {
    void *ptr = platform::mem_map(handle_, static_cast<size_t>(new_size),
                                  !read_only_);
    if (ptr == platform::MAP_FAILED_PTR)
      return storage_error("mmap", path_, platform::last_error());
    fresh->data = static_cast<uint8_t *>(ptr);
    fresh->size = static_cast<size_t>(new_size);
    platform::advise_random(ptr, fresh->size);
  }
  mapping_ = std::move(fresh);
  size_ = new_size;
  return {};
}

Result<MappedRegion> FileStorage::map(uint64_t offset, uint64_t length) {
  std::lock_guard lock(mu_);
  if (handle_ == platform::INVALID_FILE_HANDLE)
    return storage_error("map", path_, "storage is closed");
  if (offset > size_)
    return storage_error("map", path_,
                         "offset " + std::to_string(offset) +
                             " beyond size " + std::to_string(size_));
  if (length == 0)
    length = size_ - offset;
  if (length > size_ - offset)
    return storage_error("map", path_,
                         "range [" + std::to_string(offset) + ", +" +
                             std::to_string(length) + ") exceeds size " +
                             std::to_string(size_));
  uint8_t *base = mapping_->data ? mapping_->data + offset : nullptr;
  return MappedRegion(mapping_, base, static_cast<size_t>(length),
                      !read_only_);
}

uint64_t FileStorage::size() const {
  std::lock_guard lock(mu_);
  return size_;
}

Status FileStorage::resize(uint64_t new_size, const char *op) {
  if (read_only_)
    return fail(ErrorCode::ReadOnly, std::string(op) + " on read-only " + path_);
  std::lock_guard lock(mu_);
  if (handle_ == platform::INVALID_FILE_HANDLE)
    return storage_error(op, path_, "storage is closed");
  if (new_size == size_)
    return {};
  if (!platform::file_resize(handle_, new_size))
    return storage_error(op, path_, platform::last_error());
  return remap(new_size);
}

Status FileStorage::grow(uint64_t new_size) {
  if (new_size < size())
    return fail(ErrorCode::InvalidArgument,
                "grow cannot shrink " + path_ + " to " +
                    std::to_string(new_size));
  return resize(new_size, "grow");
}

Status FileStorage::truncate(uint64_t new_size) {
  if (new_size > size())
    return fail(ErrorCode::InvalidArgument,
                "truncate cannot extend " + path_ + " to " +
                    std::to_string(new_size));
  return resize(new_size, "truncate");
}

Status FileStorage::sync() {
  if (read_only_)
    return fail(ErrorCode::ReadOnly, "sync on read-only " + path_);
  std::lock_guard lock(mu_);
  if (handle_ == platform::INVALID_FILE_HANDLE)
    return storage_error("sync", path_, "storage is closed");
  if (!platform::mem_sync(mapping_->data, mapping_->size))
    return storage_error("msync", path_, platform::last_error());
  if (!platform::file_sync(handle_))
    return storage_error("fsync", path_, platform::last_error());
  return {};
}

void FileStorage::close() {
  std::lock_guard lock(mu_);
  mapping_.reset();
  if (handle_ != platform::INVALID_FILE_HANDLE) {
    platform::file_close(handle_);
    handle_ = platform::INVALID_FILE_HANDLE;
  }
  size_ = 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// FileStorageProvider
// ═══════════════════════════════════════════════════════════════════════════

Result<std::unique_ptr<MappedStorage>>
FileStorageProvider::open(const std::string &path, OpenMode mode) {
  auto storage = FileStorage::open(path, mode);
  if (!storage)
    return std::unexpected(storage.error());
  return std::unique_ptr<MappedStorage>(std::move(*storage));
}

bool FileStorageProvider::exists(const std::string &path) const {
  std::error_code ec;
  return fs::exists(path, ec);
}

Status FileStorageProvider::rename(const std::string &from,
                                   const std::string &to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec)
    return storage_error("rename", from + " -> " + to, ec.message());
  return {};
}

Status FileStorageProvider::remove(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec)
    return storage_error("remove", path, ec.message());
  return {};
}

} // namespace trigraph
