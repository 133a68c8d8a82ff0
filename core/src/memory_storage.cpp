#include "trigraph/memory_storage.hpp"

#include <algorithm>

namespace trigraph {

namespace {

class MemoryStorage final : public MappedStorage {
public:
  using Blob = MemoryStorageProvider::Blob;

  MemoryStorage(std::string path, std::shared_ptr<Blob> blob, bool read_only)
      : path_(std::move(path)), blob_(std::move(blob)), read_only_(read_only) {}

  Result<MappedRegion> map(uint64_t offset, uint64_t length) override {
    if (!blob_)
      return storage_error("map", path_, "storage is closed");
    std::lock_guard lock(blob_->mu);
    auto &buf = blob_->bytes;
    uint64_t size = buf->size();
    if (offset > size)
      return storage_error("map", path_,
                           "offset " + std::to_string(offset) +
                               " beyond size " + std::to_string(size));
    if (length == 0)
      length = size - offset;
    if (length > size - offset)
      return storage_error("map", path_,
                           "range [" + std::to_string(offset) + ", +" +
                               std::to_string(length) + ") exceeds size " +
                               std::to_string(size));
    return MappedRegion(buf, buf->data() + offset,
                        static_cast<size_t>(length), !read_only_);
  }

  uint64_t size() const override {
    if (!blob_)
      return 0;
    std::lock_guard lock(blob_->mu);
    return blob_->bytes->size();
  }

  Status grow(uint64_t new_size) override {
    if (new_size < size())
      return fail(ErrorCode::InvalidArgument,
                  "grow cannot shrink " + path_);
    return resize(new_size, "grow");
  }

  Status truncate(uint64_t new_size) override {
    if (new_size > size())
      return fail(ErrorCode::InvalidArgument,
                  "truncate cannot extend " + path_);
    return resize(new_size, "truncate");
  }

  Status sync() override {
    if (read_only_)
      return fail(ErrorCode::ReadOnly, "sync on read-only " + path_);
    if (!blob_)
      return storage_error("sync", path_, "storage is closed");
    return {};
  }

  void close() override { blob_.reset(); }
  bool read_only() const override { return read_only_; }
  const std::string &path() const override { return path_; }

private:
  // A fresh buffer replaces the old one so regions already handed out keep
  // pointing at valid (pre-resize) memory.
  Status resize(uint64_t new_size, const char *op) {
    if (read_only_)
      return fail(ErrorCode::ReadOnly, std::string(op) + " on read-only " + path_);
    if (!blob_)
      return storage_error(op, path_, "storage is closed");
    std::lock_guard lock(blob_->mu);
    auto next = std::make_shared<std::vector<uint8_t>>(
        static_cast<size_t>(new_size), uint8_t{0});
    size_t keep = std::min(next->size(), blob_->bytes->size());
    std::copy_n(blob_->bytes->begin(), keep, next->begin());
    blob_->bytes = std::move(next);
    return {};
  }

  std::string path_;
  std::shared_ptr<Blob> blob_;
  bool read_only_ = false;
};

} // namespace

Result<std::unique_ptr<MappedStorage>>
MemoryStorageProvider::open(const std::string &path, OpenMode mode) {
  std::lock_guard lock(mu_);
  auto it = blobs_.find(path);
  if (mode == OpenMode::Create) {
    if (it == blobs_.end()) {
      it = blobs_.emplace(path, std::make_shared<Blob>()).first;
    } else {
      std::lock_guard blob_lock(it->second->mu);
      it->second->bytes = std::make_shared<std::vector<uint8_t>>();
    }
  } else if (it == blobs_.end()) {
    return storage_error("open", path, "no such file");
  }
  return std::unique_ptr<MappedStorage>(std::make_unique<MemoryStorage>(
      path, it->second, mode == OpenMode::ReadOnly));
}

bool MemoryStorageProvider::exists(const std::string &path) const {
  std::lock_guard lock(mu_);
  return blobs_.contains(path);
}

Status MemoryStorageProvider::rename(const std::string &from,
                                     const std::string &to) {
  std::lock_guard lock(mu_);
  auto it = blobs_.find(from);
  if (it == blobs_.end())
    return storage_error("rename", from, "no such file");
  auto blob = it->second;
  blobs_.erase(it);
  blobs_[to] = std::move(blob);
  return {};
}

Status MemoryStorageProvider::remove(const std::string &path) {
  std::lock_guard lock(mu_);
  blobs_.erase(path);
  return {};
}

std::vector<uint8_t>
MemoryStorageProvider::contents(const std::string &path) const {
  std::lock_guard lock(mu_);
  auto it = blobs_.find(path);
  if (it == blobs_.end())
    return {};
  std::lock_guard blob_lock(it->second->mu);
  return *it->second->bytes;
}

void MemoryStorageProvider::put(const std::string &path,
                                std::vector<uint8_t> bytes) {
  std::lock_guard lock(mu_);
  auto &blob = blobs_[path];
  if (!blob)
    blob = std::make_shared<Blob>();
  std::lock_guard blob_lock(blob->mu);
  blob->bytes = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
}

} // namespace trigraph
