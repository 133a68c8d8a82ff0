#pragma once

#include "trigraph/mapped_storage.hpp"
#include "trigraph/platform.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace trigraph {

/**
 * @brief MappedStorage over an OS file mapping (MAP_SHARED).
 *
 * The whole file is mapped once; map() cuts regions out of the current
 * mapping. grow()/truncate() resize the file and install a fresh mapping;
 * outstanding regions keep the previous mapping alive until released.
 */
class FileStorage final : public MappedStorage {
public:
  static Result<std::unique_ptr<FileStorage>> open(const std::string &path,
                                                   OpenMode mode);

  ~FileStorage() override { close(); }

  FileStorage(const FileStorage &) = delete;
  FileStorage &operator=(const FileStorage &) = delete;

  Result<MappedRegion> map(uint64_t offset, uint64_t length) override;
  uint64_t size() const override;
  Status grow(uint64_t new_size) override;
  Status truncate(uint64_t new_size) override;
  Status sync() override;
  void close() override;
  bool read_only() const override { return read_only_; }
  const std::string &path() const override { return path_; }

private:
  /// One live mmap of the file. Unmapped when the last region drops it.
  struct Mapping {
    uint8_t *data = nullptr;
    size_t size = 0;
    ~Mapping() { platform::mem_unmap(data, size); }
  };

  FileStorage(std::string path, platform::FileHandle handle, bool read_only)
      : path_(std::move(path)), handle_(handle), read_only_(read_only) {}

  Status remap(uint64_t new_size);
  Status resize(uint64_t new_size, const char *op);

  std::string path_;
  platform::FileHandle handle_ = platform::INVALID_FILE_HANDLE;
  bool read_only_ = false;
  mutable std::mutex mu_;
  std::shared_ptr<Mapping> mapping_;
  uint64_t size_ = 0;
};

/// Opens real files on the local filesystem.
class FileStorageProvider final : public StorageProvider {
public:
  Result<std::unique_ptr<MappedStorage>> open(const std::string &path,
                                              OpenMode mode) override;
  bool exists(const std::string &path) const override;
  Status rename(const std::string &from, const std::string &to) override;
  Status remove(const std::string &path) override;
};

} // namespace trigraph
