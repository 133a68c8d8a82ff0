#pragma once

#include "trigraph/mapped_storage.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace trigraph {

/**
 * @brief Read-only provider over the entries of a tar or tar.gz archive.
 *
 * Plain tar archives are memory mapped and each entry is exposed in place.
 * Gzip-compressed archives (detected by the 1f 8b magic) are inflated into
 * memory once at load time.
 *
 * Path resolution: a path naming an existing regular file on disk is opened
 * read-only from disk. Otherwise the normalized path ("./" and leading "/"
 * stripped) is looked up, then its basename.
 *
 * Every mutating call fails with ReadOnly.
 */
class ArchiveStorageProvider final : public StorageProvider {
public:
  static Result<std::shared_ptr<ArchiveStorageProvider>>
  load(const std::string &archive_path);

  Result<std::unique_ptr<MappedStorage>> open(const std::string &path,
                                              OpenMode mode) override;
  bool exists(const std::string &path) const override;
  Status rename(const std::string &from, const std::string &to) override;
  Status remove(const std::string &path) override;

  /// Regular-file entry names in archive order.
  const std::vector<std::string> &entries() const noexcept { return order_; }
  bool compressed() const noexcept { return compressed_; }

private:
  struct Entry {
    uint64_t offset = 0;
    uint64_t size = 0;
  };

  ArchiveStorageProvider() = default;

  Status index_entries();
  const Entry *resolve(const std::string &path) const;

  std::string archive_path_;
  std::shared_ptr<const void> owner_;
  const uint8_t *base_ = nullptr;
  size_t size_ = 0;
  bool compressed_ = false;
  std::map<std::string, Entry> index_;
  std::vector<std::string> order_;
};

} // namespace trigraph
