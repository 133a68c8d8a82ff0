#pragma once

#include "trigraph/mapped_storage.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace trigraph {

/**
 * @brief In-process storage namespace, keyed by logical path.
 *
 * Every handle opened on the same path shares one buffer, so a store written
 * through one handle can be reopened through another. sync() is a no-op.
 */
class MemoryStorageProvider final : public StorageProvider {
public:
  Result<std::unique_ptr<MappedStorage>> open(const std::string &path,
                                              OpenMode mode) override;
  bool exists(const std::string &path) const override;
  Status rename(const std::string &from, const std::string &to) override;
  Status remove(const std::string &path) override;

  /// Snapshot of the current bytes under `path` (empty if absent).
  std::vector<uint8_t> contents(const std::string &path) const;

  /// Replaces the bytes under `path`, creating it if needed.
  void put(const std::string &path, std::vector<uint8_t> bytes);

  /// Shared byte buffer behind one logical path.
  struct Blob {
    std::mutex mu;
    std::shared_ptr<std::vector<uint8_t>> bytes =
        std::make_shared<std::vector<uint8_t>>();
  };

private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Blob>> blobs_;
};

} // namespace trigraph
