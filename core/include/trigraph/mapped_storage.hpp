#pragma once

/**
 * @file mapped_storage.hpp
 * @brief Byte-addressable storage handles and the providers that open them.
 *
 * A StorageProvider resolves a logical path to a MappedStorage. Every
 * MappedStorage hands out MappedRegion views. A region keeps the mapping it
 * was cut from alive, so a region obtained before grow() stays readable
 * (with pre-grow contents) until it is released.
 */

#include "trigraph/error.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace trigraph {

// ═══════════════════════════════════════════════════════════════════════════
// MappedRegion
// ═══════════════════════════════════════════════════════════════════════════

class MappedRegion {
public:
  MappedRegion() = default;
  MappedRegion(std::shared_ptr<const void> owner, uint8_t *data, size_t size,
               bool writable)
      : owner_(std::move(owner)), data_(data), size_(size),
        writable_(writable) {}

  std::span<const uint8_t> bytes() const noexcept { return {data_, size_}; }

  /// Empty span when the region was mapped from a read-only storage.
  std::span<uint8_t> writable_bytes() const noexcept {
    return writable_ ? std::span<uint8_t>{data_, size_} : std::span<uint8_t>{};
  }

  const uint8_t *data() const noexcept { return data_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  bool writable() const noexcept { return writable_; }

  void unmap() noexcept {
    owner_.reset();
    data_ = nullptr;
    size_ = 0;
    writable_ = false;
  }

private:
  std::shared_ptr<const void> owner_;
  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// MappedStorage
// ═══════════════════════════════════════════════════════════════════════════

class MappedStorage {
public:
  virtual ~MappedStorage() = default;

  /**
   * @brief Map `[offset, offset + length)`. `length == 0` maps the rest of
   * the storage. Fails instead of returning a shorter region.
   */
  virtual Result<MappedRegion> map(uint64_t offset, uint64_t length) = 0;

  virtual uint64_t size() const = 0;

  /// Extends the storage to `new_size` bytes. Prior regions keep old views.
  virtual Status grow(uint64_t new_size) = 0;

  /// Shrinks the storage to `new_size` bytes (rollback of unpublished tails).
  virtual Status truncate(uint64_t new_size) = 0;

  virtual Status sync() = 0;

  /// Releases the mapping and the underlying handle. Idempotent.
  virtual void close() = 0;

  virtual bool read_only() const = 0;

  virtual const std::string &path() const = 0;

  // --- Helpers built on map() ---

  /// Copies `bytes` into the storage at `offset`. Does not grow.
  Status write(uint64_t offset, std::span<const uint8_t> bytes);

  /// Copies `length` bytes out of the storage.
  Result<std::vector<uint8_t>> read(uint64_t offset, uint64_t length);
};

// ═══════════════════════════════════════════════════════════════════════════
// StorageProvider
// ═══════════════════════════════════════════════════════════════════════════

enum class OpenMode {
  ReadOnly,  ///< Existing storage, no writes
  ReadWrite, ///< Existing storage
  Create     ///< Create or truncate to zero bytes
};

class StorageProvider {
public:
  virtual ~StorageProvider() = default;

  virtual Result<std::unique_ptr<MappedStorage>> open(const std::string &path,
                                                      OpenMode mode) = 0;
  virtual bool exists(const std::string &path) const = 0;
  virtual Status rename(const std::string &from, const std::string &to) = 0;
  virtual Status remove(const std::string &path) = 0;
};

/// StorageError carrying the failing operation and its cause.
inline std::unexpected<Error> storage_error(std::string_view op,
                                            const std::string &path,
                                            const std::string &cause) {
  return fail(ErrorCode::Storage,
              std::string(op) + " " + path + ": " + cause);
}

} // namespace trigraph
