#pragma once

/**
 * @file platform.hpp
 * @brief Cross-platform OS abstraction for memory-mapped file I/O.
 *
 * Provides a unified API over:
 *   - POSIX:   open(), ftruncate(), fsync(), mmap(), msync(), madvise()
 *   - Win32:   CreateFile(), CreateFileMapping(), MapViewOfFile(), etc.
 *
 * All platform-specific headers and syscalls are confined to this single
 * translation boundary. The rest of trigraph only uses trigraph::platform::.
 */

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

// ============================================================================
// Platform-specific includes
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
#define TRIGRAPH_PLATFORM_WINDOWS 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#define TRIGRAPH_PLATFORM_POSIX 1
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace trigraph::platform {

// ============================================================================
// File Handle Abstraction
// ============================================================================

#if defined(TRIGRAPH_PLATFORM_WINDOWS)
using FileHandle = HANDLE;
inline const FileHandle INVALID_FILE_HANDLE = INVALID_HANDLE_VALUE;
#else
using FileHandle = int;
inline constexpr FileHandle INVALID_FILE_HANDLE = -1;
#endif

enum class FileAccess {
  read,       ///< Existing file, read-only
  read_write, ///< Existing file, read-write
  create      ///< Create or truncate, read-write
};

/// Human-readable text for the last failed OS call on this thread.
inline std::string last_error() {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  return "win32 error " + std::to_string(GetLastError());
#else
  return std::strerror(errno);
#endif
}

// ============================================================================
// File Operations
// ============================================================================

/**
 * @brief Open a file for memory-mapped access.
 * @return File handle or INVALID_FILE_HANDLE on failure.
 */
inline FileHandle file_open(const char *path, FileAccess access,
                            [[maybe_unused]] int mode = 0644) {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  DWORD rights = access == FileAccess::read ? GENERIC_READ
                                            : GENERIC_READ | GENERIC_WRITE;
  DWORD disposition =
      access == FileAccess::create ? CREATE_ALWAYS : OPEN_EXISTING;
  return CreateFileA(path, rights, FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                     disposition, FILE_ATTRIBUTE_NORMAL, nullptr);
#else
  int flags = O_RDWR;
  if (access == FileAccess::read)
    flags = O_RDONLY;
  else if (access == FileAccess::create)
    flags = O_RDWR | O_CREAT | O_TRUNC;
  return ::open(path, flags | O_CLOEXEC, mode);
#endif
}

inline void file_close(FileHandle h) {
  if (h == INVALID_FILE_HANDLE)
    return;
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  CloseHandle(h);
#else
  ::close(h);
#endif
}

/**
 * @brief Get the size of an open file.
 * @return true on success; the size is written to `out`.
 */
inline bool file_size(FileHandle h, uint64_t &out) {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  LARGE_INTEGER sz;
  if (!GetFileSizeEx(h, &sz))
    return false;
  out = static_cast<uint64_t>(sz.QuadPart);
  return true;
#else
  struct stat sb;
  if (fstat(h, &sb) == -1)
    return false;
  out = static_cast<uint64_t>(sb.st_size);
  return true;
#endif
}

/**
 * @brief Resize (truncate/extend) a file. New bytes read as zero.
 */
inline bool file_resize(FileHandle h, uint64_t new_size) {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  LARGE_INTEGER li;
  li.QuadPart = static_cast<LONGLONG>(new_size);
  if (!SetFilePointerEx(h, li, nullptr, FILE_BEGIN))
    return false;
  return SetEndOfFile(h) != 0;
#else
  return ftruncate(h, static_cast<off_t>(new_size)) == 0;
#endif
}

/**
 * @brief Flush file data and metadata (size changes) to the device.
 */
inline bool file_sync(FileHandle h) {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  return FlushFileBuffers(h) != 0;
#else
  return fsync(h) == 0;
#endif
}

// ============================================================================
// Memory Mapping
// ============================================================================

#if defined(TRIGRAPH_PLATFORM_WINDOWS)
inline void *const MAP_FAILED_PTR = nullptr;
#else
inline void *const MAP_FAILED_PTR = MAP_FAILED;
#endif

/**
 * @brief Create a shared mapping of the first `size` bytes of a file.
 * @return Pointer to mapped region, or MAP_FAILED_PTR on failure.
 */
inline void *mem_map(FileHandle h, size_t size, bool writable) {
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  DWORD protect = writable ? PAGE_READWRITE : PAGE_READONLY;
  HANDLE mapping = CreateFileMappingA(h, nullptr, protect,
                                      static_cast<DWORD>(uint64_t(size) >> 32),
                                      static_cast<DWORD>(size & 0xFFFFFFFF),
                                      nullptr);
  if (!mapping)
    return MAP_FAILED_PTR;
  void *ptr = MapViewOfFile(mapping, writable ? FILE_MAP_WRITE : FILE_MAP_READ,
                            0, 0, size);
  CloseHandle(mapping);
  return ptr ? ptr : MAP_FAILED_PTR;
#else
  int prot = writable ? (PROT_READ | PROT_WRITE) : PROT_READ;
  return mmap(nullptr, size, prot, MAP_SHARED, h, 0);
#endif
}

inline void mem_unmap(void *addr, [[maybe_unused]] size_t size) {
  if (!addr || addr == MAP_FAILED_PTR)
    return;
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  UnmapViewOfFile(addr);
#else
  munmap(addr, size);
#endif
}

/**
 * @brief Flush dirty pages of a mapping to disk.
 */
inline bool mem_sync(void *addr, size_t size) {
  if (!addr || addr == MAP_FAILED_PTR)
    return true;
#if defined(TRIGRAPH_PLATFORM_WINDOWS)
  return FlushViewOfFile(addr, size) != 0;
#else
  return msync(addr, size, MS_SYNC) == 0;
#endif
}

/**
 * @brief Advise the kernel that access will be random (reduces readahead).
 * Record arrays are read by id lookup, not sequentially.
 */
inline void advise_random(void *addr, size_t size) {
#if defined(TRIGRAPH_PLATFORM_POSIX)
  madvise(addr, size, MADV_RANDOM);
#else
  (void)addr;
  (void)size;
#endif
}

} // namespace trigraph::platform
