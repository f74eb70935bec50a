#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "error.hpp"

namespace ata {

// Read-only mapping of a whole archive file. Chunks are served as views into
// the mapping, so random-access extraction never copies the data region.
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile() { close(); }

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map `path` for reading, replacing any previous mapping. Empty files cannot
  // be mapped and fail with ErrorKind::Io.
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  std::span<const uint8_t> data() const { return {bytes_, size_}; }

  // Bytes [offset, offset + length), or an empty span if out of range
  std::span<const uint8_t> view(uint64_t offset, uint64_t length) const;

  void close() noexcept;

  bool isOpen() const { return bytes_ != nullptr; }
  size_t size() const { return size_; }

private:
  void release(MappedFile &other) noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;
  void *mappingHandle_ = nullptr;
#else
  int fd_ = -1;
#endif
  const uint8_t *bytes_ = nullptr;
  size_t size_ = 0;
};

} // namespace ata
