#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// Serialize the fixed-size container header and trailer
std::vector<uint8_t> encodeHeader(const ArchiveHeader &header);
std::vector<uint8_t> encodeTrailer(const ArchiveTrailer &trailer);

// Streams a container to disk: header, then stored chunks in the order they are
// appended, then manifest and trailer. A writer destroyed before finish() or
// abort() leaves a file without trailer, which readers report as incomplete.
class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Create (or truncate) the file and write the header
  bool open(const std::filesystem::path &path, const ArchiveHeader &header,
            Error *outError = nullptr);

  // Append one stored chunk and return its absolute offset
  std::optional<uint64_t> appendChunk(std::span<const uint8_t> stored, Error *outError = nullptr);

  // Write the manifest and a trailer marking the archive complete, then close
  bool finish(std::span<const uint8_t> manifest, Error *outError = nullptr);

  // Write the manifest of the entries completed so far and a trailer marking
  // the archive incomplete, then close
  bool abort(std::span<const uint8_t> partialManifest, Error *outError = nullptr);

  bool isOpen() const { return open_; }

  // Bytes written so far, i.e. the offset of the next chunk
  uint64_t position() const { return position_; }

  const ArchiveHeader &header() const { return header_; }
  const std::filesystem::path &path() const { return path_; }

private:
  bool writeBytes(std::span<const uint8_t> bytes, Error *outError);
  bool writeTail(std::span<const uint8_t> manifest, bool complete, Error *outError);

  std::ofstream stream_;
  std::filesystem::path path_;
  ArchiveHeader header_;
  uint64_t position_ = 0;
  bool open_ = false;
};

} // namespace ata
