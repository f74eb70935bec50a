#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace ata {

// Parse the fixed-size container header and trailer
std::optional<ArchiveHeader> decodeHeader(std::span<const uint8_t> data,
                                          Error *outError = nullptr);
std::optional<ArchiveTrailer> decodeTrailer(std::span<const uint8_t> data,
                                            Error *outError = nullptr);

// Memory-mapped view of a container: header, manifest and chunk records
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open a container. An archive without trailer, or whose trailer is not
  // marked complete, fails with ErrorKind::IncompleteArchive unless
  // allowIncomplete is set; it then exposes the entries of its partial
  // manifest (none if the trailer is missing).
  static std::optional<Reader> open(const std::filesystem::path &path, bool allowIncomplete = false,
                                    Error *outError = nullptr);

  const ArchiveHeader &header() const { return header_; }

  const std::vector<ManifestEntry> &entries() const { return entries_; }
  size_t entryCount() const { return entries_.size(); }

  // Case-sensitive lookup by archive path. Returns nullptr if not found.
  const ManifestEntry *findEntry(const std::string &path) const;

  // Zero-copy view of a chunk's stored bytes. Empty if outside the chunk data area.
  std::span<const uint8_t> chunkView(const ChunkDescriptor &chunk) const;

  bool isComplete() const { return complete_; }
  bool isOpen() const { return mappedFile_.isOpen(); }

  size_t fileSize() const { return mappedFile_.size(); }

  void close();

private:
  bool parse(bool allowIncomplete, Error *outError);

  MappedFile mappedFile_;
  ArchiveHeader header_;
  std::vector<ManifestEntry> entries_;
  std::unordered_map<std::string, size_t> lookup_;
  uint64_t dataEnd_ = 0; // End of the chunk data area
  bool complete_ = false;
};

} // namespace ata
