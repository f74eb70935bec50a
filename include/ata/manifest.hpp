#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// Normalize an archive path: '/' is the only separator and a trailing '/' is
// dropped. Other bytes, '\\' and ':' included, belong to the name. Fails with
// ErrorKind::InvalidArgument for empty or absolute paths and for empty, '.'
// or '..' components.
std::optional<std::string> normalizeEntryPath(std::string_view path, Error *outError = nullptr);

// LEB128 varint helpers used by the manifest
void encodeVarint(std::vector<uint8_t> &out, uint64_t value);
std::optional<uint64_t> decodeVarint(std::span<const uint8_t> data, size_t &pos);

// Accumulates entries in traversal order while the archive is written, and
// serializes them once all chunk data is on disk
class ManifestBuilder {
public:
  ManifestBuilder() = default;

  // Add an entry and return its index. The path is normalized; duplicate
  // paths are rejected.
  std::optional<size_t> addEntry(ManifestEntry entry, Error *outError = nullptr);

  // Append the next chunk descriptor of a file entry
  bool addChunk(size_t entryIndex, const ChunkDescriptor &chunk, Error *outError = nullptr);

  ManifestEntry &entry(size_t index) { return entries_[index]; }
  const std::vector<ManifestEntry> &entries() const { return entries_; }
  size_t entryCount() const { return entries_.size(); }

  // Serialize every entry
  std::vector<uint8_t> serialize() const { return serialize(entries_.size()); }

  // Serialize the first `count` entries only (partial manifest of an aborted archive)
  std::vector<uint8_t> serialize(size_t count) const;

  void clear();

private:
  std::vector<ManifestEntry> entries_;
  std::unordered_set<std::string> paths_;
};

class ManifestReader {
public:
  // Parse a serialized manifest. Chunk descriptors must point inside
  // [dataBegin, dataEnd), in write order and without overlap. Global chunk
  // sequence numbers are derived from that order.
  static std::optional<std::vector<ManifestEntry>> parse(std::span<const uint8_t> data,
                                                         uint64_t dataBegin, uint64_t dataEnd,
                                                         Error *outError = nullptr);
};

} // namespace ata
