#include <algorithm>
#include <cstring>
#include <limits>

#include <fmt/format.h>

#include <ata/endian.hpp>
#include <ata/manifest.hpp>
#include <ata/options.hpp>

namespace ata {

namespace {

// Smallest possible serialized entry: 1-byte path, no chunks
constexpr size_t kMinEntrySize = 2 + 1 + 1 + 8 + 4 + 8 + kChecksumSize + 4;
constexpr size_t kChunkRecordSize = 8 + 8 + 8 + kTagSize;
constexpr size_t kMaxPathLength = std::numeric_limits<uint16_t>::max();

// Bounds-checked reads over the manifest bytes
class Cursor {
public:
  explicit Cursor(std::span<const uint8_t> data) : data_(data) {}

  size_t remaining() const { return data_.size() - pos_; }
  size_t position() const { return pos_; }

  template <typename T> bool read(T &out) {
    if (remaining() < sizeof(T)) {
      return false;
    }
    out = get_le<T>(data_.data() + pos_);
    pos_ += sizeof(T);
    return true;
  }

  bool readBytes(uint8_t *out, size_t len) {
    if (remaining() < len) {
      return false;
    }
    std::memcpy(out, data_.data() + pos_, len);
    pos_ += len;
    return true;
  }

  bool readString(std::string &out, size_t len) {
    if (remaining() < len) {
      return false;
    }
    out.assign(reinterpret_cast<const char *>(data_.data() + pos_), len);
    pos_ += len;
    return true;
  }

  std::optional<uint64_t> readVarint() { return decodeVarint(data_, pos_); }

private:
  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

std::optional<ManifestEntry> parseEntry(Cursor &cursor, size_t entryIndex, Error *outError) {
  auto truncated = [&]() {
    setError(outError, ErrorKind::Format,
             fmt::format("Manifest entry {} is truncated at byte {}", entryIndex,
                         cursor.position()));
    return std::nullopt;
  };

  ManifestEntry entry;

  uint16_t pathLen = 0;
  std::string rawPath;
  if (!cursor.read(pathLen) || !cursor.readString(rawPath, pathLen)) {
    return truncated();
  }

  Error pathError;
  auto path = normalizeEntryPath(rawPath, &pathError);
  if (!path || *path != rawPath) {
    setError(outError, ErrorKind::Format,
             fmt::format("Manifest entry {} has an unsafe path '{}'", entryIndex, rawPath));
    return std::nullopt;
  }
  entry.path = std::move(*path);

  uint8_t kind = 0;
  if (!cursor.read(kind)) {
    return truncated();
  }
  if (kind > static_cast<uint8_t>(EntryKind::Symlink)) {
    setError(outError, ErrorKind::Format,
             fmt::format("Manifest entry '{}' has unknown kind {}", entry.path, kind));
    return std::nullopt;
  }
  entry.kind = static_cast<EntryKind>(kind);

  if (entry.kind == EntryKind::Symlink) {
    uint16_t targetLen = 0;
    if (!cursor.read(targetLen) || !cursor.readString(entry.linkTarget, targetLen)) {
      return truncated();
    }
  }

  uint64_t mtime = 0;
  uint32_t chunkCount = 0;
  if (!cursor.read(entry.size) || !cursor.read(entry.mode) || !cursor.read(mtime) ||
      !cursor.readBytes(entry.checksum.data(), entry.checksum.size()) ||
      !cursor.read(chunkCount)) {
    return truncated();
  }
  entry.mtime = static_cast<int64_t>(mtime);

  if (entry.kind != EntryKind::File && chunkCount != 0) {
    setError(outError, ErrorKind::Format,
             fmt::format("Manifest {} entry '{}' carries {} chunks", entryKindName(entry.kind),
                         entry.path, chunkCount));
    return std::nullopt;
  }
  if (entry.kind == EntryKind::Symlink && entry.size != entry.linkTarget.size()) {
    setError(outError, ErrorKind::Format,
             fmt::format("Symlink '{}' size does not match its target", entry.path));
    return std::nullopt;
  }
  if (chunkCount > cursor.remaining() / kChunkRecordSize) {
    return truncated();
  }

  entry.chunks.reserve(chunkCount);
  for (uint32_t i = 0; i < chunkCount; ++i) {
    ChunkDescriptor chunk;
    chunk.index = i;
    if (!cursor.read(chunk.offset) || !cursor.read(chunk.storedLength) ||
        !cursor.read(chunk.plainLength) || !cursor.readBytes(chunk.tag.data(), chunk.tag.size())) {
      return truncated();
    }
    entry.chunks.push_back(chunk);
  }

  return entry;
}

} // namespace

std::optional<std::string> normalizeEntryPath(std::string_view path, Error *outError) {
  std::string result(path);
  while (result.size() > 1 && result.back() == '/') {
    result.pop_back();
  }

  auto reject = [&](const char *why) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("Unsafe archive path '{}': {}", path, why));
    return std::nullopt;
  };

  if (result.empty()) {
    return reject("empty path");
  }
  if (result.size() > kMaxPathLength) {
    return reject("path too long");
  }
  if (result.front() == '/') {
    return reject("absolute path");
  }
  if (result.find('\0') != std::string::npos) {
    return reject("embedded NUL");
  }

  size_t start = 0;
  while (start <= result.size()) {
    size_t end = result.find('/', start);
    if (end == std::string::npos) {
      end = result.size();
    }
    std::string_view component(result.data() + start, end - start);
    if (component.empty()) {
      return reject("empty component");
    }
    if (component == "." || component == "..") {
      return reject("relative component");
    }
    start = end + 1;
  }

  return result;
}

void encodeVarint(std::vector<uint8_t> &out, uint64_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>(value | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
}

std::optional<uint64_t> decodeVarint(std::span<const uint8_t> data, size_t &pos) {
  uint64_t value = 0;
  for (int shift = 0; shift < 64; shift += 7) {
    if (pos >= data.size()) {
      return std::nullopt;
    }
    uint8_t byte = data[pos++];
    // The tenth byte may only carry the top bit of a 64-bit value
    if (shift == 63 && byte > 1) {
      return std::nullopt;
    }
    value |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if (!(byte & 0x80)) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<size_t> ManifestBuilder::addEntry(ManifestEntry entry, Error *outError) {
  auto path = normalizeEntryPath(entry.path, outError);
  if (!path) {
    return std::nullopt;
  }
  if (paths_.contains(*path)) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("Duplicate path in archive: {}", *path));
    return std::nullopt;
  }
  if (entry.kind == EntryKind::Symlink && entry.linkTarget.size() > kMaxPathLength) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("Symlink target too long for '{}'", *path));
    return std::nullopt;
  }
  if (entry.kind != EntryKind::File && !entry.chunks.empty()) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("Only files carry chunks ('{}')", *path));
    return std::nullopt;
  }

  entry.path = *path;
  paths_.insert(std::move(*path));
  entries_.push_back(std::move(entry));
  return entries_.size() - 1;
}

bool ManifestBuilder::addChunk(size_t entryIndex, const ChunkDescriptor &chunk, Error *outError) {
  if (entryIndex >= entries_.size()) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("No manifest entry {}", entryIndex));
  }

  ManifestEntry &entry = entries_[entryIndex];
  if (entry.kind != EntryKind::File) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Cannot add a chunk to {} '{}'", entryKindName(entry.kind),
                                entry.path));
  }
  if (chunk.index != entry.chunks.size()) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Chunk {} of '{}' added out of order", chunk.index, entry.path));
  }

  entry.chunks.push_back(chunk);
  return true;
}

std::vector<uint8_t> ManifestBuilder::serialize(size_t count) const {
  count = std::min(count, entries_.size());

  std::vector<uint8_t> out;
  encodeVarint(out, count);

  for (size_t i = 0; i < count; ++i) {
    const ManifestEntry &entry = entries_[i];

    put_le<uint16_t>(out, static_cast<uint16_t>(entry.path.size()));
    out.insert(out.end(), entry.path.begin(), entry.path.end());
    out.push_back(static_cast<uint8_t>(entry.kind));

    if (entry.kind == EntryKind::Symlink) {
      put_le<uint16_t>(out, static_cast<uint16_t>(entry.linkTarget.size()));
      out.insert(out.end(), entry.linkTarget.begin(), entry.linkTarget.end());
    }

    put_le<uint64_t>(out, entry.size);
    put_le<uint32_t>(out, entry.mode);
    put_le<uint64_t>(out, static_cast<uint64_t>(entry.mtime));
    out.insert(out.end(), entry.checksum.begin(), entry.checksum.end());

    put_le<uint32_t>(out, static_cast<uint32_t>(entry.chunks.size()));
    for (const auto &chunk : entry.chunks) {
      put_le<uint64_t>(out, chunk.offset);
      put_le<uint64_t>(out, chunk.storedLength);
      put_le<uint64_t>(out, chunk.plainLength);
      out.insert(out.end(), chunk.tag.begin(), chunk.tag.end());
    }
  }

  return out;
}

void ManifestBuilder::clear() {
  entries_.clear();
  paths_.clear();
}

std::optional<std::vector<ManifestEntry>> ManifestReader::parse(std::span<const uint8_t> data,
                                                                uint64_t dataBegin,
                                                                uint64_t dataEnd,
                                                                Error *outError) {
  Cursor cursor(data);

  auto entryCount = cursor.readVarint();
  if (!entryCount) {
    setError(outError, ErrorKind::Format, "Manifest entry count is malformed");
    return std::nullopt;
  }
  // Sanity check against corruption before reserving anything
  if (*entryCount > cursor.remaining() / kMinEntrySize) {
    setError(outError, ErrorKind::Format,
             fmt::format("Manifest claims {} entries in {} bytes", *entryCount, data.size()));
    return std::nullopt;
  }

  std::vector<ManifestEntry> entries;
  entries.reserve(static_cast<size_t>(*entryCount));
  std::unordered_set<std::string> seen;

  uint64_t sequence = 0;
  uint64_t dataCursor = dataBegin;

  for (uint64_t i = 0; i < *entryCount; ++i) {
    auto entry = parseEntry(cursor, static_cast<size_t>(i), outError);
    if (!entry) {
      return std::nullopt;
    }

    if (!seen.insert(entry->path).second) {
      setError(outError, ErrorKind::Format,
               fmt::format("Duplicate path in manifest: {}", entry->path));
      return std::nullopt;
    }

    uint64_t plainTotal = 0;
    for (auto &chunk : entry->chunks) {
      if (chunk.storedLength == 0 || chunk.plainLength == 0 || chunk.offset < dataCursor ||
          chunk.offset > dataEnd || chunk.storedLength > dataEnd - chunk.offset) {
        setError(outError, ErrorKind::Format,
                 fmt::format("Chunk {} of '{}' has invalid bounds (offset={}, length={})",
                             chunk.index, entry->path, chunk.offset, chunk.storedLength));
        return std::nullopt;
      }
      // Decoding allocates plainLength bytes, so it is bounded before any payload is read
      if (chunk.plainLength > kMaxChunkSize) {
        setError(outError, ErrorKind::Format,
                 fmt::format("Chunk {} of '{}' claims {} plain bytes, more than a chunk can hold",
                             chunk.index, entry->path, chunk.plainLength));
        return std::nullopt;
      }
      if (chunk.plainLength > std::numeric_limits<uint64_t>::max() - plainTotal) {
        setError(outError, ErrorKind::Format,
                 fmt::format("Chunk lengths of '{}' overflow", entry->path));
        return std::nullopt;
      }
      dataCursor = chunk.offset + chunk.storedLength;
      plainTotal += chunk.plainLength;
      chunk.sequence = sequence++;
    }

    if (entry->kind == EntryKind::File && plainTotal != entry->size) {
      setError(outError, ErrorKind::Format,
               fmt::format("Chunks of '{}' sum to {} bytes, entry size is {}", entry->path,
                           plainTotal, entry->size));
      return std::nullopt;
    }

    entries.push_back(std::move(*entry));
  }

  if (cursor.remaining() != 0) {
    setError(outError, ErrorKind::Format,
             fmt::format("{} unexpected bytes after the manifest", cursor.remaining()));
    return std::nullopt;
  }

  return entries;
}

} // namespace ata
