#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ata {

inline constexpr char kHeaderMagic[4] = {'A', 'T', 'A', 'C'};
inline constexpr char kTrailerMagic[4] = {'A', 'T', 'A', 'E'};
inline constexpr uint8_t kFormatVersion = 1;

inline constexpr size_t kTagSize = 16;
inline constexpr size_t kChecksumSize = 32;
inline constexpr size_t kSaltSize = 16;

using Tag = std::array<uint8_t, kTagSize>;
using Checksum = std::array<uint8_t, kChecksumSize>;
using Salt = std::array<uint8_t, kSaltSize>;

enum class EntryKind : uint8_t {
  File = 0,
  Directory = 1,
  Symlink = 2,
};

enum class CompressionId : uint8_t {
  None = 0,
  Zlib = 1,
  Zstd = 2, // Only available when built with libzstd
};

enum class EncryptionId : uint8_t {
  None = 0,
  Aes256Gcm = 1,
};

const char *entryKindName(EntryKind kind);

// Location and integrity data of one stored chunk
struct ChunkDescriptor {
  uint32_t index = 0;        // Position within the owning entry
  uint64_t offset = 0;       // Absolute offset of the stored bytes in the container
  uint64_t storedLength = 0; // Compressed and/or encrypted length
  uint64_t plainLength = 0;
  Tag tag{};

  // Archive-wide write position, used to rebuild the nonce. Derived when the
  // manifest is parsed, never serialized.
  uint64_t sequence = 0;
};

// One logical file-tree entry
struct ManifestEntry {
  std::string path; // Relative, '/' separated, no '.' or '..' components
  EntryKind kind = EntryKind::File;
  uint64_t size = 0; // File size, or symlink target length
  uint32_t mode = 0; // Permission bits (07777)
  int64_t mtime = 0; // Seconds since epoch
  Checksum checksum{};
  std::string linkTarget; // Symlinks only
  std::vector<ChunkDescriptor> chunks;

  // Sum of stored chunk lengths
  uint64_t storedSize() const;
};

// Container header (32 bytes)
struct ArchiveHeader {
  uint8_t version = kFormatVersion;
  uint8_t flags = 0;
  CompressionId compression = CompressionId::None;
  EncryptionId encryption = EncryptionId::None;
  Salt salt{};
  uint32_t kdfIterations = 0; // Stored in the first half of the reserved field

  static constexpr size_t headerSize = 32;

  static constexpr uint8_t flagEncrypted = 0x01;
  static constexpr uint8_t flagKeyedChecksums = 0x02;

  bool encrypted() const { return (flags & flagEncrypted) != 0; }
  bool keyedChecksums() const { return (flags & flagKeyedChecksums) != 0; }
};

// Container trailer (21 bytes), always the last bytes of a finished archive
struct ArchiveTrailer {
  uint64_t manifestOffset = 0;
  uint64_t manifestLength = 0;
  bool complete = false;

  static constexpr size_t trailerSize = 21;
};

} // namespace ata
