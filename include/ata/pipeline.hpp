#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "codec.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "types.hpp"

namespace ata {

// A chunk ready to be appended to the container
struct SealedChunk {
  std::vector<uint8_t> stored;
  Tag tag{};
  uint64_t plainLength = 0;
  uint64_t compressedLength = 0; // Equals plainLength when the chunk is stored raw
};

// Per-chunk transform: compress then encrypt, and the reverse with the tag
// verified before anything is decompressed. All methods are const and may be
// called from several workers at once.
class ChunkPipeline {
public:
  // key must outlive the pipeline and is required when encryption is enabled
  static std::optional<ChunkPipeline> create(CompressionId compression, int level,
                                             EncryptionId encryption, const KeyMaterial *key,
                                             Error *outError = nullptr);

  // Forward transform for the chunk written at archive-wide position `sequence`
  std::optional<SealedChunk> seal(std::span<const uint8_t> plaintext, uint64_t sequence,
                                  Error *outError = nullptr) const;

  // Reverse transform. Fails with ErrorKind::Authentication or
  // ErrorKind::CorruptData and never returns partial output.
  std::optional<std::vector<uint8_t>> open(std::span<const uint8_t> stored,
                                           const ChunkDescriptor &descriptor,
                                           Error *outError = nullptr) const;

  CompressionId compression() const { return codec_->id(); }
  EncryptionId encryption() const { return cipher_->id(); }
  bool encrypted() const { return cipher_->id() != EncryptionId::None; }

private:
  ChunkPipeline() = default;

  // Tag of an unencrypted chunk: SHA-256 prefix of the stored bytes
  static std::optional<Tag> checksumTag(std::span<const uint8_t> stored, Error *outError);

  std::shared_ptr<const Codec> codec_;
  std::shared_ptr<const Cipher> cipher_;
  const KeyMaterial *key_ = nullptr;
  int level_ = 0;
};

} // namespace ata
