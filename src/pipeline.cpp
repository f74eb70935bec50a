#include <algorithm>
#include <cstring>

#include <fmt/format.h>

#include <ata/endian.hpp>
#include <ata/pipeline.hpp>

namespace ata {

namespace {

// The plaintext length is authenticated so a rewritten descriptor fails
std::vector<uint8_t> associatedData(uint64_t plainLength) {
  std::vector<uint8_t> aad;
  aad.reserve(sizeof(uint64_t));
  put_le<uint64_t>(aad, plainLength);
  return aad;
}

} // namespace

std::optional<ChunkPipeline> ChunkPipeline::create(CompressionId compression, int level,
                                                   EncryptionId encryption, const KeyMaterial *key,
                                                   Error *outError) {
  ChunkPipeline pipeline;

  pipeline.codec_ = makeCodec(compression);
  if (!pipeline.codec_) {
    setError(outError, ErrorKind::Format,
             fmt::format("Unsupported compression id {}", static_cast<int>(compression)));
    return std::nullopt;
  }

  pipeline.cipher_ = makeCipher(encryption);
  if (!pipeline.cipher_) {
    setError(outError, ErrorKind::Format,
             fmt::format("Unsupported encryption id {}", static_cast<int>(encryption)));
    return std::nullopt;
  }

  if (encryption != EncryptionId::None && (!key || key->empty())) {
    setError(outError, ErrorKind::InvalidArgument, "Encryption requires a derived key");
    return std::nullopt;
  }

  pipeline.key_ = key;
  pipeline.level_ = level;
  return pipeline;
}

std::optional<SealedChunk> ChunkPipeline::seal(std::span<const uint8_t> plaintext,
                                               uint64_t sequence, Error *outError) const {
  SealedChunk result;
  result.plainLength = plaintext.size();

  // Keep the compressed form only when it is strictly smaller, so that
  // stored length == plain length identifies raw chunks
  std::vector<uint8_t> body;
  if (codec_->id() != CompressionId::None) {
    auto compressed = codec_->encode(plaintext, level_, outError);
    if (!compressed) {
      return std::nullopt;
    }
    if (compressed->size() < plaintext.size()) {
      body = std::move(*compressed);
    }
  }
  if (body.empty()) {
    body.assign(plaintext.begin(), plaintext.end());
  }
  result.compressedLength = body.size();

  if (!encrypted()) {
    auto tag = checksumTag(body, outError);
    if (!tag) {
      return std::nullopt;
    }
    result.tag = *tag;
    result.stored = std::move(body);
    return result;
  }

  auto aad = associatedData(result.plainLength);
  auto sealed =
      cipher_->encrypt(key_->encryptionKey(), key_->nonceFor(sequence), body, aad, outError);
  if (!sealed) {
    return std::nullopt;
  }

  result.stored = std::move(sealed->ciphertext);
  result.tag = sealed->tag;
  return result;
}

std::optional<std::vector<uint8_t>> ChunkPipeline::open(std::span<const uint8_t> stored,
                                                        const ChunkDescriptor &descriptor,
                                                        Error *outError) const {
  if (stored.size() != descriptor.storedLength) {
    setError(outError, ErrorKind::CorruptData,
             fmt::format("Chunk {} has {} stored bytes, descriptor says {}", descriptor.index,
                         stored.size(), descriptor.storedLength));
    return std::nullopt;
  }

  // Step 1: authenticate. Nothing reaches the codec before this succeeds.
  std::vector<uint8_t> body;
  if (encrypted()) {
    auto aad = associatedData(descriptor.plainLength);
    auto plain = cipher_->decrypt(key_->encryptionKey(), key_->nonceFor(descriptor.sequence),
                                  stored, descriptor.tag, aad, outError);
    if (!plain) {
      return std::nullopt;
    }
    body = std::move(*plain);
  } else {
    auto tag = checksumTag(stored, outError);
    if (!tag) {
      return std::nullopt;
    }
    if (!constantTimeEqual(*tag, descriptor.tag)) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Checksum mismatch in chunk {}", descriptor.index));
      return std::nullopt;
    }
    body.assign(stored.begin(), stored.end());
  }

  // Step 2: decode
  if (body.size() > descriptor.plainLength) {
    setError(outError, ErrorKind::CorruptData,
             fmt::format("Chunk {} is larger than its plaintext ({} > {})", descriptor.index,
                         body.size(), descriptor.plainLength));
    return std::nullopt;
  }
  if (body.size() == descriptor.plainLength) {
    return body;
  }
  if (codec_->id() == CompressionId::None) {
    setError(outError, ErrorKind::CorruptData,
             fmt::format("Chunk {} is shorter than its plaintext in an uncompressed archive",
                         descriptor.index));
    return std::nullopt;
  }

  return codec_->decode(body, descriptor.plainLength, outError);
}

std::optional<Tag> ChunkPipeline::checksumTag(std::span<const uint8_t> stored, Error *outError) {
  auto digest = ContentDigest::sha256(stored, outError);
  if (!digest) {
    return std::nullopt;
  }
  Tag tag{};
  std::copy_n(digest->begin(), tag.size(), tag.begin());
  return tag;
}

} // namespace ata
