#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace ata {

inline constexpr size_t kKeySize = 32;
inline constexpr size_t kNonceSize = 12;
inline constexpr size_t kNoncePrefixSize = 4;

using Nonce = std::array<uint8_t, kNonceSize>;

// Session key material derived from a passphrase: the chunk encryption key,
// the content checksum key and the per-archive nonce prefix. Never persisted,
// wiped when destroyed.
class KeyMaterial {
public:
  KeyMaterial() = default;
  ~KeyMaterial();

  // Delete copy, enable move
  KeyMaterial(const KeyMaterial &) = delete;
  KeyMaterial &operator=(const KeyMaterial &) = delete;
  KeyMaterial(KeyMaterial &&other) noexcept;
  KeyMaterial &operator=(KeyMaterial &&other) noexcept;

  // Split derived bytes into the three parts, fails with WeakParameter if too short
  static std::optional<KeyMaterial> fromBytes(std::vector<uint8_t> bytes,
                                              Error *outError = nullptr);

  std::span<const uint8_t> encryptionKey() const;
  std::span<const uint8_t> macKey() const;

  // Nonce of the chunk written at the given archive-wide position:
  // 4-byte prefix followed by the 8-byte little-endian counter
  Nonce nonceFor(uint64_t counter) const;

  bool empty() const { return bytes_.empty(); }

  static constexpr size_t derivedSize = 2 * kKeySize + kNoncePrefixSize;

private:
  void wipe() noexcept;

  std::vector<uint8_t> bytes_;
};

// Stretch bytes out of a passphrase with PBKDF2-HMAC-SHA256. Fails with
// ErrorKind::WeakParameter below kMinKdfIterations, with a salt that is not
// kSaltSize bytes, or for a key length under kKeySize.
std::optional<std::vector<uint8_t>> deriveKeyBytes(std::string_view passphrase,
                                                   std::span<const uint8_t> salt,
                                                   uint32_t iterations, size_t keyLength,
                                                   Error *outError = nullptr);

// Derive the full session key material
std::optional<KeyMaterial> deriveKey(std::string_view passphrase, std::span<const uint8_t> salt,
                                     uint32_t iterations, Error *outError = nullptr);

// Output of an authenticated encryption
struct SealedBuffer {
  std::vector<uint8_t> ciphertext;
  Tag tag{};
};

// Authenticated cipher backend. Implementations are stateless and thread-safe.
class Cipher {
public:
  virtual ~Cipher() = default;

  virtual EncryptionId id() const = 0;

  virtual std::optional<SealedBuffer> encrypt(std::span<const uint8_t> key, const Nonce &nonce,
                                              std::span<const uint8_t> plaintext,
                                              std::span<const uint8_t> aad,
                                              Error *outError = nullptr) const = 0;

  // Returns the plaintext only if the tag verifies, ErrorKind::Authentication otherwise
  virtual std::optional<std::vector<uint8_t>> decrypt(std::span<const uint8_t> key,
                                                      const Nonce &nonce,
                                                      std::span<const uint8_t> ciphertext,
                                                      const Tag &tag,
                                                      std::span<const uint8_t> aad,
                                                      Error *outError = nullptr) const = 0;
};

// Returns nullptr for an unknown id
std::unique_ptr<Cipher> makeCipher(EncryptionId id);

const char *encryptionName(EncryptionId id);
std::optional<EncryptionId> parseEncryptionName(std::string_view name);

// Fill a buffer from the OpenSSL CSPRNG
bool randomBytes(std::span<uint8_t> out, Error *outError = nullptr);

// Compare two buffers in constant time (for equal sizes)
bool constantTimeEqual(std::span<const uint8_t> a, std::span<const uint8_t> b);

// Incremental content checksum: SHA-256, or HMAC-SHA256 when built with a key
class ContentDigest {
public:
  ContentDigest();
  explicit ContentDigest(std::span<const uint8_t> macKey);
  ~ContentDigest();

  // Delete copy, enable move
  ContentDigest(const ContentDigest &) = delete;
  ContentDigest &operator=(const ContentDigest &) = delete;
  ContentDigest(ContentDigest &&other) noexcept;
  ContentDigest &operator=(ContentDigest &&other) noexcept;

  bool update(std::span<const uint8_t> data, Error *outError = nullptr);
  std::optional<Checksum> finish(Error *outError = nullptr);

  bool keyed() const { return keyed_; }

  // One-shot SHA-256
  static std::optional<Checksum> sha256(std::span<const uint8_t> data, Error *outError = nullptr);

private:
  struct State;
  std::unique_ptr<State> state_;
  bool keyed_ = false;
};

// Hands out nonce counters. Advanced by the orchestrating thread only, once per
// chunk, so no two chunks of an archive share a nonce.
class NonceAllocator {
public:
  NonceAllocator() = default;

  // Reserve `count` consecutive counters and return the first one
  uint64_t reserve(uint64_t count = 1) { return next_.fetch_add(count, std::memory_order_relaxed); }

  uint64_t allocated() const { return next_.load(std::memory_order_relaxed); }

private:
  std::atomic<uint64_t> next_{0};
};

} // namespace ata
