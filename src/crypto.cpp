#include <cstring>
#include <limits>

#include <fmt/format.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <ata/crypto.hpp>
#include <ata/endian.hpp>
#include <ata/options.hpp>

namespace ata {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool fitsInt(size_t size) {
  return size <= static_cast<size_t>(std::numeric_limits<int>::max());
}

class NullCipher final : public Cipher {
public:
  EncryptionId id() const override { return EncryptionId::None; }

  std::optional<SealedBuffer> encrypt(std::span<const uint8_t>, const Nonce &,
                                      std::span<const uint8_t> plaintext, std::span<const uint8_t>,
                                      Error *) const override {
    SealedBuffer sealed;
    sealed.ciphertext.assign(plaintext.begin(), plaintext.end());
    return sealed;
  }

  std::optional<std::vector<uint8_t>> decrypt(std::span<const uint8_t>, const Nonce &,
                                              std::span<const uint8_t> ciphertext, const Tag &,
                                              std::span<const uint8_t>, Error *) const override {
    return std::vector<uint8_t>(ciphertext.begin(), ciphertext.end());
  }
};

class AesGcmCipher final : public Cipher {
public:
  EncryptionId id() const override { return EncryptionId::Aes256Gcm; }

  std::optional<SealedBuffer> encrypt(std::span<const uint8_t> key, const Nonce &nonce,
                                      std::span<const uint8_t> plaintext,
                                      std::span<const uint8_t> aad,
                                      Error *outError) const override {
    if (key.size() != kKeySize) {
      setError(outError, ErrorKind::WeakParameter,
               fmt::format("AES-256-GCM expects a {}-byte key, got {}", kKeySize, key.size()));
      return std::nullopt;
    }
    if (!fitsInt(plaintext.size()) || !fitsInt(aad.size())) {
      setError(outError, ErrorKind::InvalidArgument, "Buffer too large for AES-GCM");
      return std::nullopt;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
      setError(outError, ErrorKind::Internal, "AES-GCM context allocation failed");
      return std::nullopt;
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM init failed");
      return std::nullopt;
    }

    int outLen = 0;
    if (!aad.empty() && EVP_EncryptUpdate(ctx.get(), nullptr, &outLen, aad.data(),
                                          static_cast<int>(aad.size())) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM aad failed");
      return std::nullopt;
    }

    SealedBuffer sealed;
    sealed.ciphertext.resize(plaintext.size());
    int written = 0;
    if (!plaintext.empty()) {
      if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &outLen, plaintext.data(),
                            static_cast<int>(plaintext.size())) != 1) {
        setError(outError, ErrorKind::Internal, "AES-GCM encrypt failed");
        return std::nullopt;
      }
      written = outLen;
    }

    // GCM is a stream mode, Final never emits more than the buffered remainder
    uint8_t finalBlock[16];
    if (EVP_EncryptFinal_ex(ctx.get(), finalBlock, &outLen) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM final failed");
      return std::nullopt;
    }
    if (outLen > 0) {
      std::memcpy(sealed.ciphertext.data() + written, finalBlock, static_cast<size_t>(outLen));
      written += outLen;
    }
    sealed.ciphertext.resize(static_cast<size_t>(written));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(sealed.tag.size()),
                            sealed.tag.data()) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM get tag failed");
      return std::nullopt;
    }

    return sealed;
  }

  std::optional<std::vector<uint8_t>> decrypt(std::span<const uint8_t> key, const Nonce &nonce,
                                              std::span<const uint8_t> ciphertext, const Tag &tag,
                                              std::span<const uint8_t> aad,
                                              Error *outError) const override {
    if (key.size() != kKeySize) {
      setError(outError, ErrorKind::WeakParameter,
               fmt::format("AES-256-GCM expects a {}-byte key, got {}", kKeySize, key.size()));
      return std::nullopt;
    }
    if (!fitsInt(ciphertext.size()) || !fitsInt(aad.size())) {
      setError(outError, ErrorKind::InvalidArgument, "Buffer too large for AES-GCM");
      return std::nullopt;
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
      setError(outError, ErrorKind::Internal, "AES-GCM context allocation failed");
      return std::nullopt;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM init failed");
      return std::nullopt;
    }

    int outLen = 0;
    if (!aad.empty() && EVP_DecryptUpdate(ctx.get(), nullptr, &outLen, aad.data(),
                                          static_cast<int>(aad.size())) != 1) {
      setError(outError, ErrorKind::Internal, "AES-GCM aad failed");
      return std::nullopt;
    }

    std::vector<uint8_t> plaintext(ciphertext.size());
    int written = 0;
    if (!ciphertext.empty()) {
      if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &outLen, ciphertext.data(),
                            static_cast<int>(ciphertext.size())) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        setError(outError, ErrorKind::Authentication, "AES-GCM decrypt failed");
        return std::nullopt;
      }
      written = outLen;
    }

    Tag expected = tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(expected.size()),
                            expected.data()) != 1) {
      OPENSSL_cleanse(plaintext.data(), plaintext.size());
      setError(outError, ErrorKind::Internal, "AES-GCM set tag failed");
      return std::nullopt;
    }

    // Nothing decrypted above leaves this function unless the tag verifies
    uint8_t finalBlock[16];
    if (EVP_DecryptFinal_ex(ctx.get(), finalBlock, &outLen) != 1) {
      OPENSSL_cleanse(plaintext.data(), plaintext.size());
      setError(outError, ErrorKind::Authentication,
               "Authentication tag mismatch (wrong passphrase or tampered data)");
      return std::nullopt;
    }
    if (outLen > 0) {
      std::memcpy(plaintext.data() + written, finalBlock, static_cast<size_t>(outLen));
      written += outLen;
    }

    plaintext.resize(static_cast<size_t>(written));
    return plaintext;
  }
};

} // namespace

KeyMaterial::~KeyMaterial() {
  wipe();
}

KeyMaterial::KeyMaterial(KeyMaterial &&other) noexcept : bytes_(std::move(other.bytes_)) {
  other.bytes_.clear();
}

KeyMaterial &KeyMaterial::operator=(KeyMaterial &&other) noexcept {
  if (this != &other) {
    wipe();
    bytes_ = std::move(other.bytes_);
    other.bytes_.clear();
  }
  return *this;
}

std::optional<KeyMaterial> KeyMaterial::fromBytes(std::vector<uint8_t> bytes, Error *outError) {
  if (bytes.size() != derivedSize) {
    OPENSSL_cleanse(bytes.data(), bytes.size());
    setError(outError, ErrorKind::WeakParameter,
             fmt::format("Key material must be {} bytes, got {}", derivedSize, bytes.size()));
    return std::nullopt;
  }

  KeyMaterial material;
  material.bytes_ = std::move(bytes);
  return material;
}

std::span<const uint8_t> KeyMaterial::encryptionKey() const {
  if (bytes_.empty()) {
    return {};
  }
  return std::span<const uint8_t>(bytes_.data(), kKeySize);
}

std::span<const uint8_t> KeyMaterial::macKey() const {
  if (bytes_.empty()) {
    return {};
  }
  return std::span<const uint8_t>(bytes_.data() + kKeySize, kKeySize);
}

Nonce KeyMaterial::nonceFor(uint64_t counter) const {
  Nonce nonce{};
  if (!bytes_.empty()) {
    std::memcpy(nonce.data(), bytes_.data() + 2 * kKeySize, kNoncePrefixSize);
  }
  store_le(nonce.data() + kNoncePrefixSize, counter);
  return nonce;
}

void KeyMaterial::wipe() noexcept {
  if (!bytes_.empty()) {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
    bytes_.clear();
  }
}

std::optional<std::vector<uint8_t>> deriveKeyBytes(std::string_view passphrase,
                                                   std::span<const uint8_t> salt,
                                                   uint32_t iterations, size_t keyLength,
                                                   Error *outError) {
  if (iterations < kMinKdfIterations) {
    setError(outError, ErrorKind::WeakParameter,
             fmt::format("KDF iteration count {} is below the minimum of {}", iterations,
                         kMinKdfIterations));
    return std::nullopt;
  }
  if (salt.size() != kSaltSize) {
    setError(outError, ErrorKind::WeakParameter,
             fmt::format("KDF salt must be {} bytes, got {}", kSaltSize, salt.size()));
    return std::nullopt;
  }
  if (keyLength < kKeySize) {
    setError(outError, ErrorKind::WeakParameter,
             fmt::format("Derived key length {} is below the minimum of {}", keyLength, kKeySize));
    return std::nullopt;
  }
  if (!fitsInt(passphrase.size()) || !fitsInt(keyLength) ||
      iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    setError(outError, ErrorKind::InvalidArgument, "KDF parameters out of range");
    return std::nullopt;
  }

  std::vector<uint8_t> out(keyLength);
  if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()), salt.data(),
                        static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(out.size()), out.data()) != 1) {
    setError(outError, ErrorKind::Internal, "PBKDF2 derivation failed");
    return std::nullopt;
  }
  return out;
}

std::optional<KeyMaterial> deriveKey(std::string_view passphrase, std::span<const uint8_t> salt,
                                     uint32_t iterations, Error *outError) {
  auto bytes = deriveKeyBytes(passphrase, salt, iterations, KeyMaterial::derivedSize, outError);
  if (!bytes) {
    return std::nullopt;
  }
  return KeyMaterial::fromBytes(std::move(*bytes), outError);
}

std::unique_ptr<Cipher> makeCipher(EncryptionId id) {
  switch (id) {
  case EncryptionId::None:
    return std::make_unique<NullCipher>();
  case EncryptionId::Aes256Gcm:
    return std::make_unique<AesGcmCipher>();
  }
  return nullptr;
}

const char *encryptionName(EncryptionId id) {
  switch (id) {
  case EncryptionId::None:
    return "none";
  case EncryptionId::Aes256Gcm:
    return "aes-256-gcm";
  }
  return "unknown";
}

std::optional<EncryptionId> parseEncryptionName(std::string_view name) {
  if (name == "none") {
    return EncryptionId::None;
  }
  if (name == "aes" || name == "aes-256-gcm") {
    return EncryptionId::Aes256Gcm;
  }
  return std::nullopt;
}

bool randomBytes(std::span<uint8_t> out, Error *outError) {
  if (!fitsInt(out.size())) {
    return setError(outError, ErrorKind::InvalidArgument, "Random buffer too large");
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return setError(outError, ErrorKind::Internal, "RAND_bytes failed");
  }
  return true;
}

bool constantTimeEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// Either a plain SHA-256 digest context or an HMAC-SHA256 MAC context
struct ContentDigest::State {
  EVP_MD_CTX *md = nullptr;
  EVP_MAC *mac = nullptr;
  EVP_MAC_CTX *macCtx = nullptr;
  bool ready = false;

  ~State() {
    EVP_MD_CTX_free(md);
    EVP_MAC_CTX_free(macCtx);
    EVP_MAC_free(mac);
  }
};

ContentDigest::ContentDigest() : state_(std::make_unique<State>()) {
  state_->md = EVP_MD_CTX_new();
  state_->ready = state_->md && EVP_DigestInit_ex(state_->md, EVP_sha256(), nullptr) == 1;
}

ContentDigest::ContentDigest(std::span<const uint8_t> macKey)
    : state_(std::make_unique<State>()), keyed_(true) {
  state_->mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
  if (!state_->mac) {
    return;
  }
  state_->macCtx = EVP_MAC_CTX_new(state_->mac);
  if (!state_->macCtx) {
    return;
  }

  char digestName[] = "SHA256";
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName, 0),
      OSSL_PARAM_construct_end(),
  };
  state_->ready = EVP_MAC_init(state_->macCtx, macKey.data(), macKey.size(), params) == 1;
}

ContentDigest::~ContentDigest() = default;
ContentDigest::ContentDigest(ContentDigest &&other) noexcept = default;
ContentDigest &ContentDigest::operator=(ContentDigest &&other) noexcept = default;

bool ContentDigest::update(std::span<const uint8_t> data, Error *outError) {
  if (!state_ || !state_->ready) {
    return setError(outError, ErrorKind::Internal, "Digest context is not usable");
  }
  if (data.empty()) {
    return true;
  }

  int ok = keyed_ ? EVP_MAC_update(state_->macCtx, data.data(), data.size())
                  : EVP_DigestUpdate(state_->md, data.data(), data.size());
  if (ok != 1) {
    state_->ready = false;
    return setError(outError, ErrorKind::Internal, "Digest update failed");
  }
  return true;
}

std::optional<Checksum> ContentDigest::finish(Error *outError) {
  if (!state_ || !state_->ready) {
    setError(outError, ErrorKind::Internal, "Digest context is not usable");
    return std::nullopt;
  }
  state_->ready = false;

  Checksum result{};
  if (keyed_) {
    size_t outLen = 0;
    if (EVP_MAC_final(state_->macCtx, result.data(), &outLen, result.size()) != 1 ||
        outLen != result.size()) {
      setError(outError, ErrorKind::Internal, "HMAC finalization failed");
      return std::nullopt;
    }
  } else {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(state_->md, result.data(), &outLen) != 1 || outLen != result.size()) {
      setError(outError, ErrorKind::Internal, "SHA-256 finalization failed");
      return std::nullopt;
    }
  }
  return result;
}

std::optional<Checksum> ContentDigest::sha256(std::span<const uint8_t> data, Error *outError) {
  ContentDigest digest;
  if (!digest.update(data, outError)) {
    return std::nullopt;
  }
  return digest.finish(outError);
}

} // namespace ata
