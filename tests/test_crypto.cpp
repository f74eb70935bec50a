#include <set>
#include <string>
#include <vector>

#include <ata/crypto.hpp>
#include <ata/options.hpp>

#include <gtest/gtest.h>

namespace {

constexpr uint32_t kTestIterations = ata::kMinKdfIterations;

ata::Salt testSalt() {
  ata::Salt salt{};
  for (size_t i = 0; i < salt.size(); ++i) {
    salt[i] = static_cast<uint8_t>(i * 11 + 1);
  }
  return salt;
}

std::vector<uint8_t> bytesOf(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::string hex(std::span<const uint8_t> data) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  for (uint8_t byte : data) {
    out += digits[byte >> 4];
    out += digits[byte & 0x0F];
  }
  return out;
}

} // namespace

class CipherTest : public ::testing::Test {
protected:
  void SetUp() override {
    ata::Error error;
    auto key = ata::deriveKey("secret", testSalt(), kTestIterations, &error);
    ASSERT_TRUE(key.has_value()) << error.describe();
    key_ = std::move(*key);

    cipher_ = ata::makeCipher(ata::EncryptionId::Aes256Gcm);
    ASSERT_NE(cipher_, nullptr);
  }

  ata::KeyMaterial key_;
  std::unique_ptr<ata::Cipher> cipher_;
};

TEST(KeyDerivationTest, Deterministic) {
  auto a = ata::deriveKeyBytes("secret", testSalt(), kTestIterations, ata::kKeySize);
  auto b = ata::deriveKeyBytes("secret", testSalt(), kTestIterations, ata::kKeySize);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(a->size(), ata::kKeySize);

  auto other = ata::deriveKeyBytes("wrong", testSalt(), kTestIterations, ata::kKeySize);
  ASSERT_TRUE(other.has_value());
  EXPECT_NE(*a, *other);
}

TEST(KeyDerivationTest, SaltChangesKey) {
  ata::Salt salt = testSalt();
  auto a = ata::deriveKeyBytes("secret", salt, kTestIterations, ata::kKeySize);
  salt[0] ^= 0x80;
  auto b = ata::deriveKeyBytes("secret", salt, kTestIterations, ata::kKeySize);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(*a, *b);
}

TEST(KeyDerivationTest, RejectsWeakParameters) {
  ata::Error error;
  EXPECT_FALSE(
      ata::deriveKeyBytes("secret", testSalt(), kTestIterations - 1, ata::kKeySize, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::WeakParameter);

  error = {};
  std::vector<uint8_t> shortSalt(8, 0x42);
  EXPECT_FALSE(ata::deriveKeyBytes("secret", shortSalt, kTestIterations, ata::kKeySize, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::WeakParameter);

  error = {};
  EXPECT_FALSE(ata::deriveKeyBytes("secret", testSalt(), kTestIterations, 16, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::WeakParameter);
}

TEST(KeyMaterialTest, SplitsDerivedBytes) {
  std::vector<uint8_t> bytes(ata::KeyMaterial::derivedSize);
  for (size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(i);
  }

  auto key = ata::KeyMaterial::fromBytes(bytes);
  ASSERT_TRUE(key.has_value());
  EXPECT_FALSE(key->empty());
  ASSERT_EQ(key->encryptionKey().size(), ata::kKeySize);
  ASSERT_EQ(key->macKey().size(), ata::kKeySize);
  EXPECT_EQ(key->encryptionKey()[0], 0);
  EXPECT_EQ(key->macKey()[0], 32);

  // Prefix 64..67, then the counter little-endian
  ata::Nonce nonce = key->nonceFor(0x0102030405060708ULL);
  const ata::Nonce expected = {64, 65, 66, 67, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
  EXPECT_EQ(nonce, expected);
}

TEST(KeyMaterialTest, RejectsWrongSize) {
  ata::Error error;
  EXPECT_FALSE(ata::KeyMaterial::fromBytes(std::vector<uint8_t>(32), &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::WeakParameter);
}

TEST(KeyMaterialTest, MoveLeavesSourceEmpty) {
  auto key = ata::deriveKey("secret", testSalt(), kTestIterations);
  ASSERT_TRUE(key.has_value());

  ata::KeyMaterial moved = std::move(*key);
  EXPECT_FALSE(moved.empty());
  EXPECT_TRUE(key->empty());
}

TEST(KeyMaterialTest, NoncesAreUnique) {
  auto key = ata::deriveKey("secret", testSalt(), kTestIterations);
  ASSERT_TRUE(key.has_value());

  std::set<ata::Nonce> seen;
  for (uint64_t counter = 0; counter < 1000000; ++counter) {
    EXPECT_TRUE(seen.insert(key->nonceFor(counter)).second) << "counter " << counter;
  }
}

TEST_F(CipherTest, RoundTrip) {
  auto plaintext = bytesOf("the quick brown fox jumps over the lazy dog");
  auto aad = bytesOf("aad");
  auto nonce = key_.nonceFor(7);

  ata::Error error;
  auto sealed = cipher_->encrypt(key_.encryptionKey(), nonce, plaintext, aad, &error);
  ASSERT_TRUE(sealed.has_value()) << error.describe();
  EXPECT_EQ(sealed->ciphertext.size(), plaintext.size());
  EXPECT_NE(sealed->ciphertext, plaintext);

  auto opened =
      cipher_->decrypt(key_.encryptionKey(), nonce, sealed->ciphertext, sealed->tag, aad, &error);
  ASSERT_TRUE(opened.has_value()) << error.describe();
  EXPECT_EQ(*opened, plaintext);
}

TEST_F(CipherTest, EmptyPlaintext) {
  auto nonce = key_.nonceFor(0);
  auto sealed = cipher_->encrypt(key_.encryptionKey(), nonce, {}, {});
  ASSERT_TRUE(sealed.has_value());
  EXPECT_TRUE(sealed->ciphertext.empty());

  auto opened = cipher_->decrypt(key_.encryptionKey(), nonce, {}, sealed->tag, {});
  ASSERT_TRUE(opened.has_value());
  EXPECT_TRUE(opened->empty());
}

TEST_F(CipherTest, TamperingFailsAuthentication) {
  auto plaintext = bytesOf("attack at dawn, bring snacks");
  auto aad = bytesOf("len");
  auto nonce = key_.nonceFor(1);
  auto sealed = cipher_->encrypt(key_.encryptionKey(), nonce, plaintext, aad);
  ASSERT_TRUE(sealed.has_value());

  ata::Error error;

  auto ciphertext = sealed->ciphertext;
  ciphertext[3] ^= 0x01;
  EXPECT_FALSE(cipher_->decrypt(key_.encryptionKey(), nonce, ciphertext, sealed->tag, aad, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);

  error = {};
  ata::Tag tag = sealed->tag;
  tag[0] ^= 0x01;
  EXPECT_FALSE(cipher_->decrypt(key_.encryptionKey(), nonce, sealed->ciphertext, tag, aad, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);

  error = {};
  auto otherAad = bytesOf("LEN");
  EXPECT_FALSE(cipher_->decrypt(key_.encryptionKey(), nonce, sealed->ciphertext, sealed->tag,
                                otherAad, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);

  error = {};
  EXPECT_FALSE(cipher_->decrypt(key_.encryptionKey(), key_.nonceFor(2), sealed->ciphertext,
                                sealed->tag, aad, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);
}

TEST_F(CipherTest, WrongKeyFailsAuthentication) {
  auto plaintext = bytesOf("xyz");
  auto nonce = key_.nonceFor(0);
  auto sealed = cipher_->encrypt(key_.encryptionKey(), nonce, plaintext, {});
  ASSERT_TRUE(sealed.has_value());

  auto wrong = ata::deriveKey("wrong", testSalt(), kTestIterations);
  ASSERT_TRUE(wrong.has_value());

  ata::Error error;
  EXPECT_FALSE(cipher_->decrypt(wrong->encryptionKey(), wrong->nonceFor(0), sealed->ciphertext,
                                sealed->tag, {}, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);
}

TEST_F(CipherTest, RejectsShortKey) {
  std::vector<uint8_t> shortKey(16, 0x01);
  ata::Error error;
  EXPECT_FALSE(cipher_->encrypt(shortKey, key_.nonceFor(0), bytesOf("x"), {}, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::WeakParameter);
}

TEST(CipherNamesTest, Names) {
  EXPECT_STREQ(ata::encryptionName(ata::EncryptionId::None), "none");
  EXPECT_STREQ(ata::encryptionName(ata::EncryptionId::Aes256Gcm), "aes-256-gcm");
  EXPECT_EQ(ata::parseEncryptionName("aes"), ata::EncryptionId::Aes256Gcm);
  EXPECT_EQ(ata::parseEncryptionName("aes-256-gcm"), ata::EncryptionId::Aes256Gcm);
  EXPECT_EQ(ata::parseEncryptionName("none"), ata::EncryptionId::None);
  EXPECT_FALSE(ata::parseEncryptionName("rot13").has_value());
  EXPECT_FALSE(ata::makeCipher(static_cast<ata::EncryptionId>(9)));
}

TEST(ContentDigestTest, Sha256KnownVector) {
  auto digest = ata::ContentDigest::sha256(bytesOf("abc"));
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(hex(*digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentDigestTest, IncrementalMatchesOneShot) {
  auto data = bytesOf("hello, incremental world");
  ata::ContentDigest digest;
  EXPECT_FALSE(digest.keyed());
  ASSERT_TRUE(digest.update(std::span<const uint8_t>(data).first(5)));
  ASSERT_TRUE(digest.update(std::span<const uint8_t>(data).subspan(5)));

  auto incremental = digest.finish();
  auto oneShot = ata::ContentDigest::sha256(data);
  ASSERT_TRUE(incremental.has_value());
  ASSERT_TRUE(oneShot.has_value());
  EXPECT_EQ(*incremental, *oneShot);
}

TEST(ContentDigestTest, KeyedDigestDependsOnKey) {
  auto data = bytesOf("xyz");
  std::vector<uint8_t> keyA(32, 0xAA);
  std::vector<uint8_t> keyB(32, 0xBB);

  ata::ContentDigest a(keyA);
  ata::ContentDigest b(keyB);
  EXPECT_TRUE(a.keyed());
  ASSERT_TRUE(a.update(data));
  ASSERT_TRUE(b.update(data));

  auto macA = a.finish();
  auto macB = b.finish();
  auto plain = ata::ContentDigest::sha256(data);
  ASSERT_TRUE(macA.has_value());
  ASSERT_TRUE(macB.has_value());
  EXPECT_NE(*macA, *macB);
  EXPECT_NE(*macA, *plain);
}

TEST(CryptoUtilTest, RandomBytes) {
  std::vector<uint8_t> a(32);
  std::vector<uint8_t> b(32);
  ASSERT_TRUE(ata::randomBytes(a));
  ASSERT_TRUE(ata::randomBytes(b));
  EXPECT_NE(a, b);
}

TEST(CryptoUtilTest, ConstantTimeEqual) {
  auto a = bytesOf("abcdef");
  auto b = bytesOf("abcdef");
  auto c = bytesOf("abcdeg");
  auto d = bytesOf("abc");
  EXPECT_TRUE(ata::constantTimeEqual(a, b));
  EXPECT_FALSE(ata::constantTimeEqual(a, c));
  EXPECT_FALSE(ata::constantTimeEqual(a, d));
}

TEST(NonceAllocatorTest, ReservesConsecutiveRanges) {
  ata::NonceAllocator allocator;
  EXPECT_EQ(allocator.reserve(), 0);
  EXPECT_EQ(allocator.reserve(3), 1);
  EXPECT_EQ(allocator.reserve(), 4);
  EXPECT_EQ(allocator.allocated(), 5);
}
