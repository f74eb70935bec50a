#include <random>
#include <vector>

#include <ata/crypto.hpp>
#include <ata/options.hpp>
#include <ata/pipeline.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> textLike(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>("lorem ipsum dolor sit amet "[i % 27]);
  }
  return data;
}

std::vector<uint8_t> noise(size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::vector<uint8_t> data(size);
  for (auto &byte : data) {
    byte = static_cast<uint8_t>(rng());
  }
  return data;
}

ata::ChunkDescriptor describe(const ata::SealedChunk &sealed, uint64_t sequence) {
  ata::ChunkDescriptor descriptor;
  descriptor.storedLength = sealed.stored.size();
  descriptor.plainLength = sealed.plainLength;
  descriptor.tag = sealed.tag;
  descriptor.sequence = sequence;
  return descriptor;
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ata::Salt salt{};
    salt.fill(0x5A);
    auto key = ata::deriveKey("secret", salt, ata::kMinKdfIterations);
    ASSERT_TRUE(key.has_value());
    key_ = std::move(*key);
  }

  ata::ChunkPipeline make(ata::CompressionId compression, ata::EncryptionId encryption) {
    ata::Error error;
    auto pipeline = ata::ChunkPipeline::create(compression, 0, encryption, &key_, &error);
    EXPECT_TRUE(pipeline.has_value()) << error.describe();
    return std::move(*pipeline);
  }

  ata::KeyMaterial key_;
};

TEST_F(PipelineTest, CompressedAndEncryptedRoundTrip) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::Aes256Gcm);
  auto input = textLike(20000);

  ata::Error error;
  auto sealed = pipeline.seal(input, 3, &error);
  ASSERT_TRUE(sealed.has_value()) << error.describe();
  EXPECT_EQ(sealed->plainLength, input.size());
  EXPECT_LT(sealed->compressedLength, input.size());
  EXPECT_EQ(sealed->stored.size(), sealed->compressedLength);

  auto opened = pipeline.open(sealed->stored, describe(*sealed, 3), &error);
  ASSERT_TRUE(opened.has_value()) << error.describe();
  EXPECT_EQ(*opened, input);
}

TEST_F(PipelineTest, PlainRoundTrip) {
  auto pipeline = make(ata::CompressionId::None, ata::EncryptionId::None);
  auto input = textLike(100);

  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());
  EXPECT_EQ(sealed->stored, input);

  auto opened = pipeline.open(sealed->stored, describe(*sealed, 0));
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(*opened, input);
}

// Incompressible data is kept as-is so stored length equals plain length
TEST_F(PipelineTest, IncompressibleChunkStoredRaw) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::None);
  auto input = noise(4096, 99);

  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());
  EXPECT_EQ(sealed->compressedLength, input.size());
  EXPECT_EQ(sealed->stored, input);

  auto opened = pipeline.open(sealed->stored, describe(*sealed, 0));
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(*opened, input);
}

TEST_F(PipelineTest, EncryptionRequiresKey) {
  ata::Error error;
  auto pipeline = ata::ChunkPipeline::create(ata::CompressionId::Zlib, 0,
                                             ata::EncryptionId::Aes256Gcm, nullptr, &error);
  EXPECT_FALSE(pipeline.has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);
}

TEST_F(PipelineTest, UnknownIdsAreFormatErrors) {
  ata::Error error;
  EXPECT_FALSE(ata::ChunkPipeline::create(static_cast<ata::CompressionId>(7), 0,
                                          ata::EncryptionId::None, nullptr, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);

  error = {};
  EXPECT_FALSE(ata::ChunkPipeline::create(ata::CompressionId::None, 0,
                                          static_cast<ata::EncryptionId>(7), &key_, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST_F(PipelineTest, TamperedEncryptedChunkFailsAuthentication) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::Aes256Gcm);
  auto input = textLike(5000);
  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());

  auto stored = sealed->stored;
  stored[stored.size() / 2] ^= 0x10;

  ata::Error error;
  EXPECT_FALSE(pipeline.open(stored, describe(*sealed, 0), &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);
}

// The plaintext length is bound to the ciphertext
TEST_F(PipelineTest, RewrittenPlainLengthFailsAuthentication) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::Aes256Gcm);
  auto input = textLike(5000);
  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());

  auto descriptor = describe(*sealed, 0);
  descriptor.plainLength += 1;

  ata::Error error;
  EXPECT_FALSE(pipeline.open(sealed->stored, descriptor, &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);
}

// A chunk moved to another position decrypts under the wrong nonce
TEST_F(PipelineTest, WrongSequenceFailsAuthentication) {
  auto pipeline = make(ata::CompressionId::None, ata::EncryptionId::Aes256Gcm);
  auto input = textLike(300);
  auto sealed = pipeline.seal(input, 10);
  ASSERT_TRUE(sealed.has_value());

  ata::Error error;
  EXPECT_FALSE(pipeline.open(sealed->stored, describe(*sealed, 11), &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::Authentication);
}

TEST_F(PipelineTest, SameSequenceSameOutput) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::Aes256Gcm);
  auto input = textLike(1000);

  auto a = pipeline.seal(input, 5);
  auto b = pipeline.seal(input, 5);
  auto c = pipeline.seal(input, 6);
  ASSERT_TRUE(a && b && c);
  EXPECT_EQ(a->stored, b->stored);
  EXPECT_EQ(a->tag, b->tag);
  EXPECT_NE(a->stored, c->stored);
}

TEST_F(PipelineTest, TamperedPlainChunkIsCorrupt) {
  auto pipeline = make(ata::CompressionId::Zlib, ata::EncryptionId::None);
  auto input = textLike(5000);
  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());

  auto stored = sealed->stored;
  stored[0] ^= 0xFF;

  ata::Error error;
  EXPECT_FALSE(pipeline.open(stored, describe(*sealed, 0), &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::CorruptData);
}

TEST_F(PipelineTest, StoredLengthMismatchIsCorrupt) {
  auto pipeline = make(ata::CompressionId::None, ata::EncryptionId::None);
  auto input = textLike(64);
  auto sealed = pipeline.seal(input, 0);
  ASSERT_TRUE(sealed.has_value());

  auto descriptor = describe(*sealed, 0);
  descriptor.storedLength = 63;

  ata::Error error;
  EXPECT_FALSE(pipeline.open(sealed->stored, descriptor, &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::CorruptData);
}
