#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <ata/endian.hpp>
#include <ata/writer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class WriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    // One directory per test, ctest may run them in parallel
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    tempDir_ = fs::temp_directory_path() / (std::string("ata_test_writer_") + info->name());
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  static std::vector<uint8_t> readFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
  }

  fs::path tempDir_;
};

TEST(HeaderEncodingTest, Layout) {
  ata::ArchiveHeader header;
  header.flags = ata::ArchiveHeader::flagEncrypted | ata::ArchiveHeader::flagKeyedChecksums;
  header.compression = ata::CompressionId::Zlib;
  header.encryption = ata::EncryptionId::Aes256Gcm;
  for (size_t i = 0; i < header.salt.size(); ++i) {
    header.salt[i] = static_cast<uint8_t>(0xA0 + i);
  }
  header.kdfIterations = 600000;

  auto bytes = ata::encodeHeader(header);
  ASSERT_EQ(bytes.size(), ata::ArchiveHeader::headerSize);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "ATAC");
  EXPECT_EQ(bytes[4], ata::kFormatVersion);
  EXPECT_EQ(bytes[5], 0x03);
  EXPECT_EQ(bytes[6], 1);
  EXPECT_EQ(bytes[7], 1);
  EXPECT_EQ(bytes[8], 0xA0);
  EXPECT_EQ(bytes[23], 0xAF);
  EXPECT_EQ(ata::get_le<uint32_t>(bytes.data() + 24), 600000u);
  EXPECT_EQ(ata::get_le<uint32_t>(bytes.data() + 28), 0u);
}

TEST(TrailerEncodingTest, Layout) {
  ata::ArchiveTrailer trailer;
  trailer.manifestOffset = 0x1122334455;
  trailer.manifestLength = 77;
  trailer.complete = true;

  auto bytes = ata::encodeTrailer(trailer);
  ASSERT_EQ(bytes.size(), ata::ArchiveTrailer::trailerSize);
  EXPECT_EQ(ata::get_le<uint64_t>(bytes.data()), 0x1122334455u);
  EXPECT_EQ(ata::get_le<uint64_t>(bytes.data() + 8), 77u);
  EXPECT_EQ(bytes[16], 1);
  EXPECT_EQ(std::string(bytes.end() - 4, bytes.end()), "ATAE");

  trailer.complete = false;
  EXPECT_EQ(ata::encodeTrailer(trailer)[16], 0);
}

TEST_F(WriterTest, WritesHeaderChunksManifestAndTrailer) {
  fs::path path = tempDir_ / "out.ata";
  ata::Writer writer;
  ata::Error error;
  ASSERT_TRUE(writer.open(path, ata::ArchiveHeader{}, &error)) << error.describe();
  EXPECT_TRUE(writer.isOpen());
  EXPECT_EQ(writer.position(), ata::ArchiveHeader::headerSize);

  std::vector<uint8_t> first = {1, 2, 3, 4};
  std::vector<uint8_t> second = {5, 6};
  EXPECT_EQ(writer.appendChunk(first), 32u);
  EXPECT_EQ(writer.appendChunk(second), 36u);

  std::vector<uint8_t> manifest = {0xEE, 0xFF};
  ASSERT_TRUE(writer.finish(manifest, &error)) << error.describe();
  EXPECT_FALSE(writer.isOpen());

  auto bytes = readFile(path);
  ASSERT_EQ(bytes.size(), 32u + 6 + 2 + ata::ArchiveTrailer::trailerSize);
  EXPECT_EQ(bytes[32], 1);
  EXPECT_EQ(bytes[37], 6);
  EXPECT_EQ(bytes[38], 0xEE);

  const uint8_t *trailer = bytes.data() + bytes.size() - ata::ArchiveTrailer::trailerSize;
  EXPECT_EQ(ata::get_le<uint64_t>(trailer), 38u);
  EXPECT_EQ(ata::get_le<uint64_t>(trailer + 8), 2u);
  EXPECT_EQ(trailer[16], 1);
}

TEST_F(WriterTest, AbortMarksIncomplete) {
  fs::path path = tempDir_ / "aborted.ata";
  ata::Writer writer;
  ASSERT_TRUE(writer.open(path, ata::ArchiveHeader{}));
  ASSERT_TRUE(writer.appendChunk(std::vector<uint8_t>(10, 0x42)).has_value());

  std::vector<uint8_t> partial = {0x00};
  ASSERT_TRUE(writer.abort(partial));

  auto bytes = readFile(path);
  ASSERT_EQ(bytes.size(), 32u + 10 + 1 + ata::ArchiveTrailer::trailerSize);
  EXPECT_EQ(bytes[bytes.size() - 5], 0);
}

// A writer dropped mid-way leaves a file without trailer
TEST_F(WriterTest, DestroyedWriterLeavesNoTrailer) {
  fs::path path = tempDir_ / "dropped.ata";
  {
    ata::Writer writer;
    ASSERT_TRUE(writer.open(path, ata::ArchiveHeader{}));
    ASSERT_TRUE(writer.appendChunk(std::vector<uint8_t>(8, 0x11)).has_value());
  }

  auto bytes = readFile(path);
  EXPECT_EQ(bytes.size(), 40u);
  EXPECT_NE(std::string(bytes.end() - 4, bytes.end()), "ATAE");
}

TEST_F(WriterTest, RequiresOpen) {
  ata::Writer writer;
  ata::Error error;
  EXPECT_FALSE(writer.appendChunk(std::vector<uint8_t>{1}, &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);

  error = {};
  EXPECT_FALSE(writer.finish({}, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);
}

TEST_F(WriterTest, UnwritableLocation) {
  ata::Writer writer;
  ata::Error error;
  EXPECT_FALSE(writer.open(tempDir_ / "missing" / "dir" / "out.ata", ata::ArchiveHeader{}, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Io);
  EXPECT_FALSE(writer.isOpen());
}

// Buffered bytes only reach the device at flush or close, so the tail must report the failure
TEST_F(WriterTest, FullDeviceFailsFinish) {
  if (!fs::exists("/dev/full")) {
    GTEST_SKIP() << "no /dev/full on this platform";
  }
  ata::Writer writer;
  ata::Error error;
  ASSERT_TRUE(writer.open("/dev/full", ata::ArchiveHeader{}, &error)) << error.describe();

  EXPECT_FALSE(writer.finish(std::vector<uint8_t>(16, 0x01), &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Io);
  EXPECT_FALSE(writer.isOpen());
}
