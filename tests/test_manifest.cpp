#include <string>
#include <vector>

#include <ata/endian.hpp>
#include <ata/manifest.hpp>
#include <ata/options.hpp>

#include <gtest/gtest.h>

namespace {

constexpr uint64_t kDataBegin = 32;

ata::ManifestEntry fileEntry(const std::string &path, uint64_t size) {
  ata::ManifestEntry entry;
  entry.path = path;
  entry.kind = ata::EntryKind::File;
  entry.size = size;
  entry.mode = 0644;
  entry.mtime = 1700000000;
  entry.checksum.fill(0xC5);
  return entry;
}

ata::ChunkDescriptor chunkAt(uint32_t index, uint64_t offset, uint64_t stored, uint64_t plain) {
  ata::ChunkDescriptor chunk;
  chunk.index = index;
  chunk.offset = offset;
  chunk.storedLength = stored;
  chunk.plainLength = plain;
  chunk.tag.fill(static_cast<uint8_t>(index + 1));
  return chunk;
}

// Two files of two and one chunks, a directory and a symlink
ata::ManifestBuilder sampleBuilder() {
  ata::ManifestBuilder builder;

  auto first = builder.addEntry(fileEntry("docs/a.txt", 150));
  EXPECT_TRUE(builder.addChunk(*first, chunkAt(0, 32, 60, 100)));
  EXPECT_TRUE(builder.addChunk(*first, chunkAt(1, 92, 30, 50)));

  ata::ManifestEntry dir;
  dir.path = "docs";
  dir.kind = ata::EntryKind::Directory;
  dir.mode = 0755;
  builder.addEntry(dir);

  ata::ManifestEntry link;
  link.path = "docs/latest";
  link.kind = ata::EntryKind::Symlink;
  link.linkTarget = "a.txt";
  link.size = link.linkTarget.size();
  link.mode = 0777;
  builder.addEntry(link);

  auto second = builder.addEntry(fileEntry("b.bin", 10));
  EXPECT_TRUE(builder.addChunk(*second, chunkAt(0, 122, 10, 10)));

  return builder;
}

} // namespace

TEST(VarintTest, KnownEncodings) {
  std::vector<uint8_t> out;
  ata::encodeVarint(out, 0);
  ata::encodeVarint(out, 127);
  ata::encodeVarint(out, 128);
  ata::encodeVarint(out, 300);
  EXPECT_EQ(out, (std::vector<uint8_t>{0x00, 0x7F, 0x80, 0x01, 0xAC, 0x02}));

  size_t pos = 0;
  EXPECT_EQ(ata::decodeVarint(out, pos), 0u);
  EXPECT_EQ(ata::decodeVarint(out, pos), 127u);
  EXPECT_EQ(ata::decodeVarint(out, pos), 128u);
  EXPECT_EQ(ata::decodeVarint(out, pos), 300u);
  EXPECT_EQ(pos, out.size());
}

TEST(VarintTest, MaxValue) {
  std::vector<uint8_t> out;
  ata::encodeVarint(out, UINT64_MAX);
  EXPECT_EQ(out.size(), 10);

  size_t pos = 0;
  EXPECT_EQ(ata::decodeVarint(out, pos), UINT64_MAX);
}

TEST(VarintTest, RejectsMalformed) {
  size_t pos = 0;
  std::vector<uint8_t> truncated = {0x80, 0x80};
  EXPECT_FALSE(ata::decodeVarint(truncated, pos).has_value());

  pos = 0;
  std::vector<uint8_t> overlong(10, 0xFF);
  overlong.back() = 0x02;
  EXPECT_FALSE(ata::decodeVarint(overlong, pos).has_value());
}

TEST(EntryPathTest, Normalizes) {
  EXPECT_EQ(ata::normalizeEntryPath("dir\\sub\\file.txt"), "dir\\sub\\file.txt");
  EXPECT_EQ(ata::normalizeEntryPath("x:y/a\\b.txt"), "x:y/a\\b.txt");
  EXPECT_EQ(ata::normalizeEntryPath("dir/"), "dir");
  EXPECT_EQ(ata::normalizeEntryPath("a"), "a");
  EXPECT_EQ(ata::normalizeEntryPath("..hidden/x"), "..hidden/x");
}

TEST(EntryPathTest, RejectsUnsafePaths) {
  const char *unsafe[] = {"", "/etc/passwd", "a/../b", "../a", "./a", "a//b", "a/./b", ".."};
  for (const char *path : unsafe) {
    ata::Error error;
    EXPECT_FALSE(ata::normalizeEntryPath(path, &error).has_value()) << path;
    EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument) << path;
  }

  ata::Error error;
  EXPECT_FALSE(ata::normalizeEntryPath(std::string("a\0b", 3), &error).has_value());
  EXPECT_FALSE(ata::normalizeEntryPath(std::string(70000, 'x'), &error).has_value());
}

TEST(ManifestBuilderTest, RejectsDuplicatesAfterNormalization) {
  ata::ManifestBuilder builder;
  ASSERT_TRUE(builder.addEntry(fileEntry("dir/file", 0)).has_value());

  ata::Error error;
  EXPECT_FALSE(builder.addEntry(fileEntry("dir/file/", 0), &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);
  EXPECT_EQ(builder.entryCount(), 1);
}

// A backslash is part of a name, not a separator
TEST(ManifestBuilderTest, BackslashNamesAreDistinct) {
  ata::ManifestBuilder builder;
  ASSERT_TRUE(builder.addEntry(fileEntry("dir/file", 0)).has_value());
  ASSERT_TRUE(builder.addEntry(fileEntry("dir\\file", 0)).has_value());
  ASSERT_TRUE(builder.addEntry(fileEntry("c:notes", 0)).has_value());

  auto manifest = builder.serialize();
  auto entries = ata::ManifestReader::parse(manifest, 32, 32);
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 3);
  EXPECT_EQ((*entries)[1].path, "dir\\file");
  EXPECT_EQ((*entries)[2].path, "c:notes");
}

TEST(ManifestBuilderTest, ChunksOnlyOnFilesInOrder) {
  ata::ManifestBuilder builder;
  ata::ManifestEntry dir;
  dir.path = "d";
  dir.kind = ata::EntryKind::Directory;
  auto dirIndex = builder.addEntry(dir);
  auto fileIndex = builder.addEntry(fileEntry("d/f", 20));
  ASSERT_TRUE(dirIndex && fileIndex);

  ata::Error error;
  EXPECT_FALSE(builder.addChunk(*dirIndex, chunkAt(0, 32, 10, 10), &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);

  error = {};
  EXPECT_FALSE(builder.addChunk(*fileIndex, chunkAt(1, 32, 10, 10), &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::InvalidArgument);

  EXPECT_TRUE(builder.addChunk(*fileIndex, chunkAt(0, 32, 10, 10)));
  EXPECT_FALSE(builder.addChunk(99, chunkAt(0, 32, 10, 10)));
}

TEST(ManifestReaderTest, ParsesWhatBuilderWrites) {
  auto builder = sampleBuilder();
  auto bytes = builder.serialize();

  ata::Error error;
  auto entries = ata::ManifestReader::parse(bytes, kDataBegin, 132, &error);
  ASSERT_TRUE(entries.has_value()) << error.describe();
  ASSERT_EQ(entries->size(), 4);

  const auto &a = (*entries)[0];
  EXPECT_EQ(a.path, "docs/a.txt");
  EXPECT_EQ(a.kind, ata::EntryKind::File);
  EXPECT_EQ(a.size, 150);
  EXPECT_EQ(a.mode, 0644);
  EXPECT_EQ(a.mtime, 1700000000);
  EXPECT_EQ(a.checksum, builder.entries()[0].checksum);
  ASSERT_EQ(a.chunks.size(), 2);
  EXPECT_EQ(a.chunks[1].offset, 92);
  EXPECT_EQ(a.chunks[1].tag, chunkAt(1, 0, 0, 0).tag);
  EXPECT_EQ(a.storedSize(), 90);

  EXPECT_EQ((*entries)[1].kind, ata::EntryKind::Directory);
  EXPECT_EQ((*entries)[2].kind, ata::EntryKind::Symlink);
  EXPECT_EQ((*entries)[2].linkTarget, "a.txt");
  EXPECT_EQ((*entries)[3].path, "b.bin");
}

// Chunk sequence numbers count chunks across the whole manifest
TEST(ManifestReaderTest, DerivesChunkSequences) {
  auto bytes = sampleBuilder().serialize();
  auto entries = ata::ManifestReader::parse(bytes, kDataBegin, 132);
  ASSERT_TRUE(entries.has_value());

  EXPECT_EQ((*entries)[0].chunks[0].sequence, 0);
  EXPECT_EQ((*entries)[0].chunks[1].sequence, 1);
  EXPECT_EQ((*entries)[3].chunks[0].sequence, 2);
}

TEST(ManifestReaderTest, PartialSerialization) {
  auto builder = sampleBuilder();
  auto bytes = builder.serialize(2);
  auto entries = ata::ManifestReader::parse(bytes, kDataBegin, 132);
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 2);
  EXPECT_EQ((*entries)[1].path, "docs");
}

TEST(ManifestReaderTest, EmptyManifest) {
  ata::ManifestBuilder builder;
  auto bytes = builder.serialize();
  EXPECT_EQ(bytes.size(), 1);

  auto entries = ata::ManifestReader::parse(bytes, kDataBegin, kDataBegin);
  ASSERT_TRUE(entries.has_value());
  EXPECT_TRUE(entries->empty());
}

TEST(ManifestReaderTest, RejectsChunksOutsideData) {
  auto bytes = sampleBuilder().serialize();
  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(bytes, kDataBegin, 131, &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);

  error = {};
  EXPECT_FALSE(ata::ManifestReader::parse(bytes, 40, 132, &error).has_value());
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST(ManifestReaderTest, RejectsOverlappingChunks) {
  ata::ManifestBuilder builder;
  auto index = builder.addEntry(fileEntry("f", 20));
  builder.addChunk(*index, chunkAt(0, 32, 10, 10));
  builder.addChunk(*index, chunkAt(1, 40, 10, 10));

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(builder.serialize(), kDataBegin, 100, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST(ManifestReaderTest, RejectsSizeMismatch) {
  ata::ManifestBuilder builder;
  auto index = builder.addEntry(fileEntry("f", 21));
  builder.addChunk(*index, chunkAt(0, 32, 10, 20));

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(builder.serialize(), kDataBegin, 100, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

// A forged plain length would make decoding allocate that many bytes
TEST(ManifestReaderTest, RejectsOversizedPlainLength) {
  const uint64_t forged = 3ull << 30;
  ata::ManifestBuilder builder;
  auto index = builder.addEntry(fileEntry("bomb.bin", forged));
  builder.addChunk(*index, chunkAt(0, 32, 10, forged));

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(builder.serialize(), kDataBegin, 100, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);

  ata::ManifestBuilder largest;
  index = largest.addEntry(fileEntry("full.bin", ata::kMaxChunkSize));
  largest.addChunk(*index, chunkAt(0, 32, 10, ata::kMaxChunkSize));
  EXPECT_TRUE(ata::ManifestReader::parse(largest.serialize(), kDataBegin, 100).has_value());
}

TEST(ManifestReaderTest, RejectsUnsafeStoredPath) {
  // Hand-built manifest: one directory entry named "../x"
  std::vector<uint8_t> bytes;
  ata::encodeVarint(bytes, 1);
  std::string path = "../x";
  ata::put_le<uint16_t>(bytes, static_cast<uint16_t>(path.size()));
  bytes.insert(bytes.end(), path.begin(), path.end());
  bytes.push_back(static_cast<uint8_t>(ata::EntryKind::Directory));
  ata::put_le<uint64_t>(bytes, 0);
  ata::put_le<uint32_t>(bytes, 0755);
  ata::put_le<uint64_t>(bytes, 0);
  bytes.insert(bytes.end(), ata::kChecksumSize, 0);
  ata::put_le<uint32_t>(bytes, 0);

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(bytes, kDataBegin, kDataBegin, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST(ManifestReaderTest, RejectsTruncationAndTrailingBytes) {
  auto bytes = sampleBuilder().serialize();

  ata::Error error;
  auto truncated = bytes;
  truncated.resize(bytes.size() - 5);
  EXPECT_FALSE(ata::ManifestReader::parse(truncated, kDataBegin, 132, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);

  error = {};
  auto padded = bytes;
  padded.push_back(0);
  EXPECT_FALSE(ata::ManifestReader::parse(padded, kDataBegin, 132, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST(ManifestReaderTest, RejectsAbsurdEntryCount) {
  std::vector<uint8_t> bytes;
  ata::encodeVarint(bytes, 1000000);
  bytes.resize(bytes.size() + 100, 0);

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(bytes, kDataBegin, kDataBegin, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}

TEST(ManifestReaderTest, RejectsUnknownKind) {
  ata::ManifestBuilder builder;
  builder.addEntry(fileEntry("f", 0));
  auto bytes = builder.serialize();
  // count(1) + path_len(2) + "f"(1), then the kind byte
  bytes[4] = 9;

  ata::Error error;
  EXPECT_FALSE(ata::ManifestReader::parse(bytes, kDataBegin, kDataBegin, &error));
  EXPECT_EQ(error.kind, ata::ErrorKind::Format);
}
