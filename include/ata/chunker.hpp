#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"

namespace ata {

// A slice of an entry's plaintext
struct Chunk {
  uint32_t index = 0;
  std::vector<uint8_t> data;
};

// Lazily splits a stream into fixed-size chunks. Only the last chunk may be
// shorter than the chunk size; an empty stream yields no chunk at all.
class ChunkSplitter {
public:
  ChunkSplitter(std::istream &stream, size_t chunkSize);

  // Read the next chunk. Returns std::nullopt at end of stream, or on a read
  // failure in which case failed() is true and outError is filled.
  std::optional<Chunk> next(Error *outError = nullptr);

  // Seek back to the start of the stream and start over
  bool restart(Error *outError = nullptr);

  bool done() const { return done_; }
  bool failed() const { return failed_; }
  uint32_t chunksRead() const { return chunksRead_; }
  uint64_t bytesRead() const { return bytesRead_; }

private:
  std::istream *stream_;
  std::streampos start_;
  size_t chunkSize_;
  uint32_t chunksRead_ = 0;
  uint64_t bytesRead_ = 0;
  bool done_ = false;
  bool failed_ = false;
};

// Reassembles ordered chunks into a byte stream handed to `write`, checking
// that indices are consecutive and the total matches the expected size.
class ChunkJoiner {
public:
  using WriteFn = std::function<bool(std::span<const uint8_t>, Error *)>;

  ChunkJoiner(uint64_t expectedSize, WriteFn write);

  bool append(const Chunk &chunk, Error *outError = nullptr);

  // Check that the whole stream was received
  bool finish(Error *outError = nullptr) const;

  uint64_t bytesWritten() const { return written_; }

private:
  uint64_t expected_;
  uint64_t written_ = 0;
  uint32_t nextIndex_ = 0;
  WriteFn write_;
};

// Split a memory buffer (convenience for callers that already hold the data)
std::vector<Chunk> splitBuffer(std::span<const uint8_t> data, size_t chunkSize);

// Join ordered chunks into a single buffer
std::vector<uint8_t> joinChunks(std::span<const Chunk> chunks);

} // namespace ata
