#include <algorithm>

#include <fmt/format.h>

#include <ata/chunker.hpp>

namespace ata {

ChunkSplitter::ChunkSplitter(std::istream &stream, size_t chunkSize)
    : stream_(&stream), start_(stream.tellg()), chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    failed_ = true;
    done_ = true;
  }
}

std::optional<Chunk> ChunkSplitter::next(Error *outError) {
  if (failed_) {
    setError(outError, ErrorKind::InvalidArgument, "Chunk splitter is in a failed state");
    return std::nullopt;
  }
  if (done_) {
    return std::nullopt;
  }

  Chunk chunk;
  chunk.index = chunksRead_;
  chunk.data.resize(chunkSize_);

  // Fill the whole chunk unless the stream ends, short reads are not chunk boundaries
  size_t filled = 0;
  while (filled < chunkSize_) {
    stream_->read(reinterpret_cast<char *>(chunk.data.data() + filled),
                  static_cast<std::streamsize>(chunkSize_ - filled));
    std::streamsize got = stream_->gcount();
    filled += static_cast<size_t>(got);
    if (stream_->eof()) {
      break;
    }
    if (stream_->fail()) {
      failed_ = true;
      done_ = true;
      setError(outError, ErrorKind::Io,
               fmt::format("Read failed after {} bytes", bytesRead_ + filled));
      return std::nullopt;
    }
  }

  if (stream_->bad()) {
    failed_ = true;
    done_ = true;
    setError(outError, ErrorKind::Io,
             fmt::format("Read failed after {} bytes", bytesRead_ + filled));
    return std::nullopt;
  }
  if (stream_->eof()) {
    done_ = true;
  }
  if (filled == 0) {
    done_ = true;
    return std::nullopt;
  }

  chunk.data.resize(filled);
  bytesRead_ += filled;
  ++chunksRead_;
  return chunk;
}

bool ChunkSplitter::restart(Error *outError) {
  if (chunkSize_ == 0) {
    return setError(outError, ErrorKind::InvalidArgument, "Chunk size must not be zero");
  }
  stream_->clear();
  stream_->seekg(start_);
  if (!*stream_) {
    failed_ = true;
    return setError(outError, ErrorKind::Io, "Stream cannot be rewound");
  }
  chunksRead_ = 0;
  bytesRead_ = 0;
  done_ = false;
  failed_ = false;
  return true;
}

ChunkJoiner::ChunkJoiner(uint64_t expectedSize, WriteFn write)
    : expected_(expectedSize), write_(std::move(write)) {}

bool ChunkJoiner::append(const Chunk &chunk, Error *outError) {
  if (chunk.index != nextIndex_) {
    return setError(outError, ErrorKind::CorruptData,
                    fmt::format("Chunk {} received out of order (expected {})", chunk.index,
                                nextIndex_));
  }
  if (chunk.data.size() > expected_ - written_) {
    return setError(outError, ErrorKind::CorruptData,
                    fmt::format("Chunk {} overruns the entry size of {} bytes", chunk.index,
                                expected_));
  }
  if (!chunk.data.empty() && write_ && !write_(chunk.data, outError)) {
    return false;
  }
  written_ += chunk.data.size();
  ++nextIndex_;
  return true;
}

bool ChunkJoiner::finish(Error *outError) const {
  if (written_ != expected_) {
    return setError(outError, ErrorKind::CorruptData,
                    fmt::format("Entry truncated: got {} of {} bytes", written_, expected_));
  }
  return true;
}

std::vector<Chunk> splitBuffer(std::span<const uint8_t> data, size_t chunkSize) {
  std::vector<Chunk> chunks;
  if (chunkSize == 0) {
    return chunks;
  }
  chunks.reserve((data.size() + chunkSize - 1) / chunkSize);

  for (size_t pos = 0; pos < data.size(); pos += chunkSize) {
    size_t len = std::min(chunkSize, data.size() - pos);
    Chunk chunk;
    chunk.index = static_cast<uint32_t>(chunks.size());
    chunk.data.assign(data.begin() + pos, data.begin() + pos + len);
    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

std::vector<uint8_t> joinChunks(std::span<const Chunk> chunks) {
  size_t total = 0;
  for (const auto &chunk : chunks) {
    total += chunk.data.size();
  }

  std::vector<uint8_t> result;
  result.reserve(total);
  for (const auto &chunk : chunks) {
    result.insert(result.end(), chunk.data.begin(), chunk.data.end());
  }
  return result;
}

} // namespace ata
