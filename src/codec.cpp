#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#ifdef ATA_WITH_ZSTD
#include <zstd.h>
#endif

#include <ata/codec.hpp>

namespace ata {

namespace {

class NullCodec final : public Codec {
public:
  CompressionId id() const override { return CompressionId::None; }

  std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> input, int,
                                             Error *) const override {
    return std::vector<uint8_t>(input.begin(), input.end());
  }

  std::optional<std::vector<uint8_t>> decode(std::span<const uint8_t> input, size_t expectedLength,
                                             Error *outError) const override {
    if (input.size() != expectedLength) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Stored length {} does not match expected length {}", input.size(),
                           expectedLength));
      return std::nullopt;
    }
    return std::vector<uint8_t>(input.begin(), input.end());
  }
};

class ZlibCodec final : public Codec {
public:
  CompressionId id() const override { return CompressionId::Zlib; }

  std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> input, int level,
                                             Error *outError) const override {
    if (input.size() > std::numeric_limits<uLong>::max()) {
      setError(outError, ErrorKind::InvalidArgument, "Buffer too large for zlib");
      return std::nullopt;
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::vector<uint8_t> output(bound);
    int zlevel = level == 0 ? Z_DEFAULT_COMPRESSION : level;

    int result = compress2(output.data(), &bound, input.data(), static_cast<uLong>(input.size()),
                           zlevel);
    if (result != Z_OK) {
      setError(outError, ErrorKind::Internal, fmt::format("zlib compression failed ({})", result));
      return std::nullopt;
    }

    output.resize(bound);
    return output;
  }

  std::optional<std::vector<uint8_t>> decode(std::span<const uint8_t> input, size_t expectedLength,
                                             Error *outError) const override {
    if (input.empty() || input.size() > std::numeric_limits<uLong>::max() ||
        expectedLength > std::numeric_limits<uLongf>::max()) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Invalid zlib stream of {} bytes", input.size()));
      return std::nullopt;
    }

    // One spare byte so that a stream expanding past expectedLength is caught
    std::vector<uint8_t> output(expectedLength + 1);
    uLongf outLen = static_cast<uLongf>(output.size());
    uLong inLen = static_cast<uLong>(input.size());

    int result = uncompress2(output.data(), &outLen, input.data(), &inLen);
    if (result != Z_OK) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("zlib rejected the stream ({})", zError(result)));
      return std::nullopt;
    }
    if (inLen != input.size()) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("{} trailing bytes after zlib stream", input.size() - inLen));
      return std::nullopt;
    }
    if (outLen != expectedLength) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Decoded length {} does not match expected length {}", outLen,
                           expectedLength));
      return std::nullopt;
    }

    output.resize(outLen);
    return output;
  }
};

#ifdef ATA_WITH_ZSTD
class ZstdCodec final : public Codec {
public:
  CompressionId id() const override { return CompressionId::Zstd; }

  std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> input, int level,
                                             Error *outError) const override {
    std::vector<uint8_t> output(ZSTD_compressBound(input.size()));
    size_t written = ZSTD_compress(output.data(), output.size(), input.data(), input.size(),
                                   level == 0 ? ZSTD_CLEVEL_DEFAULT : level);
    if (ZSTD_isError(written)) {
      setError(outError, ErrorKind::Internal,
               fmt::format("zstd compression failed ({})", ZSTD_getErrorName(written)));
      return std::nullopt;
    }

    output.resize(written);
    return output;
  }

  std::optional<std::vector<uint8_t>> decode(std::span<const uint8_t> input, size_t expectedLength,
                                             Error *outError) const override {
    // The frame records its content size; check it before allocating
    unsigned long long frameSize = ZSTD_getFrameContentSize(input.data(), input.size());
    if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Invalid zstd frame of {} bytes", input.size()));
      return std::nullopt;
    }
    if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN && frameSize != expectedLength) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("zstd frame holds {} bytes, expected {}", frameSize, expectedLength));
      return std::nullopt;
    }

    std::vector<uint8_t> output(expectedLength);
    size_t decoded = ZSTD_decompress(output.data(), output.size(), input.data(), input.size());
    if (ZSTD_isError(decoded)) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("zstd rejected the stream ({})", ZSTD_getErrorName(decoded)));
      return std::nullopt;
    }
    if (decoded != expectedLength) {
      setError(outError, ErrorKind::CorruptData,
               fmt::format("Decoded length {} does not match expected length {}", decoded,
                           expectedLength));
      return std::nullopt;
    }

    return output;
  }
};
#endif

} // namespace

std::unique_ptr<Codec> makeCodec(CompressionId id) {
  switch (id) {
  case CompressionId::None:
    return std::make_unique<NullCodec>();
  case CompressionId::Zlib:
    return std::make_unique<ZlibCodec>();
  case CompressionId::Zstd:
#ifdef ATA_WITH_ZSTD
    return std::make_unique<ZstdCodec>();
#else
    return nullptr;
#endif
  }
  return nullptr;
}

int maxCompressionLevel(CompressionId id) {
  switch (id) {
  case CompressionId::None:
    return 0;
  case CompressionId::Zlib:
    return 9;
  case CompressionId::Zstd:
    return 19;
  }
  return 0;
}

const char *compressionName(CompressionId id) {
  switch (id) {
  case CompressionId::None:
    return "none";
  case CompressionId::Zlib:
    return "zlib";
  case CompressionId::Zstd:
    return "zstd";
  }
  return "unknown";
}

std::optional<CompressionId> parseCompressionName(std::string_view name) {
  if (name == "none") {
    return CompressionId::None;
  }
  if (name == "zlib" || name == "deflate") {
    return CompressionId::Zlib;
  }
  if (name == "zstd") {
    return CompressionId::Zstd;
  }
  return std::nullopt;
}

} // namespace ata
