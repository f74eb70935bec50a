#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// Byte-level compression backend. Implementations are stateless and safe to
// call from several workers at once; every chunk is compressed independently.
class Codec {
public:
  virtual ~Codec() = default;

  virtual CompressionId id() const = 0;

  // Compress a buffer. level 0 selects the codec default.
  virtual std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> input, int level,
                                                     Error *outError = nullptr) const = 0;

  // Decompress a buffer that must expand to exactly expectedLength bytes,
  // fails with ErrorKind::CorruptData otherwise
  virtual std::optional<std::vector<uint8_t>> decode(std::span<const uint8_t> input,
                                                     size_t expectedLength,
                                                     Error *outError = nullptr) const = 0;
};

// Returns nullptr for an unknown id, or for a codec this build lacks
std::unique_ptr<Codec> makeCodec(CompressionId id);

// Highest level accepted by encode(); 0 for codecs without levels
int maxCompressionLevel(CompressionId id);

const char *compressionName(CompressionId id);
std::optional<CompressionId> parseCompressionName(std::string_view name);

} // namespace ata
