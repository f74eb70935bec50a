#include <thread>

#include <fmt/format.h>

#include <ata/codec.hpp>
#include <ata/options.hpp>

namespace ata {

unsigned ArchiveOptions::workerCount() const {
  if (parallelism > 0) {
    return parallelism;
  }
  unsigned hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 1;
}

bool ArchiveOptions::validate(Error *outError) const {
  if (chunkSize < kMinChunkSize || chunkSize > kMaxChunkSize) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Chunk size {} outside of [{}, {}]", chunkSize, kMinChunkSize,
                                kMaxChunkSize));
  }

  switch (compression) {
  case CompressionId::None:
    break;
  case CompressionId::Zlib:
  case CompressionId::Zstd:
    if (!makeCodec(compression)) {
      return setError(outError, ErrorKind::InvalidArgument,
                      fmt::format("{} support is not built in", compressionName(compression)));
    }
    if (compressionLevel < 0 || compressionLevel > maxCompressionLevel(compression)) {
      return setError(outError, ErrorKind::InvalidArgument,
                      fmt::format("Invalid {} compression level: {}",
                                  compressionName(compression), compressionLevel));
    }
    break;
  default:
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Unknown compression id: {}", static_cast<int>(compression)));
  }

  switch (encryption) {
  case EncryptionId::None:
    break;
  case EncryptionId::Aes256Gcm:
    // Never silently raised to the floor
    if (kdfIterations < kMinKdfIterations) {
      return setError(outError, ErrorKind::WeakParameter,
                      fmt::format("KDF iteration count {} is below the minimum of {}",
                                  kdfIterations, kMinKdfIterations));
    }
    break;
  default:
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Unknown encryption id: {}", static_cast<int>(encryption)));
  }

  return true;
}

} // namespace ata
