#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "error.hpp"
#include "types.hpp"

namespace ata {

inline constexpr size_t kDefaultChunkSize = 4 * 1024 * 1024;
inline constexpr size_t kMinChunkSize = 4 * 1024;
inline constexpr size_t kMaxChunkSize = 256 * 1024 * 1024;

inline constexpr uint32_t kDefaultKdfIterations = 600000;
inline constexpr uint32_t kMinKdfIterations = 100000;

// What to do with the other entries when one entry fails to verify
enum class ExtractPolicy {
  BestEffort,   // Extract everything that verifies, report the rest
  AllOrNothing, // Verify every requested entry first, write nothing on any failure
};

// Tunables for creating and reading archives
struct ArchiveOptions {
  size_t chunkSize = kDefaultChunkSize;
  unsigned parallelism = 0; // 0 = number of hardware threads
  size_t queueDepth = 2;    // Extra in-flight chunks beyond one per worker

  CompressionId compression = CompressionId::Zlib;
  int compressionLevel = 0; // 0 = codec default
  EncryptionId encryption = EncryptionId::None;
  uint32_t kdfIterations = kDefaultKdfIterations;
  // Fixed salt for reproducible or test output only. The same salt and passphrase derive the
  // same key, and chunk nonces repeat across archives. Random when unset.
  std::optional<Salt> salt;

  ExtractPolicy policy = ExtractPolicy::BestEffort;
  bool allowIncomplete = false; // Open unfinished archives for partial recovery

  // Set to true from any thread to stop the current operation
  const std::atomic<bool> *cancel = nullptr;

  unsigned workerCount() const;
  bool cancelled() const { return cancel && cancel->load(std::memory_order_relaxed); }

  bool validate(Error *outError = nullptr) const;
};

} // namespace ata
