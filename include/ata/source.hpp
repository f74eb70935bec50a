#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// One entry handed to the archive engine while an archive is created
struct SourceEntry {
  std::string path; // Archive path, normalized by the manifest builder
  EntryKind kind = EntryKind::File;
  uint64_t size = 0; // Expected size; the bytes actually read are what gets stored
  uint32_t mode = 0;
  int64_t mtime = 0;
  std::unique_ptr<std::istream> stream; // Files only
  std::string linkTarget;               // Symlinks only
};

// Produces the entries of a new archive, in the order they are stored
class EntrySource {
public:
  virtual ~EntrySource() = default;

  // Next entry, or std::nullopt when exhausted. A failure also returns
  // std::nullopt and sets outError.
  virtual std::optional<SourceEntry> next(Error *outError) = 0;
};

} // namespace ata
