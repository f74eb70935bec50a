#pragma once

#include <cstdint>
#include <span>

#include "error.hpp"
#include "types.hpp"

namespace ata {

// Receives extracted entries. File bytes arrive between beginFile() and
// commitFile() and must not become visible before commitFile(); discardFile()
// drops them. Bytes are only handed over after their chunk authenticated.
class EntrySink {
public:
  virtual ~EntrySink() = default;

  virtual bool makeDirectory(const ManifestEntry &entry, Error *outError) = 0;
  virtual bool makeSymlink(const ManifestEntry &entry, Error *outError) = 0;

  virtual bool beginFile(const ManifestEntry &entry, Error *outError) = 0;
  virtual bool writeFile(std::span<const uint8_t> data, Error *outError) = 0;
  virtual bool commitFile(Error *outError) = 0;
  virtual void discardFile() = 0;

  // Called once after the last entry of an extraction
  virtual bool finish(Error *) { return true; }
};

} // namespace ata
