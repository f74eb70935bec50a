#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sink.hpp"
#include "source.hpp"

namespace ata {

// Entry source backed by buffers held in memory, served in insertion order
class MemorySource : public EntrySource {
public:
  MemorySource() = default;

  void addFile(std::string path, std::vector<uint8_t> data, uint32_t mode = 0644,
               int64_t mtime = 0);
  void addFile(std::string path, std::string_view text, uint32_t mode = 0644, int64_t mtime = 0);
  void addDirectory(std::string path, uint32_t mode = 0755, int64_t mtime = 0);
  void addSymlink(std::string path, std::string target, int64_t mtime = 0);

  std::optional<SourceEntry> next(Error *outError) override;

  // Serve the entries again from the first one
  void rewind() { position_ = 0; }

  size_t size() const { return items_.size(); }

private:
  struct Item {
    std::string path;
    EntryKind kind = EntryKind::File;
    std::vector<uint8_t> data;
    std::string linkTarget;
    uint32_t mode = 0;
    int64_t mtime = 0;
  };

  std::vector<Item> items_;
  size_t position_ = 0;
};

// Entry sink collecting extracted entries in memory
class MemorySink : public EntrySink {
public:
  struct StoredEntry {
    EntryKind kind = EntryKind::File;
    std::vector<uint8_t> data;
    std::string linkTarget;
    uint32_t mode = 0;
    int64_t mtime = 0;
  };

  MemorySink() = default;

  bool makeDirectory(const ManifestEntry &entry, Error *outError) override;
  bool makeSymlink(const ManifestEntry &entry, Error *outError) override;
  bool beginFile(const ManifestEntry &entry, Error *outError) override;
  bool writeFile(std::span<const uint8_t> data, Error *outError) override;
  bool commitFile(Error *outError) override;
  void discardFile() override;
  bool finish(Error *outError) override;

  const std::map<std::string, StoredEntry> &entries() const { return entries_; }

  // Returns nullptr if the path was never committed
  const StoredEntry *find(const std::string &path) const;

  bool contains(const std::string &path) const { return entries_.count(path) != 0; }
  size_t size() const { return entries_.size(); }

  // Number of files dropped after a failed verification
  size_t discarded() const { return discarded_; }
  bool finished() const { return finished_; }

private:
  std::map<std::string, StoredEntry> entries_;
  std::optional<std::pair<std::string, StoredEntry>> pending_;
  size_t discarded_ = 0;
  bool finished_ = false;
};

} // namespace ata
