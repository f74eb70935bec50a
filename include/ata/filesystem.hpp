#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "sink.hpp"
#include "source.hpp"

namespace ata {

// Convert between filesystem timestamps and seconds since the Unix epoch
int64_t toUnixSeconds(std::filesystem::file_time_type time);
std::filesystem::file_time_type fromUnixSeconds(int64_t seconds);

// Walks files and directory trees on disk. Each root is stored under its final
// path component; directory children are visited in name order and symlinks
// are stored as links, never followed. Roots that do not exist are skipped
// with a warning.
class FilesystemSource : public EntrySource {
public:
  explicit FilesystemSource(std::vector<std::filesystem::path> roots);

  std::optional<SourceEntry> next(Error *outError) override;

private:
  struct Pending {
    std::filesystem::path diskPath;
    std::string archivePath;
    bool root = false;
  };

  std::vector<Pending> pending_; // Stack, next entry at the back
};

// Materializes extracted entries under an output directory. Files are written
// to a hidden sibling and renamed into place on commit; directory permissions
// and times are applied in finish() so read-only directories can be filled.
class FilesystemSink : public EntrySink {
public:
  explicit FilesystemSink(std::filesystem::path root);
  ~FilesystemSink() override;

  FilesystemSink(const FilesystemSink &) = delete;
  FilesystemSink &operator=(const FilesystemSink &) = delete;

  bool makeDirectory(const ManifestEntry &entry, Error *outError) override;
  bool makeSymlink(const ManifestEntry &entry, Error *outError) override;
  bool beginFile(const ManifestEntry &entry, Error *outError) override;
  bool writeFile(std::span<const uint8_t> data, Error *outError) override;
  bool commitFile(Error *outError) override;
  void discardFile() override;
  bool finish(Error *outError) override;

  const std::filesystem::path &root() const { return root_; }

private:
  // Map an archive path below root_, refusing to pass through symlinks
  std::optional<std::filesystem::path> resolve(const std::string &archivePath, Error *outError);
  bool createParents(const std::filesystem::path &target, Error *outError);

  struct DeferredDirectory {
    std::filesystem::path path;
    uint32_t mode = 0;
    int64_t mtime = 0;
  };

  std::filesystem::path root_;
  std::vector<DeferredDirectory> directories_;

  std::ofstream file_;
  std::filesystem::path filePath_;
  std::filesystem::path tempPath_;
  uint32_t fileMode_ = 0;
  int64_t fileMtime_ = 0;
  bool fileOpen_ = false;
};

} // namespace ata
