#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "error.hpp"
#include "options.hpp"
#include "passphrase.hpp"
#include "sink.hpp"
#include "source.hpp"
#include "types.hpp"

namespace ata {

// Forward declarations
class Reader;
class KeyMaterial;
class ChunkPipeline;
class Scheduler;

// Lifecycle of an archive. Creation goes Idle -> Collecting -> Processing ->
// Finalizing -> Closed, extraction Idle -> Opened -> Extracting -> Opened ->
// Closed. Failed is terminal and can be entered from any other state.
enum class ArchiveState {
  Idle,
  Collecting,
  Processing,
  Finalizing,
  Opened,
  Extracting,
  Closed,
  Failed,
};

const char *archiveStateName(ArchiveState state);

// Result of one entry in a create, extract or verify run
struct EntryOutcome {
  std::string path;
  EntryKind kind = EntryKind::File;
  bool ok = false;
  Error error;
};

struct ArchiveReport {
  std::vector<EntryOutcome> entries;
  uint64_t fileCount = 0;
  uint64_t chunkCount = 0;
  uint64_t plainBytes = 0;
  uint64_t storedBytes = 0;
  bool complete = true; // False for archives opened in recovery mode
  ArchiveState state = ArchiveState::Idle;
  Error error; // Failure not tied to a single entry

  // True if every entry succeeded and no archive-level error occurred
  bool ok() const;
  size_t failureCount() const;
};

// Archive engine: drives entries through the chunk pipeline on a worker pool
// and the container reader/writer
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Write a new archive with every entry of `source`. passphrase is required
  // when options.encryption is set and is asked for once. On failure or
  // cancellation the file is left with the entries completed so far and
  // marked incomplete, and std::nullopt is returned.
  static std::optional<ArchiveReport> create(const std::filesystem::path &path,
                                             EntrySource &source, const ArchiveOptions &options,
                                             PassphraseProvider *passphrase = nullptr,
                                             Error *outError = nullptr);

  // Open an existing archive. The manifest is read right away; the passphrase
  // is only requested once chunk payloads or checksums must be verified.
  // passphrase must outlive the archive.
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     const ArchiveOptions &options = {},
                                     PassphraseProvider *passphrase = nullptr,
                                     Error *outError = nullptr);

  // Entries in manifest order (only available when open)
  const std::vector<ManifestEntry> &entries() const;
  size_t entryCount() const;

  // Case-sensitive lookup. Returns nullptr if not found.
  const ManifestEntry *findEntry(const std::string &path) const;

  // Extract a single entry into sink
  EntryOutcome extract(const ManifestEntry &entry, EntrySink &sink);

  // Extract every entry, following options.policy
  ArchiveReport extractAll(EntrySink &sink);

  // Extract the named entries, following options.policy. A directory path
  // selects everything below it; unknown paths are reported as failed entries.
  ArchiveReport extract(std::span<const std::string> paths, EntrySink &sink);

  // Run every entry through the full reverse pipeline without writing anything
  ArchiveReport verify();

  // Extract a file entry to memory
  std::optional<std::vector<uint8_t>> extractToMemory(const ManifestEntry &entry,
                                                      Error *outError = nullptr);

  const ArchiveHeader &header() const;
  bool isEncrypted() const;
  bool isComplete() const;

  ArchiveState state() const { return state_; }

  // Reason the archive entered ArchiveState::Failed
  const Error &failure() const { return failure_; }

  bool isOpen() const { return reader_.get() != nullptr; }

  void close();

private:
  // Applies options.policy to a selection; `missing` are requested paths not found
  ArchiveReport extractSelected(const std::vector<const ManifestEntry *> &selected,
                                std::vector<EntryOutcome> missing, EntrySink &sink);

  // Passes a list of entries through the pipeline, into sink if given
  ArchiveReport run(const std::vector<const ManifestEntry *> &entries, EntrySink *sink);

  EntryOutcome processEntry(const ManifestEntry &entry, EntrySink *sink, Scheduler &scheduler);
  bool processFile(const ManifestEntry &entry, EntrySink *sink, Scheduler &scheduler,
                   Error *outError);
  bool checkChecksum(const ManifestEntry &entry, const Checksum &actual, Error *outError) const;

  // Derive the key and build the pipeline on first use
  bool preparePipeline(Error *outError);

  bool fail(Error error, Error *outError);

  std::unique_ptr<Reader> reader_;
  std::unique_ptr<KeyMaterial> key_;
  std::unique_ptr<ChunkPipeline> pipeline_;
  ArchiveOptions options_;
  PassphraseProvider *passphrase_ = nullptr;
  ArchiveState state_ = ArchiveState::Idle;
  Error failure_;
};

} // namespace ata
