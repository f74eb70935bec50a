#include <algorithm>
#include <deque>

#include <fmt/format.h>

#include <ata/archive.hpp>
#include <ata/chunker.hpp>
#include <ata/crypto.hpp>
#include <ata/log.hpp>
#include <ata/manifest.hpp>
#include <ata/memory.hpp>
#include <ata/pipeline.hpp>
#include <ata/reader.hpp>
#include <ata/scheduler.hpp>
#include <ata/writer.hpp>

namespace fs = std::filesystem;

namespace ata {

namespace {

// Adds the entry path to an error coming from a lower layer
Error withPath(Error error, const std::string &path) {
  error.message = fmt::format("{}: {}", path, error.message);
  return error;
}

void wipe(std::string &secret) {
  std::fill(secret.begin(), secret.end(), '\0');
}

// Drives one archive creation from the entry source to the finished file
class ArchiveCreator {
public:
  ArchiveCreator(const fs::path &path, EntrySource &source, const ArchiveOptions &options,
                 PassphraseProvider *passphrase)
      : path_(path), source_(source), options_(options), passphrase_(passphrase) {}

  std::optional<ArchiveReport> run(Error *outError);

private:
  struct PendingChunk {
    size_t entryIndex = 0;
    uint32_t chunkIndex = 0;
  };

  struct EntryProgress {
    bool split = false; // All chunks of the entry were submitted
    uint32_t expected = 0;
    uint32_t written = 0;
  };

  void transition(ArchiveState next);
  bool prepare(Error *outError);
  bool addEntry(SourceEntry &source, Error *outError);
  bool addFile(size_t index, std::istream &stream, Error *outError);
  bool drainOne(Error *outError);
  void advanceCompleted();
  ContentDigest newDigest() const;
  std::optional<ArchiveReport> abort(Error error, Error *outError);

  const fs::path &path_;
  EntrySource &source_;
  const ArchiveOptions &options_;
  PassphraseProvider *passphrase_;

  ArchiveState state_ = ArchiveState::Idle;
  ArchiveHeader header_;
  std::unique_ptr<KeyMaterial> key_;
  std::optional<ChunkPipeline> pipeline_;
  Writer writer_;
  ManifestBuilder manifest_;
  NonceAllocator nonces_;
  std::vector<EntryProgress> progress_;
  size_t completed_ = 0; // Leading entries whose chunks are all on disk
  std::deque<PendingChunk> inFlight_;
  std::unique_ptr<Scheduler> scheduler_; // Declared last, its tasks use pipeline_
  ArchiveReport report_;
};

void ArchiveCreator::transition(ArchiveState next) {
  if (state_ != next) {
    logger()->trace("{} -> {}", archiveStateName(state_), archiveStateName(next));
    state_ = next;
  }
}

std::optional<ArchiveReport> ArchiveCreator::run(Error *outError) {
  Error error;
  if (!prepare(&error)) {
    return abort(std::move(error), outError);
  }

  transition(ArchiveState::Collecting);
  for (;;) {
    if (options_.cancelled()) {
      return abort({ErrorKind::Cancelled, "Archive creation cancelled"}, outError);
    }

    Error sourceError;
    auto entry = source_.next(&sourceError);
    if (!entry) {
      if (sourceError.isSet()) {
        return abort(std::move(sourceError), outError);
      }
      break;
    }

    if (!addEntry(*entry, &error)) {
      return abort(std::move(error), outError);
    }
  }

  transition(ArchiveState::Processing);
  while (!inFlight_.empty()) {
    if (!drainOne(&error)) {
      return abort(std::move(error), outError);
    }
  }

  transition(ArchiveState::Finalizing);
  auto manifest = manifest_.serialize();
  if (!writer_.finish(manifest, &error)) {
    transition(ArchiveState::Failed);
    logger()->error("Failed to finalize {}: {}", path_.string(), error.describe());
    if (outError) {
      *outError = std::move(error);
    }
    return std::nullopt;
  }

  transition(ArchiveState::Closed);
  report_.state = state_;
  report_.complete = true;
  logger()->info("Created {}: {} entries, {} chunks, {} -> {} bytes", path_.string(),
                 report_.entries.size(), report_.chunkCount, report_.plainBytes,
                 report_.storedBytes);
  return std::move(report_);
}

bool ArchiveCreator::prepare(Error *outError) {
  if (!options_.validate(outError)) {
    return false;
  }

  header_.compression = options_.compression;
  header_.encryption = options_.encryption;

  if (options_.encryption != EncryptionId::None) {
    if (!passphrase_) {
      return setError(outError, ErrorKind::InvalidArgument,
                      "Encryption requested but no passphrase provider was given");
    }
    auto passphrase = passphrase_->passphrase(true);
    if (!passphrase) {
      return setError(outError, ErrorKind::Cancelled, "No passphrase entered");
    }
    if (passphrase->empty()) {
      return setError(outError, ErrorKind::InvalidArgument, "Passphrase is empty");
    }

    if (options_.salt) {
      header_.salt = *options_.salt;
    } else if (!randomBytes(header_.salt, outError)) {
      wipe(*passphrase);
      return false;
    }

    auto key = deriveKey(*passphrase, header_.salt, options_.kdfIterations, outError);
    wipe(*passphrase);
    if (!key) {
      return false;
    }

    key_ = std::make_unique<KeyMaterial>(std::move(*key));
    header_.flags = ArchiveHeader::flagEncrypted | ArchiveHeader::flagKeyedChecksums;
    header_.kdfIterations = options_.kdfIterations;
  }

  pipeline_ = ChunkPipeline::create(options_.compression, options_.compressionLevel,
                                    options_.encryption, key_.get(), outError);
  if (!pipeline_) {
    return false;
  }

  if (!writer_.open(path_, header_, outError)) {
    return false;
  }

  scheduler_ = std::make_unique<Scheduler>(options_.workerCount(), options_.queueDepth);
  logger()->debug("Creating {} with {} workers, {} byte chunks", path_.string(),
                  scheduler_->workerCount(), options_.chunkSize);
  return true;
}

bool ArchiveCreator::addEntry(SourceEntry &source, Error *outError) {
  ManifestEntry entry;
  entry.path = source.path;
  entry.kind = source.kind;
  entry.mode = source.mode & 07777;
  entry.mtime = source.mtime;

  if (entry.kind == EntryKind::Symlink) {
    entry.linkTarget = source.linkTarget;
    entry.size = entry.linkTarget.size();

    ContentDigest digest = newDigest();
    std::span<const uint8_t> target(reinterpret_cast<const uint8_t *>(entry.linkTarget.data()),
                                    entry.linkTarget.size());
    if (!digest.update(target, outError)) {
      return false;
    }
    auto checksum = digest.finish(outError);
    if (!checksum) {
      return false;
    }
    entry.checksum = *checksum;
  } else if (entry.kind == EntryKind::File && !source.stream) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("File entry '{}' has no data stream", source.path));
  }

  auto index = manifest_.addEntry(std::move(entry), outError);
  if (!index) {
    return false;
  }
  progress_.emplace_back();

  const ManifestEntry &added = manifest_.entry(*index);
  report_.entries.push_back({added.path, added.kind, true, {}});

  if (added.kind != EntryKind::File) {
    progress_.back().split = true;
    advanceCompleted();
    logger()->debug("Added {} {}", entryKindName(added.kind), added.path);
    return true;
  }

  transition(ArchiveState::Processing);
  bool ok = addFile(*index, *source.stream, outError);
  transition(ArchiveState::Collecting);
  return ok;
}

bool ArchiveCreator::addFile(size_t index, std::istream &stream, Error *outError) {
  ChunkSplitter splitter(stream, options_.chunkSize);
  ContentDigest digest = newDigest();
  const ChunkPipeline *pipeline = &*pipeline_;

  for (;;) {
    if (options_.cancelled()) {
      return setError(outError, ErrorKind::Cancelled, "Archive creation cancelled");
    }

    Error readError;
    auto chunk = splitter.next(&readError);
    if (!chunk) {
      if (splitter.failed()) {
        if (outError) {
          *outError = withPath(std::move(readError), manifest_.entry(index).path);
        }
        return false;
      }
      break;
    }

    if (!digest.update(chunk->data, outError)) {
      return false;
    }

    // Make room first, a full window would block submit() forever in sequential mode
    while (scheduler_->full()) {
      if (!drainOne(outError)) {
        return false;
      }
    }

    uint64_t sequence = nonces_.reserve();
    inFlight_.push_back({index, chunk->index});
    scheduler_->submit([pipeline, sequence, data = std::move(chunk->data)]() {
      ChunkResult result;
      auto sealed = pipeline->seal(data, sequence, &result.error);
      if (!sealed) {
        return result;
      }
      result.ok = true;
      result.data = std::move(sealed->stored);
      result.tag = sealed->tag;
      result.plainLength = sealed->plainLength;
      result.compressedLength = sealed->compressedLength;
      return result;
    });
  }

  auto checksum = digest.finish(outError);
  if (!checksum) {
    return false;
  }

  ManifestEntry &entry = manifest_.entry(index);
  entry.size = splitter.bytesRead();
  entry.checksum = *checksum;

  progress_[index].split = true;
  progress_[index].expected = splitter.chunksRead();
  ++report_.fileCount;
  report_.plainBytes += entry.size;
  advanceCompleted();

  logger()->debug("Queued {} ({} bytes, {} chunks)", entry.path, entry.size,
                  splitter.chunksRead());
  return true;
}

bool ArchiveCreator::drainOne(Error *outError) {
  ChunkResult result = scheduler_->next();
  PendingChunk pending = inFlight_.front();
  inFlight_.pop_front();

  ManifestEntry &entry = manifest_.entry(pending.entryIndex);
  if (!result.ok) {
    if (outError) {
      *outError = withPath(std::move(result.error), entry.path);
    }
    return false;
  }

  auto offset = writer_.appendChunk(result.data, outError);
  if (!offset) {
    return false;
  }

  ChunkDescriptor chunk;
  chunk.index = pending.chunkIndex;
  chunk.offset = *offset;
  chunk.storedLength = result.data.size();
  chunk.plainLength = result.plainLength;
  chunk.tag = result.tag;
  chunk.sequence = result.sequence;
  if (!manifest_.addChunk(pending.entryIndex, chunk, outError)) {
    return false;
  }

  ++progress_[pending.entryIndex].written;
  ++report_.chunkCount;
  report_.storedBytes += chunk.storedLength;
  advanceCompleted();
  return true;
}

void ArchiveCreator::advanceCompleted() {
  while (completed_ < progress_.size() && progress_[completed_].split &&
         progress_[completed_].written == progress_[completed_].expected) {
    ++completed_;
  }
}

ContentDigest ArchiveCreator::newDigest() const {
  if (key_) {
    return ContentDigest(key_->macKey());
  }
  return ContentDigest();
}

std::optional<ArchiveReport> ArchiveCreator::abort(Error error, Error *outError) {
  // Chunks sealed before the cancellation are still written, until the first
  // dropped or failed one
  if (scheduler_) {
    scheduler_->cancel();
    bool writing = writer_.isOpen();
    while (!inFlight_.empty()) {
      if (writing) {
        Error drainError;
        writing = drainOne(&drainError);
      } else {
        scheduler_->next();
        inFlight_.pop_front();
      }
    }
  }

  if (writer_.isOpen()) {
    Error abortError;
    if (writer_.abort(manifest_.serialize(completed_), &abortError)) {
      logger()->warn("Left {} incomplete with {} of {} entries", path_.string(), completed_,
                     manifest_.entryCount());
    } else {
      logger()->error("Failed to mark {} incomplete: {}", path_.string(),
                      abortError.describe());
    }
  }

  transition(ArchiveState::Failed);
  logger()->error("Creating {} failed: {}", path_.string(), error.describe());
  if (outError) {
    *outError = std::move(error);
  }
  return std::nullopt;
}

} // namespace

const char *archiveStateName(ArchiveState state) {
  switch (state) {
  case ArchiveState::Idle:
    return "Idle";
  case ArchiveState::Collecting:
    return "Collecting";
  case ArchiveState::Processing:
    return "Processing";
  case ArchiveState::Finalizing:
    return "Finalizing";
  case ArchiveState::Opened:
    return "Opened";
  case ArchiveState::Extracting:
    return "Extracting";
  case ArchiveState::Closed:
    return "Closed";
  case ArchiveState::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool ArchiveReport::ok() const {
  return !error.isSet() && failureCount() == 0;
}

size_t ArchiveReport::failureCount() const {
  return static_cast<size_t>(
      std::count_if(entries.begin(), entries.end(), [](const EntryOutcome &e) { return !e.ok; }));
}

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<ArchiveReport> Archive::create(const fs::path &path, EntrySource &source,
                                             const ArchiveOptions &options,
                                             PassphraseProvider *passphrase, Error *outError) {
  ArchiveCreator creator(path, source, options, passphrase);
  return creator.run(outError);
}

std::optional<Archive> Archive::open(const fs::path &path, const ArchiveOptions &options,
                                     PassphraseProvider *passphrase, Error *outError) {
  auto reader = Reader::open(path, options.allowIncomplete, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  archive.options_ = options;
  archive.passphrase_ = passphrase;
  archive.state_ = ArchiveState::Opened;

  const auto &header = archive.reader_->header();
  if (!archive.reader_->isComplete()) {
    logger()->warn("{} is incomplete, {} entries recoverable", path.string(),
                   archive.reader_->entryCount());
  }
  logger()->info("Opened {}: {} entries, compression {}, encryption {}", path.string(),
                 archive.reader_->entryCount(), compressionName(header.compression),
                 encryptionName(header.encryption));
  return archive;
}

const std::vector<ManifestEntry> &Archive::entries() const {
  static const std::vector<ManifestEntry> empty;
  if (!reader_) {
    return empty;
  }
  return reader_->entries();
}

size_t Archive::entryCount() const {
  return reader_ ? reader_->entryCount() : 0;
}

const ManifestEntry *Archive::findEntry(const std::string &path) const {
  if (!reader_) {
    return nullptr;
  }
  return reader_->findEntry(path);
}

const ArchiveHeader &Archive::header() const {
  static const ArchiveHeader empty;
  return reader_ ? reader_->header() : empty;
}

bool Archive::isEncrypted() const {
  return header().encrypted();
}

bool Archive::isComplete() const {
  return reader_ && reader_->isComplete();
}

EntryOutcome Archive::extract(const ManifestEntry &entry, EntrySink &sink) {
  ArchiveReport report = run({&entry}, &sink);
  if (report.entries.empty()) {
    return {entry.path, entry.kind, false, report.error};
  }
  return std::move(report.entries.front());
}

ArchiveReport Archive::extractAll(EntrySink &sink) {
  std::vector<const ManifestEntry *> selected;
  for (const auto &entry : entries()) {
    selected.push_back(&entry);
  }
  return extractSelected(selected, {}, sink);
}

ArchiveReport Archive::extract(std::span<const std::string> paths, EntrySink &sink) {
  std::vector<const ManifestEntry *> selected;
  std::vector<EntryOutcome> missing;

  for (const auto &path : paths) {
    auto normalized = normalizeEntryPath(path);
    std::string prefix = normalized.value_or(path) + "/";
    bool found = false;

    for (const auto &entry : entries()) {
      if (normalized && (entry.path == *normalized || entry.path.starts_with(prefix))) {
        found = true;
        if (std::find(selected.begin(), selected.end(), &entry) == selected.end()) {
          selected.push_back(&entry);
        }
      }
    }

    if (!found) {
      missing.push_back({path, EntryKind::File, false,
                         {ErrorKind::InvalidArgument, fmt::format("{}: not in archive", path)}});
    }
  }

  // Keep manifest order whatever order the paths were given in
  std::sort(selected.begin(), selected.end());
  return extractSelected(selected, std::move(missing), sink);
}

ArchiveReport Archive::verify() {
  std::vector<const ManifestEntry *> selected;
  for (const auto &entry : entries()) {
    selected.push_back(&entry);
  }

  ArchiveReport report = run(selected, nullptr);
  logger()->info("Verified {} entries, {} failed", report.entries.size(), report.failureCount());
  return report;
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const ManifestEntry &entry,
                                                             Error *outError) {
  if (entry.kind != EntryKind::File) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("{} is a {}, not a file", entry.path, entryKindName(entry.kind)));
    return std::nullopt;
  }

  MemorySink sink;
  EntryOutcome outcome = extract(entry, sink);
  if (!outcome.ok) {
    if (outError) {
      *outError = std::move(outcome.error);
    }
    return std::nullopt;
  }

  const auto *stored = sink.find(entry.path);
  if (!stored) {
    setError(outError, ErrorKind::Internal, fmt::format("{} was not extracted", entry.path));
    return std::nullopt;
  }
  return stored->data;
}

void Archive::close() {
  reader_.reset();
  pipeline_.reset();
  key_.reset();
  state_ = ArchiveState::Closed;
}

ArchiveReport Archive::extractSelected(const std::vector<const ManifestEntry *> &selected,
                                       std::vector<EntryOutcome> missing, EntrySink &sink) {
  auto skipAll = [](ArchiveReport &report, std::vector<EntryOutcome> &failures) {
    for (auto &outcome : report.entries) {
      if (outcome.ok) {
        outcome.ok = false;
        outcome.error = {ErrorKind::Cancelled, fmt::format("{}: skipped, another entry failed",
                                                           outcome.path)};
      }
    }
    report.entries.insert(report.entries.end(), failures.begin(), failures.end());
    report.fileCount = 0;
    report.chunkCount = 0;
    report.plainBytes = 0;
    report.storedBytes = 0;
  };

  if (options_.policy == ExtractPolicy::AllOrNothing) {
    ArchiveReport check = run(selected, nullptr);
    if (!check.ok() || !missing.empty()) {
      skipAll(check, missing);
      logger()->warn("Nothing extracted: {} of {} entries failed", check.failureCount(),
                     check.entries.size());
      return check;
    }
  }

  ArchiveReport report = run(selected, &sink);
  report.entries.insert(report.entries.end(), missing.begin(), missing.end());
  return report;
}

ArchiveReport Archive::run(const std::vector<const ManifestEntry *> &entries, EntrySink *sink) {
  ArchiveReport report;
  report.complete = isComplete();

  if (!reader_ || state_ == ArchiveState::Closed) {
    report.error = {ErrorKind::InvalidArgument, "Archive is not open"};
    report.state = state_;
    return report;
  }

  if (state_ != ArchiveState::Failed) {
    state_ = ArchiveState::Extracting;
  }

  Scheduler scheduler(options_.workerCount(), options_.queueDepth);
  for (const ManifestEntry *entry : entries) {
    EntryOutcome outcome;
    if (options_.cancelled()) {
      outcome = {entry->path, entry->kind, false,
                 {ErrorKind::Cancelled, fmt::format("{}: extraction cancelled", entry->path)}};
    } else {
      outcome = processEntry(*entry, sink, scheduler);
    }

    if (outcome.ok) {
      if (entry->kind == EntryKind::File) {
        ++report.fileCount;
        report.chunkCount += entry->chunks.size();
        report.plainBytes += entry->size;
        report.storedBytes += entry->storedSize();
      }
    } else {
      logger()->warn("{}", outcome.error.describe());
    }
    report.entries.push_back(std::move(outcome));
  }

  if (sink) {
    Error finishError;
    if (!sink->finish(&finishError)) {
      logger()->warn("{}", finishError.describe());
      report.error = std::move(finishError);
    }
  }

  if (state_ != ArchiveState::Failed) {
    state_ = ArchiveState::Opened;
  }
  report.state = state_;
  return report;
}

EntryOutcome Archive::processEntry(const ManifestEntry &entry, EntrySink *sink,
                                   Scheduler &scheduler) {
  EntryOutcome outcome{entry.path, entry.kind, false, {}};
  Error error;

  if (state_ == ArchiveState::Failed) {
    outcome.error = withPath(failure_, entry.path);
    return outcome;
  }

  switch (entry.kind) {
  case EntryKind::Directory:
    outcome.ok = !sink || sink->makeDirectory(entry, &error);
    break;

  case EntryKind::Symlink: {
    if (!preparePipeline(&error)) {
      break;
    }
    bool keyed = key_ && reader_->header().keyedChecksums();
    ContentDigest digest = keyed ? ContentDigest(key_->macKey()) : ContentDigest();
    std::span<const uint8_t> target(reinterpret_cast<const uint8_t *>(entry.linkTarget.data()),
                                    entry.linkTarget.size());
    if (!digest.update(target, &error)) {
      break;
    }
    auto checksum = digest.finish(&error);
    outcome.ok = checksum && checkChecksum(entry, *checksum, &error) &&
                 (!sink || sink->makeSymlink(entry, &error));
    break;
  }

  case EntryKind::File:
    if (!preparePipeline(&error)) {
      break;
    }
    if (sink && !sink->beginFile(entry, &error)) {
      break;
    }
    outcome.ok = processFile(entry, sink, scheduler, &error);
    if (sink) {
      if (outcome.ok) {
        outcome.ok = sink->commitFile(&error);
      } else {
        sink->discardFile();
      }
    }
    break;
  }

  if (!outcome.ok) {
    outcome.error = withPath(std::move(error), entry.path);
  } else {
    logger()->debug("Extracted {} {}", entryKindName(entry.kind), entry.path);
  }
  return outcome;
}

bool Archive::processFile(const ManifestEntry &entry, EntrySink *sink, Scheduler &scheduler,
                          Error *outError) {
  ContentDigest digest =
      key_ && reader_->header().keyedChecksums() ? ContentDigest(key_->macKey()) : ContentDigest();

  // Authenticated plaintext only: the pipeline never returns bytes of a chunk that failed
  ChunkJoiner joiner(entry.size, [&](std::span<const uint8_t> data, Error *err) {
    if (!digest.update(data, err)) {
      return false;
    }
    return !sink || sink->writeFile(data, err);
  });

  const ChunkPipeline *pipeline = pipeline_.get();
  const Reader *reader = reader_.get();
  size_t submitted = 0;
  size_t consumed = 0;
  bool ok = true;
  Error failure;

  // Results after the first failure are drained and dropped
  auto consume = [&]() {
    ChunkResult result = scheduler.next();
    const ChunkDescriptor &chunk = entry.chunks[consumed++];
    if (!ok) {
      return;
    }
    if (!result.ok) {
      ok = false;
      failure = std::move(result.error);
      return;
    }
    Chunk piece;
    piece.index = chunk.index;
    piece.data = std::move(result.data);
    ok = joiner.append(piece, &failure);
  };

  for (const auto &chunk : entry.chunks) {
    if (!ok) {
      break;
    }
    if (options_.cancelled()) {
      ok = false;
      failure = {ErrorKind::Cancelled, "extraction cancelled"};
      break;
    }

    while (scheduler.full()) {
      consume();
    }

    std::span<const uint8_t> stored = reader->chunkView(chunk);
    scheduler.submit([pipeline, stored, chunk]() {
      ChunkResult result;
      auto plain = pipeline->open(stored, chunk, &result.error);
      if (!plain) {
        return result;
      }
      result.ok = true;
      result.plainLength = plain->size();
      result.data = std::move(*plain);
      return result;
    });
    ++submitted;
  }

  while (consumed < submitted) {
    consume();
  }

  if (ok) {
    ok = joiner.finish(&failure);
  }
  if (ok) {
    auto checksum = digest.finish(&failure);
    ok = checksum && checkChecksum(entry, *checksum, &failure);
  }

  if (!ok && outError) {
    *outError = std::move(failure);
  }
  return ok;
}

bool Archive::checkChecksum(const ManifestEntry &entry, const Checksum &actual,
                            Error *outError) const {
  if (constantTimeEqual(actual, entry.checksum)) {
    return true;
  }
  if (reader_->header().keyedChecksums()) {
    return setError(outError, ErrorKind::Authentication, "content checksum does not verify");
  }
  return setError(outError, ErrorKind::CorruptData,
                  fmt::format("content checksum mismatch ({} bytes)", entry.size));
}

bool Archive::preparePipeline(Error *outError) {
  if (pipeline_) {
    return true;
  }

  const auto &header = reader_->header();
  Error error;

  if (header.encrypted()) {
    if (!passphrase_) {
      return fail({ErrorKind::InvalidArgument,
                   "archive is encrypted and no passphrase is available"},
                  outError);
    }
    auto passphrase = passphrase_->passphrase(false);
    if (!passphrase) {
      return fail({ErrorKind::Cancelled, "no passphrase entered"}, outError);
    }

    auto key = deriveKey(*passphrase, header.salt, header.kdfIterations, &error);
    wipe(*passphrase);
    if (!key) {
      return fail(std::move(error), outError);
    }
    key_ = std::make_unique<KeyMaterial>(std::move(*key));
  }

  auto pipeline =
      ChunkPipeline::create(header.compression, 0, header.encryption, key_.get(), &error);
  if (!pipeline) {
    return fail(std::move(error), outError);
  }
  pipeline_ = std::make_unique<ChunkPipeline>(std::move(*pipeline));
  return true;
}

bool Archive::fail(Error error, Error *outError) {
  logger()->error("Archive unusable: {}", error.describe());
  state_ = ArchiveState::Failed;
  failure_ = error;
  if (outError) {
    *outError = std::move(error);
  }
  return false;
}

} // namespace ata
