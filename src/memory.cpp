#include <sstream>

#include <fmt/format.h>

#include <ata/memory.hpp>

namespace ata {

void MemorySource::addFile(std::string path, std::vector<uint8_t> data, uint32_t mode,
                           int64_t mtime) {
  Item item;
  item.path = std::move(path);
  item.kind = EntryKind::File;
  item.data = std::move(data);
  item.mode = mode;
  item.mtime = mtime;
  items_.push_back(std::move(item));
}

void MemorySource::addFile(std::string path, std::string_view text, uint32_t mode,
                           int64_t mtime) {
  addFile(std::move(path), std::vector<uint8_t>(text.begin(), text.end()), mode, mtime);
}

void MemorySource::addDirectory(std::string path, uint32_t mode, int64_t mtime) {
  Item item;
  item.path = std::move(path);
  item.kind = EntryKind::Directory;
  item.mode = mode;
  item.mtime = mtime;
  items_.push_back(std::move(item));
}

void MemorySource::addSymlink(std::string path, std::string target, int64_t mtime) {
  Item item;
  item.path = std::move(path);
  item.kind = EntryKind::Symlink;
  item.linkTarget = std::move(target);
  item.mode = 0777;
  item.mtime = mtime;
  items_.push_back(std::move(item));
}

std::optional<SourceEntry> MemorySource::next(Error *) {
  if (position_ >= items_.size()) {
    return std::nullopt;
  }

  const Item &item = items_[position_++];

  SourceEntry entry;
  entry.path = item.path;
  entry.kind = item.kind;
  entry.mode = item.mode;
  entry.mtime = item.mtime;

  switch (item.kind) {
  case EntryKind::File:
    entry.size = item.data.size();
    entry.stream = std::make_unique<std::istringstream>(
        std::string(item.data.begin(), item.data.end()), std::ios::in | std::ios::binary);
    break;
  case EntryKind::Symlink:
    entry.size = item.linkTarget.size();
    entry.linkTarget = item.linkTarget;
    break;
  case EntryKind::Directory:
    break;
  }

  return entry;
}

bool MemorySink::makeDirectory(const ManifestEntry &entry, Error *) {
  StoredEntry stored;
  stored.kind = EntryKind::Directory;
  stored.mode = entry.mode;
  stored.mtime = entry.mtime;
  entries_[entry.path] = std::move(stored);
  return true;
}

bool MemorySink::makeSymlink(const ManifestEntry &entry, Error *) {
  StoredEntry stored;
  stored.kind = EntryKind::Symlink;
  stored.linkTarget = entry.linkTarget;
  stored.mode = entry.mode;
  stored.mtime = entry.mtime;
  entries_[entry.path] = std::move(stored);
  return true;
}

bool MemorySink::beginFile(const ManifestEntry &entry, Error *outError) {
  if (pending_) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("File '{}' is still open", pending_->first));
  }

  StoredEntry stored;
  stored.kind = EntryKind::File;
  stored.mode = entry.mode;
  stored.mtime = entry.mtime;
  stored.data.reserve(static_cast<size_t>(entry.size));
  pending_.emplace(entry.path, std::move(stored));
  return true;
}

bool MemorySink::writeFile(std::span<const uint8_t> data, Error *outError) {
  if (!pending_) {
    return setError(outError, ErrorKind::InvalidArgument, "No file is open");
  }
  pending_->second.data.insert(pending_->second.data.end(), data.begin(), data.end());
  return true;
}

bool MemorySink::commitFile(Error *outError) {
  if (!pending_) {
    return setError(outError, ErrorKind::InvalidArgument, "No file is open");
  }
  entries_[pending_->first] = std::move(pending_->second);
  pending_.reset();
  return true;
}

void MemorySink::discardFile() {
  if (pending_) {
    pending_.reset();
    ++discarded_;
  }
}

bool MemorySink::finish(Error *) {
  finished_ = true;
  return true;
}

const MemorySink::StoredEntry *MemorySink::find(const std::string &path) const {
  auto it = entries_.find(path);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

} // namespace ata
