#include <algorithm>
#include <chrono>

#include <fmt/format.h>

#include <ata/filesystem.hpp>
#include <ata/log.hpp>
#include <ata/manifest.hpp>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace ata {

namespace {

int64_t symlinkMtime(const fs::path &path) {
#ifdef _WIN32
  (void)path;
  return 0;
#else
  struct stat st;
  if (lstat(path.c_str(), &st) < 0) {
    return 0;
  }
  return static_cast<int64_t>(st.st_mtime);
#endif
}

uint32_t permissionBits(fs::perms perms) {
  return static_cast<uint32_t>(perms & fs::perms::mask);
}

// Name a root is stored under: its last component, even for "dir/" or "."
std::string rootName(const fs::path &root) {
  std::error_code ec;
  fs::path absolute = fs::absolute(root, ec);
  if (ec) {
    absolute = root;
  }
  absolute = absolute.lexically_normal();
  if (!absolute.has_filename()) {
    absolute = absolute.parent_path();
  }
  return absolute.filename().string();
}

} // namespace

int64_t toUnixSeconds(fs::file_time_type time) {
  auto sys = std::chrono::file_clock::to_sys(time);
  return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

fs::file_time_type fromUnixSeconds(int64_t seconds) {
  return std::chrono::file_clock::from_sys(std::chrono::sys_seconds(std::chrono::seconds(seconds)));
}

FilesystemSource::FilesystemSource(std::vector<fs::path> roots) {
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
    pending_.push_back({*it, rootName(*it), true});
  }
}

std::optional<SourceEntry> FilesystemSource::next(Error *outError) {
  while (!pending_.empty()) {
    Pending item = std::move(pending_.back());
    pending_.pop_back();

    if (item.archivePath.empty() || item.archivePath == "." || item.archivePath == "..") {
      setError(outError, ErrorKind::InvalidArgument,
               fmt::format("Cannot archive {}: no usable name", item.diskPath.string()));
      return std::nullopt;
    }

    std::error_code ec;
    auto status = fs::symlink_status(item.diskPath, ec);
    if (item.root && status.type() == fs::file_type::not_found) {
      logger()->warn("Skipping non-existent path {}", item.diskPath.string());
      continue;
    }
    if (ec) {
      setError(outError, ErrorKind::Io,
               fmt::format("Cannot stat {}: {}", item.diskPath.string(), ec.message()));
      return std::nullopt;
    }

    SourceEntry entry;
    entry.path = item.archivePath;
    entry.mode = permissionBits(status.permissions());

    if (fs::is_symlink(status)) {
      auto target = fs::read_symlink(item.diskPath, ec);
      if (ec) {
        setError(outError, ErrorKind::Io,
                 fmt::format("Cannot read symlink {}: {}", item.diskPath.string(), ec.message()));
        return std::nullopt;
      }
      entry.kind = EntryKind::Symlink;
      entry.linkTarget = target.string();
      entry.size = entry.linkTarget.size();
      entry.mtime = symlinkMtime(item.diskPath);
      return entry;
    }

    auto mtime = fs::last_write_time(item.diskPath, ec);
    if (ec) {
      setError(outError, ErrorKind::Io,
               fmt::format("Cannot read modification time of {}: {}", item.diskPath.string(),
                           ec.message()));
      return std::nullopt;
    }
    entry.mtime = toUnixSeconds(mtime);

    if (fs::is_directory(status)) {
      std::vector<std::string> names;
      fs::directory_iterator it(item.diskPath, ec);
      for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        names.push_back(it->path().filename().string());
      }
      if (ec) {
        setError(outError, ErrorKind::Io,
                 fmt::format("Cannot list {}: {}", item.diskPath.string(), ec.message()));
        return std::nullopt;
      }

      std::sort(names.begin(), names.end());
      for (auto name = names.rbegin(); name != names.rend(); ++name) {
        pending_.push_back({item.diskPath / *name, item.archivePath + "/" + *name, false});
      }

      entry.kind = EntryKind::Directory;
      return entry;
    }

    if (fs::is_regular_file(status)) {
      auto size = fs::file_size(item.diskPath, ec);
      if (ec) {
        setError(outError, ErrorKind::Io,
                 fmt::format("Cannot get size of {}: {}", item.diskPath.string(), ec.message()));
        return std::nullopt;
      }

      auto stream = std::make_unique<std::ifstream>(item.diskPath, std::ios::binary);
      if (!*stream) {
        setError(outError, ErrorKind::Io,
                 fmt::format("Failed to open file for reading: {}", item.diskPath.string()));
        return std::nullopt;
      }

      entry.kind = EntryKind::File;
      entry.size = size;
      entry.stream = std::move(stream);
      return entry;
    }

    logger()->warn("Skipping {}: not a file, directory or symlink", item.diskPath.string());
  }

  return std::nullopt;
}

FilesystemSink::FilesystemSink(fs::path root) : root_(std::move(root)) {}

FilesystemSink::~FilesystemSink() {
  discardFile();
}

std::optional<fs::path> FilesystemSink::resolve(const std::string &archivePath,
                                                Error *outError) {
  auto normalized = normalizeEntryPath(archivePath, outError);
  if (!normalized) {
    return std::nullopt;
  }

#ifdef _WIN32
  // Names are stored with POSIX rules; these bytes are separators or drive
  // prefixes here
  if (normalized->find_first_of("\\:") != std::string::npos) {
    setError(outError, ErrorKind::InvalidArgument,
             fmt::format("Cannot extract '{}' on this platform", archivePath));
    return std::nullopt;
  }
#endif

  fs::path relative(*normalized);
  fs::path target = root_;
  fs::path last;
  for (const auto &component : relative) {
    if (!last.empty()) {
      target /= last;
      std::error_code ec;
      if (fs::is_symlink(fs::symlink_status(target, ec))) {
        setError(outError, ErrorKind::InvalidArgument,
                 fmt::format("Refusing to extract '{}' through symlink {}", archivePath,
                             target.string()));
        return std::nullopt;
      }
    }
    last = component;
  }
  target /= last;
  return target;
}

bool FilesystemSink::createParents(const fs::path &target, Error *outError) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to create directory {}: {}",
                                target.parent_path().string(), ec.message()));
  }
  return true;
}

bool FilesystemSink::makeDirectory(const ManifestEntry &entry, Error *outError) {
  auto target = resolve(entry.path, outError);
  if (!target) {
    return false;
  }

  std::error_code ec;
  if (fs::is_symlink(fs::symlink_status(*target, ec))) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Refusing to replace symlink {} with a directory",
                                target->string()));
  }

  fs::create_directories(*target, ec);
  if (ec) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to create directory {}: {}", target->string(),
                                ec.message()));
  }

  directories_.push_back({*target, entry.mode, entry.mtime});
  return true;
}

bool FilesystemSink::makeSymlink(const ManifestEntry &entry, Error *outError) {
  auto target = resolve(entry.path, outError);
  if (!target || !createParents(*target, outError)) {
    return false;
  }

  std::error_code ec;
  if (fs::exists(fs::symlink_status(*target, ec))) {
    fs::remove(*target, ec);
    if (ec) {
      return setError(outError, ErrorKind::Io,
                      fmt::format("Failed to replace {}: {}", target->string(), ec.message()));
    }
  }

  fs::create_symlink(entry.linkTarget, *target, ec);
  if (ec) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to create symlink {}: {}", target->string(),
                                ec.message()));
  }
  return true;
}

bool FilesystemSink::beginFile(const ManifestEntry &entry, Error *outError) {
  if (fileOpen_) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("File {} is still open", filePath_.string()));
  }

  auto target = resolve(entry.path, outError);
  if (!target || !createParents(*target, outError)) {
    return false;
  }

  tempPath_ = target->parent_path() / fmt::format(".{}.ata-part", target->filename().string());
  file_.open(tempPath_, std::ios::binary | std::ios::trunc);
  if (!file_) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to create output file: {}", tempPath_.string()));
  }

  filePath_ = *target;
  fileMode_ = entry.mode;
  fileMtime_ = entry.mtime;
  fileOpen_ = true;
  return true;
}

bool FilesystemSink::writeFile(std::span<const uint8_t> data, Error *outError) {
  if (!fileOpen_) {
    return setError(outError, ErrorKind::InvalidArgument, "No file is open");
  }

  file_.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
  if (!file_) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to write to {}", tempPath_.string()));
  }
  return true;
}

bool FilesystemSink::commitFile(Error *outError) {
  if (!fileOpen_) {
    return setError(outError, ErrorKind::InvalidArgument, "No file is open");
  }

  file_.close();
  if (!file_) {
    discardFile();
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to close {}", tempPath_.string()));
  }

  std::error_code ec;
  fs::permissions(tempPath_, static_cast<fs::perms>(fileMode_) & fs::perms::mask, ec);
  if (ec) {
    logger()->warn("Cannot set permissions of {}: {}", filePath_.string(), ec.message());
  }

  fs::rename(tempPath_, filePath_, ec);
  if (ec) {
    discardFile();
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to move {} into place: {}", filePath_.string(),
                                ec.message()));
  }
  fileOpen_ = false;

  fs::last_write_time(filePath_, fromUnixSeconds(fileMtime_), ec);
  if (ec) {
    logger()->warn("Cannot set modification time of {}: {}", filePath_.string(), ec.message());
  }
  return true;
}

void FilesystemSink::discardFile() {
  if (!fileOpen_) {
    return;
  }

  file_.close();
  std::error_code ec;
  fs::remove(tempPath_, ec);
  if (ec) {
    logger()->warn("Cannot remove partial file {}: {}", tempPath_.string(), ec.message());
  }
  fileOpen_ = false;
}

bool FilesystemSink::finish(Error *outError) {
  bool ok = true;

  // Deepest directories first, so a parent's time is set after its children change
  for (auto it = directories_.rbegin(); it != directories_.rend(); ++it) {
    std::error_code ec;
    fs::last_write_time(it->path, fromUnixSeconds(it->mtime), ec);
    if (!ec) {
      fs::permissions(it->path, static_cast<fs::perms>(it->mode) & fs::perms::mask, ec);
    }
    if (ec && ok) {
      ok = setError(outError, ErrorKind::Io,
                    fmt::format("Failed to apply attributes to {}: {}", it->path.string(),
                                ec.message()));
    }
  }

  directories_.clear();
  return ok;
}

} // namespace ata
