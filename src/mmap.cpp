#include <utility>

#include <fmt/format.h>

#include <ata/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace ata {

namespace {

bool mapFailure(Error *outError, const std::filesystem::path &path, const char *what) {
#ifdef _WIN32
  return setError(outError, ErrorKind::Io,
                  fmt::format("{} {} (error {})", what, path.string(), GetLastError()));
#else
  return setError(outError, ErrorKind::Io,
                  fmt::format("{} {} ({})", what, path.string(), std::strerror(errno)));
#endif
}

} // namespace

MappedFile::MappedFile(MappedFile &&other) noexcept {
  release(other);
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
    release(other);
  }
  return *this;
}

// Take over other's mapping; this must be closed
void MappedFile::release(MappedFile &other) noexcept {
#ifdef _WIN32
  fileHandle_ = std::exchange(other.fileHandle_, nullptr);
  mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
  fd_ = std::exchange(other.fd_, -1);
#endif
  bytes_ = std::exchange(other.bytes_, nullptr);
  size_ = std::exchange(other.size_, 0);
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    return mapFailure(outError, path, "Failed to open archive");
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(file, &fileSize)) {
    mapFailure(outError, path, "Failed to get size of");
    close();
    return false;
  }
  if (fileSize.QuadPart == 0) {
    close();
    return setError(outError, ErrorKind::Io, fmt::format("Archive is empty: {}", path.string()));
  }

  mappingHandle_ = CreateFileMappingW(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
  void *view = mappingHandle_
                   ? MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0)
                   : nullptr;
  if (!view) {
    mapFailure(outError, path, "Failed to map");
    close();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    return mapFailure(outError, path, "Failed to open archive");
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    mapFailure(outError, path, "Failed to get size of");
    close();
    return false;
  }
  if (st.st_size == 0) {
    close();
    return setError(outError, ErrorKind::Io, fmt::format("Archive is empty: {}", path.string()));
  }

  void *view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd_, 0);
  if (view == MAP_FAILED) {
    mapFailure(outError, path, "Failed to map");
    close();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  bytes_ = static_cast<const uint8_t *>(view);
  return true;
}

std::span<const uint8_t> MappedFile::view(uint64_t offset, uint64_t length) const {
  if (offset > size_ || length > size_ - offset) {
    return {};
  }
  return data().subspan(static_cast<size_t>(offset), static_cast<size_t>(length));
}

void MappedFile::close() noexcept {
#ifdef _WIN32
  if (bytes_) {
    UnmapViewOfFile(bytes_);
  }
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (bytes_) {
    munmap(const_cast<uint8_t *>(bytes_), size_);
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
  bytes_ = nullptr;
  size_ = 0;
}

} // namespace ata
