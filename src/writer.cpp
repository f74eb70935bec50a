#include <fmt/format.h>

#include <ata/endian.hpp>
#include <ata/log.hpp>
#include <ata/writer.hpp>

namespace ata {

std::vector<uint8_t> encodeHeader(const ArchiveHeader &header) {
  std::vector<uint8_t> out;
  out.reserve(ArchiveHeader::headerSize);

  out.insert(out.end(), kHeaderMagic, kHeaderMagic + 4);
  out.push_back(header.version);
  out.push_back(header.flags);
  out.push_back(static_cast<uint8_t>(header.compression));
  out.push_back(static_cast<uint8_t>(header.encryption));
  out.insert(out.end(), header.salt.begin(), header.salt.end());

  // Reserved field: KDF iterations, then zero
  put_le<uint32_t>(out, header.kdfIterations);
  put_le<uint32_t>(out, 0);

  return out;
}

std::vector<uint8_t> encodeTrailer(const ArchiveTrailer &trailer) {
  std::vector<uint8_t> out;
  out.reserve(ArchiveTrailer::trailerSize);

  put_le<uint64_t>(out, trailer.manifestOffset);
  put_le<uint64_t>(out, trailer.manifestLength);
  out.push_back(trailer.complete ? 1 : 0);
  out.insert(out.end(), kTrailerMagic, kTrailerMagic + 4);

  return out;
}

bool Writer::open(const std::filesystem::path &path, const ArchiveHeader &header,
                  Error *outError) {
  if (open_) {
    return setError(outError, ErrorKind::InvalidArgument,
                    fmt::format("Writer already open on {}", path_.string()));
  }

  stream_.open(path, std::ios::binary | std::ios::trunc);
  if (!stream_) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to create archive: {}", path.string()));
  }

  path_ = path;
  header_ = header;
  position_ = 0;
  open_ = true;

  auto bytes = encodeHeader(header);
  if (!writeBytes(bytes, outError)) {
    stream_.close();
    open_ = false;
    return false;
  }

  logger()->debug("Opened {} for writing (compression={}, encryption={})", path.string(),
                  static_cast<int>(header.compression), static_cast<int>(header.encryption));
  return true;
}

std::optional<uint64_t> Writer::appendChunk(std::span<const uint8_t> stored, Error *outError) {
  if (!open_) {
    setError(outError, ErrorKind::InvalidArgument, "Writer is not open");
    return std::nullopt;
  }

  uint64_t offset = position_;
  if (!writeBytes(stored, outError)) {
    return std::nullopt;
  }
  return offset;
}

bool Writer::finish(std::span<const uint8_t> manifest, Error *outError) {
  return writeTail(manifest, true, outError);
}

bool Writer::abort(std::span<const uint8_t> partialManifest, Error *outError) {
  return writeTail(partialManifest, false, outError);
}

bool Writer::writeBytes(std::span<const uint8_t> bytes, Error *outError) {
  stream_.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
  if (!stream_) {
    return setError(outError, ErrorKind::Io,
                    fmt::format("Failed to write {} bytes at offset {} of {}", bytes.size(),
                                position_, path_.string()));
  }
  position_ += bytes.size();
  return true;
}

bool Writer::writeTail(std::span<const uint8_t> manifest, bool complete, Error *outError) {
  if (!open_) {
    return setError(outError, ErrorKind::InvalidArgument, "Writer is not open");
  }

  ArchiveTrailer trailer;
  trailer.manifestOffset = position_;
  trailer.manifestLength = manifest.size();
  trailer.complete = complete;

  auto trailerBytes = encodeTrailer(trailer);
  bool ok = writeBytes(manifest, outError) && writeBytes(trailerBytes, outError);

  if (ok) {
    stream_.flush();
    if (!stream_) {
      ok = setError(outError, ErrorKind::Io,
                    fmt::format("Failed to flush archive: {}", path_.string()));
    }
  }

  // close() flushes whatever the filebuf still holds and sets failbit if that fails
  stream_.close();
  open_ = false;
  if (ok && !stream_) {
    ok = setError(outError, ErrorKind::Io,
                  fmt::format("Failed to close archive: {}", path_.string()));
  }

  if (ok) {
    logger()->debug("Closed {} ({} bytes, manifest {} bytes, {})", path_.string(), position_,
                    manifest.size(), complete ? "complete" : "incomplete");
  }
  return ok;
}

} // namespace ata
