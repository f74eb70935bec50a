#include <cstring>

#include <fmt/format.h>

#include <ata/endian.hpp>
#include <ata/log.hpp>
#include <ata/manifest.hpp>
#include <ata/options.hpp>
#include <ata/reader.hpp>

namespace ata {

std::optional<ArchiveHeader> decodeHeader(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < ArchiveHeader::headerSize) {
    setError(outError, ErrorKind::Format,
             fmt::format("File too small to be an archive (size: {})", data.size()));
    return std::nullopt;
  }

  if (std::memcmp(data.data(), kHeaderMagic, 4) != 0) {
    setError(outError, ErrorKind::Format, "Invalid archive magic (expected 'ATAC')");
    return std::nullopt;
  }

  ArchiveHeader header;
  header.version = data[4];
  header.flags = data[5];
  uint8_t compression = data[6];
  uint8_t encryption = data[7];
  std::memcpy(header.salt.data(), data.data() + 8, header.salt.size());
  header.kdfIterations = get_le<uint32_t>(data.data() + 24);
  uint32_t reserved = get_le<uint32_t>(data.data() + 28);

  if (header.version != kFormatVersion) {
    setError(outError, ErrorKind::Format,
             fmt::format("Unsupported format version {}", header.version));
    return std::nullopt;
  }
  if (header.flags & ~(ArchiveHeader::flagEncrypted | ArchiveHeader::flagKeyedChecksums)) {
    setError(outError, ErrorKind::Format,
             fmt::format("Unknown header flags 0x{:02x}", header.flags));
    return std::nullopt;
  }
  if (compression > static_cast<uint8_t>(CompressionId::Zstd)) {
    setError(outError, ErrorKind::Format, fmt::format("Unknown compression id {}", compression));
    return std::nullopt;
  }
  if (encryption > static_cast<uint8_t>(EncryptionId::Aes256Gcm)) {
    setError(outError, ErrorKind::Format, fmt::format("Unknown encryption id {}", encryption));
    return std::nullopt;
  }
  if (reserved != 0) {
    setError(outError, ErrorKind::Format, "Reserved header bytes are not zero");
    return std::nullopt;
  }

  header.compression = static_cast<CompressionId>(compression);
  header.encryption = static_cast<EncryptionId>(encryption);

  if (header.encrypted() != (header.encryption != EncryptionId::None) ||
      header.keyedChecksums() != header.encrypted()) {
    setError(outError, ErrorKind::Format, "Header flags do not match the encryption id");
    return std::nullopt;
  }

  if (header.encrypted() && header.kdfIterations < kMinKdfIterations) {
    setError(outError, ErrorKind::WeakParameter,
             fmt::format("Archive uses {} KDF iterations, minimum is {}", header.kdfIterations,
                         kMinKdfIterations));
    return std::nullopt;
  }

  return header;
}

std::optional<ArchiveTrailer> decodeTrailer(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < ArchiveTrailer::trailerSize ||
      std::memcmp(data.data() + data.size() - 4, kTrailerMagic, 4) != 0) {
    setError(outError, ErrorKind::IncompleteArchive, "Archive trailer is missing");
    return std::nullopt;
  }

  const uint8_t *p = data.data() + data.size() - ArchiveTrailer::trailerSize;

  ArchiveTrailer trailer;
  trailer.manifestOffset = get_le<uint64_t>(p);
  trailer.manifestLength = get_le<uint64_t>(p + 8);
  uint8_t flag = p[16];

  if (flag > 1) {
    setError(outError, ErrorKind::Format, fmt::format("Invalid completion flag {}", flag));
    return std::nullopt;
  }
  trailer.complete = flag == 1;

  return trailer;
}

std::optional<Reader> Reader::open(const std::filesystem::path &path, bool allowIncomplete,
                                   Error *outError) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    setError(outError, ErrorKind::Io,
             fmt::format("Cannot read archive {}: {}", path.string(), ec.message()));
    return std::nullopt;
  }
  if (size < ArchiveHeader::headerSize) {
    setError(outError, ErrorKind::Format,
             fmt::format("File too small to be an archive (size: {})", size));
    return std::nullopt;
  }

  Reader reader;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.parse(allowIncomplete, outError)) {
    reader.close();
    return std::nullopt;
  }

  logger()->debug("Opened {} ({} entries, {})", path.string(), reader.entries_.size(),
                  reader.complete_ ? "complete" : "incomplete");
  return reader;
}

bool Reader::parse(bool allowIncomplete, Error *outError) {
  auto fileData = mappedFile_.data();

  auto header = decodeHeader(fileData, outError);
  if (!header) {
    return false;
  }
  header_ = *header;

  auto body = fileData.subspan(ArchiveHeader::headerSize);

  Error trailerError;
  auto trailer = decodeTrailer(body, &trailerError);
  if (!trailer) {
    if (trailerError.kind == ErrorKind::IncompleteArchive && allowIncomplete) {
      // Nothing recoverable without a manifest
      logger()->warn("Archive has no trailer, no entries can be recovered");
      dataEnd_ = fileData.size();
      complete_ = false;
      return true;
    }
    if (outError) {
      *outError = std::move(trailerError);
    }
    return false;
  }

  uint64_t trailerOffset = fileData.size() - ArchiveTrailer::trailerSize;
  if (trailer->manifestOffset < ArchiveHeader::headerSize ||
      trailer->manifestOffset > trailerOffset ||
      trailer->manifestLength != trailerOffset - trailer->manifestOffset) {
    return setError(outError, ErrorKind::Format,
                    fmt::format("Trailer points outside the archive (offset={}, length={})",
                                trailer->manifestOffset, trailer->manifestLength));
  }

  if (!trailer->complete && !allowIncomplete) {
    return setError(outError, ErrorKind::IncompleteArchive,
                    "Archive was not finished; open it in recovery mode to read what was written");
  }

  auto manifest = mappedFile_.view(trailer->manifestOffset, trailer->manifestLength);
  auto entries =
      ManifestReader::parse(manifest, ArchiveHeader::headerSize, trailer->manifestOffset, outError);
  if (!entries) {
    return false;
  }

  entries_ = std::move(*entries);
  lookup_.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    lookup_.emplace(entries_[i].path, i);
  }

  dataEnd_ = trailer->manifestOffset;
  complete_ = trailer->complete;
  return true;
}

const ManifestEntry *Reader::findEntry(const std::string &path) const {
  auto it = lookup_.find(path);
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

std::span<const uint8_t> Reader::chunkView(const ChunkDescriptor &chunk) const {
  if (chunk.offset < ArchiveHeader::headerSize || chunk.offset > dataEnd_ ||
      chunk.storedLength > dataEnd_ - chunk.offset) {
    return {};
  }
  return mappedFile_.view(chunk.offset, chunk.storedLength);
}

void Reader::close() {
  mappedFile_.close();
  entries_.clear();
  lookup_.clear();
  dataEnd_ = 0;
  complete_ = false;
}

} // namespace ata
