#include <ata/error.hpp>
#include <ata/types.hpp>

namespace ata {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "NoError";
  case ErrorKind::Format:
    return "FormatError";
  case ErrorKind::Authentication:
    return "AuthenticationError";
  case ErrorKind::CorruptData:
    return "CorruptDataError";
  case ErrorKind::WeakParameter:
    return "WeakParameterError";
  case ErrorKind::IncompleteArchive:
    return "IncompleteArchiveError";
  case ErrorKind::Io:
    return "IoError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::Internal:
    return "InternalError";
  }
  return "UnknownError";
}

std::string Error::describe() const {
  std::string result = errorKindName(kind);
  if (!message.empty()) {
    result += ": ";
    result += message;
  }
  return result;
}

const char *entryKindName(EntryKind kind) {
  switch (kind) {
  case EntryKind::File:
    return "file";
  case EntryKind::Directory:
    return "directory";
  case EntryKind::Symlink:
    return "symlink";
  }
  return "unknown";
}

uint64_t ManifestEntry::storedSize() const {
  uint64_t total = 0;
  for (const auto &chunk : chunks) {
    total += chunk.storedLength;
  }
  return total;
}

} // namespace ata
