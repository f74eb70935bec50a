#pragma once

#include <string>
#include <utility>

namespace ata {

// Failure taxonomy shared by every layer of the library
enum class ErrorKind {
  None,
  Format,            // Bad magic, version or malformed structure; archive unreadable
  Authentication,    // Tag or keyed checksum did not verify
  CorruptData,       // Codec rejected the data or a length/checksum mismatch
  WeakParameter,     // KDF iterations, salt or key length below policy
  IncompleteArchive, // Trailer missing or completion flag unset
  Io,                // Filesystem or stream failure
  Cancelled,         // Work dropped after a cancellation request
  InvalidArgument,   // Bad options or unsafe entry paths
  Internal,          // Unexpected failure inside a primitive (allocation, OpenSSL)
};

// Name of the error kind as used in reports ("AuthenticationError", ...)
const char *errorKindName(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool isSet() const { return kind != ErrorKind::None; }

  // "<KindName>: <message>"
  std::string describe() const;
};

// Fill outError if provided. Always returns false so callers can write
// `return setError(outError, ...);`
inline bool setError(Error *outError, ErrorKind kind, std::string message) {
  if (outError) {
    outError->kind = kind;
    outError->message = std::move(message);
  }
  return false;
}

} // namespace ata
