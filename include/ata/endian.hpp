#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace ata {

// All multi-byte integers in the container are little-endian. These helpers
// assemble them byte by byte, so they behave the same on any host.

// Write an unsigned integer to dst[0 .. sizeof(T)); the caller checks bounds
template <typename T> inline void store_le(uint8_t *dst, T value) noexcept {
  static_assert(std::is_unsigned_v<T>);
  for (size_t i = 0; i < sizeof(T); ++i) {
    dst[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

// Append an unsigned integer to a byte buffer
template <typename T> inline void put_le(std::vector<uint8_t> &out, T value) {
  size_t at = out.size();
  out.resize(at + sizeof(T));
  store_le(out.data() + at, value);
}

// Read an unsigned integer; the caller checks bounds
template <typename T> inline T get_le(const uint8_t *data) noexcept {
  static_assert(std::is_unsigned_v<T>);
  T value = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<T>(static_cast<T>(data[i]) << (8 * i));
  }
  return value;
}

} // namespace ata
