#pragma once

#include <bit>
#include <concepts>
#include <rsl/Types.hpp>

static_assert(__cpp_lib_byteswap >= 202110L, "Depends on std::byteswap");

namespace oishii {

//! @brief Reverse the byte order of an integer.
template <std::integral T> inline T swapEndian(T v) {
  if constexpr (sizeof(T) == 1) {
    return v;
  } else {
    return std::byteswap(v);
  }
}

enum class EndianSelect {
  Current, // Use the stream's endian
  // Explicitly use endian
  Big,
  Little
};

//! Convert between file order and host order. The operation is its own
//! inverse, so writers use it too.
template <std::integral T, EndianSelect E = EndianSelect::Current>
inline T endianDecode(T val, std::endian fileEndian) {
  if constexpr (E == EndianSelect::Big) {
    return std::endian::native != std::endian::big ? swapEndian<T>(val) : val;
  } else if constexpr (E == EndianSelect::Little) {
    return std::endian::native != std::endian::little ? swapEndian<T>(val)
                                                      : val;
  } else {
    return std::endian::native != fileEndian ? swapEndian<T>(val) : val;
  }
}

} // namespace oishii
