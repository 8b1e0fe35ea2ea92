#pragma once

#include <core/common.h>

namespace libmar {

//! Why an archive was rejected.
enum class MarErrorKind {
  //! Input smaller than the sum of the fixed headers.
  TooShort,
  //! A signature header or payload runs past the end of the input.
  TruncatedSignature,
  //! An additional section declares fewer than 8 bytes.
  InvalidBlockSize,
  //! The offset to the index points past the end of the input.
  IndexOutOfBounds,
  //! An index entry name has no zero terminator before the end of the input.
  MissingNameTerminator,
  //! Two index entries share a file name.
  DuplicateName,
  //! Any other read or write outside of its buffer.
  BoundsViolation,
  //! The serialized index disagrees with the stored index size.
  IndexSizeMismatch,
  //! An archive value that contradicts itself: a MAR id that is not 4 bytes,
  //! a header count that differs from its list, or an index entry with no
  //! content or content of the wrong length.
  ContentMismatch,
};

std::string_view MarErrorKindName(MarErrorKind kind);

struct MarError {
  MarErrorKind kind = MarErrorKind::BoundsViolation;
  //! Byte position in the archive (or in the signable output) if known.
  std::optional<u64> offset;
  std::string message;

  //! "DuplicateName at 0x2c (44): File named ..."
  std::string format() const;

  bool operator==(const MarError&) const = default;
};

template <typename T> using MarResult = Result<T, MarError>;

inline MarError MakeMarError(MarErrorKind kind, std::optional<u64> offset,
                             std::string message) {
  return MarError{
      .kind = kind, .offset = offset, .message = std::move(message)};
}

} // namespace libmar
