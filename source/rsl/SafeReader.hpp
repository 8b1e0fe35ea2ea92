#pragma once

#include <oishii/reader/binary_reader.hxx>
#include <rsl/Result.hpp>
#include <rsl/Types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace rsl {

//! Bounded reads on top of an `oishii::BinaryReader`.
//!
//! Nothing here ever reads past the end of the buffer: every accessor either
//! returns the full value and advances, or returns a message and leaves the
//! cursor where it was.
class SafeReader {
public:
  template <typename T> using Result = std::expected<T, std::string>;

  SafeReader(oishii::BinaryReader& reader) : mReader(reader) {}

  // Slicing shouldn't fail, python approach. Just returns a null span.
  auto slice(u64 ofs = 0) -> std::span<const u8>;

  // Doesn't ever fail
  void seekSet(u64 pos);
  auto tell() const -> u64;
  auto endpos() const -> u64;
  auto remaining() const -> u64;

  auto U64() -> Result<u64>;
  auto U32() -> Result<u32>;
  auto U16() -> Result<u16>;
  auto U8() -> Result<u8>;

  //! Copy |size| bytes.
  auto Bytes(u64 size) -> Result<std::vector<u8>>;
  //! Borrow |size| bytes.
  auto Span(u64 size) -> Result<std::span<const u8>>;
  //! |size| bytes reinterpreted as text. Embedded nulls are kept.
  auto String(u64 size) -> Result<std::string>;

  auto Magic(std::string_view ident) -> Result<std::string_view>;

  //! Text up to the next zero byte; the cursor ends past the terminator.
  auto CString() -> Result<std::string>;

private:
  oishii::BinaryReader& mReader;
};

} // namespace rsl
