#pragma once

#include "../AbstractStream.hxx"
#include "../Endian.hxx"

#include <cstring>
#include <rsl/Expected.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace oishii {

//! Bounds-checked reader over a borrowed byte buffer.
//!
//! The reader never owns the bytes it walks: the caller keeps the buffer alive
//! (and unmodified) for the reader's lifetime. Every read either succeeds in
//! full or fails without moving the cursor.
class BinaryReader final : public AbstractStream {
public:
  //! Failure type is always `std::string`
  template <typename T> using Result = std::expected<T, std::string>;

  BinaryReader(std::span<const u8> view, std::string_view path,
               std::endian endian);

  // Path of the file or "Unknown path"
  const char* getFile() const noexcept { return m_path.c_str(); }

  //! Get a read-only view of the file
  std::span<const u8> slice() const { return mBuf; }

  void seekSet(u64 pos) override { mPos = pos; }
  u64 tell() const override { return mPos; }
  u64 endpos() const override { return mBuf.size(); }

  //! True if |size| bytes starting at |addr| lie inside the buffer.
  bool isInBounds(u64 addr, u64 size) const {
    return addr <= endpos() && size <= endpos() - addr;
  }

  //! Get a value from an arbitrary point in the file
  template <typename T, EndianSelect E = EndianSelect::Current>
  auto tryGetAt(u64 addr) -> Result<T> {
    if (!isInBounds(addr, sizeof(T))) {
      return RSL_UNEXPECTED(boundsError(sizeof(T), addr));
    }

    T raw;
    std::memcpy(&raw, mBuf.data() + addr, sizeof(T));
    return endianDecode<T, E>(raw, mFileEndian);
  }

  //! Pop a value from the stream (of type |T|)
  template <typename T, EndianSelect E = EndianSelect::Current>
  auto tryRead() -> Result<T> {
    auto result = tryGetAt<T, E>(tell());
    // Only advance stream on success
    if (result.has_value()) {
      skip(sizeof(T));
    }
    return result;
  }

  //! View |size| bytes at |addr| without copying.
  auto tryGetSpan(u64 size, u64 addr) const -> Result<std::span<const u8>>;
  //! View |size| bytes at the cursor and advance past them.
  auto tryReadSpan(u64 size) -> Result<std::span<const u8>>;

  template <typename T>
  auto tryReadBuffer(u64 size, u64 addr) const -> Result<std::vector<T>> {
    static_assert(sizeof(T) == 1);
    auto span = tryGetSpan(size, addr);
    if (!span) {
      return RSL_UNEXPECTED(span.error());
    }
    return std::vector<T>(span->begin(), span->end());
  }
  template <typename T> auto tryReadBuffer(u64 size) -> Result<std::vector<T>> {
    auto buf = tryReadBuffer<T>(size, tell());
    if (!buf) {
      return RSL_UNEXPECTED(buf.error());
    }
    skip(size);
    return buf;
  }

private:
  std::string boundsError(u64 size, u64 addr) const;

  std::span<const u8> mBuf;
  u64 mPos = 0;
  std::endian mFileEndian = std::endian::big;
  std::string m_path = "Unknown Path";
};

} // namespace oishii
