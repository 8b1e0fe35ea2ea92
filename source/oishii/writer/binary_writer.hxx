#pragma once

#include <bit>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

#include "../Endian.hxx"
#include "../VectorStream.hxx"

namespace oishii {

//! Writer with expanding buffer.
//!
//! Writing past the end grows the buffer, zero-filling any gap.
class Writer final : public VectorStream {
public:
  Writer(std::endian endian);
  Writer(std::vector<u8>&& buf, std::endian endian);

  template <typename T, EndianSelect E = EndianSelect::Current>
  void write(T val) {
    reserveFor(sizeof(T));
    const T decoded = endianDecode<T, E>(val, m_endian);
    std::memcpy(&mBuf[tell()], &decoded, sizeof(T));
    skip(sizeof(T));
  }

  //! Copy raw bytes, no endian conversion.
  void writeBytes(std::span<const u8> bytes) {
    if (bytes.empty())
      return;
    reserveFor(bytes.size());
    std::memcpy(&mBuf[tell()], bytes.data(), bytes.size());
    skip(bytes.size());
  }
  void writeBytes(std::string_view chars) {
    writeBytes(std::span<const u8>(
        reinterpret_cast<const u8*>(chars.data()), chars.size()));
  }

  template <typename T> void writeAt(T val, u64 pos) {
    const auto back = tell();
    seekSet(pos);
    write<T>(val);
    seekSet(back);
  }

private:
  void reserveFor(u64 size) {
    if (tell() + size > mBuf.size())
      mBuf.resize(tell() + size);
  }

  std::endian m_endian = std::endian::big; // to swap
};

} // namespace oishii
