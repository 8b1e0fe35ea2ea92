#include "SafeReader.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <rsl/Try.hpp>

namespace rsl {

auto SafeReader::slice(u64 ofs) -> std::span<const u8> {
  auto data = mReader.slice();
  if (ofs >= data.size()) {
    return {};
  }
  return data.subspan(ofs);
}
void SafeReader::seekSet(u64 pos) { mReader.seekSet(pos); }
auto SafeReader::tell() const -> u64 { return mReader.tell(); }
auto SafeReader::endpos() const -> u64 { return mReader.endpos(); }
auto SafeReader::remaining() const -> u64 {
  return tell() >= endpos() ? 0 : endpos() - tell();
}

auto SafeReader::U64() -> Result<u64> { return mReader.tryRead<u64>(); }
auto SafeReader::U32() -> Result<u32> { return mReader.tryRead<u32>(); }
auto SafeReader::U16() -> Result<u16> { return mReader.tryRead<u16>(); }
auto SafeReader::U8() -> Result<u8> { return mReader.tryRead<u8>(); }

auto SafeReader::Bytes(u64 size) -> Result<std::vector<u8>> {
  return mReader.tryReadBuffer<u8>(size);
}
auto SafeReader::Span(u64 size) -> Result<std::span<const u8>> {
  return mReader.tryReadSpan(size);
}
auto SafeReader::String(u64 size) -> Result<std::string> {
  auto buf = TRY(mReader.tryReadSpan(size));
  return std::string(buf.begin(), buf.end());
}

auto SafeReader::Magic(std::string_view ident) -> Result<std::string_view> {
  const auto start = tell();
  auto buf = TRY(mReader.tryReadSpan(ident.size()));
  if (!std::ranges::equal(buf, ident, [](u8 a, char b) {
        return a == static_cast<u8>(b);
      })) {
    seekSet(start);
    return RSL_UNEXPECTED(
        fmt::format("Expected magic identifier {} at 0x{:x}. Instead saw {}.",
                    ident, start, std::string(buf.begin(), buf.end())));
  }
  return ident;
}

auto SafeReader::CString() -> Result<std::string> {
  const auto tail = slice(tell());
  const auto terminator = std::ranges::find(tail, u8{0});

  // very unlikely
  [[unlikely]] if (terminator == tail.end()) {
    return RSL_UNEXPECTED(fmt::format(
        "File has been truncated. String at 0x{:x} does not contain a final "
        "null terminator",
        tell()));
  }

  std::string result(tail.begin(), terminator);
  seekSet(tell() + result.size() + 1);
  return result;
}

} // namespace rsl
