#include "binary_reader.hxx"

#include <fmt/format.h>

namespace oishii {

BinaryReader::BinaryReader(std::span<const u8> view, std::string_view path,
                           std::endian endian)
    : mBuf(view), mFileEndian(endian), m_path(path) {}

std::string BinaryReader::boundsError(u64 size, u64 addr) const {
  return fmt::format(
      "Bounds error: Reading {} bytes from 0x{:x} ({} decimal) exceeds "
      "buffer size of {} ({})",
      size, addr, addr, endpos(), getFile());
}

auto BinaryReader::tryGetSpan(u64 size, u64 addr) const
    -> Result<std::span<const u8>> {
  if (!isInBounds(addr, size)) {
    return RSL_UNEXPECTED(boundsError(size, addr));
  }
  return mBuf.subspan(addr, size);
}

auto BinaryReader::tryReadSpan(u64 size) -> Result<std::span<const u8>> {
  auto span = tryGetSpan(size, tell());
  if (span.has_value()) {
    skip(size);
  }
  return span;
}

} // namespace oishii
