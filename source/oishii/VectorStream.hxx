#pragma once

#include "AbstractStream.hxx"
#include <vector>

namespace oishii {

//! Stream that owns its (growable) backing buffer.
class VectorStream : public AbstractStream {
public:
  VectorStream() = default;
  VectorStream(std::vector<u8> buf) : mBuf(std::move(buf)) {}

  void seekSet(u64 pos) override { mPos = pos; }
  u64 tell() const override { return mPos; }
  u64 endpos() const override { return mBuf.size(); }

  std::span<const u8> slice() const { return mBuf; }
  std::vector<u8>&& takeBuf() { return std::move(mBuf); }

protected:
  std::vector<u8> mBuf;
  u64 mPos = 0;
};

} // namespace oishii
