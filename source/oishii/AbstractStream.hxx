#pragma once

#include "interfaces.hxx"

namespace oishii {

//! Cursor over a byte buffer. Positions are absolute file offsets.
class AbstractStream {
public:
  virtual ~AbstractStream() = default;

  template <Whence W = Whence::Set> void seek(s64 ofs) {
    static_assert(W == Whence::Set || W == Whence::Current, "Invalid whence.");
    switch (W) {
    case Whence::Set:
      seekSet(static_cast<u64>(ofs));
      break;
    case Whence::Current:
      if (ofs != 0) {
        seekSet(tell() + ofs);
      }
      break;
    }
  }

  void skip(s64 ofs) { seek<Whence::Current>(ofs); }

  virtual void seekSet(u64 pos) = 0;
  virtual u64 tell() const = 0;
  virtual u64 endpos() const = 0;
};

} // namespace oishii
