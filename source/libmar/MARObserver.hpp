#pragma once

#include <core/common.h>
#include <libmar/MAR.hpp>

namespace libmar {

//! Structural events emitted by `LoadMarArchive`, in file order.
//!
//! Every callback has an empty default so implementations only override what
//! they care about. Callbacks run on the decoding thread and must not retain
//! references past the call.
class DecodeObserver {
public:
  virtual ~DecodeObserver() = default;

  virtual void onHeader(std::string_view mar_id, u32 offset_to_index) {}
  virtual void onSignaturesHeader(const SignaturesHeader& header) {}
  virtual void onSignature(u32 i, const Signature& sig) {}
  virtual void
  onAdditionalSectionsHeader(const AdditionalSectionsHeader& header) {}
  virtual void onAdditionalSection(u32 i, const AdditionalSection& section) {}
  //! The decoder is about to seek to the index.
  virtual void onIndexJump(u32 offset_to_index) {}
  virtual void onIndexHeader(const IndexHeader& header) {}
  virtual void onIndexEntry(u32 i, const IndexEntry& entry) {}
  //! Something suspicious that did not stop decoding.
  virtual void onWarning(u64 offset, std::string_view message) {}
};

//! Traces the archive structure through `rsl::logging`.
class LoggingObserver final : public DecodeObserver {
public:
  explicit LoggingObserver(rsl::logging::Level level = rsl::logging::Level::Debug)
      : mLevel(level) {}

  void onHeader(std::string_view mar_id, u32 offset_to_index) override;
  void onSignaturesHeader(const SignaturesHeader& header) override;
  void onSignature(u32 i, const Signature& sig) override;
  void
  onAdditionalSectionsHeader(const AdditionalSectionsHeader& header) override;
  void onAdditionalSection(u32 i, const AdditionalSection& section) override;
  void onIndexJump(u32 offset_to_index) override;
  void onIndexHeader(const IndexHeader& header) override;
  void onIndexEntry(u32 i, const IndexEntry& entry) override;
  void onWarning(u64 offset, std::string_view message) override;

private:
  rsl::logging::Level mLevel;
};

} // namespace libmar
