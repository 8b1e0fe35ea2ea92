#include "MARObserver.hpp"

#include <libmar/MARDump.hpp>

namespace libmar {

void LoggingObserver::onHeader(std::string_view mar_id, u32 offset_to_index) {
  rsl::log(mLevel, "Header: id \"{}\", index at {}", mar_id, offset_to_index);
}

void LoggingObserver::onSignaturesHeader(const SignaturesHeader& header) {
  rsl::log(mLevel, "Signatures header: file size {}, {} signature(s)",
           header.file_size, header.num_signatures);
}

void LoggingObserver::onSignature(u32 i, const Signature& sig) {
  rsl::log(mLevel, "* Signature {}: {} (id {}), {} bytes: {}", i,
           sig.algorithm, sig.algorithm_id, sig.size, HexPreview(sig.data));
}

void LoggingObserver::onAdditionalSectionsHeader(
    const AdditionalSectionsHeader& header) {
  rsl::log(mLevel, "Additional sections: {}",
           header.num_additional_sections);
}

void LoggingObserver::onAdditionalSection(u32 i,
                                          const AdditionalSection& section) {
  rsl::log(mLevel, "* Additional section {}: block {}, {} bytes", i,
           BlockIdName(section.block_id), section.block_size);
}

void LoggingObserver::onIndexJump(u32 offset_to_index) {
  rsl::log(mLevel, "Seeking to index at {}", offset_to_index);
}

void LoggingObserver::onIndexHeader(const IndexHeader& header) {
  rsl::log(mLevel, "Index size: {}", header.size);
}

void LoggingObserver::onIndexEntry(u32 i, const IndexEntry& entry) {
  rsl::log(mLevel, "* Index entry {:3}: size {:10} flags {} offset {:10} \"{}\"",
           i, entry.size, FormatPermissions(entry.flags),
           entry.offset_to_content, entry.file_name);
}

void LoggingObserver::onWarning(u64 offset, std::string_view message) {
  rsl::warn("0x{:x}: {}", offset, message);
}

} // namespace libmar
