#include "MARDump.hpp"

#include <algorithm>
#include <iterator>

namespace libmar {

std::string FormatPermissions(u32 flags) {
  static constexpr std::string_view rwx = "rwxrwxrwx";
  std::string out = "-";
  for (u32 i = 0; i < rwx.size(); ++i) {
    const u32 bit = 1u << (8 - i);
    out += (flags & bit) ? rwx[i] : '-';
  }
  return out;
}

std::string BlockIdName(u32 block_id) {
  switch (block_id) {
  case BLOCK_ID_PRODUCT_INFO:
    return "Product Information";
  default:
    return fmt::format("{} (unknown)", block_id);
  }
}

std::string HexPreview(rsl::byte_view data, size_t max_bytes) {
  std::string out;
  const auto shown = std::min(data.size(), max_bytes);
  out.reserve(shown * 2 + 3);
  for (size_t i = 0; i < shown; ++i) {
    fmt::format_to(std::back_inserter(out), "{:02X}", data[i]);
  }
  if (shown < data.size()) {
    out += "...";
  }
  return out;
}

std::string ListIndex(const Archive& arc) {
  std::string out;
  auto it = std::back_inserter(out);
  for (const auto& entry : arc.index) {
    const auto* content = arc.find(entry.file_name);
    const bool xz = content != nullptr && content->is_compressed;
    fmt::format_to(it, "{} {:10} {}{}\n", FormatPermissions(entry.flags),
                   entry.size, entry.file_name, xz ? " [xz]" : "");
  }
  return out;
}

std::string DescribeArchive(const Archive& arc) {
  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "MAR id \"{}\", index at {}\n", arc.mar_id,
                 arc.offset_to_index);
  if (!arc.product_information.empty()) {
    fmt::format_to(it, "Product information: \"{}\"\n",
                   arc.product_information);
  }

  fmt::format_to(it, "\nSignatures: file size {}, {} signature(s)\n",
                 arc.signatures_header.file_size,
                 arc.signatures_header.num_signatures);
  u32 i = 0;
  for (const auto& sig : arc.signatures) {
    fmt::format_to(it, "  * {}: {} (id {}), {} bytes: {}\n", i++,
                   sig.algorithm, sig.algorithm_id, sig.size,
                   HexPreview(sig.data));
  }

  fmt::format_to(it, "\nAdditional sections: {}\n",
                 arc.additional_sections_header.num_additional_sections);
  i = 0;
  for (const auto& section : arc.additional_sections) {
    fmt::format_to(it, "  * {}: block {}, {} bytes\n", i++,
                   BlockIdName(section.block_id), section.block_size);
  }

  fmt::format_to(it, "\nIndex: {} bytes, {} entries\n", arc.index_header.size,
                 arc.index.size());
  i = 0;
  for (const auto& entry : arc.index) {
    const auto* content = arc.find(entry.file_name);
    const bool xz = content != nullptr && content->is_compressed;
    fmt::format_to(it, "  * {:3}: {} {:10} @ {:10} \"{}\"{}\n", i++,
                   FormatPermissions(entry.flags), entry.size,
                   entry.offset_to_content, entry.file_name,
                   xz ? " [xz]" : "");
  }
  return out;
}

} // namespace libmar
