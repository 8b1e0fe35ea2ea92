#include "MARJson.hpp"

namespace libmar {

std::string EncodeBase64(rsl::byte_view data) {
  static constexpr std::string_view alphabet =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    const u32 v = (u32(data[i]) << 16) | (u32(data[i + 1]) << 8) | data[i + 2];
    out += alphabet[(v >> 18) & 0x3F];
    out += alphabet[(v >> 12) & 0x3F];
    out += alphabet[(v >> 6) & 0x3F];
    out += alphabet[v & 0x3F];
  }
  const size_t rest = data.size() - i;
  if (rest == 1) {
    const u32 v = u32(data[i]) << 16;
    out += alphabet[(v >> 18) & 0x3F];
    out += alphabet[(v >> 12) & 0x3F];
    out += "==";
  } else if (rest == 2) {
    const u32 v = (u32(data[i]) << 16) | (u32(data[i + 1]) << 8);
    out += alphabet[(v >> 18) & 0x3F];
    out += alphabet[(v >> 12) & 0x3F];
    out += alphabet[(v >> 6) & 0x3F];
    out += '=';
  }
  return out;
}

JSONArchive JSONArchive::from(const Archive& arc) {
  JSONArchive result;
  result.mar_id = arc.mar_id;
  result.offset_to_index = arc.offset_to_index;
  result.product_information = arc.product_information;
  result.signatures_header = {
      .file_size = arc.signatures_header.file_size,
      .num_signatures = arc.signatures_header.num_signatures,
  };
  for (const auto& sig : arc.signatures) {
    result.signatures.push_back({
        .algorithm_id = sig.algorithm_id,
        .size = sig.size,
        .algorithm = sig.algorithm,
        .data = EncodeBase64(sig.data),
    });
  }
  result.additional_sections_header.num_additional_sections =
      arc.additional_sections_header.num_additional_sections;
  for (const auto& section : arc.additional_sections) {
    result.additional_sections.push_back({
        .block_size = section.block_size,
        .block_id = section.block_id,
        .data = EncodeBase64(section.data),
    });
  }
  result.index_header.size = arc.index_header.size;
  for (const auto& entry : arc.index) {
    result.index.push_back({
        .offset_to_content = entry.offset_to_content,
        .size = entry.size,
        .flags = entry.flags,
        .file_name = entry.file_name,
    });
  }
  for (const auto& [name, entry] : arc.content) {
    result.content.emplace(name, JSONEntry{
                                     .data = EncodeBase64(entry.data),
                                     .is_compressed = entry.is_compressed,
                                 });
  }
  return result;
}

std::string SerializeArchive(const Archive& arc, bool pretty) {
  const auto json = JSONArchive::from(arc);
  return JS::serializeStruct(
      json, JS::SerializerOptions(pretty ? JS::SerializerOptions::Pretty
                                         : JS::SerializerOptions::Compact));
}

} // namespace libmar
