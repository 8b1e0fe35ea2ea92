#include "MAR.hpp"

#include <algorithm>
#include <oishii/writer/binary_writer.hxx>

namespace libmar {

// Every write into the output goes through here, after the range is checked.
static MarResult<void> Place(std::vector<u8>& output, u64 pos,
                             rsl::byte_view bytes, std::string_view what) {
  if (pos > output.size() || bytes.size() > output.size() - pos) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::BoundsViolation, pos,
        fmt::format("Placing {} ({} bytes) at {} overruns the {} byte signable "
                    "buffer",
                    what, bytes.size(), pos, output.size())));
  }
  std::ranges::copy(bytes, output.begin() + static_cast<std::ptrdiff_t>(pos));
  return {};
}

// Absolute offsets were recorded with the signature payloads in place.
static MarResult<u64> Shift(u64 absolute, u64 sig_data_size,
                            std::string_view what) {
  if (absolute < sig_data_size) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::BoundsViolation, absolute,
        fmt::format("Offset {} of {} lies inside the {} bytes of signature "
                    "data",
                    absolute, what, sig_data_size)));
  }
  return absolute - sig_data_size;
}

static void WriteHeaders(oishii::Writer& writer, const Archive& arc) {
  writer.writeBytes(arc.mar_id);
  writer.write<u32>(arc.offset_to_index);
  writer.write<u64>(arc.signatures_header.file_size);
  writer.write<u32>(arc.signatures_header.num_signatures);
  // Payloads are exactly what is being signed, so only their headers stay.
  for (const auto& sig : arc.signatures) {
    writer.write<u32>(sig.algorithm_id);
    writer.write<u32>(sig.size);
  }
  writer.write<u32>(arc.additional_sections_header.num_additional_sections);
  for (const auto& section : arc.additional_sections) {
    writer.write<u32>(section.block_size);
    writer.write<u32>(section.block_id);
    writer.writeBytes(section.data);
  }
}

static void WriteIndex(oishii::Writer& writer, const Archive& arc) {
  writer.write<u32>(arc.index_header.size);
  for (const auto& entry : arc.index) {
    writer.write<u32>(entry.offset_to_content);
    writer.write<u32>(entry.size);
    writer.write<u32>(entry.flags);
    writer.writeBytes(entry.file_name);
    writer.write<u8>(0);
  }
}

// Headers are written from the field values, so they must agree with the
// vectors they describe.
static MarResult<void> CheckHeaders(const Archive& arc) {
  if (arc.mar_id.size() != MarIdLen) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::ContentMismatch, 0,
        fmt::format("MAR id \"{}\" is {} bytes; it must be {}", arc.mar_id,
                    arc.mar_id.size(), MarIdLen)));
  }
  if (arc.signatures_header.num_signatures != arc.signatures.size()) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::ContentMismatch, MarIdLen + OffsetToIndexLen + 8,
        fmt::format("Signature count is {} but {} signatures are present",
                    arc.signatures_header.num_signatures,
                    arc.signatures.size())));
  }
  if (arc.additional_sections_header.num_additional_sections !=
      arc.additional_sections.size()) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::ContentMismatch, std::nullopt,
        fmt::format("Additional section count is {} but {} sections are "
                    "present",
                    arc.additional_sections_header.num_additional_sections,
                    arc.additional_sections.size())));
  }
  for (const auto& section : arc.additional_sections) {
    if (section.block_size !=
        section.data.size() + AdditionalSectionEntryHeaderLen) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::ContentMismatch, std::nullopt,
          fmt::format("Block {} declares {} bytes but carries {} bytes of "
                      "data",
                      section.block_id, section.block_size,
                      section.data.size())));
    }
  }
  return {};
}

MarResult<std::vector<u8>> SaveSignableBytes(const Archive& arc) {
  TRY(CheckHeaders(arc));

  u64 sig_data_size = 0;
  for (const auto& sig : arc.signatures) {
    sig_data_size += sig.size;
  }

  const u64 file_size = arc.signatures_header.file_size;
  if (sig_data_size > file_size) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::BoundsViolation, std::nullopt,
        fmt::format("Signatures hold {} bytes of data but the whole file is "
                    "only {} bytes",
                    sig_data_size, file_size)));
  }
  std::vector<u8> output(file_size - sig_data_size);

  oishii::Writer head(std::endian::big);
  WriteHeaders(head, arc);
  TRY(Place(output, 0, head.slice(), "headers"));

  oishii::Writer index(std::endian::big);
  WriteIndex(index, arc);
  const u64 expected_index_size = u64(arc.index_header.size) + IndexHeaderLen;
  if (index.slice().size() != expected_index_size) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::IndexSizeMismatch, arc.offset_to_index,
        fmt::format("Serialized index is {} bytes where {} were expected",
                    index.slice().size(), expected_index_size)));
  }

  for (const auto& entry : arc.index) {
    const auto* content = arc.find(entry.file_name);
    if (content == nullptr) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::ContentMismatch, entry.offset_to_content,
          fmt::format("Index entry \"{}\" has no content", entry.file_name)));
    }
    if (content->data.size() != entry.size) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::ContentMismatch, entry.offset_to_content,
          fmt::format("Content of \"{}\" is {} bytes; the index says {}",
                      entry.file_name, content->data.size(), entry.size)));
    }
    const auto pos =
        TRY(Shift(entry.offset_to_content, sig_data_size, entry.file_name));
    TRY(Place(output, pos, content->data, entry.file_name));
  }

  const auto index_pos = TRY(Shift(arc.offset_to_index, sig_data_size, "index"));
  TRY(Place(output, index_pos, index.slice(), "index"));

  return output;
}

} // namespace libmar
