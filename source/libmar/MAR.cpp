#include "MAR.hpp"

#include <algorithm>
#include <libmar/MARObserver.hpp>
#include <oishii/reader/binary_reader.hxx>
#include <oishii/util/util.hxx>
#include <rsl/SafeReader.hpp>

namespace libmar {

namespace {

// Attaches a kind and the starting position to whatever `rsl::SafeReader`
// reports. The position is sampled before the read so it names the field that
// failed rather than wherever the cursor ended up.
class MarReader {
public:
  MarReader(rsl::SafeReader& reader) : mReader(reader) {}

  auto tell() const { return mReader.tell(); }
  void seekSet(u64 pos) { mReader.seekSet(pos); }

  MarResult<u64> U64(MarErrorKind kind = MarErrorKind::BoundsViolation) {
    const auto at = tell();
    return tag(at, kind, mReader.U64());
  }
  MarResult<u32> U32(MarErrorKind kind = MarErrorKind::BoundsViolation) {
    const auto at = tell();
    return tag(at, kind, mReader.U32());
  }
  MarResult<std::vector<u8>>
  Bytes(u64 size, MarErrorKind kind = MarErrorKind::BoundsViolation) {
    const auto at = tell();
    return tag(at, kind, mReader.Bytes(size));
  }
  MarResult<std::string>
  String(u64 size, MarErrorKind kind = MarErrorKind::BoundsViolation) {
    const auto at = tell();
    return tag(at, kind, mReader.String(size));
  }
  MarResult<std::string> CString(MarErrorKind kind) {
    const auto at = tell();
    return tag(at, kind, mReader.CString());
  }

private:
  template <typename T>
  static MarResult<T> tag(u64 at, MarErrorKind kind,
                          std::expected<T, std::string>&& result) {
    if (!result) {
      return RSL_UNEXPECTED(
          MakeMarError(kind, at, std::move(result).error()));
    }
    return std::move(*result);
  }

  rsl::SafeReader& mReader;
};

} // namespace

bool IsDataMarArchive(rsl::byte_view data) {
  return data.size() >= MarIdMagic.size() &&
         std::ranges::equal(data.subspan(0, MarIdMagic.size()), MarIdMagic,
                            [](u8 a, char b) { return a == static_cast<u8>(b); });
}

bool IsXzCompressed(rsl::byte_view data) {
  // A bare 6-byte magic counts too; only the leading bytes are compared.
  return data.size() >= XzMagic.size() &&
         std::ranges::equal(data.subspan(0, XzMagic.size()), XzMagic);
}

std::string_view AlgorithmName(u32 algorithm_id) {
  switch (algorithm_id) {
  case SIG_ALG_RSA_PKCS1_SHA1:
    return "RSA-PKCS1-SHA1";
  case SIG_ALG_RSA_PKCS1_SHA384:
    return "RSA-PKCS1-SHA384";
  default:
    return "unknown";
  }
}

std::string ProductInformationString(rsl::byte_view data) {
  auto first = std::ranges::find_if(data, [](u8 c) { return c != 0; });
  auto last = std::find_if(data.rbegin(), data.rend(),
                           [](u8 c) { return c != 0; })
                  .base();
  if (first >= last) {
    return {};
  }
  std::string out(first, last);
  std::ranges::replace(out, '\0', ' ');
  return out;
}

const Entry* Archive::find(std::string_view file_name) const {
  auto it = content.find(file_name);
  return it != content.end() ? &it->second : nullptr;
}

static MarResult<void> ReadSignatures(MarReader& reader, Archive& arc,
                                      DecodeObserver& observer) {
  for (u32 i = 0; i < arc.signatures_header.num_signatures; ++i) {
    Signature sig;
    sig.algorithm_id = TRY(reader.U32(MarErrorKind::TruncatedSignature));
    sig.size = TRY(reader.U32(MarErrorKind::TruncatedSignature));
    sig.algorithm = AlgorithmName(sig.algorithm_id);
    sig.data = TRY(reader.Bytes(sig.size, MarErrorKind::TruncatedSignature));
    observer.onSignature(i, sig);
    arc.signatures.push_back(std::move(sig));
  }
  return {};
}

static MarResult<void> ReadAdditionalSections(MarReader& reader, Archive& arc,
                                              DecodeObserver& observer) {
  const u32 count = arc.additional_sections_header.num_additional_sections;
  for (u32 i = 0; i < count; ++i) {
    const auto section_start = reader.tell();
    AdditionalSection section;
    section.block_size = TRY(reader.U32());
    section.block_id = TRY(reader.U32());
    if (section.block_size < AdditionalSectionEntryHeaderLen) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::InvalidBlockSize, section_start,
          fmt::format("Additional section {} declares a block size of {}; "
                      "the block header alone takes {} bytes",
                      i, section.block_size,
                      AdditionalSectionEntryHeaderLen)));
    }
    section.data = TRY(reader.Bytes(section.block_size -
                                    AdditionalSectionEntryHeaderLen));
    if (section.block_id == BLOCK_ID_PRODUCT_INFO) {
      arc.product_information = ProductInformationString(section.data);
    }
    observer.onAdditionalSection(i, section);
    arc.additional_sections.push_back(std::move(section));
  }
  return {};
}

// Entries are not counted anywhere in the file: they run until the cursor
// reaches the total file size from the signatures header.
static MarResult<std::vector<u64>>
ReadIndex(MarReader& reader, Archive& arc, const DecodeOptions& options,
          DecodeObserver& observer) {
  const auto header_start = reader.tell();
  arc.index_header.size = TRY(reader.U32());
  observer.onIndexHeader(arc.index_header);

  std::vector<u64> entry_offsets;
  const auto entries_start = reader.tell();
  for (u32 i = 0; reader.tell() < arc.signatures_header.file_size; ++i) {
    entry_offsets.push_back(reader.tell());
    IndexEntry entry;
    entry.offset_to_content = TRY(reader.U32());
    entry.size = TRY(reader.U32());
    entry.flags = TRY(reader.U32());
    entry.file_name = TRY(reader.CString(MarErrorKind::MissingNameTerminator));
    observer.onIndexEntry(i, entry);
    arc.index.push_back(std::move(entry));
  }

  const u64 consumed = reader.tell() - entries_start;
  if (consumed != arc.index_header.size) {
    auto msg = fmt::format("Index entries span {} bytes but the index header "
                           "declares {}",
                           consumed, arc.index_header.size);
    observer.onWarning(header_start, msg);
    if (options.strict_index_size) {
      return RSL_UNEXPECTED(MakeMarError(MarErrorKind::IndexSizeMismatch,
                                         header_start, std::move(msg)));
    }
  }
  return entry_offsets;
}

static MarResult<void> ReadContent(const oishii::BinaryReader& unsafeReader,
                                   Archive& arc,
                                   std::span<const u64> entry_offsets) {
  for (size_t i = 0; i < arc.index.size(); ++i) {
    const auto& entry = arc.index[i];
    auto bytes = unsafeReader.tryGetSpan(entry.size, entry.offset_to_content);
    if (!bytes) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::BoundsViolation, entry.offset_to_content,
          fmt::format("Content of \"{}\": {}", entry.file_name,
                      bytes.error())));
    }

    Entry content{
        .data = std::vector<u8>(bytes->begin(), bytes->end()),
        .is_compressed = IsXzCompressed(*bytes),
    };
    auto [it, inserted] =
        arc.content.try_emplace(entry.file_name, std::move(content));
    if (!inserted) {
      return RSL_UNEXPECTED(MakeMarError(
          MarErrorKind::DuplicateName, entry_offsets[i],
          fmt::format("File named \"{}\" already exists in the archive, "
                      "duplicates are not permitted",
                      entry.file_name)));
    }
  }
  return {};
}

MarResult<Archive> LoadMarArchive(rsl::byte_view data,
                                  const DecodeOptions& options) {
  DecodeObserver silent;
  DecodeObserver& observer =
      options.observer != nullptr ? *options.observer : silent;

  if (data.size() < MinimumArchiveSize) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::TooShort, 0,
        fmt::format("Input is {} bytes; the fixed MAR headers alone take {}",
                    data.size(), MinimumArchiveSize)));
  }

  oishii::BinaryReader unsafeReader(data, options.path, std::endian::big);
  rsl::SafeReader safe(unsafeReader);
  MarReader reader(safe);
  Archive arc;

  arc.mar_id = TRY(reader.String(MarIdLen));
  arc.offset_to_index = TRY(reader.U32());
  observer.onHeader(arc.mar_id, arc.offset_to_index);

  arc.signatures_header.file_size = TRY(reader.U64());
  arc.signatures_header.num_signatures = TRY(reader.U32());
  observer.onSignaturesHeader(arc.signatures_header);
  TRY(ReadSignatures(reader, arc, observer));

  arc.additional_sections_header.num_additional_sections =
      TRY(reader.U32());
  observer.onAdditionalSectionsHeader(arc.additional_sections_header);
  TRY(ReadAdditionalSections(reader, arc, observer));

  // The index sits after all of the file content, so this is a forward seek.
  if (arc.offset_to_index > data.size()) {
    return RSL_UNEXPECTED(MakeMarError(
        MarErrorKind::IndexOutOfBounds, MarIdLen,
        fmt::format("Offset to index {} is past the end of the {} byte input",
                    arc.offset_to_index, data.size())));
  }
  observer.onIndexJump(arc.offset_to_index);
  reader.seekSet(arc.offset_to_index);
  auto entry_offsets = TRY(ReadIndex(reader, arc, options, observer));

  TRY(ReadContent(unsafeReader, arc, entry_offsets));
  return arc;
}

Result<std::vector<u8>> ReadArchiveFile(std::string_view path) {
  auto file = oishii::UtilReadFile(path);
  if (!file) {
    return RSL_UNEXPECTED(
        fmt::format("Cannot load archive: {}", file.error()));
  }
  return std::move(*file);
}

} // namespace libmar
