#pragma once

#include <core/common.h>
#include <libmar/MARError.hpp>

/* MAR layout (all integers big-endian):
 *
 * [4]  MAR id, "MAR1"
 * [4]  offset to index (absolute)
 * [8]  total file size
 * [4]  signature count
 *   per signature: [4] algorithm id, [4] size, [size] data
 * [4]  additional section count
 *   per section: [4] block size (incl. these 8 bytes), [4] block id, data
 * ...  file content, located only through the index
 * [offset to index]
 * [4]  index size (excluding this field)
 *   per entry until the total file size is reached:
 *   [4] offset to content (absolute), [4] size, [4] flags, name, '\0'
 */

namespace libmar {

constexpr u32 MarIdLen = 4;
constexpr u32 OffsetToIndexLen = 4;
constexpr u32 SignaturesHeaderLen = 12;
constexpr u32 SignatureEntryHeaderLen = 8;
constexpr u32 AdditionalSectionsHeaderLen = 4;
constexpr u32 AdditionalSectionEntryHeaderLen = 8;
constexpr u32 IndexHeaderLen = 4;
constexpr u32 IndexEntryHeaderLen = 12;

//! Smallest input the decoder will look at.
constexpr u32 MinimumArchiveSize = MarIdLen + OffsetToIndexLen +
                                   SignaturesHeaderLen +
                                   AdditionalSectionsHeaderLen + IndexHeaderLen;

constexpr std::string_view MarIdMagic = "MAR1";

//! xz stream header. Content starting with it is stored compressed.
constexpr std::array<u8, 6> XzMagic = {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00};

enum SignatureAlgorithm : u32 {
  SIG_ALG_RSA_PKCS1_SHA1 = 1,
  SIG_ALG_RSA_PKCS1_SHA384 = 2,
};

enum BlockId : u32 {
  BLOCK_ID_PRODUCT_INFO = 1,
};

struct SignaturesHeader {
  //! Size of the whole signed file.
  u64 file_size = 0;
  u32 num_signatures = 0;

  bool operator==(const SignaturesHeader&) const = default;
};

struct Signature {
  u32 algorithm_id = 0;
  u32 size = 0;
  //! "RSA-PKCS1-SHA1", "RSA-PKCS1-SHA384" or "unknown"
  std::string algorithm;
  std::vector<u8> data;

  bool operator==(const Signature&) const = default;
};

struct AdditionalSectionsHeader {
  u32 num_additional_sections = 0;

  bool operator==(const AdditionalSectionsHeader&) const = default;
};

struct AdditionalSection {
  u32 block_size = 0;
  u32 block_id = 0;
  std::vector<u8> data;

  bool operator==(const AdditionalSection&) const = default;
};

struct IndexHeader {
  u32 size = 0;

  bool operator==(const IndexHeader&) const = default;
};

struct IndexEntry {
  u32 offset_to_content = 0;
  u32 size = 0;
  //! Unix permission bits
  u32 flags = 0;
  std::string file_name;

  bool operator==(const IndexEntry&) const = default;
};

//! Bytes of one archived file. Compressed entries are left as-is.
struct Entry {
  std::vector<u8> data;
  bool is_compressed = false;

  bool operator==(const Entry&) const = default;
};

struct Archive {
  std::string mar_id;
  u32 offset_to_index = 0;
  //! Text of the product information block, if present.
  std::string product_information;
  SignaturesHeader signatures_header;
  std::vector<Signature> signatures;
  AdditionalSectionsHeader additional_sections_header;
  std::vector<AdditionalSection> additional_sections;
  IndexHeader index_header;
  //! In file order.
  std::vector<IndexEntry> index;
  std::map<std::string, Entry, std::less<>> content;

  const Entry* find(std::string_view file_name) const;

  bool operator==(const Archive&) const = default;
};

class DecodeObserver;

struct DecodeOptions {
  //! Receives structural events as they are parsed. Not owned.
  DecodeObserver* observer = nullptr;
  //! Fail when the index entries do not fill exactly `IndexHeader::size`.
  //! The mismatch is reported to the observer either way.
  bool strict_index_size = false;
  //! Only used in diagnostics.
  std::string_view path = "<memory>";
};

[[nodiscard]] bool IsDataMarArchive(rsl::byte_view data);
[[nodiscard]] bool IsXzCompressed(rsl::byte_view data);
[[nodiscard]] std::string_view AlgorithmName(u32 algorithm_id);
//! Product information text: outer zero bytes trimmed, inner ones turned into
//! spaces.
[[nodiscard]] std::string ProductInformationString(rsl::byte_view data);

//! Parse a whole MAR file. The buffer is only borrowed for the duration of the
//! call; the result owns copies of everything it needs.
[[nodiscard]] MarResult<Archive>
LoadMarArchive(rsl::byte_view data, const DecodeOptions& options = {});

//! The bytes a signature covers: the archive file with every signature
//! payload removed. Content and index land at their recorded offsets minus the
//! total payload size; the recorded offsets themselves are written unchanged.
[[nodiscard]] MarResult<std::vector<u8>>
SaveSignableBytes(const Archive& arc);

//! Whole file contents, for feeding `LoadMarArchive`.
[[nodiscard]] Result<std::vector<u8>> ReadArchiveFile(std::string_view path);

} // namespace libmar
