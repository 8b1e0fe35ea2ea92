#include "MarBuilder.hpp"

#include <gtest/gtest.h>
#include <libmar/MARObserver.hpp>
#include <thread>

using namespace std::string_view_literals;

namespace libmar {
namespace {

using test::Bytes;
using test::MarBuilder;
using test::PatchBE32;
using test::ReadBE32;

// One file "a.txt" containing "abcd", no signatures or additional sections.
const std::vector<u8> MinimalArchive = {
    'M',  'A',  'R',  '1',                          // id
    0x00, 0x00, 0x00, 0x1C,                         // offset to index: 28
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x32, // file size: 50
    0x00, 0x00, 0x00, 0x00,                         // signatures: 0
    0x00, 0x00, 0x00, 0x00,                         // sections: 0
    'a',  'b',  'c',  'd',                          // content
    0x00, 0x00, 0x00, 0x12,                         // index size: 18
    0x00, 0x00, 0x00, 0x18,                         // offset: 24
    0x00, 0x00, 0x00, 0x04,                         // size: 4
    0x00, 0x00, 0x01, 0xA4,                         // flags: 0644
    'a',  '.',  't',  'x',  't',  0x00,             // name
};

std::vector<u8> XzPayload() {
  std::vector<u8> data(XzMagic.begin(), XzMagic.end());
  data.push_back(0x42);
  data.push_back(0x43);
  return data;
}

MarError DecodeError(std::span<const u8> data, DecodeOptions options = {}) {
  auto arc = LoadMarArchive(data, options);
  EXPECT_FALSE(arc.has_value());
  return arc ? MarError{} : arc.error();
}

class RecordingObserver : public DecodeObserver {
public:
  void onHeader(std::string_view mar_id, u32 offset_to_index) override {
    events.push_back(fmt::format("header {} {}", mar_id, offset_to_index));
  }
  void onSignaturesHeader(const SignaturesHeader& header) override {
    events.push_back(fmt::format("signatures {} {}", header.file_size,
                                 header.num_signatures));
  }
  void onSignature(u32 i, const Signature& sig) override {
    events.push_back(fmt::format("signature {} {}", i, sig.algorithm));
  }
  void onAdditionalSectionsHeader(
      const AdditionalSectionsHeader& header) override {
    events.push_back(
        fmt::format("sections {}", header.num_additional_sections));
  }
  void onAdditionalSection(u32 i, const AdditionalSection& section) override {
    events.push_back(fmt::format("section {} {}", i, section.block_id));
  }
  void onIndexJump(u32 offset_to_index) override {
    events.push_back(fmt::format("jump {}", offset_to_index));
  }
  void onIndexHeader(const IndexHeader& header) override {
    events.push_back(fmt::format("index {}", header.size));
  }
  void onIndexEntry(u32 i, const IndexEntry& entry) override {
    events.push_back(fmt::format("entry {} {}", i, entry.file_name));
  }
  void onWarning(u64 offset, std::string_view message) override {
    warnings.push_back(offset);
  }

  std::vector<std::string> events;
  std::vector<u64> warnings;
};

TEST(MarDecode, MinimalArchive) {
  auto arc = LoadMarArchive(MinimalArchive);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();

  EXPECT_EQ(arc->mar_id, "MAR1");
  EXPECT_EQ(arc->offset_to_index, 28u);
  EXPECT_EQ(arc->signatures_header.file_size, 50u);
  EXPECT_EQ(arc->signatures_header.num_signatures, 0u);
  EXPECT_TRUE(arc->signatures.empty());
  EXPECT_EQ(arc->additional_sections_header.num_additional_sections, 0u);
  EXPECT_TRUE(arc->additional_sections.empty());
  EXPECT_TRUE(arc->product_information.empty());
  EXPECT_EQ(arc->index_header.size, 18u);

  ASSERT_EQ(arc->index.size(), 1u);
  EXPECT_EQ(arc->index[0], (IndexEntry{.offset_to_content = 24,
                                       .size = 4,
                                       .flags = 0644,
                                       .file_name = "a.txt"}));

  ASSERT_EQ(arc->content.size(), 1u);
  const auto* entry = arc->find("a.txt");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->data, Bytes("abcd"));
  EXPECT_FALSE(entry->is_compressed);
  EXPECT_EQ(arc->find("b.txt"), nullptr);
}

TEST(MarDecode, BuilderMatchesHandWrittenLayout) {
  EXPECT_EQ(MarBuilder{}.file("a.txt", Bytes("abcd")).build(), MinimalArchive);
}

TEST(MarDecode, EmptyIndex) {
  auto data = MarBuilder{}.build();
  ASSERT_EQ(data.size(), MinimumArchiveSize);
  auto arc = LoadMarArchive(data);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_TRUE(arc->index.empty());
  EXPECT_TRUE(arc->content.empty());
  EXPECT_EQ(arc->index_header.size, 0u);
}

TEST(MarDecode, SignaturesAndProductInformation) {
  auto data = MarBuilder{}
                  .sig(SIG_ALG_RSA_PKCS1_SHA1, Bytes("sig-one"))
                  .sig(SIG_ALG_RSA_PKCS1_SHA384, Bytes("signature-two"))
                  .sig(7, Bytes("?"))
                  .section(BLOCK_ID_PRODUCT_INFO,
                           Bytes("\0\0Firefox\0"
                                 "100.0\0\0"sv))
                  .section(42, Bytes("opaque"))
                  .file("defaults/prefs.js", Bytes("pref(1);"), 0755)
                  .file("update.manifest", Bytes("add \"prefs.js\""))
                  .build();

  auto arc = LoadMarArchive(data);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();

  ASSERT_EQ(arc->signatures.size(), 3u);
  EXPECT_EQ(arc->signatures[0].algorithm, "RSA-PKCS1-SHA1");
  EXPECT_EQ(arc->signatures[0].data, Bytes("sig-one"));
  EXPECT_EQ(arc->signatures[1].algorithm, "RSA-PKCS1-SHA384");
  EXPECT_EQ(arc->signatures[1].size, 13u);
  EXPECT_EQ(arc->signatures[2].algorithm, "unknown");
  EXPECT_EQ(arc->signatures[2].algorithm_id, 7u);

  ASSERT_EQ(arc->additional_sections.size(), 2u);
  EXPECT_EQ(arc->additional_sections[0].block_size, 8u + 17u);
  EXPECT_EQ(arc->additional_sections[1].block_id, 42u);
  EXPECT_EQ(arc->additional_sections[1].data, Bytes("opaque"));
  EXPECT_EQ(arc->product_information, "Firefox 100.0");

  ASSERT_EQ(arc->index.size(), 2u);
  EXPECT_EQ(arc->index[0].file_name, "defaults/prefs.js");
  EXPECT_EQ(arc->index[0].flags, 0755u);
  EXPECT_EQ(arc->index[1].file_name, "update.manifest");
  EXPECT_EQ(arc->find("update.manifest")->data, Bytes("add \"prefs.js\""));
  EXPECT_EQ(arc->signatures_header.file_size, data.size());
}

TEST(MarDecode, ProductInformationIsLastOneWins) {
  auto data = MarBuilder{}
                  .section(BLOCK_ID_PRODUCT_INFO, Bytes("first"))
                  .section(BLOCK_ID_PRODUCT_INFO, Bytes("second"))
                  .build();
  auto arc = LoadMarArchive(data);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_EQ(arc->product_information, "second");
}

TEST(MarDecode, ProductInformationString) {
  EXPECT_EQ(ProductInformationString(Bytes("\0\0a\0b\0\0"sv)), "a b");
  EXPECT_EQ(ProductInformationString(Bytes("a\0\0b"sv)), "a  b");
  EXPECT_EQ(ProductInformationString(Bytes("\0\0\0"sv)), "");
  EXPECT_EQ(ProductInformationString({}), "");
}

TEST(MarDecode, CompressionDetection) {
  auto data = MarBuilder{}
                  .file("xz", XzPayload())
                  .file("magic-only", std::vector<u8>(XzMagic.begin(),
                                                      XzMagic.end()))
                  .file("short", std::vector<u8>(XzMagic.begin(),
                                                 XzMagic.begin() + 5))
                  .file("plain", Bytes("plain text"))
                  .file("empty", {})
                  .build();
  auto arc = LoadMarArchive(data);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_TRUE(arc->find("xz")->is_compressed);
  EXPECT_TRUE(arc->find("magic-only")->is_compressed);
  EXPECT_FALSE(arc->find("short")->is_compressed);
  EXPECT_FALSE(arc->find("plain")->is_compressed);
  EXPECT_FALSE(arc->find("empty")->is_compressed);
  // Compressed content is passed through untouched.
  EXPECT_EQ(arc->find("xz")->data, XzPayload());
}

TEST(MarDecode, IsDataMarArchive) {
  EXPECT_TRUE(IsDataMarArchive(MinimalArchive));
  EXPECT_TRUE(IsDataMarArchive(Bytes("MAR1")));
  EXPECT_FALSE(IsDataMarArchive(Bytes("MAR")));
  EXPECT_FALSE(IsDataMarArchive(Bytes("Yaz0....")));
}

TEST(MarDecode, ForeignIdIsNotRejected) {
  auto builder = MarBuilder{}.file("a", Bytes("a"));
  builder.mar_id = "XXXX";
  auto arc = LoadMarArchive(builder.build());
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_EQ(arc->mar_id, "XXXX");
}

TEST(MarDecode, TooShort) {
  std::vector<u8> data(MinimalArchive.begin(),
                       MinimalArchive.begin() + MinimumArchiveSize - 1);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::TooShort);
  EXPECT_EQ(err.offset, 0u);
  EXPECT_EQ(DecodeError({}).kind, MarErrorKind::TooShort);
}

TEST(MarDecode, TruncatedSignature) {
  auto data = MarBuilder{}
                  .sig(SIG_ALG_RSA_PKCS1_SHA1, Bytes("12345678"))
                  .file("a", Bytes("a"))
                  .build();
  // id(4) offset(4) size(8) count(4) algorithm(4) | size
  PatchBE32(data, 24, 0xFFFF);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::TruncatedSignature);
  EXPECT_EQ(err.offset, 28u);
}

TEST(MarDecode, SignatureCountPastEnd) {
  auto data = MarBuilder{}.build();
  PatchBE32(data, 16, 100);
  EXPECT_EQ(DecodeError(data).kind, MarErrorKind::TruncatedSignature);
}

TEST(MarDecode, InvalidBlockSize) {
  auto data = MarBuilder{}.section(BLOCK_ID_PRODUCT_INFO, Bytes("x")).build();
  // The section count is at 20, the first section at 24.
  PatchBE32(data, 24, 7);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::InvalidBlockSize);
  EXPECT_EQ(err.offset, 24u);
}

TEST(MarDecode, EmptyBlockIsValid) {
  auto data = MarBuilder{}.section(9, {}).build();
  auto arc = LoadMarArchive(data);
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_EQ(arc->additional_sections[0].block_size, 8u);
  EXPECT_TRUE(arc->additional_sections[0].data.empty());
}

TEST(MarDecode, IndexOutOfBounds) {
  auto data = MarBuilder{}.file("a", Bytes("a")).build();
  PatchBE32(data, MarIdLen, static_cast<u32>(data.size()) + 1);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::IndexOutOfBounds);
  EXPECT_EQ(err.offset, u64(MarIdLen));
}

TEST(MarDecode, IndexAtEndOfInput) {
  auto data = MarBuilder{}.file("a", Bytes("a")).build();
  PatchBE32(data, MarIdLen, static_cast<u32>(data.size()));
  EXPECT_EQ(DecodeError(data).kind, MarErrorKind::BoundsViolation);
}

TEST(MarDecode, MissingNameTerminator) {
  auto data = MarBuilder{}.file("a.txt", Bytes("abcd")).build();
  const u64 name_at = data.size() - 6;
  data.pop_back();
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::MissingNameTerminator);
  EXPECT_EQ(err.offset, name_at);
}

TEST(MarDecode, DuplicateName) {
  auto data = MarBuilder{}
                  .file("dup", Bytes("one"))
                  .file("dup", Bytes("two"))
                  .build();
  const u32 index_at = ReadBE32(data, MarIdLen);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::DuplicateName);
  // Second entry: after the index size and the first 12 + "dup\0" bytes.
  EXPECT_EQ(err.offset, u64(index_at) + 4 + 16);
  EXPECT_NE(err.message.find("dup"), std::string::npos);
}

TEST(MarDecode, ContentPastEnd) {
  auto data = MarBuilder{}.file("a", Bytes("abcd")).build();
  const u32 index_at = ReadBE32(data, MarIdLen);
  PatchBE32(data, index_at + 4 + 4, 1000);
  auto err = DecodeError(data);
  EXPECT_EQ(err.kind, MarErrorKind::BoundsViolation);
  EXPECT_EQ(err.offset, u64(ReadBE32(data, index_at + 4)));
}

TEST(MarDecode, IndexSizeMismatchIsLenientByDefault) {
  auto builder = MarBuilder{}.file("a.txt", Bytes("abcd"));
  builder.index_size_override = 99;
  auto data = builder.build();
  const u32 index_at = ReadBE32(data, MarIdLen);

  RecordingObserver observer;
  auto arc = LoadMarArchive(data, {.observer = &observer});
  ASSERT_TRUE(arc.has_value()) << arc.error().format();
  EXPECT_EQ(arc->index_header.size, 99u);
  EXPECT_EQ(arc->index.size(), 1u);
  EXPECT_EQ(observer.warnings, std::vector<u64>{index_at});

  auto err =
      DecodeError(data, {.observer = &observer, .strict_index_size = true});
  EXPECT_EQ(err.kind, MarErrorKind::IndexSizeMismatch);
  EXPECT_EQ(err.offset, u64(index_at));
}

TEST(MarDecode, ObserverSeesEventsInFileOrder) {
  auto data = MarBuilder{}
                  .sig(SIG_ALG_RSA_PKCS1_SHA384, Bytes("s"))
                  .section(BLOCK_ID_PRODUCT_INFO, Bytes("p"))
                  .file("one", Bytes("1"))
                  .file("two", Bytes("2"))
                  .build();
  const u32 index_at = ReadBE32(data, MarIdLen);

  RecordingObserver observer;
  auto arc = LoadMarArchive(data, {.observer = &observer});
  ASSERT_TRUE(arc.has_value()) << arc.error().format();

  const std::vector<std::string> expected = {
      fmt::format("header MAR1 {}", index_at),
      fmt::format("signatures {} 1", data.size()),
      "signature 0 RSA-PKCS1-SHA384",
      "sections 1",
      "section 0 1",
      fmt::format("jump {}", index_at),
      fmt::format("index {}", 2 * (12 + 4)),
      "entry 0 one",
      "entry 1 two",
  };
  EXPECT_EQ(observer.events, expected);
  EXPECT_TRUE(observer.warnings.empty());
}

TEST(MarDecode, LoggingObserverDecodesTheSame) {
  auto data = MarBuilder{}
                  .sig(SIG_ALG_RSA_PKCS1_SHA1, Bytes("sig"))
                  .file("a", Bytes("abcd"))
                  .build();
  LoggingObserver observer(rsl::logging::Level::Trace);
  auto logged = LoadMarArchive(data, {.observer = &observer});
  auto silent = LoadMarArchive(data);
  ASSERT_TRUE(logged.has_value());
  ASSERT_TRUE(silent.has_value());
  EXPECT_EQ(*logged, *silent);
}

TEST(MarDecode, ConcurrentDecodesShareInput) {
  const auto data = MarBuilder{}
                        .sig(SIG_ALG_RSA_PKCS1_SHA1, Bytes("signature"))
                        .file("a", Bytes("alpha"))
                        .file("b", XzPayload())
                        .build();
  auto reference = LoadMarArchive(data);
  ASSERT_TRUE(reference.has_value());

  std::vector<std::optional<Archive>> results(8);
  std::vector<std::thread> threads;
  for (auto& result : results) {
    threads.emplace_back([&data, &result] {
      auto arc = LoadMarArchive(data);
      if (arc) {
        result = std::move(*arc);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (const auto& result : results) {
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, *reference);
  }
}

TEST(MarError, Format) {
  EXPECT_EQ(MakeMarError(MarErrorKind::DuplicateName, 44, "File exists")
                .format(),
            "DuplicateName at 0x2c (44): File exists");
  EXPECT_EQ(MakeMarError(MarErrorKind::BoundsViolation, std::nullopt, "Oops")
                .format(),
            "BoundsViolation: Oops");
  EXPECT_EQ(MarErrorKindName(MarErrorKind::IndexSizeMismatch),
            "IndexSizeMismatch");
}

} // namespace
} // namespace libmar
