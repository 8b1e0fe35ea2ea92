#include <core/common.h>
#include <gtest/gtest.h>
#include <oishii/reader/binary_reader.hxx>
#include <rsl/SafeReader.hpp>

namespace {

const std::vector<u8> Buffer = {0x12, 0x34, 0x56, 0x78, 'h', 'i',
                                0x00, 'M',  'A',  'R',  '1'};

TEST(SafeReader, BigEndianIntegers) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  EXPECT_EQ(reader.U16(), 0x1234u);
  EXPECT_EQ(reader.U8(), 0x56u);
  EXPECT_EQ(reader.tell(), 3u);
  reader.seekSet(0);
  EXPECT_EQ(reader.U32(), 0x12345678u);
}

TEST(SafeReader, FailedReadKeepsCursor) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  reader.seekSet(8);
  auto value = reader.U64();
  ASSERT_FALSE(value.has_value());
  EXPECT_NE(value.error().find("Bounds error"), std::string::npos);
  EXPECT_EQ(reader.tell(), 8u);
  EXPECT_EQ(reader.remaining(), 3u);

  EXPECT_FALSE(reader.Bytes(4).has_value());
  EXPECT_EQ(reader.tell(), 8u);
}

TEST(SafeReader, HugeSizesDoNotWrap) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  reader.seekSet(1);
  EXPECT_FALSE(reader.Span(~u64(0)).has_value());
  EXPECT_FALSE(unsafe.isInBounds(~u64(0), 2));
  EXPECT_TRUE(unsafe.isInBounds(Buffer.size(), 0));
}

TEST(SafeReader, CString) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  reader.seekSet(4);
  EXPECT_EQ(reader.CString(), "hi");
  EXPECT_EQ(reader.tell(), 7u);

  auto unterminated = reader.CString();
  ASSERT_FALSE(unterminated.has_value());
  EXPECT_NE(unterminated.error().find("null terminator"), std::string::npos);
  EXPECT_EQ(reader.tell(), 7u);
}

TEST(SafeReader, MagicAndStrings) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  reader.seekSet(7);
  EXPECT_EQ(reader.Magic("MAR1"), "MAR1");

  reader.seekSet(4);
  EXPECT_FALSE(reader.Magic("MAR1").has_value());
  EXPECT_EQ(reader.tell(), 4u);
  EXPECT_EQ(reader.String(3), std::string("hi\0", 3));
}

TEST(SafeReader, Slice) {
  oishii::BinaryReader unsafe(Buffer, "<test>", std::endian::big);
  rsl::SafeReader reader(unsafe);
  EXPECT_EQ(reader.slice(7).size(), 4u);
  EXPECT_TRUE(reader.slice(100).empty());
}

} // namespace
