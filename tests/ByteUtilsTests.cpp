#include <gtest/gtest.h>

#include "../LEDBLEEngine/Common/ByteUtils.hpp"

using namespace LEDBLE::Bytes;

TEST(ByteUtilsTests, ChecksumIsModulo256Sum) {
    const Buffer bytes{0x31, 0xFF, 0x00, 0x00, 0x00, 0x00, 0x5A, 0x0F};
    EXPECT_EQ(Checksum(bytes), 0x99);
    EXPECT_EQ(Checksum({}), 0x00);
}

TEST(ByteUtilsTests, TrailingChecksumValidation) {
    const Buffer good{0x71, 0x23, 0x0F, 0xA3};
    const Buffer bad{0x71, 0x23, 0x0F, 0xA4};
    const Buffer tooShort{0x00};

    EXPECT_TRUE(HasValidTrailingChecksum(good));
    EXPECT_FALSE(HasValidTrailingChecksum(bad));
    EXPECT_FALSE(HasValidTrailingChecksum(tooShort));
}

TEST(ByteUtilsTests, BitFieldExtraction) {
    static_assert(bit<uint8_t>(6) == 0x40);
    static_assert(bit_range<uint8_t>(7, 2) == 0xFC);
    EXPECT_EQ(extract_bits<uint8_t>(0xB5, 1, 0), 0x01);
    EXPECT_EQ(extract_bits<uint8_t>(0xB5, 7, 2), 0x2D);
    EXPECT_EQ(extract_bits<uint8_t>(0xFF, 4, 0), 0x1F);
}

TEST(ByteUtilsTests, EndianReaders) {
    const Buffer bytes{0x5A, 0x33, 0x01};
    EXPECT_EQ(ReadBE16(bytes, 0), 0x5A33);
    EXPECT_EQ(ReadLE16(bytes, 0), 0x335A);
    EXPECT_EQ(ReadBE16(bytes, 1), 0x3301);

    Buffer out;
    AppendBE16(out, 0x8001);
    EXPECT_EQ(out, (Buffer{0x80, 0x01}));
}

TEST(ByteUtilsTests, HexFormatting) {
    const Buffer bytes{0x31, 0xFF, 0x0A};
    EXPECT_EQ(ToHex(bytes), "31 FF 0A");
    EXPECT_EQ(ToHex({}), "");
}

TEST(ByteUtilsTests, HexParsing) {
    Buffer out;
    ASSERT_TRUE(FromHex("81ff0A", out));
    EXPECT_EQ(out, (Buffer{0x81, 0xFF, 0x0A}));

    EXPECT_FALSE(FromHex("81F", out));
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(FromHex("8G", out));
    EXPECT_TRUE(out.empty());
}
