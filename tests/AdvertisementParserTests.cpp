#include <gtest/gtest.h>

#include "../LEDBLEEngine/Advertisement/AdvertisementParser.hpp"
#include "TestDataUtils.hpp"

using namespace LEDBLE;
using namespace LEDBLE::Advertisement;
using LEDBLE::Tests::Hex;

namespace {

// Ctrl_Mini_RGB (0x33), BLE version 5, extended fields present
const auto kOutOfBandPayload =
    Hex("5B 05 E4 98 BB 95 EE 8E 00 33 29 0A 01 02 24 2F 23 08 00 00 00 00 0A 00 0F 00 00");

Bytes::Buffer Embedded(uint16_t companyId, const Bytes::Buffer& body) {
    Bytes::Buffer out{static_cast<uint8_t>(companyId & 0xFF), static_cast<uint8_t>(companyId >> 8)};
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace

TEST(AdvertisementParserTests, ParsesOutOfBandLayout) {
    ASSERT_EQ(kOutOfBandPayload.size(), 27u);

    AdvertisementParser parser;
    auto identity = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_TRUE(identity.has_value());

    EXPECT_EQ(identity->companyId, 0x5A33);
    EXPECT_EQ(identity->productId, 0x33);
    EXPECT_EQ(identity->MacString(), "E4:98:BB:95:EE:8E");
    EXPECT_EQ(identity->bleVersion, 5);
    EXPECT_EQ(identity->firmwareVersion, 0x29);
    EXPECT_EQ(identity->ledVersion, 0x0A);
    EXPECT_EQ(identity->status, 0x5B);
    EXPECT_EQ(identity->checkKey, 1);
    EXPECT_EQ(identity->firmwareFlag, 2);
    EXPECT_EQ(identity->Framing(), FramingVersion::Legacy);

    ASSERT_TRUE(identity->snapshot.has_value());
    EXPECT_EQ(identity->snapshot->raw[0], 0x24);
    EXPECT_EQ(identity->snapshot->PowerOn(), std::optional<bool>(false));
    EXPECT_EQ(identity->snapshot->ModeType(), 0x2F);
    EXPECT_EQ(identity->snapshot->SubMode(), 0x23);
    EXPECT_EQ(identity->snapshot->BrightnessPercent(), 0x08);
}

TEST(AdvertisementParserTests, EmbeddedLayoutMatchesOutOfBand) {
    AdvertisementParser parser;
    const auto embedded = Embedded(0x5A33, kOutOfBandPayload);
    ASSERT_EQ(embedded.size(), AdvertisementParser::ExpectedLength(AdvertisementLayout::CompanyIdEmbedded));

    auto a = parser.Parse(embedded, AdvertisementLayout::CompanyIdEmbedded);
    auto b = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
}

TEST(AdvertisementParserTests, ParsingIsDeterministic) {
    AdvertisementParser parser;
    auto first = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A00);
    auto second = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A00);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(AdvertisementParserTests, RejectsWrongLength) {
    AdvertisementParser parser;
    Bytes::Buffer shortPayload(kOutOfBandPayload.begin(), kOutOfBandPayload.end() - 1);

    auto result = parser.Parse(shortPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().Is(ParseError::InvalidLength));

    // 27 bytes offered as the 29-byte layout
    auto mismatched = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdEmbedded);
    ASSERT_FALSE(mismatched.has_value());
    EXPECT_TRUE(mismatched.error().Is(ParseError::InvalidLength));
}

TEST(AdvertisementParserTests, RejectsCompanyIdOutsideRange) {
    AdvertisementParser parser;

    auto low = parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x59FF);
    ASSERT_FALSE(low.has_value());
    EXPECT_TRUE(low.error().Is(ParseError::InvalidCompanyId));

    auto embedded = parser.Parse(Embedded(0x5B00, kOutOfBandPayload), AdvertisementLayout::CompanyIdEmbedded);
    ASSERT_FALSE(embedded.has_value());
    EXPECT_TRUE(embedded.error().Is(ParseError::InvalidCompanyId));

    EXPECT_TRUE(parser.IsAcceptedCompanyId(0x5A00));
    EXPECT_TRUE(parser.IsAcceptedCompanyId(0x5AFF));
}

TEST(AdvertisementParserTests, AcceptedRangeIsConfigurable) {
    AdvertisementConfig config{};
    config.companyIdMin = 0x1000;
    config.companyIdMax = 0x1000;
    AdvertisementParser parser(config);

    EXPECT_TRUE(parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x1000).has_value());
    EXPECT_FALSE(parser.Parse(kOutOfBandPayload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33).has_value());
}

TEST(AdvertisementParserTests, OldVersionsCarryNoExtendedFields) {
    auto payload = kOutOfBandPayload;
    payload[Offsets::kBleVersion] = 4;

    AdvertisementParser parser;
    auto identity = parser.Parse(payload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->checkKey, 0);
    EXPECT_EQ(identity->firmwareFlag, 0);
    EXPECT_FALSE(identity->snapshot.has_value());
}

TEST(AdvertisementParserTests, VersionSixAddsFirmwareHighBits) {
    auto payload = kOutOfBandPayload;
    payload[Offsets::kBleVersion] = 6;
    payload[Offsets::kCheckKey] = 0x05;  // high bits 0b000001, check key 0b01

    AdvertisementParser parser;
    auto identity = parser.Parse(payload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->firmwareVersion, 0x0129);
    EXPECT_EQ(identity->checkKey, 1);
}

TEST(AdvertisementParserTests, FramingFollowsAdvertisedVersion) {
    EXPECT_EQ(FramingForVersion(0), FramingVersion::Legacy);
    EXPECT_EQ(FramingForVersion(7), FramingVersion::Legacy);
    EXPECT_EQ(FramingForVersion(8), FramingVersion::Modern);
    EXPECT_EQ(FramingForVersion(10), FramingVersion::Modern);

    auto payload = kOutOfBandPayload;
    payload[Offsets::kBleVersion] = 8;
    auto identity = AdvertisementParser{}.Parse(payload, AdvertisementLayout::CompanyIdOutOfBand, 0x5A33);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->Framing(), FramingVersion::Modern);
}
