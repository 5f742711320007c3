#include <gtest/gtest.h>

#include "../LEDBLEEngine/Advertisement/DeviceIdentity.hpp"
#include "../LEDBLEEngine/Advertisement/ServiceDataCodec.hpp"
#include "TestDataUtils.hpp"

using namespace LEDBLE;
using namespace LEDBLE::Advertisement;
using LEDBLE::Tests::Hex;

namespace {

const auto kIdentification = Hex("00 5A 33 06 E4 98 BB 95 EE 8E 00 33 29 0A 05 02");

} // namespace

TEST(ServiceDataCodecTests, DecodesIdentificationRecord) {
    ASSERT_EQ(kIdentification.size(), ServiceDataCodec::kIdentificationLength);

    auto record = ServiceDataCodec::Decode(kIdentification);
    ASSERT_TRUE(record.has_value());

    EXPECT_EQ(record->variant, ServiceDataVariant::Identification);
    EXPECT_EQ(record->manufacturer, 0x5A33);
    EXPECT_EQ(record->bleVersion, 6);
    EXPECT_EQ(record->mac[0], 0xE4);
    EXPECT_EQ(record->mac[5], 0x8E);
    EXPECT_EQ(record->productId, 0x33);
    EXPECT_EQ(record->ledVersion, 0x0A);
    EXPECT_EQ(record->checkKey, 1);
    EXPECT_EQ(record->firmwareFlag, 2);
    EXPECT_EQ(record->firmwareVersion, 0x0129);
    EXPECT_FALSE(record->powerOn.has_value());
    EXPECT_FALSE(record->IsOta());
}

TEST(ServiceDataCodecTests, ReversedCarrierIsUndoneFirst) {
    auto reversed = ServiceDataCodec::ReverseBytes(kIdentification);
    ASSERT_NE(reversed, kIdentification);

    auto direct = ServiceDataCodec::Decode(kIdentification);
    auto undone = ServiceDataCodec::Decode(reversed, ServiceDataOrder::Reversed);
    ASSERT_TRUE(direct.has_value());
    ASSERT_TRUE(undone.has_value());
    EXPECT_EQ(*direct, *undone);
}

TEST(ServiceDataCodecTests, StateVariantCarriesPower) {
    auto payload = kIdentification;
    payload.resize(ServiceDataCodec::kIdentificationWithStateLength, 0x00);
    payload[ServiceDataCodec::kPowerOffset] = kPowerOnMarker;

    auto record = ServiceDataCodec::Decode(payload);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->variant, ServiceDataVariant::IdentificationWithState);
    EXPECT_EQ(record->powerOn, std::optional<bool>(true));

    payload[ServiceDataCodec::kPowerOffset] = kPowerOffMarker;
    EXPECT_EQ(ServiceDataCodec::Decode(payload)->powerOn, std::optional<bool>(false));
}

TEST(ServiceDataCodecTests, OlderVersionsIgnoreKeyByte) {
    auto payload = kIdentification;
    payload[3] = 5;

    auto record = ServiceDataCodec::Decode(payload);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->firmwareVersion, 0x29);
    EXPECT_EQ(record->checkKey, 0);
}

TEST(ServiceDataCodecTests, OtaStatusIsReported) {
    auto payload = kIdentification;
    payload[0] = ServiceDataCodec::kOtaStatus;

    auto record = ServiceDataCodec::Decode(payload);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->IsOta());
}

TEST(ServiceDataCodecTests, DecodesMeshRecord) {
    const auto mesh = Hex("01 07 E4 98 BB 95 EE 8E 12 34 0B 61 03 00");
    ASSERT_EQ(mesh.size(), ServiceDataCodec::kMeshLength);

    auto record = ServiceDataCodec::Decode(mesh);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->variant, ServiceDataVariant::Mesh);
    EXPECT_EQ(record->bleVersion, 7);
    EXPECT_EQ(record->meshAddress, 0x1234);
    EXPECT_EQ(record->ledVersion, 0x0B);
    EXPECT_EQ(record->meshMode, 0x61);
    EXPECT_EQ(record->firmwareFlag, 0x03);
    EXPECT_EQ(record->productId, 0);
}

TEST(ServiceDataCodecTests, RejectsBadManufacturerAndLength) {
    auto payload = kIdentification;
    payload[1] = 0x12;
    auto badMarker = ServiceDataCodec::Decode(payload);
    ASSERT_FALSE(badMarker.has_value());
    EXPECT_TRUE(badMarker.error().Is(ParseError::InvalidCompanyId));

    auto badLength = ServiceDataCodec::Decode(Hex("00 5A 33"));
    ASSERT_FALSE(badLength.has_value());
    EXPECT_TRUE(badLength.error().Is(ParseError::InvalidLength));
}

TEST(ServiceDataCodecTests, BitFieldHelpers) {
    static_assert(ServiceDataCodec::ExtractCheckKey(0xFD) == 0x01);
    static_assert(ServiceDataCodec::ExtractFirmwareHigh(0xFD) == 0x3F);
    static_assert(ServiceDataCodec::ExtractFirmwareFlag(0xE7) == 0x07);
    static_assert(ServiceDataCodec::ComposeFirmwareVersion(0x10, 0x02) == 0x0210);
    EXPECT_TRUE(ServiceDataCodec::IsManufacturerMarker(0x5B));
    EXPECT_FALSE(ServiceDataCodec::IsManufacturerMarker(0x5C));
}
