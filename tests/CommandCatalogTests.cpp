#include <gtest/gtest.h>

#include "../LEDBLEEngine/Capabilities/CapabilityDatabase.hpp"
#include "../LEDBLEEngine/Commands/CommandBuilder.hpp"
#include "../LEDBLEEngine/Commands/CommandCatalog.hpp"
#include "TestDataUtils.hpp"

using namespace LEDBLE;
using namespace LEDBLE::Commands;
using Capabilities::CapabilityDatabase;
using Capabilities::EffectType;
using LEDBLE::Tests::Hex;
using LEDBLE::Tests::WithChecksum;
namespace Fn = LEDBLE::Commands::FunctionCode;

TEST(CommandCatalogTests, PowerMarkers) {
    EXPECT_EQ(Catalog::Power(true).at("power"), 0x23);
    EXPECT_EQ(Catalog::Power(false).at("power"), 0x24);

    auto bytes = CommandBuilder::Build(CapabilityDatabase::Shared(), 0x33, Fn::kPowerV1, Catalog::Power(true));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, Hex("71 23 0F A3"));
}

TEST(CommandCatalogTests, ColourPersistFlag) {
    EXPECT_EQ(Catalog::Color(1, 2, 3, 4, 5, ColorMode::Rgb, true).at("persist"), kPersist);
    EXPECT_EQ(Catalog::Color(1, 2, 3, 4, 5, ColorMode::Rgb, false).at("persist"), kNoPersist);
    EXPECT_EQ(Catalog::Color(1, 2, 3, 4, 5, ColorMode::White, false).at("mode"), 0x0F);
}

TEST(CommandCatalogTests, RgbToHsvPrimaries) {
    const Hsv red = RgbToHsv(255, 0, 0);
    EXPECT_EQ(red.hue, 0);
    EXPECT_EQ(red.saturation, 100);
    EXPECT_EQ(red.value, 100);

    const Hsv green = RgbToHsv(0, 255, 0);
    EXPECT_NEAR(green.hue, 120, 1);

    const Hsv blue = RgbToHsv(0, 0, 255);
    EXPECT_NEAR(blue.hue, 240, 1);

    const Hsv black = RgbToHsv(0, 0, 0);
    EXPECT_EQ(black.value, 0);
    EXPECT_EQ(black.saturation, 0);
}

TEST(CommandCatalogTests, HsvPacking) {
    static_assert(HsvPack(240, 100) == ((240 << 7) | 100));

    const auto params = Catalog::ColorHsv(0, 0, 255, 80);
    const Hsv hsv = RgbToHsv(0, 0, 255);
    const uint16_t packed = HsvPack(hsv.hue, hsv.saturation);
    EXPECT_EQ(params.at("hs_hi"), packed >> 8);
    EXPECT_EQ(params.at("hs_lo"), packed & 0xFF);
    EXPECT_EQ(params.at("bright"), 80);
}

TEST(CommandCatalogTests, KelvinSplit) {
    const auto warm = KelvinToWhite(2700, 255);
    EXPECT_EQ(warm.warm, 255);
    EXPECT_EQ(warm.cool, 0);

    const auto cool = KelvinToWhite(6500, 255);
    EXPECT_EQ(cool.warm, 0);
    EXPECT_EQ(cool.cool, 255);

    // Clamped to the supported range
    const auto belowRange = KelvinToWhite(1000, 100);
    EXPECT_EQ(belowRange.warm, 100);

    EXPECT_EQ(KelvinToTemperaturePercent(2700), 100);
    EXPECT_EQ(KelvinToTemperaturePercent(6500), 0);
    EXPECT_EQ(KelvinToTemperaturePercent(4600), 50);
}

TEST(CommandCatalogTests, EffectSpeedScales) {
    // scene_data: inverted, 1 fastest
    EXPECT_EQ(EffectSpeedByte(Fn::kScene, EffectType::Simple, 100), 1);
    EXPECT_EQ(EffectSpeedByte(Fn::kScene, EffectType::Simple, 0), 31);

    // scene_data_v2: 1-31, 31 fastest
    EXPECT_EQ(EffectSpeedByte(Fn::kSceneV2, EffectType::Symphony, 0), 1);
    EXPECT_EQ(EffectSpeedByte(Fn::kSceneV2, EffectType::Symphony, 100), 31);

    // Addressable and v3 take percent directly
    EXPECT_EQ(EffectSpeedByte(Fn::kSceneV2, EffectType::Addressable, 70), 70);
    EXPECT_EQ(EffectSpeedByte(Fn::kSceneV3, EffectType::Symphony, 150), 100);
}

TEST(CommandCatalogTests, ReportedSpeedBackToPercent) {
    EXPECT_EQ(ReportedSpeedPercent(EffectType::Simple, 1), 100);
    EXPECT_EQ(ReportedSpeedPercent(EffectType::Simple, 31), 0);
    EXPECT_EQ(ReportedSpeedPercent(EffectType::Simple, 16), 50);
    EXPECT_EQ(ReportedSpeedPercent(EffectType::Symphony, 0x40), 64);
    EXPECT_EQ(ReportedSpeedPercent(EffectType::Addressable, 200), 100);

    // Reported speed re-renders to the byte the device sent
    const uint8_t percent = ReportedSpeedPercent(EffectType::Simple, 16);
    EXPECT_EQ(EffectSpeedByte(Fn::kScene, EffectType::Simple, percent), 16);
}

TEST(CommandCatalogTests, EffectParametersPerFamily) {
    const auto simple = Catalog::Effect(Fn::kScene, EffectType::Simple, 37, 100, 50, true);
    EXPECT_EQ(simple.at("model"), 37);
    EXPECT_EQ(simple.at("speed"), 1);
    EXPECT_EQ(simple.at("persist"), kPersist);
    EXPECT_EQ(simple.count("bright"), 0u);

    // Symphony devices never get brightness 0
    const auto symphony = Catalog::Effect(Fn::kSceneV2, EffectType::Symphony, 5, 50, 0);
    EXPECT_EQ(symphony.at("bright"), 1);

    const auto addressable = Catalog::Effect(Fn::kSceneV2, EffectType::Addressable, 5, 50, 0);
    EXPECT_EQ(addressable.at("bright"), 0);
}

TEST(CommandCatalogTests, SimpleEffectRendersWithChecksum) {
    auto bytes = CommandBuilder::Build(CapabilityDatabase::Shared(), 0x33, Fn::kScene,
                                       Catalog::Effect(Fn::kScene, EffectType::Simple, 0x25, 100, 100));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, WithChecksum({0x61, 0x25, 0x01, 0x0F}));
}

TEST(CommandCatalogTests, CctDurationInTenths) {
    const auto params = Catalog::Cct(40, 80, 1500);
    EXPECT_EQ(params.at("temp"), 40);
    EXPECT_EQ(params.at("bright"), 80);
    EXPECT_EQ(params.at("duration_hi"), 0);
    EXPECT_EQ(params.at("duration_lo"), 15);

    auto bytes = CommandBuilder::Build(CapabilityDatabase::Shared(), 9, Fn::kCct, params);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, WithChecksum({0x35, 0xB1, 40, 80, 0x00, 0x00, 0x00, 15}));
}

TEST(CommandCatalogTests, LedSettingsFields) {
    const auto params = Catalog::LedSettings(300, Capabilities::LedType::WS2812B,
                                             Capabilities::ColorOrder::GRB);
    auto bytes = CommandBuilder::Build(CapabilityDatabase::Shared(), 161, Fn::kLedSettings, params);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, WithChecksum({0x62, 0x01, 0x2C, 0x04, 0x02,
                                    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0}));
}
