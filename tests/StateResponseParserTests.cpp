#include <gtest/gtest.h>

#include "../LEDBLEEngine/State/StateResponseParser.hpp"
#include "TestDataUtils.hpp"

using namespace LEDBLE;
using namespace LEDBLE::State;
using LEDBLE::Tests::AsBytes;
using LEDBLE::Tests::Hex;
using LEDBLE::Tests::WithChecksum;

TEST(StateResponseParserTests, DecodesStaticRgbState) {
    const auto bytes = WithChecksum({0x81, 0x01, 0x23, 0x61, 0xF0, 0x64, 0x64, 0x32, 0x10,
                                     0x00, 0x0A, 0x00, 0x00});
    ASSERT_EQ(bytes.size(), kStateResponseLength);

    auto state = StateResponseParser::Parse(bytes);
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->valid);
    EXPECT_TRUE(state->powerOn);
    EXPECT_TRUE(state->isStatic);
    EXPECT_EQ(state->colorMode, ColorMode::Rgb);
    EXPECT_EQ(state->red, 100);
    EXPECT_EQ(state->green, 50);
    EXPECT_EQ(state->blue, 16);
    EXPECT_EQ(state->brightness, 100);
    EXPECT_EQ(state->ledVersion, 0x0A);
    EXPECT_EQ(state->colorOrderNibble, 0x0F);
    EXPECT_FALSE(state->effectId.has_value());
}

TEST(StateResponseParserTests, DecodesWrappedEffectState) {
    const auto text = std::string_view(R"({"code":0,"payload":"8133242B231DED00ED000A000F36"})");

    auto payload = StateResponseParser::UnwrapNotification(AsBytes(text));
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, Hex("81 33 24 2B 23 1D ED 00 ED 00 0A 00 0F 36"));

    auto state = StateResponseParser::Parse(*payload);
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->powerOn);
    EXPECT_FALSE(state->isStatic);
    EXPECT_EQ(state->colorMode, ColorMode::Effect);
    EXPECT_EQ(state->effectId, std::optional<uint8_t>(0x23));
    EXPECT_EQ(state->effectSpeed, std::optional<uint8_t>(0));
    EXPECT_EQ(state->brightness, 100);
}

TEST(StateResponseParserTests, WhiteModeBrightnessFromChannels) {
    // value byte 0: brightness derives from the brighter white channel
    const auto bytes = WithChecksum({0x81, 0x01, 0x23, 0x61, 0x0F, 0x00, 0x00, 0x00, 0x00,
                                     0xFF, 0x0A, 0x80, 0x00});
    auto state = StateResponseParser::Parse(bytes);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->colorMode, ColorMode::White);
    EXPECT_EQ(state->warmWhite, 0xFF);
    EXPECT_EQ(state->coolWhite, 0x80);
    EXPECT_EQ(state->brightness, 100);
}

TEST(StateResponseParserTests, RgbBrightnessFallsBackToHsvValue) {
    const auto bytes = WithChecksum({0x81, 0x01, 0x23, 0x61, 0xF0, 0x00, 0x80, 0x00, 0x00,
                                     0x00, 0x0A, 0x00, 0x00});
    auto state = StateResponseParser::Parse(bytes);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->brightness, 50);
}

TEST(StateResponseParserTests, RejectsMalformedResponses) {
    auto tooShort = StateResponseParser::Parse(Hex("81 01 23"));
    ASSERT_FALSE(tooShort.has_value());
    EXPECT_TRUE(tooShort.error().Is(ParseError::TooShort));

    auto wrongMarker = StateResponseParser::Parse(
        WithChecksum({0x82, 0x01, 0x23, 0x61, 0xF0, 0x64, 0x64, 0x32, 0x10, 0x00, 0x0A, 0x00, 0x00}));
    ASSERT_FALSE(wrongMarker.has_value());
    EXPECT_TRUE(wrongMarker.error().Is(ParseError::UnexpectedMarker));

    auto corrupted = WithChecksum({0x81, 0x01, 0x23, 0x61, 0xF0, 0x64, 0x64, 0x32, 0x10,
                                   0x00, 0x0A, 0x00, 0x00});
    corrupted.back() ^= 0x01;
    auto badChecksum = StateResponseParser::Parse(corrupted);
    ASSERT_FALSE(badChecksum.has_value());
    EXPECT_TRUE(badChecksum.error().Is(ParseError::ChecksumMismatch));
}

TEST(StateResponseParserTests, DecodesLedSettings) {
    // direction 1, 60 LEDs per segment (LE), 5 segments, WS2812B, GRB
    const auto bytes = WithChecksum({0x63, 0x01, 0x3C, 0x00, 0x05, 0x04, 0x02, 0x10, 0x20});
    ASSERT_EQ(bytes.size(), kLedSettingsResponseLength);

    auto settings = StateResponseParser::ParseLedSettings(bytes);
    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->direction, 1);
    EXPECT_EQ(settings->ledCount, 60);
    EXPECT_EQ(settings->segments, 5);
    EXPECT_EQ(settings->TotalLeds(), 300u);
    EXPECT_EQ(settings->ledType, Capabilities::LedType::WS2812B);
    EXPECT_EQ(settings->colorOrder, Capabilities::ColorOrder::GRB);
    EXPECT_EQ(settings->musicPoint, 0x10);
    EXPECT_EQ(settings->musicPart, 0x20);
}

TEST(StateResponseParserTests, LedSettingsStatusPrefixIsStripped) {
    auto wrapped = WithChecksum({0x63, 0x01, 0x3C, 0x00, 0x05, 0x63, 0x09, 0x10, 0x20});
    wrapped.insert(wrapped.begin(), 0x00);

    auto payload = StateResponseParser::UnwrapNotification(wrapped);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(payload->front(), kLedSettingsMarker);

    auto settings = StateResponseParser::ParseLedSettings(*payload);
    ASSERT_TRUE(settings.has_value());
    // Unknown chip and order values degrade gracefully
    EXPECT_EQ(settings->ledType, Capabilities::LedType::Unknown);
    EXPECT_EQ(settings->rawIcType, 0x63);
    EXPECT_EQ(settings->colorOrder, Capabilities::ColorOrder::RGB);
}

TEST(StateResponseParserTests, DecodesAck) {
    auto ack = StateResponseParser::ParseAck(WithChecksum({0xF0, 0x31, 0x00}));
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(ack->command, 0x31);
    EXPECT_TRUE(ack->Succeeded());

    auto failed = StateResponseParser::ParseAck(WithChecksum({0xF0, 0x31, 0x01}));
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->Succeeded());
}

TEST(StateResponseParserTests, WrappedPayloadIsFoundByKey) {
    const auto state = Hex("81 33 24 2B 23 1D ED 00 ED 00 0A 00 0F 36");

    auto trailing = StateResponseParser::UnwrapNotification(
        AsBytes(R"({"payload":"8133242B231DED00ED000A000F36","code":0,"msg":"ok"})"));
    ASSERT_TRUE(trailing.has_value());
    EXPECT_EQ(*trailing, state);

    auto spaced = StateResponseParser::UnwrapNotification(
        AsBytes(R"({ "msg" : "ok", "payload" : "8133242b231ded00ed000a000f36", "code" : 3 })"));
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(*spaced, state);

    auto bare = StateResponseParser::UnwrapNotification(AsBytes(R"("8133242B231DED00ED000A000F36")"));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*bare, state);
}

TEST(StateResponseParserTests, WrappedNotificationWithoutPayloadIsRejected) {
    auto missing = StateResponseParser::UnwrapNotification(AsBytes(R"({"code":0,"msg":"8133"})"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ParseError::UnexpectedMarker);

    EXPECT_FALSE(StateResponseParser::UnwrapNotification(AsBytes(R"({"code":0,"payload":12})")).has_value());
    EXPECT_FALSE(StateResponseParser::UnwrapNotification(AsBytes(R"({"code":0,"payload":"81)")).has_value());
}

TEST(StateResponseParserTests, RawNotificationsPassThrough) {
    const auto raw = Hex("81 01 23");
    auto payload = StateResponseParser::UnwrapNotification(raw);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, raw);

    EXPECT_FALSE(StateResponseParser::UnwrapNotification({}).has_value());
    EXPECT_FALSE(StateResponseParser::UnwrapNotification(AsBytes(R"({"code":0,"payload":"XYZ"})")).has_value());
}

TEST(StateResponseParserTests, ClassifiesAndValidatesByMarker) {
    EXPECT_EQ(StateResponseParser::Classify(Hex("81")), ResponseKind::State);
    EXPECT_EQ(StateResponseParser::Classify(Hex("63")), ResponseKind::LedSettings);
    EXPECT_EQ(StateResponseParser::Classify(Hex("F0")), ResponseKind::Ack);
    EXPECT_EQ(StateResponseParser::Classify(Hex("11")), ResponseKind::Unknown);

    const auto ack = WithChecksum({0xF0, 0x31, 0x00});
    EXPECT_TRUE(StateResponseParser::IsStructurallyValid(ack, kAckMarker, 4));
    EXPECT_FALSE(StateResponseParser::IsStructurallyValid(ack, kStateMarker, 4));
    EXPECT_FALSE(StateResponseParser::IsStructurallyValid(ack, kAckMarker, 14));
}
