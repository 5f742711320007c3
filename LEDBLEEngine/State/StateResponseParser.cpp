//
// StateResponseParser.cpp
// LEDBLEEngine - State Layer
//

#include "StateResponseParser.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

#include <cJSON.h>

#include "../Commands/CommandCatalog.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::State {

namespace {
constexpr uint8_t kPercentMax = 100;

// Sub-mode values selecting static output
constexpr uint8_t kSubModeRgb = 0xF0;
constexpr uint8_t kSubModeRgbAlt = 0x01;
constexpr uint8_t kSubModeRgbLegacy = 0x0B;
constexpr uint8_t kSubModeWhite = 0x0F;

constexpr uint8_t kLedSettingsStatusPrefix = 0x00;

struct JsonDeleter {
    void operator()(cJSON* json) const { cJSON_Delete(json); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

ColorMode ClassifyStaticSubMode(uint8_t subMode) {
    switch (subMode) {
        case kSubModeRgb:
        case kSubModeRgbAlt:
        case kSubModeRgbLegacy:
            return ColorMode::Rgb;
        case kSubModeWhite:
            return ColorMode::White;
        default:
            return ColorMode::Unknown;
    }
}

uint8_t ScaleToPercent(uint8_t value) {
    return static_cast<uint8_t>(value * kPercentMax / 255);
}
} // namespace

bool StateResponseParser::IsStructurallyValid(std::span<const uint8_t> bytes,
                                              uint8_t marker,
                                              size_t minLength) noexcept {
    return bytes.size() >= minLength && !bytes.empty() && bytes[0] == marker &&
           Bytes::HasValidTrailingChecksum(bytes);
}

ResponseKind StateResponseParser::Classify(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) {
        return ResponseKind::Unknown;
    }
    switch (bytes[0]) {
        case kStateMarker:       return ResponseKind::State;
        case kLedSettingsMarker: return ResponseKind::LedSettings;
        case kAckMarker:         return ResponseKind::Ack;
        default:                 return ResponseKind::Unknown;
    }
}

uint8_t StateResponseParser::DeriveBrightness(const DeviceState& state, uint8_t valueByte) {
    if (!state.isStatic) {
        return std::min<uint8_t>(state.red, kPercentMax);
    }
    if (valueByte != 0) {
        return std::min<uint8_t>(valueByte, kPercentMax);
    }
    if (state.colorMode == ColorMode::White) {
        return ScaleToPercent(std::max(state.warmWhite, state.coolWhite));
    }
    return Commands::RgbToHsv(state.red, state.green, state.blue).value;
}

Result<DeviceState> StateResponseParser::Parse(std::span<const uint8_t> bytes) {
    using namespace StateOffsets;

    if (bytes.size() < kStateResponseLength) {
        LEDBLE_LOG_V2(State, "State response too short: %zu bytes", bytes.size());
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "State response shorter than 14 bytes");
    }
    if (bytes[kMarker] != kStateMarker) {
        LEDBLE_LOG_V2(State, "State response marker 0x%02x", bytes[kMarker]);
        return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "State response marker is not 0x81");
    }
    if (!Bytes::HasValidTrailingChecksum(bytes)) {
        LEDBLE_LOG_V1(State, "State response checksum mismatch: got 0x%02x want 0x%02x",
                      bytes.back(), Bytes::Checksum(bytes.first(bytes.size() - 1)));
        return LEDBLE_ERROR_FATAL(ParseError::ChecksumMismatch, "State response checksum mismatch");
    }

    DeviceState state{};
    state.mode = bytes[kMode];
    state.powerOn = bytes[kPower] == kPowerOnValue;
    state.modeType = bytes[kModeType];
    state.isStatic = IsStaticModeType(state.modeType);
    state.subMode = bytes[kSubMode];
    state.colorOrderNibble = static_cast<uint8_t>((state.subMode & 0xF0) >> 4);
    state.red = bytes[kRed];
    state.green = bytes[kGreen];
    state.blue = bytes[kBlue];
    state.warmWhite = bytes[kWarmWhite];
    state.ledVersion = bytes[kLedVersion];
    state.coolWhite = bytes[kCoolWhite];

    if (state.isStatic) {
        state.colorMode = ClassifyStaticSubMode(state.subMode);
    } else {
        state.colorMode = ColorMode::Effect;
        state.effectId = state.subMode;
        state.effectSpeed = bytes[kEffectSpeed];
    }

    state.brightness = DeriveBrightness(state, bytes[kValue]);
    state.valid = true;

    LEDBLE_LOG_V3(State, "State: power=%d modeType=0x%02x (%s) sub=0x%02x rgb=%u,%u,%u ww=%u cw=%u bright=%u",
                  state.powerOn, state.modeType, ToString(state.colorMode), state.subMode,
                  state.red, state.green, state.blue, state.warmWhite, state.coolWhite,
                  state.brightness);
    return state;
}

Result<LedSettings> StateResponseParser::ParseLedSettings(std::span<const uint8_t> bytes) {
    if (bytes.size() < kLedSettingsResponseLength) {
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "LED settings response shorter than 10 bytes");
    }
    if (bytes[0] != kLedSettingsMarker) {
        return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "LED settings marker is not 0x63");
    }
    if (!Bytes::HasValidTrailingChecksum(bytes)) {
        LEDBLE_LOG_V1(State, "LED settings checksum mismatch");
        return LEDBLE_ERROR_FATAL(ParseError::ChecksumMismatch, "LED settings checksum mismatch");
    }

    LedSettings settings{};
    settings.direction = bytes[1];
    settings.ledCount = Bytes::ReadLE16(bytes, 2);
    settings.segments = bytes[4];
    settings.rawIcType = bytes[5];
    settings.ledType = bytes[5] <= static_cast<uint8_t>(Capabilities::LedType::UCS2904B)
                           ? static_cast<Capabilities::LedType>(bytes[5])
                           : Capabilities::LedType::Unknown;
    if (bytes[6] <= static_cast<uint8_t>(Capabilities::ColorOrder::BGR)) {
        settings.colorOrder = static_cast<Capabilities::ColorOrder>(bytes[6]);
    } else {
        LEDBLE_LOG_V1(State, "LED settings colour order %u out of range, keeping RGB", bytes[6]);
    }
    settings.musicPoint = bytes[7];
    settings.musicPart = bytes[8];

    LEDBLE_LOG_V3(State, "LED settings: count=%u segments=%u ic=%u order=%u dir=%u",
                  settings.ledCount, settings.segments, settings.rawIcType,
                  static_cast<unsigned>(settings.colorOrder), settings.direction);
    return settings;
}

Result<AckResponse> StateResponseParser::ParseAck(std::span<const uint8_t> bytes) {
    if (bytes.size() < kAckResponseLength) {
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "ACK shorter than 4 bytes");
    }
    if (bytes[0] != kAckMarker) {
        return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "ACK marker is not 0xF0");
    }
    if (!Bytes::HasValidTrailingChecksum(bytes)) {
        return LEDBLE_ERROR_FATAL(ParseError::ChecksumMismatch, "ACK checksum mismatch");
    }

    AckResponse ack{bytes[1], bytes[2]};
    if (!ack.Succeeded()) {
        LEDBLE_LOG_V1(State, "ACK for 0x%02x reports status 0x%02x", ack.command, ack.status);
    }
    return ack;
}

Result<Bytes::Buffer> StateResponseParser::UnwrapNotification(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "Empty notification");
    }

    if (bytes[0] == '{' || bytes[0] == '"') {
        // {"code":N,"payload":"<hex>"} or a bare "<hex>" string
        const std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        JsonPtr root(cJSON_Parse(text.c_str()));
        if (!root) {
            LEDBLE_LOG_V2(State, "Text notification is not valid JSON");
            return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "Text notification is not valid JSON");
        }

        const cJSON* payloadItem = root.get();
        if (cJSON_IsObject(root.get())) {
            const cJSON* code = cJSON_GetObjectItemCaseSensitive(root.get(), "code");
            if (cJSON_IsNumber(code) && code->valueint != 0) {
                LEDBLE_LOG_V1(State, "Wrapped notification reports code %d", code->valueint);
            }
            payloadItem = cJSON_GetObjectItemCaseSensitive(root.get(), "payload");
        }
        if (!cJSON_IsString(payloadItem) || payloadItem->valuestring == nullptr) {
            return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "Wrapped notification has no payload string");
        }

        Bytes::Buffer payload;
        if (!Bytes::FromHex(payloadItem->valuestring, payload) || payload.empty()) {
            LEDBLE_LOG_V2(State, "Wrapped notification payload is not hex");
            return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "Wrapped notification payload is not hex");
        }
        LEDBLE_LOG_V4(State, "Unwrapped %zu-byte payload from text notification", payload.size());
        return payload;
    }

    if (bytes.size() >= 2 && bytes[0] == kLedSettingsStatusPrefix && bytes[1] == kLedSettingsMarker) {
        return Bytes::Buffer(bytes.begin() + 1, bytes.end());
    }

    return Bytes::Buffer(bytes.begin(), bytes.end());
}

} // namespace LEDBLE::State
