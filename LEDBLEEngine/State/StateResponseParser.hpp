//
// StateResponseParser.hpp
// LEDBLEEngine - State Layer
//
// Decodes reassembled notification payloads
//

#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "DeviceState.hpp"
#include "../Common/ByteUtils.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::State {

/// 0x81 state response (14 bytes)
///
///  0   0x81 marker
///  1   mode
///  2   power (0x23 on)
///  3   mode type (0x61-0x63 static, anything else effect)
///  4   sub-mode: 0xF0/0x01/0x0B RGB, 0x0F white, effect id in effect mode;
///      upper nibble carries colour order on simple controllers
///  5   value (brightness 0-100)
///  6-8 RGB; in effect mode 6 = brightness 0-100, 7 = speed
///  9   warm white
///  10  LED controller version
///  11  cool white
///  12  reserved
///  13  checksum
namespace StateOffsets {
inline constexpr size_t kMarker = 0;
inline constexpr size_t kMode = 1;
inline constexpr size_t kPower = 2;
inline constexpr size_t kModeType = 3;
inline constexpr size_t kSubMode = 4;
inline constexpr size_t kValue = 5;
inline constexpr size_t kRed = 6;
inline constexpr size_t kGreen = 7;
inline constexpr size_t kBlue = 8;
inline constexpr size_t kWarmWhite = 9;
inline constexpr size_t kLedVersion = 10;
inline constexpr size_t kCoolWhite = 11;
inline constexpr size_t kEffectBrightness = kRed;
inline constexpr size_t kEffectSpeed = kGreen;
} // namespace StateOffsets

inline constexpr uint8_t kStateMarker = 0x81;
inline constexpr uint8_t kLedSettingsMarker = 0x63;
inline constexpr uint8_t kAckMarker = 0xF0;

inline constexpr size_t kStateResponseLength = 14;
inline constexpr size_t kLedSettingsResponseLength = 10;
inline constexpr size_t kAckResponseLength = 4;

inline constexpr uint8_t kPowerOnValue = 0x23;

inline constexpr std::array<uint8_t, 3> kStaticModeTypes{0x61, 0x62, 0x63};

[[nodiscard]] constexpr bool IsStaticModeType(uint8_t modeType) noexcept {
    for (uint8_t t : kStaticModeTypes) {
        if (t == modeType) {
            return true;
        }
    }
    return false;
}

/// Which parser a payload belongs to, by marker byte
enum class ResponseKind : uint8_t {
    State,
    LedSettings,
    Ack,
    Unknown,
};

class StateResponseParser {
public:
    /// TooShort below 14 bytes, UnexpectedMarker without 0x81,
    /// ChecksumMismatch when the last byte is not the sum of the others
    [[nodiscard]] static Result<DeviceState> Parse(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<LedSettings> ParseLedSettings(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<AckResponse> ParseAck(std::span<const uint8_t> bytes);

    /// Strip notification wrappers: JSON text {"code":0,"payload":"<hex>"}
    /// (hex between the last pair of quotes) and the 0x00 status prefix in
    /// front of LED settings. Raw payloads pass through unchanged.
    [[nodiscard]] static Result<Bytes::Buffer> UnwrapNotification(std::span<const uint8_t> bytes);

    [[nodiscard]] static ResponseKind Classify(std::span<const uint8_t> bytes) noexcept;

    /// Marker present and trailing checksum valid
    [[nodiscard]] static bool IsStructurallyValid(std::span<const uint8_t> bytes,
                                                  uint8_t marker,
                                                  size_t minLength) noexcept;

private:
    static uint8_t DeriveBrightness(const DeviceState& state, uint8_t valueByte);
};

} // namespace LEDBLE::State
