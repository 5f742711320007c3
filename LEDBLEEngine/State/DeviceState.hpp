//
// DeviceState.hpp
// LEDBLEEngine - State Layer
//
// Decoded device responses: 0x81 state, 0x63 LED settings, 0xF0 ACK
//

#pragma once

#include <cstdint>
#include <optional>

#include "../Capabilities/CapabilityTypes.hpp"

namespace LEDBLE::State {

/// Static output (from the sub-mode byte) or running effect
enum class ColorMode : uint8_t {
    Rgb,
    White,
    Effect,
    Unknown,
};

[[nodiscard]] constexpr const char* ToString(ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Rgb:     return "rgb";
        case ColorMode::White:   return "white";
        case ColorMode::Effect:  return "effect";
        case ColorMode::Unknown: return "unknown";
    }
    return "unknown";
}

struct DeviceState {
    uint8_t mode{0};
    uint8_t modeType{0};
    /// modeType in the static set; RGB/white bytes are the literal output
    bool isStatic{false};
    bool powerOn{false};

    uint8_t red{0};
    uint8_t green{0};
    uint8_t blue{0};
    uint8_t warmWhite{0};
    uint8_t coolWhite{0};

    /// 0-100
    uint8_t brightness{0};

    uint8_t subMode{0};
    ColorMode colorMode{ColorMode::Unknown};
    /// Present in effect mode
    std::optional<uint8_t> effectId;
    std::optional<uint8_t> effectSpeed;
    uint8_t ledVersion{0};
    /// Upper nibble of the sub-mode byte (wiring order on simple controllers)
    uint8_t colorOrderNibble{0};

    /// Checksum verified
    bool valid{false};

    bool operator==(const DeviceState&) const = default;
};

struct LedSettings {
    uint8_t direction{0};
    /// LEDs per segment
    uint16_t ledCount{0};
    uint8_t segments{0};
    Capabilities::LedType ledType{Capabilities::LedType::Unknown};
    uint8_t rawIcType{0};
    Capabilities::ColorOrder colorOrder{Capabilities::ColorOrder::RGB};
    uint8_t musicPoint{0};
    uint8_t musicPart{0};

    [[nodiscard]] uint32_t TotalLeds() const noexcept {
        return static_cast<uint32_t>(ledCount) * segments;
    }

    bool operator==(const LedSettings&) const = default;
};

struct AckResponse {
    uint8_t command{0};
    uint8_t status{0};

    [[nodiscard]] bool Succeeded() const noexcept { return status == 0x00; }

    bool operator==(const AckResponse&) const = default;
};

} // namespace LEDBLE::State
