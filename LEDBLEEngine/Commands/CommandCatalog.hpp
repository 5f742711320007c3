//
// CommandCatalog.hpp
// LEDBLEEngine - Command Layer
//
// Typed parameter sets for the command families plus the colour math the
// intents need (HSV packing, kelvin split, effect speed scales)
//

#pragma once

#include <cstdint>
#include <string_view>

#include "CommandBuilder.hpp"
#include "../Capabilities/CapabilityTypes.hpp"

namespace LEDBLE::Commands {

/// 0x31 mode byte: which channel group the device applies
enum class ColorMode : uint8_t {
    Rgb = 0xF0,
    White = 0x0F,
    All = 0x5A,
};

inline constexpr uint8_t kPersist = 0xF0;
inline constexpr uint8_t kNoPersist = 0x0F;

inline constexpr uint16_t kMinKelvin = 2700;
inline constexpr uint16_t kMaxKelvin = 6500;

struct Hsv {
    uint16_t hue{0};         // 0-360
    uint8_t saturation{0};   // 0-100
    uint8_t value{0};        // 0-100
};

struct WhiteLevels {
    uint8_t warm{0};
    uint8_t cool{0};
};

/// RGB (0-255) to integer HSV, components truncated
[[nodiscard]] Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b);

/// (hue << 7) | saturation, as carried by the 0x3B colour form
[[nodiscard]] constexpr uint16_t HsvPack(uint16_t hue, uint8_t saturation) noexcept {
    return static_cast<uint16_t>((hue << 7) | (saturation & 0x7F));
}

/// Split a colour temperature (clamped to 2700-6500 K) across warm/cool channels
[[nodiscard]] WhiteLevels KelvinToWhite(uint16_t kelvin, uint8_t brightness);

/// Kelvin to the 0-100 "warmth" scale of the 0x35 form (0 = coolest)
[[nodiscard]] uint8_t KelvinToTemperaturePercent(uint16_t kelvin);

/// 0-100 speed to the byte a given effect function expects:
///   scene_data      inverted 1-31 (1 fastest)
///   scene_data_v2   1-31 (31 fastest); addressable products take 0-100 direct
///   scene_data_v3   0-100 direct
[[nodiscard]] uint8_t EffectSpeedByte(std::string_view functionCode,
                                      Capabilities::EffectType effectType,
                                      uint8_t speedPercent);

/// Speed byte from a state response back to 0-100. Simple controllers report
/// the inverted 1-31 scale; everything else reports 0-100.
[[nodiscard]] uint8_t ReportedSpeedPercent(Capabilities::EffectType effectType, uint8_t speedByte);

namespace Catalog {

[[nodiscard]] CommandParams Power(bool on);

[[nodiscard]] CommandParams Color(uint8_t r, uint8_t g, uint8_t b,
                                  uint8_t ww, uint8_t cw,
                                  ColorMode mode, bool persist);

[[nodiscard]] CommandParams ColorHsv(uint8_t r, uint8_t g, uint8_t b, uint8_t brightnessPercent);

[[nodiscard]] CommandParams White(uint8_t ww, uint8_t cw, bool persist);

[[nodiscard]] CommandParams Cct(uint8_t temperaturePercent,
                                uint8_t brightnessPercent,
                                uint16_t durationMs = 300);

/// Parameters for scene_data / scene_data_v2 / scene_data_v3
[[nodiscard]] CommandParams Effect(std::string_view functionCode,
                                   Capabilities::EffectType effectType,
                                   uint8_t effectId,
                                   uint8_t speedPercent,
                                   uint8_t brightnessPercent,
                                   bool persist = false);

[[nodiscard]] CommandParams LedSettings(uint16_t ledCount,
                                        Capabilities::LedType ledType,
                                        Capabilities::ColorOrder colorOrder);

} // namespace Catalog

} // namespace LEDBLE::Commands
