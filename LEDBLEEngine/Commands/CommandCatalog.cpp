//
// CommandCatalog.cpp
// LEDBLEEngine - Command Layer
//

#include "CommandCatalog.hpp"

#include <algorithm>
#include <cmath>

namespace LEDBLE::Commands {

using Capabilities::EffectType;

Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b) {
    const double rf = r / 255.0;
    const double gf = g / 255.0;
    const double bf = b / 255.0;
    const double maxc = std::max({rf, gf, bf});
    const double minc = std::min({rf, gf, bf});
    const double delta = maxc - minc;

    Hsv hsv{};
    hsv.value = static_cast<uint8_t>(maxc * 100.0);
    if (maxc <= 0.0 || delta <= 0.0) {
        return hsv;
    }
    hsv.saturation = static_cast<uint8_t>((delta / maxc) * 100.0);

    double hue = 0.0;
    if (maxc == rf) {
        hue = std::fmod((gf - bf) / delta, 6.0);
    } else if (maxc == gf) {
        hue = (bf - rf) / delta + 2.0;
    } else {
        hue = (rf - gf) / delta + 4.0;
    }
    hue /= 6.0;
    if (hue < 0.0) {
        hue += 1.0;
    }
    hsv.hue = static_cast<uint16_t>(hue * 360.0);
    return hsv;
}

WhiteLevels KelvinToWhite(uint16_t kelvin, uint8_t brightness) {
    const uint16_t k = std::clamp(kelvin, kMinKelvin, kMaxKelvin);
    const double coolRatio = static_cast<double>(k - kMinKelvin) / (kMaxKelvin - kMinKelvin);
    const double warmRatio = 1.0 - coolRatio;
    return WhiteLevels{
        .warm = static_cast<uint8_t>(warmRatio * brightness),
        .cool = static_cast<uint8_t>(coolRatio * brightness),
    };
}

uint8_t KelvinToTemperaturePercent(uint16_t kelvin) {
    const uint16_t k = std::clamp(kelvin, kMinKelvin, kMaxKelvin);
    return static_cast<uint8_t>((kMaxKelvin - k) * 100 / (kMaxKelvin - kMinKelvin));
}

uint8_t EffectSpeedByte(std::string_view functionCode, EffectType effectType, uint8_t speedPercent) {
    const int pct = std::min<int>(speedPercent, 100);

    if (functionCode == FunctionCode::kScene) {
        const int inverted = 1 + static_cast<int>(30.0 * (1.0 - pct / 100.0));
        return static_cast<uint8_t>(std::clamp(inverted, 1, 31));
    }
    if (functionCode == FunctionCode::kSceneV2 && effectType != EffectType::Addressable) {
        const int scaled = 1 + static_cast<int>(std::lround(pct * 30.0 / 100.0));
        return static_cast<uint8_t>(std::clamp(scaled, 1, 31));
    }
    return static_cast<uint8_t>(pct);
}

uint8_t ReportedSpeedPercent(EffectType effectType, uint8_t speedByte) {
    if (effectType == EffectType::Simple && speedByte >= 1 && speedByte <= 31) {
        return static_cast<uint8_t>((31 - speedByte) * 100 / 30);
    }
    return std::min<uint8_t>(speedByte, 100);
}

namespace Catalog {

CommandParams Power(bool on) {
    return {{"power", on ? 0x23 : 0x24}};
}

CommandParams Color(uint8_t r, uint8_t g, uint8_t b,
                    uint8_t ww, uint8_t cw,
                    ColorMode mode, bool persist) {
    return {
        {"r", r}, {"g", g}, {"b", b},
        {"ww", ww}, {"cw", cw},
        {"mode", static_cast<uint8_t>(mode)},
        {"persist", persist ? kPersist : kNoPersist},
    };
}

CommandParams ColorHsv(uint8_t r, uint8_t g, uint8_t b, uint8_t brightnessPercent) {
    const Hsv hsv = RgbToHsv(r, g, b);
    const uint16_t packed = HsvPack(hsv.hue, hsv.saturation);
    return {
        {"hs_hi", (packed >> 8) & 0xFF},
        {"hs_lo", packed & 0xFF},
        {"bright", std::min<int>(brightnessPercent, 100)},
        {"r", r}, {"g", g}, {"b", b},
    };
}

CommandParams White(uint8_t ww, uint8_t cw, bool persist) {
    return {
        {"ww", ww}, {"cw", cw},
        {"persist", persist ? kPersist : kNoPersist},
    };
}

CommandParams Cct(uint8_t temperaturePercent, uint8_t brightnessPercent, uint16_t durationMs) {
    // Duration travels in tenths of a second
    const int duration = durationMs / 100;
    return {
        {"temp", std::min<int>(temperaturePercent, 100)},
        {"bright", std::min<int>(brightnessPercent, 100)},
        {"duration_hi", (duration >> 8) & 0xFF},
        {"duration_lo", duration & 0xFF},
    };
}

CommandParams Effect(std::string_view functionCode,
                     EffectType effectType,
                     uint8_t effectId,
                     uint8_t speedPercent,
                     uint8_t brightnessPercent,
                     bool persist) {
    CommandParams params{
        {"model", effectId},
        {"speed", EffectSpeedByte(functionCode, effectType, speedPercent)},
    };
    if (functionCode == FunctionCode::kScene) {
        params.emplace("persist", persist ? kPersist : kNoPersist);
        return params;
    }

    // Brightness 0 switches symphony devices off; only addressable ones accept it
    const int minBright = effectType == EffectType::Addressable ? 0 : 1;
    params.emplace("bright", std::clamp<int>(brightnessPercent, minBright, 100));
    return params;
}

CommandParams LedSettings(uint16_t ledCount,
                          Capabilities::LedType ledType,
                          Capabilities::ColorOrder colorOrder) {
    return {
        {"count_hi", (ledCount >> 8) & 0xFF},
        {"count_lo", ledCount & 0xFF},
        {"ic_type", static_cast<uint8_t>(ledType)},
        {"color_order", static_cast<uint8_t>(colorOrder)},
    };
}

} // namespace Catalog

} // namespace LEDBLE::Commands
