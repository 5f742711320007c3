// SPDX-License-Identifier: LGPL-3.0-or-later
// Copyright (c) 2024 LEDBLE Project
//
// CapabilityTypes.hpp - Declared (per product) and resolved (per device) capabilities

#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "../Commands/CommandTemplate.hpp"

namespace LEDBLE::Capabilities {

/// Effect command family a product speaks
enum class EffectType : uint8_t {
    None = 0,
    Simple,       // 0x61, ids 37-56
    Symphony,     // 0x38 / 0x42, scene ids
    Addressable,  // 0x38 without checksum
};

/// Wiring order of the colour channels
enum class ColorOrder : uint8_t {
    RGB = 0,
    RBG = 1,
    GRB = 2,
    GBR = 3,
    BRG = 4,
    BGR = 5,
};

/// Addressable LED chip
enum class LedType : uint8_t {
    Unknown = 0,
    UCS1903 = 1,
    SM16703 = 2,
    WS2811 = 3,
    WS2812B = 4,
    SK6812 = 5,
    INK1003 = 6,
    WS2801 = 7,
    WS2815 = 8,
    APA102 = 9,
    TM1914 = 10,
    UCS2904B = 11,
};

/// Where a DeviceCapabilities value came from
enum class Provenance : uint8_t {
    Declared,
    Probed,
    Overridden,
    Assumed,    // probe got no baseline; channels guessed, never cached
};

[[nodiscard]] constexpr const char* ToString(Provenance provenance) noexcept {
    switch (provenance) {
        case Provenance::Declared:   return "declared";
        case Provenance::Probed:     return "probed";
        case Provenance::Overridden: return "overridden";
        case Provenance::Assumed:    return "assumed";
    }
    return "unknown";
}

/// One declared function with its firmware gate and field ranges
struct FunctionCapability {
    std::string_view code;
    uint16_t minFirmware{0};
    std::span<const Commands::FieldRange> fields{};

    [[nodiscard]] constexpr const Commands::FieldRange* FindField(std::string_view name) const noexcept {
        for (const auto& field : fields) {
            if (field.name == name) {
                return &field;
            }
        }
        return nullptr;
    }
};

/// Static record for one product identifier. Immutable after load.
struct CapabilityRecord {
    uint16_t productId{0};
    std::string_view name{};

    bool hasRgb{false};
    bool hasWarmWhite{false};
    bool hasCoolWhite{false};
    bool isSwitch{false};
    bool hasDimmer{false};
    bool hasSegments{false};
    bool hasIcConfig{false};
    /// Channel set is not declared; the device must be probed
    bool needsProbe{false};

    EffectType effectType{EffectType::None};
    uint8_t effectIdMax{0};

    std::span<const FunctionCapability> functions{};
    std::span<const Commands::CommandTemplate> overrides{};

    [[nodiscard]] constexpr const FunctionCapability* FindFunction(std::string_view code) const noexcept {
        for (const auto& fn : functions) {
            if (fn.code == code) {
                return &fn;
            }
        }
        return nullptr;
    }

    [[nodiscard]] constexpr const Commands::CommandTemplate* FindOverride(std::string_view code) const noexcept {
        for (const auto& tpl : overrides) {
            if (tpl.functionCode == code) {
                return &tpl;
            }
        }
        return nullptr;
    }
};

/// Resolved capabilities for one physical device.
/// Once provenance is Probed the value is authoritative until the host
/// invalidates it.
struct DeviceCapabilities {
    bool hasRgb{false};
    bool hasWarmWhite{false};
    bool hasCoolWhite{false};
    bool hasEffects{false};
    uint8_t effectIdMax{0};
    EffectType effectType{EffectType::None};
    ColorOrder colorOrder{ColorOrder::RGB};
    LedType ledType{LedType::Unknown};
    uint16_t ledCount{0};
    uint8_t segments{0};
    Provenance provenance{Provenance::Declared};

    bool operator==(const DeviceCapabilities&) const = default;
};

} // namespace LEDBLE::Capabilities
