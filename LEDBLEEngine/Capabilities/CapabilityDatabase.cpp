// SPDX-License-Identifier: LGPL-3.0-or-later
// Copyright (c) 2024 LEDBLE Project
//
// CapabilityDatabase.cpp - Built-in product table

#include "CapabilityDatabase.hpp"

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::Capabilities {

namespace {

using Commands::CommandTemplate;
using Commands::FieldRange;
namespace Fn = Commands::FunctionCode;

// ============================================================================
// Field ranges
// ============================================================================

constexpr FieldRange kPowerFields[] = {
    {"power", 0x23, 0x24},
};

constexpr FieldRange kColourFields[] = {
    {"r", 0, 255}, {"g", 0, 255}, {"b", 0, 255},
    {"ww", 0, 255}, {"cw", 0, 255},
    {"mode", 0x0F, 0xF0},
    {"persist", 0x0F, 0xF0},
};

constexpr FieldRange kColourV2Fields[] = {
    {"hs_hi", 0, 255}, {"hs_lo", 0, 255},
    {"bright", 0, 100},
    {"r", 0, 255}, {"g", 0, 255}, {"b", 0, 255},
};

constexpr FieldRange kWhiteFields[] = {
    {"ww", 0, 255}, {"cw", 0, 255},
    {"persist", 0x0F, 0xF0},
};

constexpr FieldRange kCctFields[] = {
    {"temp", 0, 100}, {"bright", 0, 100},
    {"duration_hi", 0, 255}, {"duration_lo", 0, 255},
};

constexpr FieldRange kSceneFields[] = {
    {"model", 37, 56},
    {"speed", 1, 31},
    {"persist", 0x0F, 0xF0},
};

constexpr FieldRange kSceneV2Fields[] = {
    {"model", 1, 255},
    {"speed", 1, 31},
    {"bright", 1, 100},
};

constexpr FieldRange kSceneV2DirectFields[] = {
    {"model", 1, 255},
    {"speed", 0, 100},
    {"bright", 0, 100},
};

constexpr FieldRange kSceneV3Fields[] = {
    {"model", 1, 255},
    {"speed", 0, 100},
    {"bright", 1, 100},
};

constexpr FieldRange kLedSettingsFields[] = {
    {"count_hi", 0, 255}, {"count_lo", 0, 255},
    {"ic_type", 0, 11},
    {"color_order", 0, 5},
};

// ============================================================================
// Global default templates
// ============================================================================

constexpr CommandTemplate kDefaultTemplates[] = {
    {Fn::kPowerV1, "71{power}0F", true, 0},
    {Fn::kPowerV2, "3B{power}00000000000000320000", true, 0},
    {Fn::kColour, "31{r}{g}{b}{ww}{cw}{mode}{persist}", true, 0},
    {Fn::kColourV2, "3BA1{hs_hi}{hs_lo}{bright}0000{r}{g}{b}0000", true, 0},
    {Fn::kWhite, "31000000{ww}{cw}0F{persist}", true, 0},
    {Fn::kCct, "35B1{temp}{bright}0000{duration_hi}{duration_lo}", true, 0},
    {Fn::kScene, "61{model}{speed}{persist}", true, 0},
    {Fn::kSceneV2, "38{model}{speed}{bright}", true, 0},
    {Fn::kSceneV3, "42{model}{speed}{bright}", true, 0},
    {Fn::kQueryState, "818A8B", true, 14},
    {Fn::kQueryLedSettings, "631221F0", true, 10},
    {Fn::kLedSettings, "62{count_hi}{count_lo}{ic_type}{color_order}000000000000F0", true, 0},
};

// ============================================================================
// Function sets
// ============================================================================

constexpr FunctionCapability kSimpleRgbFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kScene, 0, kSceneFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kSimpleRgbwFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kWhite, 0, kWhiteFields},
    {Fn::kScene, 0, kSceneFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kCctFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kWhite, 0, kWhiteFields},
    {Fn::kCct, 0, kCctFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kDimmerFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kWhite, 0, kWhiteFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kSwitchFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kSymphonyFunctions[] = {
    {Fn::kPowerV2, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kColourV2, 0, kColourV2Fields},
    {Fn::kSceneV2, 0, kSceneV2Fields},
    {Fn::kQueryState, 0, {}},
    {Fn::kQueryLedSettings, 0, {}},
    {Fn::kLedSettings, 0, kLedSettingsFields},
};

constexpr FunctionCapability kSymphonyIcFunctions[] = {
    {Fn::kPowerV2, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kColourV2, 0, kColourV2Fields},
    {Fn::kSceneV2, 0, kSceneV2Fields},
    {Fn::kSceneV3, 5, kSceneV3Fields},
    {Fn::kQueryState, 0, {}},
    {Fn::kQueryLedSettings, 0, {}},
    {Fn::kLedSettings, 0, kLedSettingsFields},
};

constexpr FunctionCapability kRingLightFunctions[] = {
    {Fn::kPowerV2, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kColourV2, 0, kColourV2Fields},
    {Fn::kSceneV2, 0, kSceneV2DirectFields},
    {Fn::kQueryState, 0, {}},
};

constexpr FunctionCapability kBackgroundStripFunctions[] = {
    {Fn::kPowerV2, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kColourV2, 0, kColourV2Fields},
    {Fn::kSceneV3, 0, kSceneV3Fields},
    {Fn::kQueryState, 0, {}},
};

// Undeclared hardware: enough to drive a probe
constexpr FunctionCapability kProbeOnlyFunctions[] = {
    {Fn::kPowerV1, 0, kPowerFields},
    {Fn::kColour, 0, kColourFields},
    {Fn::kQueryState, 0, {}},
};

// Ring lights send 0x38 effects without a trailing checksum
constexpr CommandTemplate kRingLightOverrides[] = {
    {Fn::kSceneV2, "38{model}{speed}{bright}", false, 0},
};

// ============================================================================
// Product table
// ============================================================================

constexpr CapabilityRecord SimpleRgb(uint16_t id, std::string_view name) {
    return {.productId = id, .name = name, .hasRgb = true,
            .effectType = EffectType::Simple, .effectIdMax = 56,
            .functions = kSimpleRgbFunctions};
}

constexpr CapabilityRecord SimpleRgbw(uint16_t id, std::string_view name, bool coolWhite) {
    return {.productId = id, .name = name, .hasRgb = true, .hasWarmWhite = true,
            .hasCoolWhite = coolWhite,
            .effectType = EffectType::Simple, .effectIdMax = 56,
            .functions = kSimpleRgbwFunctions};
}

constexpr CapabilityRecord Cct(uint16_t id, std::string_view name) {
    return {.productId = id, .name = name, .hasWarmWhite = true, .hasCoolWhite = true,
            .functions = kCctFunctions};
}

constexpr CapabilityRecord Dimmer(uint16_t id, std::string_view name) {
    return {.productId = id, .name = name, .hasDimmer = true, .functions = kDimmerFunctions};
}

constexpr CapabilityRecord Switch(uint16_t id, std::string_view name) {
    return {.productId = id, .name = name, .isSwitch = true, .functions = kSwitchFunctions};
}

constexpr CapabilityRecord SymphonyIc(uint16_t id, std::string_view name) {
    return {.productId = id, .name = name, .hasRgb = true, .hasSegments = true,
            .hasIcConfig = true, .effectType = EffectType::Symphony, .effectIdMax = 100,
            .functions = kSymphonyIcFunctions};
}

constexpr CapabilityRecord kBuiltinRecords[] = {
    {.productId = 0x00, .name = "RingLight_Generic", .hasRgb = true, .hasWarmWhite = true,
     .hasCoolWhite = true, .hasSegments = true, .effectType = EffectType::Addressable,
     .effectIdMax = 113, .functions = kRingLightFunctions, .overrides = kRingLightOverrides},
    SimpleRgbw(4, "Ctrl_RGBW_UFO", false),
    SimpleRgbw(6, "Ctrl_Mini_RGBW", false),
    SimpleRgbw(7, "Ctrl_Mini_RGBCW", true),
    {.productId = 8, .name = "Ctrl_Mini_RGB_Mic", .hasRgb = true, .hasSegments = true,
     .effectType = EffectType::Symphony, .effectIdMax = 44, .functions = kSymphonyFunctions},
    Cct(9, "Ctrl_Ceiling_CCT"),
    Switch(11, "Switch_1c"),
    SimpleRgbw(14, "FloorLamp_RGBCW", true),
    SimpleRgb(16, "ChristmasLight"),
    Cct(22, "Magnetic_CCT"),
    Dimmer(23, "Magnetic_Dim"),
    SimpleRgb(26, "ChristmasLight"),
    SimpleRgb(27, "SprayLight"),
    Cct(28, "TableLamp_CCT"),
    {.productId = 29, .name = "FillLight", .needsProbe = true, .functions = kProbeOnlyFunctions},
    SimpleRgbw(30, "CeilingLight_RGBCW", true),
    SimpleRgbw(32, "Ctrl_Mini_RGBW", false),
    Dimmer(33, "Bulb_Dim"),
    SimpleRgbw(37, "Ctrl_RGBCW_Both", true),
    SimpleRgbw(38, "Ctrl_Mini_RGBW", false),
    SimpleRgbw(39, "Ctrl_Mini_RGBW", false),
    SimpleRgbw(41, "MirrorLight", true),
    SimpleRgb(51, "Ctrl_Mini_RGB"),
    SimpleRgbw(53, "Bulb_RGBCW_R120", true),
    SimpleRgbw(59, "Bulb_RGBCW", true),
    Dimmer(65, "Ctrl_Dim"),
    SimpleRgbw(68, "Bulb_RGBW", false),
    SimpleRgbw(72, "Ctrl_Mini_RGBW_Mic", false),
    Cct(82, "Bulb_CCT"),
    {.productId = 83, .name = "RingLight_0x53", .hasRgb = true, .hasWarmWhite = true,
     .hasCoolWhite = true, .hasSegments = true, .effectType = EffectType::Addressable,
     .effectIdMax = 113, .functions = kRingLightFunctions, .overrides = kRingLightOverrides},
    SimpleRgbw(84, "Downlight_RGBW", false),
    {.productId = 86, .name = "RingLight_0x56", .hasRgb = true, .hasSegments = true,
     .effectType = EffectType::Symphony, .effectIdMax = 99, .functions = kBackgroundStripFunctions},
    Cct(98, "Ctrl_CCT"),
    {.productId = 128, .name = "RingLight_0x80", .hasRgb = true, .hasSegments = true,
     .effectType = EffectType::Symphony, .effectIdMax = 99, .functions = kBackgroundStripFunctions},
    Switch(147, "Switch_1C"),
    Switch(148, "Switch_1c_Watt"),
    Switch(149, "Switch_2c"),
    Switch(150, "Switch_4c"),
    Switch(151, "Socket_1c"),
    SymphonyIc(161, "Ctrl_RGB_Symphony"),
    SymphonyIc(162, "Ctrl_RGB_Symphony_new"),
    SymphonyIc(163, "Ctrl_RGB_Symphony_new"),
    SymphonyIc(164, "Ctrl_RGB_Symphony_new"),
    SymphonyIc(166, "Ctrl_RGB_Symphony_new"),
    SymphonyIc(167, "Ctrl_RGB_Symphony_new"),
    SymphonyIc(169, "Ctrl_RGB_Symphony_new"),
    {.productId = 209, .name = "Digital_Light", .hasRgb = true, .hasSegments = true,
     .effectType = EffectType::Symphony, .effectIdMax = 44, .functions = kSymphonyFunctions},
    Cct(225, "Ctrl_Ceiling"),
    Cct(226, "Ctrl_Ceiling_Assist"),
};

} // namespace

const CapabilityDatabase& CapabilityDatabase::Shared() {
    static const CapabilityDatabase instance(kBuiltinRecords, kDefaultTemplates);
    return instance;
}

const CapabilityRecord* CapabilityDatabase::Find(uint16_t productId) const {
    for (const auto& record : records_) {
        if (record.productId == productId) {
            return &record;
        }
    }
    return nullptr;
}

Result<const CapabilityRecord*> CapabilityDatabase::Lookup(uint16_t productId) const {
    if (const auto* record = Find(productId)) {
        return record;
    }
    LEDBLE_LOG_V2(Capabilities, "No record for product 0x%04x", productId);
    return LEDBLE_ERROR_RECOVERABLE(CapabilityError::UnknownProduct, "Product id not in capability table");
}

bool CapabilityDatabase::Supports(uint16_t productId,
                                  std::string_view functionCode,
                                  uint16_t firmwareVersion) const {
    const auto* record = Find(productId);
    if (!record) {
        return false;
    }
    const auto* fn = record->FindFunction(functionCode);
    return fn != nullptr && firmwareVersion >= fn->minFirmware;
}

const CommandTemplate* CapabilityDatabase::DefaultTemplate(std::string_view functionCode) const {
    for (const auto& tpl : defaults_) {
        if (tpl.functionCode == functionCode) {
            return &tpl;
        }
    }
    return nullptr;
}

Result<CommandTemplate> CapabilityDatabase::ResolveTemplate(uint16_t productId,
                                                            std::string_view functionCode) const {
    if (const auto* record = Find(productId)) {
        if (const auto* overrideTpl = record->FindOverride(functionCode)) {
            LEDBLE_LOG_V3(Capabilities, "Product 0x%04x: override template for %.*s",
                          productId, static_cast<int>(functionCode.size()), functionCode.data());
            return *overrideTpl;
        }
    }
    if (const auto* tpl = DefaultTemplate(functionCode)) {
        return *tpl;
    }
    LEDBLE_LOG_V1(Capabilities, "No template for function %.*s (product 0x%04x)",
                  static_cast<int>(functionCode.size()), functionCode.data(), productId);
    return LEDBLE_ERROR_FATAL(TemplateError::UnknownFunction, "No template for function code");
}

std::span<const FieldRange> CapabilityDatabase::FieldsFor(uint16_t productId,
                                                          std::string_view functionCode) const {
    if (const auto* record = Find(productId)) {
        if (const auto* fn = record->FindFunction(functionCode)) {
            return fn->fields;
        }
    }
    return {};
}

std::optional<std::string_view> CapabilityDatabase::BestFunction(
    uint16_t productId,
    uint16_t firmwareVersion,
    std::span<const std::string_view> preferences) const {
    for (const auto code : preferences) {
        if (Supports(productId, code, firmwareVersion)) {
            return code;
        }
    }
    return std::nullopt;
}

Result<DeviceCapabilities> CapabilityDatabase::DeclaredCapabilities(uint16_t productId) const {
    const auto* record = Find(productId);
    if (!record) {
        return LEDBLE_ERROR_RECOVERABLE(CapabilityError::UnknownProduct, "Product id not in capability table");
    }
    if (record->needsProbe) {
        LEDBLE_LOG_V2(Capabilities, "Product 0x%04x (%.*s) declares no channel set",
                      productId, static_cast<int>(record->name.size()), record->name.data());
        return LEDBLE_ERROR_RECOVERABLE(CapabilityError::UnknownProduct, "Product channel set must be probed");
    }

    DeviceCapabilities caps{};
    caps.hasRgb = record->hasRgb;
    caps.hasWarmWhite = record->hasWarmWhite;
    caps.hasCoolWhite = record->hasCoolWhite;
    caps.effectType = record->effectType;
    caps.hasEffects = record->effectType != EffectType::None;
    caps.effectIdMax = record->effectIdMax;
    caps.provenance = Provenance::Declared;
    return caps;
}

} // namespace LEDBLE::Capabilities
