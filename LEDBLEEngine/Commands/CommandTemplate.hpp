//
// CommandTemplate.hpp
// LEDBLEEngine - Command Layer
//
// Declarative command forms: a hex-digit string with {named} placeholders
//

#pragma once

#include <cstdint>
#include <string_view>

namespace LEDBLE::Commands {

/// Declared range for one template field
struct FieldRange {
    std::string_view name;
    int32_t min{0};
    int32_t max{255};
    int32_t step{1};

    [[nodiscard]] constexpr bool Accepts(int32_t value) const noexcept {
        if (value < min || value > max) {
            return false;
        }
        return step <= 1 || ((value - min) % step) == 0;
    }
};

/// One renderable command.
///
/// `form` is hex digits plus `{name}` placeholders, e.g.
/// "31{r}{g}{b}{ww}{cw}{mode}{persist}". Each placeholder renders as one byte.
struct CommandTemplate {
    std::string_view functionCode;
    std::string_view form;
    bool needsChecksum{false};
    /// Length of the expected response payload, 0 for fire-and-forget
    uint8_t responseLength{0};

    [[nodiscard]] constexpr bool ExpectsResponse() const noexcept { return responseLength != 0; }
};

// Function codes known to the engine
namespace FunctionCode {
inline constexpr std::string_view kPowerV1 = "switch_led_v1";
inline constexpr std::string_view kPowerV2 = "switch_led_v2";
inline constexpr std::string_view kColour = "colour_data";
inline constexpr std::string_view kColourV2 = "colour_data_v2";
inline constexpr std::string_view kWhite = "white_data";
inline constexpr std::string_view kCct = "cct_data";
inline constexpr std::string_view kScene = "scene_data";
inline constexpr std::string_view kSceneV2 = "scene_data_v2";
inline constexpr std::string_view kSceneV3 = "scene_data_v3";
inline constexpr std::string_view kQueryState = "query_state";
inline constexpr std::string_view kQueryLedSettings = "query_led_settings";
inline constexpr std::string_view kLedSettings = "led_settings";
} // namespace FunctionCode

} // namespace LEDBLE::Commands
