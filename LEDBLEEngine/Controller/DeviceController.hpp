//
// DeviceController.hpp
// LEDBLEEngine - Controller Layer
//
// Logical intents for one device: renders commands from the capability
// table, submits them through the session and decodes responses
//

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "../Advertisement/DeviceIdentity.hpp"
#include "../Capabilities/CapabilityDatabase.hpp"
#include "../Capabilities/ICapabilityCache.hpp"
#include "../Commands/CommandBuilder.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Core/Error.hpp"
#include "../Probe/CapabilityProbe.hpp"
#include "../Session/DeviceSession.hpp"
#include "../State/DeviceState.hpp"

namespace LEDBLE::Controller {

using CommandCompletion = std::function<void(Result<void>)>;
using StateCompletion = std::function<void(Result<State::DeviceState>)>;
using LedSettingsCompletion = std::function<void(Result<State::LedSettings>)>;
using CapabilitiesCompletion = std::function<void(Result<Capabilities::DeviceCapabilities>)>;

/// Last output the controller asked for (or read back), used to rescale
/// brightness without losing the colour
struct OutputModel {
    enum class Kind : uint8_t { None, Rgb, White, Effect };

    Kind kind{Kind::None};
    uint8_t red{0};
    uint8_t green{0};
    uint8_t blue{0};
    uint8_t warmWhite{0};
    uint8_t coolWhite{0};
    uint8_t effectId{0};
    uint8_t effectSpeedPercent{50};
    /// 0-255
    uint8_t brightness{255};
};

/// DeviceController - intent surface for one controller
///
/// Function selection per intent is data driven: the preferred function that
/// the product declares for its firmware wins (power: switch_led_v2 over
/// switch_led_v1; effects: scene_data_v3, scene_data_v2, scene_data). Unknown
/// products fall back to the universal forms (0x71 power, 0x31 colour).
///
/// Parse and template errors reject the single intent and leave the device
/// untouched; transport errors are passed through verbatim. Nothing is retried.
///
/// All completions run outside the controller lock, on whatever thread the
/// session completes on.
class DeviceController {
public:
    DeviceController(const Advertisement::DeviceIdentity& identity,
                     Session::DeviceSession& session,
                     Transport::IScheduler& scheduler,
                     Capabilities::ICapabilityCache& cache,
                     const Capabilities::CapabilityDatabase& database = Capabilities::CapabilityDatabase::Shared(),
                     const ProbeConfig& probeConfig = {});

    DeviceController(const DeviceController&) = delete;
    DeviceController& operator=(const DeviceController&) = delete;

    /// Open the session using the advertised address and framing
    void Connect(Session::OpenCompletion completion);

    void SetPower(bool on, CommandCompletion completion);

    /// 0x31 with mode 0x5A (RGB and white groups applied together). Pure RGB on
    /// products declaring colour_data_v2 goes out as the 0x3B HSV form instead.
    void SetRgbww(uint8_t r, uint8_t g, uint8_t b, uint8_t ww, uint8_t cw,
                  bool persist, CommandCompletion completion);

    /// 0-255; rescales the last known output. 0 switches the device off.
    void SetBrightness(uint8_t level, CommandCompletion completion);

    /// speed and brightness 0-100
    void SetEffect(uint8_t effectId, uint8_t speedPercent, uint8_t brightnessPercent,
                   CommandCompletion completion);

    /// 2700-6500 K (clamped); brightness 0-100
    void SetColorTemperature(uint16_t kelvin, uint8_t brightnessPercent, CommandCompletion completion);

    /// Addressable strip configuration (products declaring led_settings)
    void SetLedSettings(uint16_t ledCount, Capabilities::LedType ledType,
                        Capabilities::ColorOrder colorOrder, CommandCompletion completion);

    void QueryState(StateCompletion completion);

    void QueryLedSettings(LedSettingsCompletion completion);

    /// Cache, then declared table, then probe. forceProbe invalidates the
    /// cache entry and always probes. Probe results are saved to the cache.
    void ResolveCapabilities(bool forceProbe, CapabilitiesCompletion completion);

    [[nodiscard]] const Advertisement::DeviceIdentity& Identity() const { return identity_; }
    [[nodiscard]] std::optional<Capabilities::DeviceCapabilities> ResolvedCapabilities() const;
    [[nodiscard]] std::optional<State::DeviceState> LastState() const;
    [[nodiscard]] OutputModel CurrentOutput() const;

private:
    /// Render a function for this product and submit it fire-and-forget
    void SendCommand(std::string_view functionCode,
                     const Commands::CommandParams& params,
                     CommandCompletion completion,
                     std::function<void()> onSuccess = nullptr);

    std::string_view PowerFunction() const;
    std::string_view ColourFunction() const;
    void SendRgb(uint8_t r, uint8_t g, uint8_t b, uint8_t brightnessPercent,
                 CommandCompletion completion, std::function<void()> onSuccess);
    std::optional<std::string_view> EffectFunction() const;
    Capabilities::EffectType EffectFamily() const;

    void AdoptState(const State::DeviceState& state);
    void AdoptCapabilities(const Capabilities::DeviceCapabilities& caps, CapabilitiesCompletion completion);

    /// Fill strip details for products with IC configuration
    void EnrichWithLedSettings(Capabilities::DeviceCapabilities caps, CapabilitiesCompletion completion);

    const Advertisement::DeviceIdentity identity_;
    Session::DeviceSession& session_;
    Capabilities::ICapabilityCache& cache_;
    const Capabilities::CapabilityDatabase& database_;
    Probe::CapabilityProbe probe_;

    mutable std::mutex lock_;
    std::optional<Capabilities::DeviceCapabilities> capabilities_;
    std::optional<State::DeviceState> lastState_;
    OutputModel output_;
};

} // namespace LEDBLE::Controller
