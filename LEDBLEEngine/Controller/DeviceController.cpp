//
// DeviceController.cpp
// LEDBLEEngine - Controller Layer
//

#include "DeviceController.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>

#include "../Commands/CommandBuilder.hpp"
#include "../Commands/CommandCatalog.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"
#include "../State/StateResponseParser.hpp"

namespace LEDBLE::Controller {

using Commands::CommandBuilder;
using Session::SessionRequest;
namespace Catalog = Commands::Catalog;
namespace Fn = Commands::FunctionCode;

namespace {

constexpr std::array<std::string_view, 2> kPowerPreference{Fn::kPowerV2, Fn::kPowerV1};
constexpr std::array<std::string_view, 2> kColourPreference{Fn::kColourV2, Fn::kColour};
constexpr std::array<std::string_view, 3> kEffectPreference{Fn::kSceneV3, Fn::kSceneV2, Fn::kScene};

constexpr uint8_t kFullScale = 255;

uint8_t Scale(uint8_t value, uint8_t level) {
    return static_cast<uint8_t>(static_cast<unsigned>(value) * level / kFullScale);
}

uint8_t PercentToLevel(uint8_t percent) {
    return static_cast<uint8_t>(std::min<unsigned>(percent, 100) * kFullScale / 100);
}

// Never 0 for a non-zero level; 0 would switch symphony devices off
uint8_t LevelToPercent(uint8_t level) {
    if (level == 0) {
        return 0;
    }
    return static_cast<uint8_t>(std::max<long>(1, std::lround(level * 100.0 / kFullScale)));
}

// Brightest channel becomes full scale; returns that channel's level
uint8_t Normalize(std::initializer_list<uint8_t*> channels) {
    uint8_t peak = 0;
    for (const auto* c : channels) {
        peak = std::max(peak, *c);
    }
    if (peak == 0) {
        return 0;
    }
    for (auto* c : channels) {
        *c = static_cast<uint8_t>(static_cast<unsigned>(*c) * kFullScale / peak);
    }
    return peak;
}

} // anonymous namespace

DeviceController::DeviceController(const Advertisement::DeviceIdentity& identity,
                                   Session::DeviceSession& session,
                                   Transport::IScheduler& scheduler,
                                   Capabilities::ICapabilityCache& cache,
                                   const Capabilities::CapabilityDatabase& database,
                                   const ProbeConfig& probeConfig)
    : identity_(identity)
    , session_(session)
    , cache_(cache)
    , database_(database)
    , probe_(session, scheduler, database, probeConfig) {}

void DeviceController::Connect(Session::OpenCompletion completion) {
    session_.Open(identity_.MacString(), identity_.Framing(), std::move(completion));
}

// ============================================================================
// Function selection
// ============================================================================

std::string_view DeviceController::PowerFunction() const {
    return database_.BestFunction(identity_.productId, identity_.firmwareVersion, kPowerPreference)
        .value_or(Fn::kPowerV1);
}

std::string_view DeviceController::ColourFunction() const {
    return database_.BestFunction(identity_.productId, identity_.firmwareVersion, kColourPreference)
        .value_or(Fn::kColour);
}

std::optional<std::string_view> DeviceController::EffectFunction() const {
    return database_.BestFunction(identity_.productId, identity_.firmwareVersion, kEffectPreference);
}

Capabilities::EffectType DeviceController::EffectFamily() const {
    {
        std::lock_guard guard(lock_);
        if (capabilities_) {
            return capabilities_->effectType;
        }
    }
    if (auto record = database_.Lookup(identity_.productId)) {
        return (*record)->effectType;
    }
    return Capabilities::EffectType::None;
}

// ============================================================================
// Command intents
// ============================================================================

void DeviceController::SendCommand(std::string_view functionCode,
                                   const Commands::CommandParams& params,
                                   CommandCompletion completion,
                                   std::function<void()> onSuccess) {
    auto bytes = CommandBuilder::Build(database_, identity_.productId, functionCode, params);
    if (!bytes) {
        LEDBLE_LOG_V1(Engine, "%s: %.*s rejected (%s)", identity_.MacString().c_str(),
                      static_cast<int>(functionCode.size()), functionCode.data(),
                      ToString(bytes.error().code));
        completion(std::unexpected(bytes.error()));
        return;
    }

    session_.Submit(SessionRequest::Command(std::move(*bytes)),
                    [completion = std::move(completion), onSuccess = std::move(onSuccess)](
                        Result<Bytes::Buffer> result) {
        if (!result) {
            completion(std::unexpected(result.error()));
            return;
        }
        if (onSuccess) {
            onSuccess();
        }
        completion(Result<void>{});
    });
}

void DeviceController::SetPower(bool on, CommandCompletion completion) {
    const auto function = PowerFunction();
    LEDBLE_LOG_V2(Engine, "%s: power %s via %.*s", identity_.MacString().c_str(), on ? "on" : "off",
                  static_cast<int>(function.size()), function.data());
    SendCommand(function, Catalog::Power(on), std::move(completion));
}

void DeviceController::SendRgb(uint8_t r, uint8_t g, uint8_t b, uint8_t brightnessPercent,
                               CommandCompletion completion, std::function<void()> onSuccess) {
    const auto function = ColourFunction();
    if (function == Fn::kColourV2) {
        SendCommand(function, Catalog::ColorHsv(r, g, b, brightnessPercent),
                    std::move(completion), std::move(onSuccess));
        return;
    }
    SendCommand(Fn::kColour, Catalog::Color(r, g, b, 0, 0, Commands::ColorMode::Rgb, false),
                std::move(completion), std::move(onSuccess));
}

void DeviceController::SetRgbww(uint8_t r, uint8_t g, uint8_t b, uint8_t ww, uint8_t cw,
                                bool persist, CommandCompletion completion) {
    const bool anyRgb = (r | g | b) != 0;
    auto remember = [this, r, g, b, ww, cw, anyRgb] {
        std::lock_guard guard(lock_);
        output_ = OutputModel{};
        output_.kind = anyRgb ? OutputModel::Kind::Rgb : OutputModel::Kind::White;
        output_.red = r;
        output_.green = g;
        output_.blue = b;
        output_.warmWhite = ww;
        output_.coolWhite = cw;
        output_.brightness = kFullScale;
    };

    if (anyRgb && (ww | cw) == 0 && !persist && ColourFunction() == Fn::kColourV2) {
        const uint8_t value = std::max<uint8_t>(1, Commands::RgbToHsv(r, g, b).value);
        SendRgb(r, g, b, value, std::move(completion), std::move(remember));
        return;
    }
    SendCommand(Fn::kColour,
                Catalog::Color(r, g, b, ww, cw, Commands::ColorMode::All, persist),
                std::move(completion), std::move(remember));
}

void DeviceController::SetBrightness(uint8_t level, CommandCompletion completion) {
    if (level == 0) {
        SetPower(false, std::move(completion));
        return;
    }

    const OutputModel current = CurrentOutput();

    switch (current.kind) {
        case OutputModel::Kind::Effect:
            SetEffect(current.effectId, current.effectSpeedPercent, LevelToPercent(level),
                      std::move(completion));
            return;

        case OutputModel::Kind::White: {
            const auto updateLevel = [this, level] {
                std::lock_guard guard(lock_);
                output_.brightness = level;
            };
            const uint8_t ww = Scale(current.warmWhite, level);
            const uint8_t cw = Scale(current.coolWhite, level);
            if (database_.Supports(identity_.productId, Fn::kWhite, identity_.firmwareVersion)) {
                SendCommand(Fn::kWhite, Catalog::White(ww, cw, false), std::move(completion), updateLevel);
            } else {
                SendCommand(Fn::kColour,
                            Catalog::Color(0, 0, 0, ww, cw, Commands::ColorMode::White, false),
                            std::move(completion), updateLevel);
            }
            return;
        }

        case OutputModel::Kind::Rgb:
        case OutputModel::Kind::None: {
            OutputModel base = current;
            if (current.kind == OutputModel::Kind::None) {
                // Nothing known yet: full white on the RGB channels
                base = OutputModel{};
                base.red = base.green = base.blue = kFullScale;
            }
            base.kind = OutputModel::Kind::Rgb;
            base.brightness = level;

            SendRgb(Scale(base.red, level), Scale(base.green, level), Scale(base.blue, level),
                    LevelToPercent(level), std::move(completion),
                    [this, base] {
                std::lock_guard guard(lock_);
                output_ = base;
            });
            return;
        }
    }
}

void DeviceController::SetEffect(uint8_t effectId, uint8_t speedPercent, uint8_t brightnessPercent,
                                 CommandCompletion completion) {
    const auto function = EffectFunction();
    if (!function) {
        LEDBLE_LOG_V1(Engine, "%s: product 0x%04x declares no effect function",
                      identity_.MacString().c_str(), identity_.productId);
        completion(LEDBLE_ERROR_FATAL(TemplateError::UnknownFunction, "Product declares no effect function"));
        return;
    }

    uint8_t effectIdMax = 0;
    {
        std::lock_guard guard(lock_);
        if (capabilities_) {
            effectIdMax = capabilities_->effectIdMax;
        }
    }
    if (effectIdMax != 0 && effectId > effectIdMax) {
        completion(LEDBLE_ERROR_FATAL(TemplateError::ParameterOutOfRange, "Effect id above product maximum"));
        return;
    }

    const auto family = EffectFamily();
    LEDBLE_LOG_V2(Engine, "%s: effect %u speed %u%% bright %u%% via %.*s",
                  identity_.MacString().c_str(), effectId, speedPercent, brightnessPercent,
                  static_cast<int>(function->size()), function->data());

    SendCommand(*function,
                Catalog::Effect(*function, family, effectId, speedPercent, brightnessPercent),
                std::move(completion),
                [this, effectId, speedPercent, brightnessPercent] {
        std::lock_guard guard(lock_);
        output_.kind = OutputModel::Kind::Effect;
        output_.effectId = effectId;
        output_.effectSpeedPercent = std::min<uint8_t>(speedPercent, 100);
        output_.brightness = PercentToLevel(brightnessPercent);
    });
}

void DeviceController::SetColorTemperature(uint16_t kelvin, uint8_t brightnessPercent,
                                           CommandCompletion completion) {
    const uint8_t level = PercentToLevel(brightnessPercent);
    const auto base = Commands::KelvinToWhite(kelvin, kFullScale);
    const auto remember = [this, base, level] {
        std::lock_guard guard(lock_);
        output_ = OutputModel{};
        output_.kind = OutputModel::Kind::White;
        output_.warmWhite = base.warm;
        output_.coolWhite = base.cool;
        output_.brightness = level;
    };

    if (database_.Supports(identity_.productId, Fn::kCct, identity_.firmwareVersion)) {
        SendCommand(Fn::kCct,
                    Catalog::Cct(Commands::KelvinToTemperaturePercent(kelvin), brightnessPercent),
                    std::move(completion), remember);
        return;
    }

    const auto levels = Commands::KelvinToWhite(kelvin, level);
    if (database_.Supports(identity_.productId, Fn::kWhite, identity_.firmwareVersion)) {
        SendCommand(Fn::kWhite, Catalog::White(levels.warm, levels.cool, false),
                    std::move(completion), remember);
        return;
    }
    SendCommand(Fn::kColour,
                Catalog::Color(0, 0, 0, levels.warm, levels.cool, Commands::ColorMode::White, false),
                std::move(completion), remember);
}

void DeviceController::SetLedSettings(uint16_t ledCount, Capabilities::LedType ledType,
                                      Capabilities::ColorOrder colorOrder, CommandCompletion completion) {
    SendCommand(Fn::kLedSettings, Catalog::LedSettings(ledCount, ledType, colorOrder),
                std::move(completion),
                [this, ledCount, ledType, colorOrder] {
        std::lock_guard guard(lock_);
        if (capabilities_) {
            capabilities_->ledCount = ledCount;
            capabilities_->ledType = ledType;
            capabilities_->colorOrder = colorOrder;
        }
    });
}

// ============================================================================
// Queries
// ============================================================================

void DeviceController::QueryState(StateCompletion completion) {
    auto bytes = CommandBuilder::Build(database_, identity_.productId, Fn::kQueryState, Commands::CommandParams{});
    if (!bytes) {
        completion(std::unexpected(bytes.error()));
        return;
    }

    session_.Submit(SessionRequest::Query(std::move(*bytes), State::kStateMarker, State::kStateResponseLength),
                    [this, completion = std::move(completion)](Result<Bytes::Buffer> response) {
        if (!response) {
            completion(std::unexpected(response.error()));
            return;
        }
        auto state = State::StateResponseParser::Parse(*response);
        if (!state) {
            LEDBLE_LOG_V1(Engine, "%s: discarding state response (%s)",
                          identity_.MacString().c_str(), ToString(state.error().code));
            completion(std::unexpected(state.error()));
            return;
        }
        AdoptState(*state);
        completion(*state);
    });
}

void DeviceController::QueryLedSettings(LedSettingsCompletion completion) {
    auto bytes = CommandBuilder::Build(database_, identity_.productId, Fn::kQueryLedSettings,
                                       Commands::CommandParams{});
    if (!bytes) {
        completion(std::unexpected(bytes.error()));
        return;
    }

    session_.Submit(SessionRequest::Query(std::move(*bytes), State::kLedSettingsMarker,
                                          State::kLedSettingsResponseLength),
                    [completion = std::move(completion)](Result<Bytes::Buffer> response) {
        if (!response) {
            completion(std::unexpected(response.error()));
            return;
        }
        completion(State::StateResponseParser::ParseLedSettings(*response));
    });
}

void DeviceController::AdoptState(const State::DeviceState& state) {
    std::lock_guard guard(lock_);
    lastState_ = state;

    switch (state.colorMode) {
        case State::ColorMode::Effect:
            output_.kind = OutputModel::Kind::Effect;
            output_.effectId = state.effectId.value_or(0);
            output_.brightness = PercentToLevel(state.brightness);
            break;
        case State::ColorMode::Rgb: {
            output_ = OutputModel{};
            output_.kind = OutputModel::Kind::Rgb;
            output_.red = state.red;
            output_.green = state.green;
            output_.blue = state.blue;
            const uint8_t peak = Normalize({&output_.red, &output_.green, &output_.blue});
            output_.brightness = peak != 0 ? peak : kFullScale;
            break;
        }
        case State::ColorMode::White: {
            output_ = OutputModel{};
            output_.kind = OutputModel::Kind::White;
            output_.warmWhite = state.warmWhite;
            output_.coolWhite = state.coolWhite;
            const uint8_t peak = Normalize({&output_.warmWhite, &output_.coolWhite});
            output_.brightness = peak != 0 ? peak : kFullScale;
            break;
        }
        case State::ColorMode::Unknown:
            break;
    }
}

// ============================================================================
// Capability resolution
// ============================================================================

void DeviceController::ResolveCapabilities(bool forceProbe, CapabilitiesCompletion completion) {
    const auto& mac = identity_.mac;

    if (forceProbe) {
        LEDBLE_LOG_V1(Engine, "%s: forced probe, dropping cached capabilities", identity_.MacString().c_str());
        cache_.Invalidate(mac);
    } else {
        if (auto cached = cache_.Load(mac)) {
            LEDBLE_LOG_V2(Engine, "%s: capabilities from cache (%s)",
                          identity_.MacString().c_str(), Capabilities::ToString(cached->provenance));
            AdoptCapabilities(*cached, std::move(completion));
            return;
        }

        auto declared = database_.DeclaredCapabilities(identity_.productId);
        if (declared) {
            EnrichWithLedSettings(*declared, std::move(completion));
            return;
        }
        LEDBLE_LOG_V1(Engine, "%s: product 0x%04x not declared (%s), probing",
                      identity_.MacString().c_str(), identity_.productId, ToString(declared.error().code));
    }

    const bool started = probe_.Start(identity_.productId, identity_.firmwareVersion,
                                      [this, completion](Result<Capabilities::DeviceCapabilities> probed) {
        if (!probed) {
            completion(std::unexpected(probed.error()));
            return;
        }
        if (probed->provenance == Capabilities::Provenance::Probed) {
            cache_.Save(identity_.mac, *probed);
        } else {
            LEDBLE_LOG_V1(Engine, "%s: capabilities %s, not caching",
                          identity_.MacString().c_str(), Capabilities::ToString(probed->provenance));
        }
        AdoptCapabilities(*probed, completion);
    });

    if (!started) {
        completion(LEDBLE_ERROR_RECOVERABLE(TransportError::QueueFull, "Capability probe already running"));
    }
}

void DeviceController::EnrichWithLedSettings(Capabilities::DeviceCapabilities caps,
                                             CapabilitiesCompletion completion) {
    auto record = database_.Lookup(identity_.productId);
    if (!record || !(*record)->hasIcConfig ||
        !database_.Supports(identity_.productId, Fn::kQueryLedSettings, identity_.firmwareVersion)) {
        AdoptCapabilities(caps, std::move(completion));
        return;
    }

    QueryLedSettings([this, caps, completion = std::move(completion)](Result<State::LedSettings> settings) mutable {
        if (settings) {
            caps.ledType = settings->ledType;
            caps.colorOrder = settings->colorOrder;
            caps.ledCount = settings->ledCount;
            caps.segments = settings->segments;
        } else {
            LEDBLE_LOG_V1(Engine, "%s: LED settings unavailable (%s), keeping declared values",
                          identity_.MacString().c_str(), ToString(settings.error().code));
        }
        AdoptCapabilities(caps, std::move(completion));
    });
}

void DeviceController::AdoptCapabilities(const Capabilities::DeviceCapabilities& caps,
                                         CapabilitiesCompletion completion) {
    {
        std::lock_guard guard(lock_);
        capabilities_ = caps;
    }
    completion(caps);
}

// ============================================================================
// Accessors
// ============================================================================

std::optional<Capabilities::DeviceCapabilities> DeviceController::ResolvedCapabilities() const {
    std::lock_guard guard(lock_);
    return capabilities_;
}

std::optional<State::DeviceState> DeviceController::LastState() const {
    std::lock_guard guard(lock_);
    return lastState_;
}

OutputModel DeviceController::CurrentOutput() const {
    std::lock_guard guard(lock_);
    return output_;
}

} // namespace LEDBLE::Controller
