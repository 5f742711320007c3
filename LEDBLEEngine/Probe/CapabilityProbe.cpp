#include "CapabilityProbe.hpp"

#include <array>
#include <cstdlib>
#include <string_view>

#include "../Capabilities/CapabilityDatabase.hpp"
#include "../Commands/CommandBuilder.hpp"
#include "../Commands/CommandCatalog.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"
#include "../Session/DeviceSession.hpp"
#include "../State/StateResponseParser.hpp"

namespace LEDBLE::Probe {

using Commands::CommandBuilder;
using Session::SessionRequest;
namespace Catalog = Commands::Catalog;
namespace Fn = Commands::FunctionCode;

namespace {

constexpr std::array<std::string_view, 2> kPowerPreference{Fn::kPowerV2, Fn::kPowerV1};
constexpr std::array<std::string_view, 3> kScenePreference{Fn::kSceneV3, Fn::kSceneV2, Fn::kScene};

} // anonymous namespace

CapabilityProbe::CapabilityProbe(Session::DeviceSession& session,
                                 Transport::IScheduler& scheduler,
                                 const Capabilities::CapabilityDatabase& database,
                                 const ProbeConfig& config)
    : session_(session), scheduler_(scheduler), database_(database), config_(config) {}

CapabilityProbe::~CapabilityProbe() {
    if (settleTimer_ != Transport::kInvalidTimer) {
        scheduler_.Cancel(settleTimer_);
    }
}

bool CapabilityProbe::WithinTolerance(uint8_t observed, uint8_t expected, uint8_t tolerance) {
    return std::abs(static_cast<int>(observed) - static_cast<int>(expected)) <= tolerance;
}

bool CapabilityProbe::IsRunning() const {
    return fsm_.CurrentState() != ProbeState::Init && !fsm_.IsTerminal();
}

bool CapabilityProbe::IsTransportFailure(const Error& error) {
    return error.code.domain == ErrorDomain::Transport && error.code != TransportError::Timeout;
}

bool CapabilityProbe::Start(uint16_t productId, uint16_t firmwareVersion, ProbeCompletion completion) {
    if (IsRunning()) {
        LEDBLE_LOG_V1(Probe, "Start ignored: probe already in %s", ToString(fsm_.CurrentState()));
        return false;
    }

    fsm_.Reset();
    productId_ = productId;
    firmwareVersion_ = firmwareVersion;
    completion_ = std::move(completion);
    baseline_.reset();
    abortError_.reset();

    LEDBLE_LOG_V1(Probe, "Probing product 0x%04x (fw %u): test=0x%02x tolerance=%u settle=%u ms",
                  productId, firmwareVersion, config_.testValue, config_.toleranceBand,
                  config_.settleDelayMs);

    EnterState(ProbeState::SaveState);
    RunSaveState();
    return true;
}

void CapabilityProbe::EnterState(ProbeState next) {
    const auto previous = fsm_.CurrentState();
    if (!fsm_.TransitionTo(next)) {
        LEDBLE_LOG_V0(Probe, "Illegal transition %s -> %s, forcing", ToString(previous), ToString(next));
        fsm_.ForceState(next);
        return;
    }
    LEDBLE_LOG_V2(Probe, "%s -> %s", ToString(previous), ToString(next));
}

// ============================================================================
// SaveState
// ============================================================================

void CapabilityProbe::RunSaveState() {
    auto query = BuildQuery();
    if (!query) {
        Abort(query.error());
        return;
    }
    session_.Submit(SessionRequest::Query(std::move(*query), State::kStateMarker, State::kStateResponseLength),
                    [this](Result<Bytes::Buffer> response) { OnBaseline(std::move(response)); });
}

void CapabilityProbe::OnBaseline(Result<Bytes::Buffer> response) {
    if (!response && IsTransportFailure(response.error())) {
        Abort(response.error());
        return;
    }

    std::optional<State::DeviceState> state;
    if (response) {
        if (auto parsed = State::StateResponseParser::Parse(*response)) {
            state = *parsed;
        }
    }

    if (!state) {
        LEDBLE_LOG_V1(Probe, "No baseline state; assuming all channels present");
        fsm_.AssumeAllChannels();
        EnterState(ProbeState::Done);
        Finish();
        return;
    }

    baseline_ = *state;
    fsm_.SetHasBaseline(true);
    LEDBLE_LOG_V2(Probe, "Baseline: power=%d rgb=%u,%u,%u ww=%u cw=%u static=%d",
                  state->powerOn, state->red, state->green, state->blue,
                  state->warmWhite, state->coolWhite, state->isStatic);

    EnterState(ProbeState::ProbeRGB);
    RunProbeStep();
}

// ============================================================================
// Probe steps
// ============================================================================

void CapabilityProbe::RunProbeStep() {
    fsm_.SetPhase(CapabilityProbeStateMachine::StepPhase::Write);

    auto bytes = BuildTestWrite();
    if (!bytes) {
        LEDBLE_LOG_V1(Probe, "%s: cannot render test write (%s)",
                      ToString(fsm_.CurrentState()), ToString(bytes.error().code));
        fsm_.RecordResult(false);
        AdvanceProbe();
        return;
    }

    session_.Submit(SessionRequest::Command(std::move(*bytes)),
                    [this](Result<Bytes::Buffer> result) { OnTestWritten(std::move(result)); });
}

void CapabilityProbe::OnTestWritten(Result<Bytes::Buffer> result) {
    if (!result) {
        if (IsTransportFailure(result.error())) {
            FailAndRestore(result.error());
            return;
        }
        LEDBLE_LOG_V1(Probe, "%s: test write timed out", ToString(fsm_.CurrentState()));
        fsm_.RecordResult(false);
        AdvanceProbe();
        return;
    }

    fsm_.SetPhase(CapabilityProbeStateMachine::StepPhase::Settle);
    settleTimer_ = scheduler_.ScheduleAfter(config_.settleDelayMs, [this] { OnSettled(); });
}

void CapabilityProbe::OnSettled() {
    settleTimer_ = Transport::kInvalidTimer;
    fsm_.SetPhase(CapabilityProbeStateMachine::StepPhase::Verify);

    auto query = BuildQuery();
    if (!query) {
        fsm_.RecordResult(false);
        AdvanceProbe();
        return;
    }
    session_.Submit(SessionRequest::Query(std::move(*query), State::kStateMarker, State::kStateResponseLength),
                    [this](Result<Bytes::Buffer> response) { OnVerify(std::move(response)); });
}

void CapabilityProbe::OnVerify(Result<Bytes::Buffer> response) {
    if (!response) {
        if (IsTransportFailure(response.error())) {
            FailAndRestore(response.error());
            return;
        }
        LEDBLE_LOG_V1(Probe, "%s: no state response, channel unsupported", ToString(fsm_.CurrentState()));
        fsm_.RecordResult(false);
        AdvanceProbe();
        return;
    }

    auto state = State::StateResponseParser::Parse(*response);
    if (!state) {
        LEDBLE_LOG_V1(Probe, "%s: unreadable state (%s), channel unsupported",
                      ToString(fsm_.CurrentState()), ToString(state.error().code));
        fsm_.RecordResult(false);
        AdvanceProbe();
        return;
    }

    const uint8_t observed = ObservedChannel(*state);
    const bool supported = WithinTolerance(observed, config_.testValue, config_.toleranceBand);
    LEDBLE_LOG_V1(Probe, "%s: observed 0x%02x, expected 0x%02x -> %s",
                  ToString(fsm_.CurrentState()), observed, config_.testValue,
                  supported ? "supported" : "unsupported");
    fsm_.RecordResult(supported);
    AdvanceProbe();
}

void CapabilityProbe::AdvanceProbe() {
    EnterState(fsm_.NextProbeState());
    if (fsm_.IsProbing()) {
        RunProbeStep();
    } else {
        RunRestore();
    }
}

// ============================================================================
// Restore
// ============================================================================

void CapabilityProbe::FailAndRestore(const Error& error) {
    LEDBLE_LOG_V0(Probe, "%s: transport failure %s, restoring before abort",
                  ToString(fsm_.CurrentState()), ToString(error.code));
    abortError_ = error;
    EnterState(ProbeState::Restore);
    RunRestore();
}

void CapabilityProbe::RunRestore() {
    if (!baseline_) {
        Finish();
        return;
    }

    auto bytes = BuildRestoreOutput();
    if (!bytes) {
        LEDBLE_LOG_V0(Probe, "Cannot render restore output (%s)", ToString(bytes.error().code));
        RestorePower();
        return;
    }

    session_.Submit(SessionRequest::Command(std::move(*bytes)),
                    [this](Result<Bytes::Buffer> result) { OnRestoreStep(std::move(result), false); });
}

void CapabilityProbe::RestorePower() {
    const auto function = database_.BestFunction(productId_, firmwareVersion_, kPowerPreference)
                              .value_or(Fn::kPowerV1);

    auto bytes = CommandBuilder::Build(database_, productId_, function, Catalog::Power(baseline_->powerOn));
    if (!bytes) {
        LEDBLE_LOG_V0(Probe, "Cannot render power restore (%s)", ToString(bytes.error().code));
        Finish();
        return;
    }

    session_.Submit(SessionRequest::Command(std::move(*bytes)),
                    [this](Result<Bytes::Buffer> result) { OnRestoreStep(std::move(result), true); });
}

void CapabilityProbe::OnRestoreStep(Result<Bytes::Buffer> result, bool last) {
    if (!result) {
        LEDBLE_LOG_V0(Probe, "Restore %s failed: %s",
                      last ? "power" : "output", ToString(result.error().code));
        if (!abortError_ && IsTransportFailure(result.error())) {
            abortError_ = result.error();
        }
    }

    if (last) {
        Finish();
    } else {
        RestorePower();
    }
}

// ============================================================================
// Completion
// ============================================================================

void CapabilityProbe::Abort(const Error& error) {
    LEDBLE_LOG_V0(Probe, "%s: aborting on %s", ToString(fsm_.CurrentState()), ToString(error.code));
    abortError_ = error;
    EnterState(ProbeState::Aborted);
    Finish();
}

void CapabilityProbe::Finish() {
    if (fsm_.CurrentState() == ProbeState::Restore) {
        EnterState(abortError_ ? ProbeState::Aborted : ProbeState::Done);
    }

    auto completion = std::move(completion_);
    completion_ = nullptr;

    if (abortError_) {
        if (completion) {
            completion(std::unexpected(*abortError_));
        }
        return;
    }

    const auto caps = BuildResult();
    LEDBLE_LOG_V1(Probe, "Product 0x%04x %s: rgb=%d ww=%d cw=%d",
                  productId_, Capabilities::ToString(caps.provenance),
                  caps.hasRgb, caps.hasWarmWhite, caps.hasCoolWhite);
    if (completion) {
        completion(caps);
    }
}

Capabilities::DeviceCapabilities CapabilityProbe::BuildResult() const {
    Capabilities::DeviceCapabilities caps{};

    // Effect family stays whatever the table knows about the product
    if (auto record = database_.Lookup(productId_)) {
        caps.effectType = (*record)->effectType;
        caps.effectIdMax = (*record)->effectIdMax;
        caps.hasEffects = caps.effectType != Capabilities::EffectType::None;
    }

    caps.hasRgb = fsm_.RgbDetected();
    caps.hasWarmWhite = fsm_.WarmWhiteDetected();
    caps.hasCoolWhite = fsm_.CoolWhiteDetected();
    caps.provenance = fsm_.HasBaseline() ? Capabilities::Provenance::Probed
                                         : Capabilities::Provenance::Assumed;
    return caps;
}

// ============================================================================
// Command rendering
// ============================================================================

Result<Bytes::Buffer> CapabilityProbe::BuildQuery() const {
    return CommandBuilder::Build(database_, productId_, Fn::kQueryState, Commands::CommandParams{});
}

Result<Bytes::Buffer> CapabilityProbe::BuildTestWrite() const {
    const uint8_t v = config_.testValue;
    Commands::CommandParams params;

    switch (fsm_.CurrentState()) {
        case ProbeState::ProbeRGB:
            params = Catalog::Color(v, 0, 0, 0, 0, Commands::ColorMode::All, false);
            break;
        case ProbeState::ProbeWarmWhite:
            params = Catalog::Color(0, 0, 0, v, 0, Commands::ColorMode::All, false);
            break;
        case ProbeState::ProbeCoolWhite:
            params = Catalog::Color(0, 0, 0, 0, v, Commands::ColorMode::All, false);
            break;
        default:
            return LEDBLE_ERROR_FATAL(TemplateError::UnknownFunction, "No test write outside a probe step");
    }
    return CommandBuilder::Build(database_, productId_, Fn::kColour, params);
}

Result<Bytes::Buffer> CapabilityProbe::BuildRestoreOutput() const {
    const auto& saved = *baseline_;

    if (!saved.isStatic && saved.effectId) {
        if (auto scene = database_.BestFunction(productId_, firmwareVersion_, kScenePreference)) {
            auto family = Capabilities::EffectType::None;
            if (auto record = database_.Lookup(productId_)) {
                family = (*record)->effectType;
            }
            const uint8_t speedPercent = Commands::ReportedSpeedPercent(family, saved.effectSpeed.value_or(0));
            auto bytes = CommandBuilder::Build(database_, productId_, *scene,
                                               Catalog::Effect(*scene, family, *saved.effectId,
                                                               speedPercent, saved.brightness));
            if (bytes) {
                return bytes;
            }
            LEDBLE_LOG_V1(Probe, "Effect 0x%02x not replayable (%s), restoring static output",
                          *saved.effectId, ToString(bytes.error().code));
        }
    }

    return CommandBuilder::Build(database_, productId_, Fn::kColour,
                                 Catalog::Color(saved.red, saved.green, saved.blue,
                                                saved.warmWhite, saved.coolWhite,
                                                Commands::ColorMode::All, false));
}

uint8_t CapabilityProbe::ObservedChannel(const State::DeviceState& state) const {
    switch (fsm_.CurrentState()) {
        case ProbeState::ProbeWarmWhite: return state.warmWhite;
        case ProbeState::ProbeCoolWhite: return state.coolWhite;
        default:                         return state.red;
    }
}

} // namespace LEDBLE::Probe
