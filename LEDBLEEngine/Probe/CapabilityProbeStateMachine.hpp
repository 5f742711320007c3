#pragma once

#include <cstdint>

namespace LEDBLE::Probe {

// Holds capability probe progress and validates legal FSM transitions.
class CapabilityProbeStateMachine {
public:
    enum class State : uint8_t {
        Init,
        SaveState,
        ProbeRGB,
        ProbeWarmWhite,
        ProbeCoolWhite,
        Restore,
        Done,
        Aborted
    };

    // Sub-steps of one Probe* state
    enum class StepPhase : uint8_t {
        Write,
        Settle,
        Verify
    };

    [[nodiscard]] bool IsTerminal() const {
        return state_ == State::Done || state_ == State::Aborted;
    }

    [[nodiscard]] bool IsProbing() const {
        return state_ == State::ProbeRGB ||
               state_ == State::ProbeWarmWhite ||
               state_ == State::ProbeCoolWhite;
    }

    [[nodiscard]] State CurrentState() const { return state_; }
    [[nodiscard]] StepPhase Phase() const { return phase_; }
    void SetPhase(StepPhase phase) { phase_ = phase; }

    [[nodiscard]] bool HasBaseline() const { return hasBaseline_; }
    void SetHasBaseline(bool value) { hasBaseline_ = value; }

    [[nodiscard]] bool RgbDetected() const { return rgbDetected_; }
    [[nodiscard]] bool WarmWhiteDetected() const { return warmWhiteDetected_; }
    [[nodiscard]] bool CoolWhiteDetected() const { return coolWhiteDetected_; }

    /// Record the verdict for the channel of the current Probe* state
    void RecordResult(bool supported) {
        switch (state_) {
            case State::ProbeRGB:       rgbDetected_ = supported; break;
            case State::ProbeWarmWhite: warmWhiteDetected_ = supported; break;
            case State::ProbeCoolWhite: coolWhiteDetected_ = supported; break;
            default: break;
        }
    }

    /// Without a baseline nothing can be verified; every channel is assumed present
    void AssumeAllChannels() {
        rgbDetected_ = true;
        warmWhiteDetected_ = true;
        coolWhiteDetected_ = true;
    }

    /// Next state after the current probe step, regardless of its verdict
    [[nodiscard]] State NextProbeState() const {
        using enum State;

        switch (state_) {
            case SaveState:      return ProbeRGB;
            case ProbeRGB:       return ProbeWarmWhite;
            case ProbeWarmWhite: return ProbeCoolWhite;
            default:             return Restore;
        }
    }

    [[nodiscard]] bool CanTransitionTo(State next) const {
        using enum State;

        switch (state_) {
            case Init:
                return next == SaveState || next == Aborted;
            case SaveState:
                return next == ProbeRGB ||
                       next == Done ||      // no baseline, nothing to restore
                       next == Aborted;
            case ProbeRGB:
                return next == ProbeWarmWhite || next == Restore;
            case ProbeWarmWhite:
                return next == ProbeCoolWhite || next == Restore;
            case ProbeCoolWhite:
                return next == Restore;
            case Restore:
                return next == Done || next == Aborted;
            case Done:
                return next == Init;  // re-run
            case Aborted:
                return next == Init;  // retry
        }
        return false;
    }

    [[nodiscard]] bool TransitionTo(State next) {
        if (!CanTransitionTo(next)) {
            return false;
        }
        state_ = next;
        phase_ = StepPhase::Write;
        return true;
    }

    void ForceState(State next) {
        state_ = next;
        phase_ = StepPhase::Write;
    }

    void Reset() {
        state_ = State::Init;
        phase_ = StepPhase::Write;
        hasBaseline_ = false;
        rgbDetected_ = false;
        warmWhiteDetected_ = false;
        coolWhiteDetected_ = false;
    }

private:
    State state_{State::Init};
    StepPhase phase_{StepPhase::Write};

    bool hasBaseline_{false};
    bool rgbDetected_{false};
    bool warmWhiteDetected_{false};
    bool coolWhiteDetected_{false};
};

[[nodiscard]] constexpr const char* ToString(CapabilityProbeStateMachine::State state) noexcept {
    using enum CapabilityProbeStateMachine::State;

    switch (state) {
        case Init:           return "Init";
        case SaveState:      return "SaveState";
        case ProbeRGB:       return "ProbeRGB";
        case ProbeWarmWhite: return "ProbeWarmWhite";
        case ProbeCoolWhite: return "ProbeCoolWhite";
        case Restore:        return "Restore";
        case Done:           return "Done";
        case Aborted:        return "Aborted";
    }
    return "Unknown";
}

} // namespace LEDBLE::Probe
