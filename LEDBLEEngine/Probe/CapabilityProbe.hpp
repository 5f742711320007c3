#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "CapabilityProbeStateMachine.hpp"
#include "../Capabilities/CapabilityTypes.hpp"
#include "../Common/ByteUtils.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Core/Error.hpp"
#include "../State/DeviceState.hpp"
#include "../Transport/IScheduler.hpp"

namespace LEDBLE::Capabilities {
class CapabilityDatabase;
}

namespace LEDBLE::Session {
class DeviceSession;
}

namespace LEDBLE::Probe {

// Completion: probed capabilities, or the transport error that aborted the run
using ProbeCompletion = std::function<void(Result<Capabilities::DeviceCapabilities>)>;

// Channel detection for devices whose channel set is not declared.
//
// Sequence: query baseline state, then for RGB, warm white and cool white in
// turn write the test value to that channel alone, wait the settle delay and
// query state again. A channel is supported when the observed value is within
// the tolerance band of the test value. A timed out or unreadable step counts
// as unsupported and never stops the sequence. Restore always re-applies the
// baseline before the probe finishes; only a transport failure ends in Aborted.
//
// The probe must outlive its run. Steps are serialized through the session,
// so callbacks never overlap.
class CapabilityProbe {
public:
    CapabilityProbe(Session::DeviceSession& session,
                    Transport::IScheduler& scheduler,
                    const Capabilities::CapabilityDatabase& database,
                    const ProbeConfig& config = {});
    ~CapabilityProbe();

    CapabilityProbe(const CapabilityProbe&) = delete;
    CapabilityProbe& operator=(const CapabilityProbe&) = delete;

    // Begin a run. Returns false if one is already in progress.
    bool Start(uint16_t productId, uint16_t firmwareVersion, ProbeCompletion completion);

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] CapabilityProbeStateMachine::State CurrentState() const { return fsm_.CurrentState(); }
    [[nodiscard]] const ProbeConfig& GetConfig() const { return config_; }

    // Pure verdict for one channel
    [[nodiscard]] static bool WithinTolerance(uint8_t observed, uint8_t expected, uint8_t tolerance);

private:
    using ProbeState = CapabilityProbeStateMachine::State;

    void EnterState(ProbeState next);

    void RunSaveState();
    void OnBaseline(Result<Bytes::Buffer> response);

    void RunProbeStep();
    void OnTestWritten(Result<Bytes::Buffer> result);
    void OnSettled();
    void OnVerify(Result<Bytes::Buffer> response);
    void AdvanceProbe();

    void RunRestore();
    void RestorePower();
    void OnRestoreStep(Result<Bytes::Buffer> result, bool last);

    void Finish();
    void FailAndRestore(const Error& error);
    void Abort(const Error& error);

    // Bytes for the current Probe* state's test write
    Result<Bytes::Buffer> BuildTestWrite() const;
    Result<Bytes::Buffer> BuildQuery() const;
    Result<Bytes::Buffer> BuildRestoreOutput() const;
    uint8_t ObservedChannel(const State::DeviceState& state) const;

    // Transport errors other than Timeout end the run
    static bool IsTransportFailure(const Error& error);

    Capabilities::DeviceCapabilities BuildResult() const;

    Session::DeviceSession& session_;
    Transport::IScheduler& scheduler_;
    const Capabilities::CapabilityDatabase& database_;
    ProbeConfig config_;

    CapabilityProbeStateMachine fsm_;
    uint16_t productId_{0};
    uint16_t firmwareVersion_{0};
    ProbeCompletion completion_;

    std::optional<State::DeviceState> baseline_;
    std::optional<Error> abortError_;
    Transport::TimerToken settleTimer_{Transport::kInvalidTimer};
};

} // namespace LEDBLE::Probe
