//
// DeviceSession.hpp
// LEDBLEEngine - Session Layer
//
// Per-device command queue: one command in flight, FIFO behind it
//

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../Common/ByteUtils.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Core/Error.hpp"
#include "../Transport/IBleTransport.hpp"
#include "../Transport/IScheduler.hpp"
#include "../Transport/SequenceCounter.hpp"
#include "../Transport/TransportCodec.hpp"

namespace LEDBLE::Session {

using Transport::ConnectionHandle;
using Transport::FramingVersion;

/// One logical command handed to the session
struct SessionRequest {
    /// Logical command bytes (checksum included when the template has one)
    Bytes::Buffer payload;

    /// Marker byte of the awaited response; empty for fire-and-forget
    std::optional<uint8_t> responseMarker;

    /// Minimum length of the awaited response
    size_t responseLength{0};

    /// 0 selects the configured default for the request class
    uint32_t timeoutMs{0};

    [[nodiscard]] bool ExpectsResponse() const noexcept { return responseMarker.has_value(); }

    [[nodiscard]] static SessionRequest Command(Bytes::Buffer bytes) {
        return SessionRequest{std::move(bytes), std::nullopt, 0, 0};
    }

    [[nodiscard]] static SessionRequest Query(Bytes::Buffer bytes, uint8_t marker, size_t length) {
        return SessionRequest{std::move(bytes), marker, length, 0};
    }
};

/// Resolves with the response bytes (empty for fire-and-forget) or the
/// transport error verbatim
using SessionCompletion = std::function<void(Result<Bytes::Buffer>)>;

/// Messages that are not the awaited response (remote-control pushes,
/// late answers, anything outside a wait window)
using AmbientListener = std::function<void(std::span<const uint8_t>)>;

using OpenCompletion = std::function<void(Result<uint16_t>)>;

/// DeviceSession - serialized command/response exchange with one controller
///
/// CONCURRENCY MODEL:
/// - Exactly one command in flight; later submissions queue FIFO up to
///   SessionConfig::maxQueueDepth, beyond that QueueFull
/// - The protocol carries no response id: the first structurally valid frame
///   (expected marker, valid checksum, minimum length) received while a query
///   is in flight is its response. Anything else is an ambient update
/// - Every wait is bounded by a scheduler timer (Timeout, recoverable)
///
/// CANCELLATION:
/// - Cancel(), Close() and OnDisconnected() resolve the in-flight command and
///   every queued one with Disconnected
///
/// THREAD SAFETY:
/// - All methods are thread-safe (one mutex per session)
/// - Completions, the ambient listener and adapter calls run OUTSIDE the lock
/// - Sessions share nothing; many devices can be driven concurrently
class DeviceSession {
public:
    DeviceSession(Transport::IBleTransport& transport,
                  Transport::IScheduler& scheduler,
                  const SessionConfig& config = {});

    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /// Connect, subscribe to notifications and negotiate the MTU.
    /// Completes with the effective MTU.
    void Open(std::string_view address, FramingVersion framing, OpenCompletion completion);

    /// Adopt a connection the host already owns
    void Attach(ConnectionHandle handle, FramingVersion framing, uint16_t grantedMtu);

    /// Resolve all waits with Disconnected and release the link
    void Close();

    /// Queue a command. NotConnected when not open, QueueFull past the depth limit.
    void Submit(SessionRequest request, SessionCompletion completion);

    /// Resolve all waits with Disconnected; the link stays open
    void Cancel();

    /// Adapter reports link loss
    void OnDisconnected();

    /// Inbound bytes from the notify characteristic
    void OnNotification(std::span<const uint8_t> bytes);

    void SetAmbientListener(AmbientListener listener);

    [[nodiscard]] bool IsOpen() const;
    [[nodiscard]] bool HasCommandInFlight() const;
    [[nodiscard]] size_t QueueDepth() const;
    [[nodiscard]] uint16_t Mtu() const;
    [[nodiscard]] FramingVersion Framing() const;

    const SessionConfig& GetConfig() const { return config_; }

private:
    struct PendingCommand {
        uint64_t id{0};
        SessionRequest request;
        SessionCompletion completion;
    };

    struct InFlight {
        PendingCommand command;
        std::vector<Bytes::Buffer> frames;
        size_t nextFrame{0};
        Transport::TimerToken timer{Transport::kInvalidTimer};
    };

    void Pump();
    void WriteNext(uint64_t id);
    void OnWriteComplete(uint64_t id, Result<void> result);
    void OnTimeout(uint64_t id);
    void FinishInFlight(uint64_t id, Result<Bytes::Buffer> result);
    void ResolveAll(const char* reason);

    /// Strip link framing; nullopt while segments are outstanding or the frame is dropped.
    /// Unframed bytes pass through as one message.
    std::optional<Transport::ReassemblyResult> ReassembleLocked(std::span<const uint8_t> bytes);

    uint32_t TimeoutFor(const SessionRequest& request) const;

    Transport::IBleTransport& transport_;
    Transport::IScheduler& scheduler_;
    SessionConfig config_;

    mutable std::mutex lock_;

    bool open_{false};
    ConnectionHandle handle_{Transport::kInvalidConnection};
    FramingVersion framing_{FramingVersion::Legacy};
    uint16_t mtu_{Transport::kLegacyProfile.mtuCeiling};

    Transport::SequenceCounter sequence_;
    Transport::TransportDecoder decoder_;

    std::deque<PendingCommand> queue_;
    std::optional<InFlight> inFlight_;
    uint64_t nextCommandId_{1};

    AmbientListener ambientListener_;
};

} // namespace LEDBLE::Session
