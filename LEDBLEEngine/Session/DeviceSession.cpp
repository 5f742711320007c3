//
// DeviceSession.cpp
// LEDBLEEngine - Session Layer
//

#include "DeviceSession.hpp"

#include <algorithm>

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"
#include "../State/StateResponseParser.hpp"

namespace LEDBLE::Session {

using Transport::kInvalidConnection;
using Transport::kInvalidTimer;
using Transport::ReassemblyResult;
using Transport::ReassemblyStatus;
using Transport::TimerToken;
using Transport::TransportCodec;

namespace {
// ATT default MTU (23) minus the 3-byte ATT header
constexpr uint16_t kDefaultAttPayload = 20;
// Marker plus checksum
constexpr size_t kMinStructuralLength = 2;
} // namespace

//==============================================================================
// Constructor / Destructor
//==============================================================================

DeviceSession::DeviceSession(Transport::IBleTransport& transport,
                             Transport::IScheduler& scheduler,
                             const SessionConfig& config)
    : transport_(transport), scheduler_(scheduler), config_(config) {}

DeviceSession::~DeviceSession() {
    {
        std::lock_guard guard(lock_);
        open_ = false;
    }
    ResolveAll("Session destroyed");
}

//==============================================================================
// Link lifecycle
//==============================================================================

void DeviceSession::Open(std::string_view address, FramingVersion framing, OpenCompletion completion) {
    LEDBLE_LOG_V1(Session, "Connecting to %.*s (%s framing)",
                  static_cast<int>(address.size()), address.data(), Transport::ToString(framing));

    transport_.Connect(address, [this, framing, completion = std::move(completion)](
                                    Result<ConnectionHandle> connected) mutable {
        if (!connected) {
            LEDBLE_LOG_V0(Session, "Connect failed: %s", ToString(connected.error().code));
            completion(std::unexpected(connected.error()));
            return;
        }

        const ConnectionHandle handle = *connected;
        transport_.NegotiateMtu(handle, config_.requestedMtu,
                                [this, handle, framing, completion = std::move(completion)](
                                    Result<uint16_t> granted) mutable {
            uint16_t mtu = kDefaultAttPayload;
            if (granted) {
                mtu = *granted;
            } else {
                LEDBLE_LOG_V1(Session, "MTU negotiation failed (%s), using %u",
                              ToString(granted.error().code), kDefaultAttPayload);
            }
            Attach(handle, framing, mtu);
            completion(Mtu());
        });
    });
}

void DeviceSession::Attach(ConnectionHandle handle, FramingVersion framing, uint16_t grantedMtu) {
    uint16_t effective = 0;
    {
        std::lock_guard guard(lock_);
        handle_ = handle;
        framing_ = framing;
        mtu_ = TransportCodec::EffectiveMtu(framing, grantedMtu);
        effective = mtu_;
        open_ = true;
        sequence_.Reset();
        decoder_.Reset();
    }

    LEDBLE_LOG_V1(Session, "Attached handle=%u framing=%s mtu=%u (granted %u)",
                  handle, Transport::ToString(framing), effective, grantedMtu);

    transport_.Subscribe(handle, [this](std::span<const uint8_t> bytes) { OnNotification(bytes); });
    Pump();
}

void DeviceSession::Close() {
    ConnectionHandle handle = kInvalidConnection;
    bool wasOpen = false;
    {
        std::lock_guard guard(lock_);
        wasOpen = open_;
        open_ = false;
        handle = handle_;
        handle_ = kInvalidConnection;
    }

    ResolveAll("Session closed");

    if (wasOpen) {
        transport_.Disconnect(handle);
    }
}

void DeviceSession::OnDisconnected() {
    {
        std::lock_guard guard(lock_);
        open_ = false;
        handle_ = kInvalidConnection;
    }
    LEDBLE_LOG_V1(Session, "Link lost");
    ResolveAll("Link lost");
}

void DeviceSession::Cancel() {
    ResolveAll("Cancelled");
}

//==============================================================================
// Command submission
//==============================================================================

void DeviceSession::Submit(SessionRequest request, SessionCompletion completion) {
    {
        std::unique_lock guard(lock_);

        if (!open_) {
            guard.unlock();
            LEDBLE_LOG_V1(Session, "Submit rejected: not connected");
            completion(LEDBLE_ERROR_RECOVERABLE(TransportError::NotConnected, "Session is not connected"));
            return;
        }

        if (queue_.size() >= config_.maxQueueDepth) {
            const size_t depth = queue_.size();
            guard.unlock();
            LEDBLE_LOG_V1(Session, "Submit rejected: queue full (%zu)", depth);
            completion(LEDBLE_ERROR_RECOVERABLE(TransportError::QueueFull, "Command queue is full"));
            return;
        }

        queue_.push_back(PendingCommand{nextCommandId_++, std::move(request), std::move(completion)});
    }

    Pump();
}

uint32_t DeviceSession::TimeoutFor(const SessionRequest& request) const {
    if (request.timeoutMs != 0) {
        return request.timeoutMs;
    }
    return request.ExpectsResponse() ? config_.queryTimeoutMs : config_.commandTimeoutMs;
}

void DeviceSession::Pump() {
    for (;;) {
        std::unique_lock guard(lock_);

        if (!open_ || inFlight_ || queue_.empty()) {
            return;
        }

        InFlight next{};
        next.command = std::move(queue_.front());
        queue_.pop_front();

        const bool expectsResponse = next.command.request.ExpectsResponse();
        const uint32_t timeoutMs = TimeoutFor(next.command.request);
        const uint64_t id = next.command.id;

        Transport::EncodeOptions options{};
        options.commandId = expectsResponse ? Transport::kCmdExpectsResponse : Transport::kCmdFireAndForget;
        options.framing = framing_;
        options.mtu = mtu_;
        options.sequence = sequence_.Next();

        auto frames = TransportCodec::Encode(next.command.request.payload, options);
        if (!frames) {
            auto completion = std::move(next.command.completion);
            guard.unlock();
            completion(std::unexpected(frames.error()));
            continue;
        }

        next.frames.reserve(frames->size());
        for (const auto& frame : *frames) {
            next.frames.push_back(TransportCodec::Serialize(frame));
        }

        if (expectsResponse) {
            decoder_.BeginRequest();
        }

        LEDBLE_LOG_V2(Session, "Command %llu: seq=%u %zu bytes in %zu frames, %s, timeout %u ms",
                      static_cast<unsigned long long>(id), options.sequence,
                      next.command.request.payload.size(), next.frames.size(),
                      expectsResponse ? "awaiting response" : "fire-and-forget", timeoutMs);

        inFlight_ = std::move(next);
        guard.unlock();

        const TimerToken token = scheduler_.ScheduleAfter(timeoutMs, [this, id] { OnTimeout(id); });

        bool stale = false;
        {
            std::lock_guard relock(lock_);
            if (inFlight_ && inFlight_->command.id == id) {
                inFlight_->timer = token;
            } else {
                stale = true;
            }
        }
        if (stale) {
            scheduler_.Cancel(token);
            continue;
        }

        WriteNext(id);
        return;
    }
}

void DeviceSession::WriteNext(uint64_t id) {
    std::unique_lock guard(lock_);

    if (!inFlight_ || inFlight_->command.id != id) {
        return;  // Already completed or cancelled
    }

    if (inFlight_->nextFrame >= inFlight_->frames.size()) {
        const bool expectsResponse = inFlight_->command.request.ExpectsResponse();
        guard.unlock();
        if (!expectsResponse) {
            FinishInFlight(id, Bytes::Buffer{});
        }
        return;
    }

    Bytes::Buffer frame = inFlight_->frames[inFlight_->nextFrame++];
    const ConnectionHandle handle = handle_;
    guard.unlock();

    LEDBLE_LOG_HEX(Session, "TX %s", Bytes::ToHex(frame).c_str());

    transport_.Write(handle, frame, [this, id](Result<void> result) {
        OnWriteComplete(id, std::move(result));
    });
}

void DeviceSession::OnWriteComplete(uint64_t id, Result<void> result) {
    if (!result) {
        LEDBLE_LOG_V0(Session, "Command %llu write failed: %s",
                      static_cast<unsigned long long>(id), ToString(result.error().code));
        FinishInFlight(id, std::unexpected(result.error()));
        return;
    }
    WriteNext(id);
}

//==============================================================================
// Completion
//==============================================================================

void DeviceSession::OnTimeout(uint64_t id) {
    {
        std::lock_guard guard(lock_);
        if (!inFlight_ || inFlight_->command.id != id) {
            return;
        }
        inFlight_->timer = kInvalidTimer;
    }
    LEDBLE_LOG_V1(Session, "Command %llu timed out", static_cast<unsigned long long>(id));
    FinishInFlight(id, LEDBLE_ERROR_TIMEOUT("No response within wait window"));
}

void DeviceSession::FinishInFlight(uint64_t id, Result<Bytes::Buffer> result) {
    SessionCompletion completion;
    TimerToken timer = kInvalidTimer;
    {
        std::lock_guard guard(lock_);
        if (!inFlight_ || inFlight_->command.id != id) {
            return;
        }
        completion = std::move(inFlight_->command.completion);
        timer = inFlight_->timer;
        inFlight_.reset();
        decoder_.EndRequest();
    }

    if (timer != kInvalidTimer) {
        scheduler_.Cancel(timer);
    }

    // Invoke completion OUTSIDE lock
    if (completion) {
        completion(std::move(result));
    }

    Pump();
}

void DeviceSession::ResolveAll(const char* reason) {
    std::vector<SessionCompletion> completions;
    TimerToken timer = kInvalidTimer;
    {
        std::lock_guard guard(lock_);
        if (inFlight_) {
            completions.push_back(std::move(inFlight_->command.completion));
            timer = inFlight_->timer;
            inFlight_.reset();
        }
        for (auto& pending : queue_) {
            completions.push_back(std::move(pending.completion));
        }
        queue_.clear();
        decoder_.Reset();
    }

    if (timer != kInvalidTimer) {
        scheduler_.Cancel(timer);
    }

    if (!completions.empty()) {
        LEDBLE_LOG_V1(Session, "%s: resolving %zu waits with Disconnected", reason, completions.size());
    }

    for (auto& completion : completions) {
        if (completion) {
            completion(LEDBLE_ERROR_DISCONNECTED(reason));
        }
    }
}

//==============================================================================
// Inbound
//==============================================================================

std::optional<ReassemblyResult> DeviceSession::ReassembleLocked(std::span<const uint8_t> bytes) {
    auto frame = TransportCodec::Deserialize(bytes, framing_);
    if (!frame) {
        ReassemblyResult raw{};
        raw.status = decoder_.HasRequestInFlight() ? ReassemblyStatus::Complete
                                                   : ReassemblyStatus::Unsolicited;
        raw.bytes.assign(bytes.begin(), bytes.end());
        return raw;
    }

    auto result = decoder_.DecodeIncoming(*frame);
    if (!result) {
        LEDBLE_LOG_V1(Session, "Dropping inbound frame seq=%u: %s",
                      frame->sequence, ToString(result.error().code));
        return std::nullopt;
    }
    if (result->status == ReassemblyStatus::Pending) {
        return std::nullopt;
    }
    return std::move(*result);
}

void DeviceSession::OnNotification(std::span<const uint8_t> bytes) {
    LEDBLE_LOG_HEX(Session, "RX %s", Bytes::ToHex(bytes).c_str());

    std::unique_lock guard(lock_);

    auto message = ReassembleLocked(bytes);
    if (!message) {
        return;
    }

    auto payload = State::StateResponseParser::UnwrapNotification(message->bytes);
    if (!payload) {
        guard.unlock();
        LEDBLE_LOG_V2(Session, "Discarding notification: %s", ToString(payload.error().code));
        return;
    }

    if (message->status == ReassemblyStatus::Complete && inFlight_ &&
        inFlight_->command.request.ExpectsResponse()) {
        const auto& request = inFlight_->command.request;
        const size_t minLength = std::max(request.responseLength, kMinStructuralLength);
        if (State::StateResponseParser::IsStructurallyValid(*payload, *request.responseMarker, minLength)) {
            const uint64_t id = inFlight_->command.id;
            guard.unlock();
            LEDBLE_LOG_V3(Session, "Command %llu answered (%zu bytes)",
                          static_cast<unsigned long long>(id), payload->size());
            FinishInFlight(id, std::move(*payload));
            return;
        }
    }

    auto listener = ambientListener_;
    guard.unlock();

    LEDBLE_LOG_RL(Session, "session/ambient", 5000, "ambient update marker=0x%02x len=%zu",
                  payload->empty() ? 0 : (*payload)[0], payload->size());
    if (listener) {
        listener(*payload);
    }
}

void DeviceSession::SetAmbientListener(AmbientListener listener) {
    std::lock_guard guard(lock_);
    ambientListener_ = std::move(listener);
}

//==============================================================================
// Accessors
//==============================================================================

bool DeviceSession::IsOpen() const {
    std::lock_guard guard(lock_);
    return open_;
}

bool DeviceSession::HasCommandInFlight() const {
    std::lock_guard guard(lock_);
    return inFlight_.has_value();
}

size_t DeviceSession::QueueDepth() const {
    std::lock_guard guard(lock_);
    return queue_.size();
}

uint16_t DeviceSession::Mtu() const {
    std::lock_guard guard(lock_);
    return mtu_;
}

FramingVersion DeviceSession::Framing() const {
    std::lock_guard guard(lock_);
    return framing_;
}

} // namespace LEDBLE::Session
