//
// TransportCodec.hpp
// LEDBLEEngine - Transport Layer
//
// Segments logical commands into wire frames under a negotiated MTU and
// reassembles inbound frames into logical messages
//

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "WireFrame.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::Transport {

struct EncodeOptions {
    uint8_t commandId{kCmdFireAndForget};
    bool ackRequested{false};
    FramingVersion framing{FramingVersion::Legacy};
    /// Requested write size; clamped to the framing's ceiling
    uint16_t mtu{kLegacyProfile.mtuCeiling};
    uint8_t sequence{0};
};

class TransportCodec {
public:
    /// Split a logical payload into frames.
    ///
    /// One frame with the single-segment marker when header + payload fits the
    /// effective MTU. Otherwise the first frame carries (mtu - first header)
    /// bytes, each continuation (mtu - continuation header) bytes with an
    /// incrementing index, and the last sets end-of-message. All frames of one
    /// message share the sequence number.
    ///
    /// FragmentationOverflow when the MTU cannot hold a header plus one byte or
    /// the payload exceeds the 16-bit total length field.
    [[nodiscard]] static Result<std::vector<WireFrame>> Encode(std::span<const uint8_t> payload,
                                                               const EncodeOptions& options);

    /// Requested MTU clamped to the framing ceiling
    [[nodiscard]] static constexpr uint16_t EffectiveMtu(FramingVersion framing, uint16_t mtu) noexcept {
        const uint16_t ceiling = ProfileFor(framing).mtuCeiling;
        return mtu < ceiling ? mtu : ceiling;
    }

    /// Wire bytes for one frame
    [[nodiscard]] static Bytes::Buffer Serialize(const WireFrame& frame);

    /// Parse wire bytes using the header geometry of `framing`.
    /// TooShort for truncated headers or payloads; UnexpectedMarker when the
    /// version bits disagree with `framing`.
    [[nodiscard]] static Result<WireFrame> Deserialize(std::span<const uint8_t> bytes,
                                                       FramingVersion framing);
};

enum class ReassemblyStatus : uint8_t {
    /// More segments needed
    Pending,
    /// Full message while a request is in flight
    Complete,
    /// Full message with no request in flight (ambient notification)
    Unsolicited,
};

struct ReassemblyResult {
    ReassemblyStatus status{ReassemblyStatus::Pending};
    Bytes::Buffer bytes;
    uint8_t sequence{0};
};

/// Per-connection reassembly buffer.
///
/// The session marks a request in flight before writing and clears it once
/// the request resolves; complete messages are classified against that flag.
/// Overflow past the declared total, a continuation without a first segment,
/// an index gap, or a total mismatch at end-of-message all reset the buffer
/// and report FragmentationOverflow.
class TransportDecoder {
public:
    void BeginRequest() noexcept { requestInFlight_ = true; }
    void EndRequest() noexcept { requestInFlight_ = false; }
    [[nodiscard]] bool HasRequestInFlight() const noexcept { return requestInFlight_; }

    [[nodiscard]] Result<ReassemblyResult> DecodeIncoming(const WireFrame& frame);

    /// Drop partial data and the in-flight mark (disconnect)
    void Reset() noexcept;

    [[nodiscard]] bool IsAssembling() const noexcept { return assembling_; }

private:
    ReassemblyResult Finish(Bytes::Buffer bytes, uint8_t sequence);
    void DropPartial() noexcept;

    bool requestInFlight_{false};
    bool assembling_{false};
    uint8_t sequence_{0};
    uint16_t expectedTotal_{0};
    uint16_t nextIndex_{0};
    Bytes::Buffer buffer_;
};

} // namespace LEDBLE::Transport
