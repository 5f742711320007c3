//
// WireFrame.hpp
// LEDBLEEngine - Transport Layer
//
// One transmittable unit of the vendor link protocol
//

#pragma once

#include <cstddef>
#include <cstdint>

#include "../Advertisement/DeviceIdentity.hpp"
#include "../Common/ByteUtils.hpp"

namespace LEDBLE::Transport {

using Advertisement::FramingVersion;

// ============================================================================
// Field encodings
// ============================================================================

/// cmdId: device answers on the notify characteristic
inline constexpr uint8_t kCmdExpectsResponse = 0x0A;
/// cmdId: no answer expected
inline constexpr uint8_t kCmdFireAndForget = 0x0B;

// Flags byte (LSB-0)
inline constexpr uint8_t kFlagVersionMask = 0x03;   // bits 0-1
inline constexpr uint8_t kFlagAckRequested = 0x04;  // bit 2
inline constexpr uint8_t kFlagProtected = 0x08;     // bit 3
inline constexpr uint8_t kFlagSegmented = 0x40;     // bit 6

// Fragment control (16-bit, big-endian on the wire)
inline constexpr uint16_t kFragEndOfMessage = 0x8000;
inline constexpr uint16_t kFragIndexMask = 0x7FFF;
inline constexpr uint16_t kSingleSegmentMarker = kFragEndOfMessage;

inline constexpr size_t kMaxLogicalLength = 0xFFFF;

/// Header geometry and MTU ceiling per framing version
///
///   legacy first         flags seq frag(2) total(2) len(1) cmdId   8 bytes
///   legacy continuation  flags seq frag(2) len(1) cmdId            6 bytes
///   modern first         flags seq frag(2) total(2) len(2) cmdId   9 bytes
///   modern continuation  flags seq frag(2) len(2) cmdId            7 bytes
struct FramingProfile {
    uint8_t versionBits;
    uint8_t lengthFieldSize;
    size_t firstHeaderSize;
    size_t continuationHeaderSize;
    uint16_t mtuCeiling;
};

inline constexpr FramingProfile kLegacyProfile{0, 1, 8, 6, 255};
inline constexpr FramingProfile kModernProfile{1, 2, 9, 7, 512};

[[nodiscard]] constexpr const FramingProfile& ProfileFor(FramingVersion framing) noexcept {
    return framing == FramingVersion::Modern ? kModernProfile : kLegacyProfile;
}

[[nodiscard]] constexpr const char* ToString(FramingVersion framing) noexcept {
    return framing == FramingVersion::Modern ? "modern" : "legacy";
}

// ============================================================================
// WireFrame
// ============================================================================

struct WireFrame {
    FramingVersion framing{FramingVersion::Legacy};

    bool ackRequested{false};
    bool isProtected{false};
    bool segmented{false};

    uint8_t sequence{0};
    uint16_t fragmentControl{kSingleSegmentMarker};

    /// Logical message length; carried only by the first segment
    uint16_t totalLength{0};

    uint8_t commandId{kCmdFireAndForget};
    Bytes::Buffer payload;

    [[nodiscard]] uint16_t SegmentIndex() const noexcept {
        return static_cast<uint16_t>(fragmentControl & kFragIndexMask);
    }
    [[nodiscard]] bool IsEndOfMessage() const noexcept {
        return (fragmentControl & kFragEndOfMessage) != 0;
    }
    [[nodiscard]] bool IsFirst() const noexcept { return SegmentIndex() == 0; }
    [[nodiscard]] bool IsSingle() const noexcept { return IsFirst() && IsEndOfMessage(); }

    [[nodiscard]] size_t HeaderSize() const noexcept {
        const auto& profile = ProfileFor(framing);
        return IsFirst() ? profile.firstHeaderSize : profile.continuationHeaderSize;
    }

    [[nodiscard]] size_t WireSize() const noexcept { return HeaderSize() + payload.size(); }

    [[nodiscard]] uint8_t FlagsByte() const noexcept {
        uint8_t flags = ProfileFor(framing).versionBits & kFlagVersionMask;
        if (ackRequested) flags |= kFlagAckRequested;
        if (isProtected) flags |= kFlagProtected;
        if (segmented) flags |= kFlagSegmented;
        return flags;
    }

    bool operator==(const WireFrame&) const = default;
};

} // namespace LEDBLE::Transport
