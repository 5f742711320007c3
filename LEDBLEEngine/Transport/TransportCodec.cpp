//
// TransportCodec.cpp
// LEDBLEEngine - Transport Layer
//

#include "TransportCodec.hpp"

#include <algorithm>

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::Transport {

namespace {
constexpr uint8_t kFlagReservedMask =
    static_cast<uint8_t>(~(kFlagVersionMask | kFlagAckRequested | kFlagProtected | kFlagSegmented));
constexpr size_t kFragControlOffset = 2;
constexpr size_t kTotalLengthOffset = 4;
} // namespace

// ============================================================================
// Encode / Serialize
// ============================================================================

Result<std::vector<WireFrame>> TransportCodec::Encode(std::span<const uint8_t> payload,
                                                      const EncodeOptions& options) {
    const auto& profile = ProfileFor(options.framing);
    const uint16_t mtu = EffectiveMtu(options.framing, options.mtu);

    if (payload.size() > kMaxLogicalLength) {
        LEDBLE_LOG_V0(Transport, "Encode: payload %zu exceeds 16-bit total length", payload.size());
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Payload exceeds maximum logical length");
    }
    if (mtu <= profile.firstHeaderSize) {
        LEDBLE_LOG_V0(Transport, "Encode: MTU %u cannot hold a %s header (%zu bytes)",
                      mtu, ToString(options.framing), profile.firstHeaderSize);
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "MTU smaller than frame header");
    }

    WireFrame base{};
    base.framing = options.framing;
    base.ackRequested = options.ackRequested;
    base.sequence = options.sequence;
    base.commandId = options.commandId;

    std::vector<WireFrame> frames;

    if (profile.firstHeaderSize + payload.size() <= mtu) {
        WireFrame frame = base;
        frame.fragmentControl = kSingleSegmentMarker;
        frame.totalLength = static_cast<uint16_t>(payload.size());
        frame.payload.assign(payload.begin(), payload.end());
        frames.push_back(std::move(frame));

        LEDBLE_LOG_V4(Transport, "Encode: seq=%u single frame, %zu bytes (%s, mtu=%u)",
                      options.sequence, payload.size(), ToString(options.framing), mtu);
        return frames;
    }

    const size_t firstChunk = mtu - profile.firstHeaderSize;
    const size_t continuationChunk = mtu - profile.continuationHeaderSize;

    size_t offset = 0;
    uint16_t index = 0;
    while (offset < payload.size()) {
        if (index > kFragIndexMask) {
            return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Segment index exceeds 15 bits");
        }
        const size_t chunk = (index == 0) ? firstChunk : continuationChunk;
        const size_t count = std::min(chunk, payload.size() - offset);

        WireFrame frame = base;
        frame.segmented = true;
        frame.fragmentControl = index;
        if (offset + count == payload.size()) {
            frame.fragmentControl |= kFragEndOfMessage;
        }
        frame.totalLength = (index == 0) ? static_cast<uint16_t>(payload.size()) : 0;
        frame.payload.assign(payload.begin() + static_cast<std::ptrdiff_t>(offset),
                             payload.begin() + static_cast<std::ptrdiff_t>(offset + count));
        frames.push_back(std::move(frame));

        offset += count;
        ++index;
    }

    LEDBLE_LOG_V3(Transport, "Encode: seq=%u %zu bytes -> %zu frames (%s, mtu=%u)",
                  options.sequence, payload.size(), frames.size(), ToString(options.framing), mtu);
    return frames;
}

Bytes::Buffer TransportCodec::Serialize(const WireFrame& frame) {
    const auto& profile = ProfileFor(frame.framing);

    Bytes::Buffer out;
    out.reserve(frame.WireSize());
    out.push_back(frame.FlagsByte());
    out.push_back(frame.sequence);
    Bytes::AppendBE16(out, frame.fragmentControl);
    if (frame.IsFirst()) {
        Bytes::AppendBE16(out, frame.totalLength);
    }

    const size_t segmentLength = frame.payload.size() + 1;
    if (profile.lengthFieldSize == 1) {
        out.push_back(static_cast<uint8_t>(segmentLength & 0xFF));
    } else {
        Bytes::AppendBE16(out, static_cast<uint16_t>(segmentLength));
    }
    out.push_back(frame.commandId);
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

// ============================================================================
// Deserialize
// ============================================================================

Result<WireFrame> TransportCodec::Deserialize(std::span<const uint8_t> bytes, FramingVersion framing) {
    const auto& profile = ProfileFor(framing);

    if (bytes.size() < kTotalLengthOffset) {
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "Frame shorter than fixed header");
    }

    const uint8_t flags = bytes[0];
    if ((flags & kFlagVersionMask) != profile.versionBits || (flags & kFlagReservedMask) != 0) {
        LEDBLE_LOG_V4(Transport, "Deserialize: flags 0x%02x not a %s header", flags, ToString(framing));
        return LEDBLE_ERROR_FATAL(ParseError::UnexpectedMarker, "Flags byte does not match framing");
    }

    WireFrame frame{};
    frame.framing = framing;
    frame.ackRequested = (flags & kFlagAckRequested) != 0;
    frame.isProtected = (flags & kFlagProtected) != 0;
    frame.segmented = (flags & kFlagSegmented) != 0;
    frame.sequence = bytes[1];
    frame.fragmentControl = Bytes::ReadBE16(bytes, kFragControlOffset);

    const size_t headerSize = frame.HeaderSize();
    if (bytes.size() < headerSize) {
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "Frame shorter than its header");
    }

    size_t offset = kTotalLengthOffset;
    if (frame.IsFirst()) {
        frame.totalLength = Bytes::ReadBE16(bytes, offset);
        offset += 2;
    }

    size_t segmentLength = 0;
    if (profile.lengthFieldSize == 1) {
        segmentLength = bytes[offset];
    } else {
        segmentLength = Bytes::ReadBE16(bytes, offset);
    }
    offset += profile.lengthFieldSize;
    frame.commandId = bytes[offset];

    if (segmentLength == 0) {
        return LEDBLE_ERROR_FATAL(ParseError::InvalidLength, "Segment length field is zero");
    }
    const size_t payloadLength = segmentLength - 1;
    if (bytes.size() < headerSize + payloadLength) {
        LEDBLE_LOG_V3(Transport, "Deserialize: declared %zu payload bytes, have %zu",
                      payloadLength, bytes.size() - headerSize);
        return LEDBLE_ERROR_FATAL(ParseError::TooShort, "Frame payload truncated");
    }

    const auto body = bytes.subspan(headerSize, payloadLength);
    frame.payload.assign(body.begin(), body.end());
    return frame;
}

// ============================================================================
// TransportDecoder
// ============================================================================

void TransportDecoder::DropPartial() noexcept {
    assembling_ = false;
    expectedTotal_ = 0;
    nextIndex_ = 0;
    buffer_.clear();
}

void TransportDecoder::Reset() noexcept {
    DropPartial();
    requestInFlight_ = false;
}

ReassemblyResult TransportDecoder::Finish(Bytes::Buffer bytes, uint8_t sequence) {
    ReassemblyResult result{};
    result.status = requestInFlight_ ? ReassemblyStatus::Complete : ReassemblyStatus::Unsolicited;
    result.bytes = std::move(bytes);
    result.sequence = sequence;
    return result;
}

Result<ReassemblyResult> TransportDecoder::DecodeIncoming(const WireFrame& frame) {
    if (frame.IsFirst()) {
        if (assembling_) {
            LEDBLE_LOG_V2(Transport, "Reassembly restarted by seq=%u, dropping %zu partial bytes",
                          frame.sequence, buffer_.size());
            DropPartial();
        }

        if (frame.payload.size() > frame.totalLength) {
            return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Segment exceeds declared total length");
        }

        if (frame.IsEndOfMessage()) {
            if (frame.payload.size() != frame.totalLength) {
                return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Single frame shorter than declared total");
            }
            return Finish(frame.payload, frame.sequence);
        }

        assembling_ = true;
        sequence_ = frame.sequence;
        expectedTotal_ = frame.totalLength;
        nextIndex_ = 1;
        buffer_ = frame.payload;
        ReassemblyResult pending{};
        pending.sequence = frame.sequence;
        return pending;
    }

    if (!assembling_) {
        LEDBLE_LOG_V2(Transport, "Continuation index %u with no first segment", frame.SegmentIndex());
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Continuation without first segment");
    }

    if (frame.SegmentIndex() != nextIndex_ || frame.sequence != sequence_) {
        LEDBLE_LOG_V2(Transport, "Out-of-order segment: index %u seq %u (expected %u seq %u)",
                      frame.SegmentIndex(), frame.sequence, nextIndex_, sequence_);
        DropPartial();
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Out-of-order segment");
    }

    if (buffer_.size() + frame.payload.size() > expectedTotal_) {
        LEDBLE_LOG_V2(Transport, "Overflow: %zu + %zu > declared %u",
                      buffer_.size(), frame.payload.size(), expectedTotal_);
        DropPartial();
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Segments exceed declared total length");
    }

    buffer_.insert(buffer_.end(), frame.payload.begin(), frame.payload.end());
    ++nextIndex_;

    if (!frame.IsEndOfMessage()) {
        ReassemblyResult pending{};
        pending.sequence = sequence_;
        return pending;
    }

    if (buffer_.size() != expectedTotal_) {
        LEDBLE_LOG_V2(Transport, "End-of-message at %zu of %u bytes", buffer_.size(), expectedTotal_);
        DropPartial();
        return LEDBLE_ERROR_FATAL(TransportError::FragmentationOverflow, "Message shorter than declared total length");
    }

    Bytes::Buffer message = std::move(buffer_);
    const uint8_t sequence = sequence_;
    DropPartial();
    return Finish(std::move(message), sequence);
}

} // namespace LEDBLE::Transport
