#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace LEDBLE::Bytes {

using Buffer = std::vector<uint8_t>;

// ============================================================================
// Bit Manipulation Utilities
// ============================================================================

// LSB-0 bit helper
template <class T>
constexpr T bit(unsigned n) {
    return T(1u) << n;
}

// LSB-0 inclusive range mask
template <class T>
constexpr T bit_range(unsigned msb, unsigned lsb) {
    return ((T(~T(0)) << lsb) & (T(~T(0)) >> (sizeof(T) * 8 - 1 - msb)));
}

// Extract an LSB-0 inclusive bit field, shifted down to bit 0
template <class T>
constexpr T extract_bits(T value, unsigned msb, unsigned lsb) {
    return static_cast<T>((value & bit_range<T>(msb, lsb)) >> lsb);
}

// ============================================================================
// Checksum
// ============================================================================

/// Modulo-256 sum of every byte in `data`
[[nodiscard]] constexpr uint8_t Checksum(std::span<const uint8_t> data) noexcept {
    uint32_t sum = 0;
    for (uint8_t b : data) {
        sum += b;
    }
    return static_cast<uint8_t>(sum & 0xFFu);
}

/// True when the last byte equals the checksum of all preceding bytes
[[nodiscard]] constexpr bool HasValidTrailingChecksum(std::span<const uint8_t> data) noexcept {
    if (data.size() < 2) {
        return false;
    }
    return Checksum(data.first(data.size() - 1)) == data.back();
}

// ============================================================================
// Endian Helpers
// ============================================================================

[[nodiscard]] constexpr uint16_t ReadBE16(std::span<const uint8_t> data, size_t offset) noexcept {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[offset]) << 8) | data[offset + 1]);
}

[[nodiscard]] constexpr uint16_t ReadLE16(std::span<const uint8_t> data, size_t offset) noexcept {
    return static_cast<uint16_t>(data[offset] | (static_cast<uint16_t>(data[offset + 1]) << 8));
}

inline void AppendBE16(Buffer& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

// ============================================================================
// Hex Formatting
// ============================================================================

/// "31 FF 00 ..." (upper case, space separated)
[[nodiscard]] std::string ToHex(std::span<const uint8_t> data);

/// Parse contiguous hex digit pairs ("31ff00"). Returns false on odd length or
/// a non-hex character; `out` is left empty in that case.
[[nodiscard]] bool FromHex(std::string_view text, Buffer& out);

} // namespace LEDBLE::Bytes
