//
// AdvertisementParser.hpp
// LEDBLEEngine - Advertisement Layer
//
// Decodes manufacturer-specific advertisement bytes into a DeviceIdentity
//

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "DeviceIdentity.hpp"
#include "../Core/EngineConfig.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::Advertisement {

/// Layout of the 27-byte body shared by both layouts (offsets relative to body)
///
///  0      status
///  1      BLE / protocol version
///  2..7   MAC address
///  8..9   product id (big-endian)
///  10     firmware version, low byte
///  11     LED controller version
///  12     bits 0-1 check key, bits 2-7 firmware high bits (version >= 6)
///  13     bits 0-4 firmware flag
///  14..24 state snapshot (version >= 5)
///  25..26 reserved
namespace Offsets {
inline constexpr size_t kStatus = 0;
inline constexpr size_t kBleVersion = 1;
inline constexpr size_t kMac = 2;
inline constexpr size_t kProductId = 8;
inline constexpr size_t kFirmwareLow = 10;
inline constexpr size_t kLedVersion = 11;
inline constexpr size_t kCheckKey = 12;
inline constexpr size_t kFirmwareFlag = 13;
inline constexpr size_t kSnapshot = 14;
} // namespace Offsets

inline constexpr size_t kBodyLength = 27;
inline constexpr size_t kEmbeddedCompanyIdLength = 2;
inline constexpr size_t kLayoutEmbeddedLength = kBodyLength + kEmbeddedCompanyIdLength;  // 29
inline constexpr size_t kLayoutOutOfBandLength = kBodyLength;                            // 27

inline constexpr uint8_t kExtendedFieldsMinVersion = 5;
inline constexpr uint8_t kFirmwareHighBitsMinVersion = 6;
inline constexpr uint8_t kModernFramingMinVersion = 8;

/// Stateless advertisement decoder. Same bytes always yield the same identity.
class AdvertisementParser {
public:
    explicit AdvertisementParser(const AdvertisementConfig& config = {})
        : config_(config) {}

    /// Decode one payload.
    ///
    /// @param bytes manufacturer-data bytes exactly as delivered by the scan layer
    /// @param layout which of the two layouts `bytes` is in
    /// @param outOfBandCompanyId company id from the scan layer (CompanyIdOutOfBand only)
    [[nodiscard]] Result<DeviceIdentity> Parse(std::span<const uint8_t> bytes,
                                               AdvertisementLayout layout,
                                               uint16_t outOfBandCompanyId = 0) const;

    /// Expected payload length for a layout
    [[nodiscard]] static constexpr size_t ExpectedLength(AdvertisementLayout layout) noexcept {
        return layout == AdvertisementLayout::CompanyIdEmbedded ? kLayoutEmbeddedLength
                                                                : kLayoutOutOfBandLength;
    }

    [[nodiscard]] bool IsAcceptedCompanyId(uint16_t companyId) const noexcept {
        return companyId >= config_.companyIdMin && companyId <= config_.companyIdMax;
    }

    [[nodiscard]] const AdvertisementConfig& GetConfig() const { return config_; }

private:
    Result<DeviceIdentity> ParseBody(std::span<const uint8_t> body, uint16_t companyId) const;

    AdvertisementConfig config_;
};

/// Framing selected by advertised version (legacy below 8, modern from 8)
[[nodiscard]] constexpr FramingVersion FramingForVersion(uint8_t bleVersion) noexcept {
    return bleVersion < kModernFramingMinVersion ? FramingVersion::Legacy : FramingVersion::Modern;
}

} // namespace LEDBLE::Advertisement
