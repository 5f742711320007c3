//
// DeviceIdentity.hpp
// LEDBLEEngine - Advertisement Layer
//
// Identity and optional state snapshot decoded from one advertisement
//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace LEDBLE::Advertisement {

/// Raw manufacturer-data layouts. The caller always states which one it has.
enum class AdvertisementLayout : uint8_t {
    /// 29 bytes, company identifier embedded in the first two bytes
    CompanyIdEmbedded,
    /// 27 bytes, company identifier delivered out of band by the scan layer
    CompanyIdOutOfBand,
};

/// Link framing a device speaks, chosen from its advertised BLE version
enum class FramingVersion : uint8_t {
    Legacy,
    Modern,
};

inline constexpr uint8_t kPowerOnMarker = 0x23;
inline constexpr uint8_t kPowerOffMarker = 0x24;

/// 11-byte state block carried by extended advertisements
struct StateSnapshot {
    static constexpr size_t kSize = 11;

    std::array<uint8_t, kSize> raw{};

    [[nodiscard]] std::optional<bool> PowerOn() const {
        if (raw[0] == kPowerOnMarker) return true;
        if (raw[0] == kPowerOffMarker) return false;
        return std::nullopt;
    }
    [[nodiscard]] uint8_t ModeType() const { return raw[1]; }
    [[nodiscard]] uint8_t SubMode() const { return raw[2]; }
    [[nodiscard]] uint8_t BrightnessPercent() const { return raw[3]; }
    [[nodiscard]] uint8_t Red() const { return raw[4]; }
    [[nodiscard]] uint8_t Green() const { return raw[5]; }
    [[nodiscard]] uint8_t Blue() const { return raw[6]; }
    [[nodiscard]] uint8_t ColorTemperaturePercent() const { return raw[7]; }

    bool operator==(const StateSnapshot&) const = default;
};

struct DeviceIdentity {
    std::array<uint8_t, 6> mac{};
    uint16_t companyId{0};
    uint16_t productId{0};
    uint8_t bleVersion{0};
    uint16_t firmwareVersion{0};
    uint8_t ledVersion{0};
    uint8_t status{0};

    // Present only when bleVersion >= kExtendedFieldsMinVersion
    uint8_t checkKey{0};
    uint8_t firmwareFlag{0};
    std::optional<StateSnapshot> snapshot;

    /// "E4:98:BB:95:EE:8E"
    [[nodiscard]] std::string MacString() const;

    [[nodiscard]] FramingVersion Framing() const;

    bool operator==(const DeviceIdentity&) const = default;
};

} // namespace LEDBLE::Advertisement
