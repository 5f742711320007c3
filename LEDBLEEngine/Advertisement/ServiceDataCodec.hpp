//
// ServiceDataCodec.hpp
// LEDBLEEngine - Advertisement Layer
//
// Bit-packed service-data broadcast (non-connectable and newer devices).
// Kept apart from AdvertisementParser: the packing, the byte order and the
// record variants are all specific to this carrier.
//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

#include "../Common/ByteUtils.hpp"
#include "../Core/Error.hpp"

namespace LEDBLE::Advertisement {

/// Byte order the scan layer delivered the service-data payload in
enum class ServiceDataOrder : uint8_t {
    /// Bytes as transmitted
    AsTransmitted,
    /// Payload delivered end-to-start (UUID-style little-endian carriers)
    Reversed,
};

enum class ServiceDataVariant : uint8_t {
    /// 16-byte identification record
    Identification,
    /// 29-byte identification record followed by power / state bytes
    IdentificationWithState,
    /// 14-byte mesh record (no product id, mesh address instead)
    Mesh,
};

struct ServiceDataRecord {
    ServiceDataVariant variant{ServiceDataVariant::Identification};
    uint8_t status{0};
    uint16_t manufacturer{0};
    uint8_t bleVersion{0};
    std::array<uint8_t, 6> mac{};
    uint16_t productId{0};
    uint16_t firmwareVersion{0};
    uint8_t ledVersion{0};
    uint8_t checkKey{0};
    uint8_t firmwareFlag{0};
    uint16_t meshAddress{0};        // Mesh only
    uint8_t meshMode{0};            // Mesh only
    std::optional<bool> powerOn;    // IdentificationWithState only

    [[nodiscard]] bool IsOta() const { return status == 0xFF; }

    bool operator==(const ServiceDataRecord&) const = default;
};

class ServiceDataCodec {
public:
    static constexpr size_t kIdentificationLength = 16;
    static constexpr size_t kIdentificationWithStateLength = 29;
    static constexpr size_t kMeshLength = 14;
    static constexpr size_t kPowerOffset = 16;
    static constexpr uint8_t kOtaStatus = 0xFF;
    static constexpr uint8_t kFirmwareHighBitsMinVersion = 6;

    /// Decode a service-data payload, undoing the carrier byte order first
    [[nodiscard]] static Result<ServiceDataRecord> Decode(std::span<const uint8_t> payload,
                                                          ServiceDataOrder order = ServiceDataOrder::AsTransmitted);

    // ------------------------------------------------------------------------
    // Named transforms and bit-field extractors
    // ------------------------------------------------------------------------

    /// Reverse byte order end-to-start
    [[nodiscard]] static Bytes::Buffer ReverseBytes(std::span<const uint8_t> payload);

    /// Bits 0-1 of the key byte
    [[nodiscard]] static constexpr uint8_t ExtractCheckKey(uint8_t keyByte) noexcept {
        return Bytes::extract_bits<uint8_t>(keyByte, 1, 0);
    }

    /// Bits 2-7 of the key byte (firmware bits 8-13)
    [[nodiscard]] static constexpr uint8_t ExtractFirmwareHigh(uint8_t keyByte) noexcept {
        return Bytes::extract_bits<uint8_t>(keyByte, 7, 2);
    }

    /// Bits 0-4 of the flag byte
    [[nodiscard]] static constexpr uint8_t ExtractFirmwareFlag(uint8_t flagByte) noexcept {
        return Bytes::extract_bits<uint8_t>(flagByte, 4, 0);
    }

    [[nodiscard]] static constexpr uint16_t ComposeFirmwareVersion(uint8_t low, uint8_t high6) noexcept {
        return static_cast<uint16_t>(low | (static_cast<uint16_t>(high6 & 0x3F) << 8));
    }

    [[nodiscard]] static constexpr bool IsManufacturerMarker(uint8_t high) noexcept {
        return high == 0x5A || high == 0x5B;
    }

private:
    static Result<ServiceDataRecord> DecodeIdentification(std::span<const uint8_t> data);
    static ServiceDataRecord DecodeMesh(std::span<const uint8_t> data);
};

} // namespace LEDBLE::Advertisement
