//
// ServiceDataCodec.cpp
// LEDBLEEngine - Advertisement Layer
//

#include "ServiceDataCodec.hpp"

#include <algorithm>

#include "DeviceIdentity.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::Advertisement {

namespace {
// Identification record
constexpr size_t kStatus = 0;
constexpr size_t kManufacturer = 1;
constexpr size_t kBleVersion = 3;
constexpr size_t kMac = 4;
constexpr size_t kProductId = 10;
constexpr size_t kFirmwareLow = 12;
constexpr size_t kLedVersion = 13;
constexpr size_t kKeyByte = 14;
constexpr size_t kFlagByte = 15;

// Mesh record
constexpr size_t kMeshMac = 2;
constexpr size_t kMeshAddress = 8;
constexpr size_t kMeshLedVersion = 10;
constexpr size_t kMeshMode = 11;
constexpr size_t kMeshFlags = 12;
} // namespace

Bytes::Buffer ServiceDataCodec::ReverseBytes(std::span<const uint8_t> payload) {
    return Bytes::Buffer(payload.rbegin(), payload.rend());
}

Result<ServiceDataRecord> ServiceDataCodec::Decode(std::span<const uint8_t> payload,
                                                   ServiceDataOrder order) {
    Bytes::Buffer ordered;
    std::span<const uint8_t> data = payload;
    if (order == ServiceDataOrder::Reversed) {
        ordered = ReverseBytes(payload);
        data = ordered;
    }

    switch (data.size()) {
        case kMeshLength:
            return DecodeMesh(data);
        case kIdentificationLength:
        case kIdentificationWithStateLength:
            return DecodeIdentification(data);
        default:
            LEDBLE_LOG_V2(Advertisement, "Service data: unsupported length %zu", data.size());
            return LEDBLE_ERROR_FATAL(ParseError::InvalidLength, "Service data length not recognized");
    }
}

Result<ServiceDataRecord> ServiceDataCodec::DecodeIdentification(std::span<const uint8_t> data) {
    if (!IsManufacturerMarker(data[kManufacturer])) {
        LEDBLE_LOG_V2(Advertisement, "Service data: bad manufacturer marker 0x%02x", data[kManufacturer]);
        return LEDBLE_ERROR_FATAL(ParseError::InvalidCompanyId, "Service data manufacturer marker invalid");
    }

    ServiceDataRecord record{};
    record.variant = data.size() == kIdentificationWithStateLength
                         ? ServiceDataVariant::IdentificationWithState
                         : ServiceDataVariant::Identification;
    record.status = data[kStatus];
    record.manufacturer = Bytes::ReadBE16(data, kManufacturer);
    record.bleVersion = data[kBleVersion];
    std::copy_n(data.begin() + kMac, record.mac.size(), record.mac.begin());
    record.productId = Bytes::ReadBE16(data, kProductId);
    record.firmwareVersion = data[kFirmwareLow];
    record.ledVersion = data[kLedVersion];

    if (record.bleVersion >= kFirmwareHighBitsMinVersion) {
        record.checkKey = ExtractCheckKey(data[kKeyByte]);
        record.firmwareFlag = ExtractFirmwareFlag(data[kFlagByte]);
        record.firmwareVersion = ComposeFirmwareVersion(data[kFirmwareLow],
                                                        ExtractFirmwareHigh(data[kKeyByte]));
    }

    if (record.variant == ServiceDataVariant::IdentificationWithState) {
        const uint8_t power = data[kPowerOffset];
        if (power == kPowerOnMarker) {
            record.powerOn = true;
        } else if (power == kPowerOffMarker) {
            record.powerOn = false;
        }
    }

    if (record.IsOta()) {
        LEDBLE_LOG_V1(Advertisement, "Service data: product 0x%04x is in OTA mode", record.productId);
    }
    return record;
}

ServiceDataRecord ServiceDataCodec::DecodeMesh(std::span<const uint8_t> data) {
    ServiceDataRecord record{};
    record.variant = ServiceDataVariant::Mesh;
    record.status = data[kStatus];
    record.bleVersion = data[1];
    std::copy_n(data.begin() + kMeshMac, record.mac.size(), record.mac.begin());
    record.meshAddress = Bytes::ReadBE16(data, kMeshAddress);
    record.ledVersion = data[kMeshLedVersion];
    record.firmwareVersion = record.ledVersion;
    record.meshMode = data[kMeshMode];
    record.firmwareFlag = data[kMeshFlags];
    return record;
}

} // namespace LEDBLE::Advertisement
