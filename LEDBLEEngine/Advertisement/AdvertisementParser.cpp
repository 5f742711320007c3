//
// AdvertisementParser.cpp
// LEDBLEEngine - Advertisement Layer
//

#include "AdvertisementParser.hpp"

#include <algorithm>
#include <cstdio>

#include "../Common/ByteUtils.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace LEDBLE::Advertisement {

using Bytes::extract_bits;

std::string DeviceIdentity::MacString() const {
    char text[18];
    std::snprintf(text, sizeof(text), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return std::string(text);
}

FramingVersion DeviceIdentity::Framing() const {
    return FramingForVersion(bleVersion);
}

Result<DeviceIdentity> AdvertisementParser::Parse(std::span<const uint8_t> bytes,
                                                  AdvertisementLayout layout,
                                                  uint16_t outOfBandCompanyId) const {
    switch (layout) {
        case AdvertisementLayout::CompanyIdEmbedded: {
            if (bytes.size() != kLayoutEmbeddedLength) {
                LEDBLE_LOG_V2(Advertisement, "Embedded layout: got %zu bytes, expected %zu",
                              bytes.size(), kLayoutEmbeddedLength);
                return LEDBLE_ERROR_FATAL(ParseError::InvalidLength,
                                          "Advertisement length does not match embedded layout");
            }
            // Manufacturer data carries the company id least-significant byte first
            const uint16_t companyId = Bytes::ReadLE16(bytes, 0);
            return ParseBody(bytes.subspan(kEmbeddedCompanyIdLength), companyId);
        }
        case AdvertisementLayout::CompanyIdOutOfBand: {
            if (bytes.size() != kLayoutOutOfBandLength) {
                LEDBLE_LOG_V2(Advertisement, "Out-of-band layout: got %zu bytes, expected %zu",
                              bytes.size(), kLayoutOutOfBandLength);
                return LEDBLE_ERROR_FATAL(ParseError::InvalidLength,
                                          "Advertisement length does not match out-of-band layout");
            }
            return ParseBody(bytes, outOfBandCompanyId);
        }
    }
    return LEDBLE_ERROR_FATAL(ParseError::UnrecognizedLayout, "Unknown advertisement layout");
}

Result<DeviceIdentity> AdvertisementParser::ParseBody(std::span<const uint8_t> body,
                                                      uint16_t companyId) const {
    if (!IsAcceptedCompanyId(companyId)) {
        LEDBLE_LOG_V2(Advertisement, "Rejecting company id 0x%04x (accepted 0x%04x-0x%04x)",
                      companyId, config_.companyIdMin, config_.companyIdMax);
        return LEDBLE_ERROR_FATAL(ParseError::InvalidCompanyId,
                                  "Company id outside accepted range");
    }

    DeviceIdentity identity{};
    identity.companyId = companyId;
    identity.status = body[Offsets::kStatus];
    identity.bleVersion = body[Offsets::kBleVersion];
    std::copy_n(body.begin() + Offsets::kMac, identity.mac.size(), identity.mac.begin());
    identity.productId = Bytes::ReadBE16(body, Offsets::kProductId);
    identity.ledVersion = body[Offsets::kLedVersion];
    identity.firmwareVersion = body[Offsets::kFirmwareLow];

    if (identity.bleVersion >= kExtendedFieldsMinVersion) {
        const uint8_t keyByte = body[Offsets::kCheckKey];
        identity.checkKey = extract_bits<uint8_t>(keyByte, 1, 0);
        identity.firmwareFlag = extract_bits<uint8_t>(body[Offsets::kFirmwareFlag], 4, 0);

        if (identity.bleVersion >= kFirmwareHighBitsMinVersion) {
            const uint16_t high = extract_bits<uint8_t>(keyByte, 7, 2);
            identity.firmwareVersion = static_cast<uint16_t>(identity.firmwareVersion | (high << 8));
        }

        StateSnapshot snapshot{};
        std::copy_n(body.begin() + Offsets::kSnapshot, StateSnapshot::kSize, snapshot.raw.begin());
        identity.snapshot = snapshot;
    }

    LEDBLE_LOG_V3(Advertisement,
                  "Parsed %s: company=0x%04x product=0x%04x ble=%u fw=0x%04x led=%u sta=0x%02x",
                  identity.MacString().c_str(), companyId, identity.productId,
                  identity.bleVersion, identity.firmwareVersion, identity.ledVersion,
                  identity.status);
    return identity;
}

} // namespace LEDBLE::Advertisement
