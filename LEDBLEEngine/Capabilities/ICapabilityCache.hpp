#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "CapabilityTypes.hpp"

namespace LEDBLE::Capabilities {

using MacAddress = std::array<uint8_t, 6>;

/**
 * @brief Host-owned per-device capability store.
 *
 * The engine reads it before probing and writes back probe results.
 * Persistence (memory, disk, config entry) is entirely the host's choice.
 */
class ICapabilityCache {
public:
    virtual ~ICapabilityCache() = default;

    virtual std::optional<DeviceCapabilities> Load(const MacAddress& mac) = 0;
    virtual void Save(const MacAddress& mac, const DeviceCapabilities& caps) = 0;
    virtual void Invalidate(const MacAddress& mac) = 0;
};

} // namespace LEDBLE::Capabilities
