//
// EngineConfig.hpp
// LEDBLEEngine - Core
//
// Host-supplied configuration for the protocol engine. The engine never
// persists these; the host resolves them and passes them in by value.
//

#pragma once

#include <cstdint>

namespace LEDBLE {

/// Per-device command queue configuration
struct SessionConfig {
    /// Timeout for commands expecting a response (state / settings queries)
    uint32_t queryTimeoutMs{3000};

    /// Timeout for a fire-and-forget write to be acknowledged by the adapter
    uint32_t commandTimeoutMs{1000};

    /// MTU requested from the adapter after connecting
    uint16_t requestedMtu{512};

    /// Commands allowed to wait behind the in-flight one
    uint16_t maxQueueDepth{32};
};

/// Capability probe tuning
struct ProbeConfig {
    /// Delay between a test write and the verifying state query
    uint32_t settleDelayMs{300};

    /// Channel value written during each probe step
    uint8_t testValue{0x32};

    /// Accepted distance between written and observed channel value
    uint8_t toleranceBand{25};
};

/// Advertisement acceptance rules
struct AdvertisementConfig {
    uint16_t companyIdMin{0x5A00};
    uint16_t companyIdMax{0x5AFF};
};

/// Per-category log verbosity (0-4) and hex dump switch
struct LogVerbosityConfig {
    uint8_t engine{1};
    uint8_t advertisement{1};
    uint8_t capabilities{1};
    uint8_t commands{1};
    uint8_t transport{1};
    uint8_t session{1};
    uint8_t state{1};
    uint8_t probe{1};
    bool hexDumps{false};
};

struct EngineConfig {
    SessionConfig session{};
    ProbeConfig probe{};
    AdvertisementConfig advertisement{};
    LogVerbosityConfig logging{};
};

} // namespace LEDBLE
