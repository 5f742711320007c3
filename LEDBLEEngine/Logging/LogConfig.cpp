//
// LogConfig.cpp
// LEDBLEEngine
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"
#include "../Core/EngineConfig.hpp"

namespace LEDBLE {

namespace {
constexpr uint8_t kDefaultVerbosity = 1;
constexpr uint8_t kMaxVerbosity = 4;
} // namespace

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig() {
    Reset();
}

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize(const LogVerbosityConfig& config) {
    if (initialized_.load()) {
        LEDBLE_LOG(Engine, "LogConfig already initialized, skipping");
        return;
    }

    engineVerbosity_.store(ClampLevel(config.engine));
    advertisementVerbosity_.store(ClampLevel(config.advertisement));
    capabilitiesVerbosity_.store(ClampLevel(config.capabilities));
    commandsVerbosity_.store(ClampLevel(config.commands));
    transportVerbosity_.store(ClampLevel(config.transport));
    sessionVerbosity_.store(ClampLevel(config.session));
    stateVerbosity_.store(ClampLevel(config.state));
    probeVerbosity_.store(ClampLevel(config.probe));
    enableHexDumps_.store(config.hexDumps);

    initialized_.store(true);

    LEDBLE_LOG_INFO(Engine,
                    "LogConfig initialized: Transport=%u Session=%u Probe=%u State=%u HexDumps=%d",
                    transportVerbosity_.load(), sessionVerbosity_.load(), probeVerbosity_.load(),
                    stateVerbosity_.load(), enableHexDumps_.load());
}

void LogConfig::Reset() {
    engineVerbosity_.store(kDefaultVerbosity);
    advertisementVerbosity_.store(kDefaultVerbosity);
    capabilitiesVerbosity_.store(kDefaultVerbosity);
    commandsVerbosity_.store(kDefaultVerbosity);
    transportVerbosity_.store(kDefaultVerbosity);
    sessionVerbosity_.store(kDefaultVerbosity);
    stateVerbosity_.store(kDefaultVerbosity);
    probeVerbosity_.store(kDefaultVerbosity);
    enableHexDumps_.store(false);
    initialized_.store(false);
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetEngineVerbosity() const {
    return engineVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetAdvertisementVerbosity() const {
    return advertisementVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetCapabilitiesVerbosity() const {
    return capabilitiesVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetCommandsVerbosity() const {
    return commandsVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetTransportVerbosity() const {
    return transportVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetSessionVerbosity() const {
    return sessionVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetStateVerbosity() const {
    return stateVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetProbeVerbosity() const {
    return probeVerbosity_.load(std::memory_order_relaxed);
}

bool LogConfig::IsHexDumpsEnabled() const {
    return enableHexDumps_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetEngineVerbosity(uint8_t level) {
    level = ClampLevel(level);
    engineVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Engine verbosity changed to %u", level);
}

void LogConfig::SetAdvertisementVerbosity(uint8_t level) {
    level = ClampLevel(level);
    advertisementVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Advertisement verbosity changed to %u", level);
}

void LogConfig::SetCapabilitiesVerbosity(uint8_t level) {
    level = ClampLevel(level);
    capabilitiesVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Capabilities verbosity changed to %u", level);
}

void LogConfig::SetCommandsVerbosity(uint8_t level) {
    level = ClampLevel(level);
    commandsVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Commands verbosity changed to %u", level);
}

void LogConfig::SetTransportVerbosity(uint8_t level) {
    level = ClampLevel(level);
    transportVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Transport verbosity changed to %u", level);
}

void LogConfig::SetSessionVerbosity(uint8_t level) {
    level = ClampLevel(level);
    sessionVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Session verbosity changed to %u", level);
}

void LogConfig::SetStateVerbosity(uint8_t level) {
    level = ClampLevel(level);
    stateVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "State verbosity changed to %u", level);
}

void LogConfig::SetProbeVerbosity(uint8_t level) {
    level = ClampLevel(level);
    probeVerbosity_.store(level, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Probe verbosity changed to %u", level);
}

void LogConfig::SetHexDumps(bool enable) {
    enableHexDumps_.store(enable, std::memory_order_relaxed);
    LEDBLE_LOG_INFO(Engine, "Hex dumps %s", enable ? "enabled" : "disabled");
}

// ============================================================================
// Private Helpers
// ============================================================================

uint8_t LogConfig::ClampLevel(uint8_t level) {
    return level > kMaxVerbosity ? kMaxVerbosity : level;
}

} // namespace LEDBLE
