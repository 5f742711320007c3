//
// LogConfig.hpp
// LEDBLEEngine
//
// Runtime logging configuration singleton
// Takes verbosity levels from the host EngineConfig and supports runtime updates
//

#ifndef LEDBLE_LOGGING_LOGCONFIG_HPP
#define LEDBLE_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <atomic>

namespace LEDBLE {

struct LogVerbosityConfig;

/**
 * @brief Centralized logging configuration manager
 *
 * One verbosity level (0-4) per logging category plus a hex dump switch.
 * Thread-safe singleton; levels may be changed at runtime by the host.
 */
class LogConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static LogConfig& Shared();

    /**
     * @brief Apply host configuration
     *
     * Call once when the host brings the engine up. Later calls are ignored
     * until Reset().
     */
    void Initialize(const LogVerbosityConfig& config);

    /**
     * @brief Return to defaults (level 1, no hex dumps) and allow Initialize again
     */
    void Reset();

    // ========================================================================
    // Getters (thread-safe, const)
    // ========================================================================

    uint8_t GetEngineVerbosity() const;
    uint8_t GetAdvertisementVerbosity() const;
    uint8_t GetCapabilitiesVerbosity() const;
    uint8_t GetCommandsVerbosity() const;

    /**
     * @brief Get Transport (framing / reassembly) verbosity level (0-4)
     */
    uint8_t GetTransportVerbosity() const;

    /**
     * @brief Get Session (command queue) verbosity level (0-4)
     */
    uint8_t GetSessionVerbosity() const;
    uint8_t GetStateVerbosity() const;
    uint8_t GetProbeVerbosity() const;

    /**
     * @brief Check if hex dumps are enabled
     */
    bool IsHexDumpsEnabled() const;

    // ========================================================================
    // Runtime Setters (thread-safe)
    // ========================================================================

    void SetEngineVerbosity(uint8_t level);
    void SetAdvertisementVerbosity(uint8_t level);
    void SetCapabilitiesVerbosity(uint8_t level);
    void SetCommandsVerbosity(uint8_t level);
    void SetTransportVerbosity(uint8_t level);
    void SetSessionVerbosity(uint8_t level);
    void SetStateVerbosity(uint8_t level);
    void SetProbeVerbosity(uint8_t level);
    void SetHexDumps(bool enable);

private:
    LogConfig();
    ~LogConfig() = default;

    // Non-copyable
    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    /**
     * @brief Clamp verbosity level to valid range [0, 4]
     */
    static uint8_t ClampLevel(uint8_t level);

    std::atomic<uint8_t> engineVerbosity_;
    std::atomic<uint8_t> advertisementVerbosity_;
    std::atomic<uint8_t> capabilitiesVerbosity_;
    std::atomic<uint8_t> commandsVerbosity_;
    std::atomic<uint8_t> transportVerbosity_;
    std::atomic<uint8_t> sessionVerbosity_;
    std::atomic<uint8_t> stateVerbosity_;
    std::atomic<uint8_t> probeVerbosity_;
    std::atomic<bool> enableHexDumps_;
    std::atomic<bool> initialized_;
};

} // namespace LEDBLE

#endif // LEDBLE_LOGGING_LOGCONFIG_HPP
