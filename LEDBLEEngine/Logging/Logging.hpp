#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

//
// Category-stable logging for the engine. Every line carries a "[Category]"
// prefix so host log filters can select a subsystem. Output goes through a
// replaceable sink (stderr by default).
//

namespace LEDBLE::Logging {

enum class Level : uint8_t {
    Default,
    Info,
    Debug,
    Error,
    Fault,
};

struct LogCategory {
    const char* name;
};

const LogCategory& Engine();
const LogCategory& Advertisement();
const LogCategory& Capabilities();
const LogCategory& Commands();
const LogCategory& Transport();
const LogCategory& Session();
const LogCategory& State();
const LogCategory& Probe();

/// Receives fully formatted lines (prefix included, no trailing newline).
using LogSink = std::function<void(Level level, const LogCategory& category, std::string_view line)>;

/// Replace the process-wide sink. Passing an empty function restores stderr.
void SetSink(LogSink sink);

void Emit(const LogCategory& category, Level level, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

[[nodiscard]] const char* ToString(Level level) noexcept;

} // namespace LEDBLE::Logging

// ----- time helpers -----
namespace LEDBLE::LogDetail {
inline uint64_t NowNs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace LEDBLE::LogDetail

// ----- Plain logging -----
#define LEDBLE_LOG_TYPE(cat, level, fmt, ...) \
    ::LEDBLE::Logging::Emit(::LEDBLE::Logging::cat(), (level), "[%s] " fmt, #cat, ##__VA_ARGS__)

#define LEDBLE_LOG(cat, fmt, ...) \
    LEDBLE_LOG_TYPE(cat, ::LEDBLE::Logging::Level::Default, fmt, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "session/ambient"); interval_ms: throttle window
#define LEDBLE_LOG_RL(cat, key, interval_ms, fmt, ...)                                         \
    do {                                                                                        \
        static ::LEDBLE::LogDetail::RlState _s;                                                 \
        const uint64_t _now = ::LEDBLE::LogDetail::NowNs();                                     \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    LEDBLE_LOG(cat, "[%s] (suppressed=%llu prior)", key,                        \
                               (unsigned long long)_lost);                                      \
                }                                                                               \
            }                                                                                   \
            LEDBLE_LOG(cat, "[%s] " fmt, key, ##__VA_ARGS__);                                   \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

// Convenience shorthands
#define LEDBLE_LOG_INFO(cat, fmt, ...)  LEDBLE_LOG_TYPE(cat, ::LEDBLE::Logging::Level::Info,  fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_ERROR(cat, fmt, ...) LEDBLE_LOG_TYPE(cat, ::LEDBLE::Logging::Level::Error, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_DEBUG(cat, fmt, ...) LEDBLE_LOG_TYPE(cat, ::LEDBLE::Logging::Level::Debug, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_FAULT(cat, fmt, ...) LEDBLE_LOG_TYPE(cat, ::LEDBLE::Logging::Level::Fault, fmt, ##__VA_ARGS__)

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
//   LEDBLE_LOG_V0(Transport, "Write failed");        // Level 0+ (errors, failures)
//   LEDBLE_LOG_V1(Transport, "TX seq=3 OK");         // Level 1+ (compact summaries)
//   LEDBLE_LOG_V2(Probe, "State transition");        // Level 2+ (key transitions)
//   LEDBLE_LOG_V3(Session, "Detailed flow");         // Level 3+ (verbose)
//   LEDBLE_LOG_V4(Transport, "Frame dump");          // Level 4+ (full diagnostics)
//   LEDBLE_LOG_HEX(Transport, "Frame: %s", hex);     // Hex dumps (flag or level 4)
//
// Levels come from LogConfig (see LogConfig.hpp).

namespace LEDBLE {
class LogConfig;
}

#define LEDBLE_GET_VERBOSITY(category) \
    (::LEDBLE::LogConfig::Shared().Get##category##Verbosity())

#define LEDBLE_LOG_VN(category, n, fmt, ...) \
    do { \
        if (LEDBLE_GET_VERBOSITY(category) >= (n)) { \
            LEDBLE_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define LEDBLE_LOG_V0(category, fmt, ...) LEDBLE_LOG(category, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_V1(category, fmt, ...) LEDBLE_LOG_VN(category, 1, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_V2(category, fmt, ...) LEDBLE_LOG_VN(category, 2, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_V3(category, fmt, ...) LEDBLE_LOG_VN(category, 3, fmt, ##__VA_ARGS__)
#define LEDBLE_LOG_V4(category, fmt, ...) LEDBLE_LOG_VN(category, 4, fmt, ##__VA_ARGS__)

#define LEDBLE_LOG_HEX(category, fmt, ...) \
    do { \
        if (::LEDBLE::LogConfig::Shared().IsHexDumpsEnabled() || \
            LEDBLE_GET_VERBOSITY(category) >= 4) { \
            LEDBLE_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)
