#pragma once

#include <cstdint>
#include <functional>

namespace LEDBLE::Transport {

using TimerToken = uint64_t;
inline constexpr TimerToken kInvalidTimer = 0;

/**
 * @brief Injectable clock and one-shot timer source.
 *
 * The session arms response timeouts and the probe waits its settle delay
 * through this interface, so tests drive time by hand.
 */
class IScheduler {
public:
    virtual ~IScheduler() = default;

    /// Monotonic milliseconds
    virtual uint64_t NowMs() const = 0;

    /// Run `fn` once after `delayMs`. Returns a token for Cancel().
    virtual TimerToken ScheduleAfter(uint32_t delayMs, std::function<void()> fn) = 0;

    /// Returns false if the timer already fired or was unknown
    virtual bool Cancel(TimerToken token) = 0;
};

} // namespace LEDBLE::Transport
