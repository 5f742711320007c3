#pragma once

#include "../../LEDBLEEngine/Transport/IScheduler.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace LEDBLE::Transport::Fakes {

/**
 * @brief Manually driven clock and timer queue.
 *
 * Nothing fires until the test calls Advance(). Timers due at the same
 * instant fire in scheduling order.
 *
 * **Example usage**:
 *
 *   FakeScheduler scheduler;
 *   bool fired = false;
 *   scheduler.ScheduleAfter(300, [&] { fired = true; });
 *
 *   scheduler.Advance(299);
 *   EXPECT_FALSE(fired);
 *   scheduler.Advance(1);
 *   EXPECT_TRUE(fired);
 */
class FakeScheduler : public IScheduler {
public:
    uint64_t NowMs() const override { return now_; }

    TimerToken ScheduleAfter(uint32_t delayMs, std::function<void()> fn) override {
        const TimerToken token = nextToken_++;
        timers_.emplace(token, Timer{now_ + delayMs, std::move(fn)});
        return token;
    }

    bool Cancel(TimerToken token) override {
        return timers_.erase(token) != 0;
    }

    /// Move the clock forward, firing every timer that comes due on the way
    void Advance(uint64_t ms) {
        const uint64_t target = now_ + ms;
        for (;;) {
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline <= target &&
                    (due == timers_.end() || it->second.deadline < due->second.deadline)) {
                    due = it;
                }
            }
            if (due == timers_.end()) {
                break;
            }
            now_ = due->second.deadline;
            auto fn = std::move(due->second.fn);
            timers_.erase(due);
            fn();
        }
        now_ = target;
    }

    /// Fire everything pending, however far out
    void RunAll() {
        while (!timers_.empty()) {
            uint64_t latest = now_;
            for (const auto& [token, timer] : timers_) {
                latest = std::max(latest, timer.deadline);
            }
            Advance(latest - now_);
        }
    }

    [[nodiscard]] size_t PendingCount() const { return timers_.size(); }

private:
    struct Timer {
        uint64_t deadline;
        std::function<void()> fn;
    };

    uint64_t now_{0};
    TimerToken nextToken_{1};
    // Ordered by token, so equal deadlines fire in scheduling order
    std::map<TimerToken, Timer> timers_;
};

} // namespace LEDBLE::Transport::Fakes
