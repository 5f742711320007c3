#pragma once

#include <cstdint>

namespace LEDBLE::Transport {

// Connection-scoped frame sequence number. Wraps mod 256 and is used only to
// correlate frames, never as an anti-replay value. Reset on every connect.
class SequenceCounter {
public:
    [[nodiscard]] uint8_t Next() noexcept { return next_++; }
    [[nodiscard]] uint8_t Peek() const noexcept { return next_; }
    void Reset(uint8_t start = 0) noexcept { next_ = start; }

private:
    uint8_t next_{0};
};

} // namespace LEDBLE::Transport
