#pragma once

#include <chrono>

namespace statesync::test {

// -----------------------------------------------------------------------------
// ManualClock
// -----------------------------------------------------------------------------
//
// Clock satisfying the std::chrono Clock requirements whose time only moves
// when a test calls advance(). Handshake windows, heartbeats, backoff delays
// and response timeouts become deterministic.
// -----------------------------------------------------------------------------
struct ManualClock {
    using duration = std::chrono::steady_clock::duration;
    using rep = duration::rep;
    using period = duration::period;
    using time_point = std::chrono::time_point<ManualClock, duration>;
    static constexpr bool is_steady = true;

    static time_point now() noexcept {
        return now_;
    }

    template <typename Rep, typename Period>
    static void advance(std::chrono::duration<Rep, Period> d) noexcept {
        now_ += std::chrono::duration_cast<duration>(d);
    }

    // Starts well after the epoch so "zero" deadlines are already in the past
    static void reset() noexcept {
        now_ = time_point{} + std::chrono::hours(1);
    }

private:
    inline static time_point now_{std::chrono::hours(1)};
};

} // namespace statesync::test
