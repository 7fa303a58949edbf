#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <algorithm>

#include "statesync/core/sync/link_status.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

// -----------------------------------------------------------------------------
// Exponential backoff: delay(attempt) = min(cap, base * 2^attempt)
// -----------------------------------------------------------------------------
struct Backoff {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};

    [[nodiscard]]
    inline std::chrono::milliseconds delay(std::uint32_t attempt) const noexcept {
        // Saturate before shifting: past 2^30 every realistic cap is reached
        if (attempt >= 30) {
            return cap;
        }
        const auto factor = std::chrono::milliseconds::rep{1} << attempt;
        if (base.count() > cap.count() / factor) {
            return cap;
        }
        return std::min(cap, base * factor);
    }
};


/*
===============================================================================
 sync::ReconnectSupervisor
===============================================================================

Drives reconnection after the pool goes fully down.

    Disconnected → Connecting → Connected → (failure) Reconnecting → Connecting → ...
                                                   ↘ (attempts exhausted) Offline

- The attempt counter counts reconnection cycles scheduled since the last
  success and resets to 0 on every successful connection.
- With a finite max_attempts, the cycle after the last allowed attempt parks
  the supervisor in Offline instead of scheduling another retry. Offline is
  terminal until restart() (force_sync) or start() (connect).
- Every transition updates the observable status string. Nothing in the core
  branches on that string.

Poll-driven: poll(now) returns true exactly once when a scheduled retry is
due, and the owner then opens a new pool generation.
===============================================================================
*/
template <typename Clock = std::chrono::steady_clock>
class ReconnectSupervisor {
public:
    using time_point = typename Clock::time_point;

    ReconnectSupervisor(Backoff backoff, std::int32_t max_attempts) noexcept
        : backoff_(backoff)
        , max_attempts_(max_attempts)
    {}

    // User intent: connect()
    inline void start() noexcept {
        attempts_ = 0;
        set_status_(LinkStatus::Connecting);
    }

    // User intent: disconnect()
    inline void stop() noexcept {
        set_status_(LinkStatus::Disconnected);
    }

    // User intent: force_sync() while not connected. Leaves Offline too.
    inline void restart() noexcept {
        SS_INFO("[SUPERVISOR] Reconnection cycle restarted");
        attempts_ = 0;
        set_status_(LinkStatus::Connecting);
    }

    inline void on_connected() noexcept {
        if (attempts_ > 0) {
            SS_INFO("[SUPERVISOR] Reconnected after " << attempts_ << " attempt(s)");
        }
        attempts_ = 0;
        set_status_(LinkStatus::Connected);
    }

    // The pool went fully down, or a connection cycle failed entirely.
    inline void on_connection_lost(time_point now) noexcept {
        if (status_ == LinkStatus::Disconnected || status_ == LinkStatus::Offline) {
            return; // no auto-retry after stop() or give-up
        }
        if (max_attempts_ >= 0 && attempts_ >= static_cast<std::uint32_t>(max_attempts_)) {
            SS_WARN("[SUPERVISOR] Giving up after " << attempts_ << " reconnection attempt(s). Going offline.");
            set_status_(LinkStatus::Offline);
            return;
        }
        last_delay_ = backoff_.delay(attempts_);
        ++attempts_;
        next_attempt_ = now + last_delay_;
        SS_INFO("[SUPERVISOR] Reconnection attempt " << attempts_ << " in " << last_delay_.count() << " ms");
        set_status_(LinkStatus::Reconnecting);
    }

    // Returns true when a scheduled retry is due (Reconnecting → Connecting).
    [[nodiscard]]
    inline bool poll(time_point now) noexcept {
        if (status_ != LinkStatus::Reconnecting || now < next_attempt_) {
            return false;
        }
        set_status_(LinkStatus::Connecting);
        return true;
    }

    // Status edge for the owner; reports each transition at most once.
    [[nodiscard]]
    inline bool take_status_change(LinkStatus& out) noexcept {
        if (!status_dirty_) {
            return false;
        }
        status_dirty_ = false;
        out = status_;
        return true;
    }

    // Accessors
    [[nodiscard]] inline LinkStatus status() const noexcept { return status_; }
    [[nodiscard]] inline std::string_view status_text() const noexcept { return to_string(status_); }
    [[nodiscard]] inline std::uint32_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] inline std::chrono::milliseconds last_delay() const noexcept { return last_delay_; }
    [[nodiscard]] inline time_point next_attempt() const noexcept { return next_attempt_; }
    [[nodiscard]] inline const Backoff& backoff() const noexcept { return backoff_; }

private:
    Backoff backoff_;
    std::int32_t max_attempts_;

    LinkStatus status_{LinkStatus::Disconnected};
    bool status_dirty_{false};
    std::uint32_t attempts_{0};
    std::chrono::milliseconds last_delay_{0};
    time_point next_attempt_{};

    inline void set_status_(LinkStatus next) noexcept {
        if (next == status_) {
            return;
        }
        SS_DEBUG("[SUPERVISOR] Status: " << to_string(status_) << " -> " << to_string(next));
        status_ = next;
        status_dirty_ = true;
    }
};

} // namespace statesync::core::sync
