#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "statesync/core/protocol/priority.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

// Locally generated event waiting for an event_ack.
struct PendingEvent {
    std::string id;                               // message id reused on every replay
    std::string content;
    std::map<std::string, std::string> context;
    std::int64_t created_at{0};                   // ms since epoch
    protocol::Priority priority{protocol::Priority::Normal};
    bool in_flight{false};
};


/*
===============================================================================
 sync::OfflineBuffer
===============================================================================

Holds every locally submitted event, in submission order, until the remote
authority acknowledges it. Events submitted while offline wait here idle;
events submitted while connected enter already in flight.

Lifecycle of an entry:

    add() ──► idle ──mark_in_flight()──► in flight ──ack()──► removed
               ▲                             │
               └──────────release()──────────┘   (send failed / dropped)

- Removal happens only on ack() or clear(). Sending an entry does not
  remove it; a lost connection (or a failover) after the send releases it
  to be replayed again (at-least-once). The id is stable across replays so the
  authority can de-duplicate.
- replay candidates are idle entries only. An entry already in flight is
  skipped, which keeps two overlapping replays from queueing it twice.
- Bounded: when full, the oldest non-high entry is evicted first; if every
  entry is high priority the oldest one goes.
===============================================================================
*/
class OfflineBuffer {
public:
    explicit OfflineBuffer(std::size_t capacity) noexcept
        : capacity_(capacity)
    {}

    OfflineBuffer(const OfflineBuffer&) = delete;
    OfflineBuffer& operator=(const OfflineBuffer&) = delete;

    // Returns true if an older entry was evicted to make room.
    inline bool add(PendingEvent event) {
        if (contains(event.id)) {
            // Re-buffering a replayed entry: just make it eligible again
            (void)release(event.id);
            return false;
        }
        bool evicted = false;
        if (entries_.size() >= capacity_) {
            evict_one_();
            evicted = true;
        }
        SS_DEBUG("[BUFFER] Buffered event " << event.id << " (" << (entries_.size() + 1) << "/" << capacity_ << ")");
        event.in_flight = false;
        entries_.push_back(std::move(event));
        return evicted;
    }

    // Idle entries in submission order (copies).
    [[nodiscard]]
    inline std::vector<PendingEvent> pending_replay() const {
        std::vector<PendingEvent> out;
        for (const auto& e : entries_) {
            if (!e.in_flight) {
                out.push_back(e);
            }
        }
        return out;
    }

    inline bool mark_in_flight(std::string_view id) noexcept {
        if (auto* e = find_(id)) {
            e->in_flight = true;
            return true;
        }
        return false;
    }

    // Makes an in-flight entry eligible for the next replay.
    inline bool release(std::string_view id) noexcept {
        if (auto* e = find_(id)) {
            e->in_flight = false;
            return true;
        }
        return false;
    }

    // Releases the in-flight entries matching `pred`. Returns how many.
    template <typename Pred>
    inline std::size_t release_if(Pred&& pred) {
        std::size_t n = 0;
        for (auto& e : entries_) {
            if (e.in_flight && pred(static_cast<const PendingEvent&>(e))) {
                e.in_flight = false;
                ++n;
            }
        }
        return n;
    }

    // Removes the entry acknowledged by the authority.
    inline bool ack(std::string_view ref_id) {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->id == ref_id) {
                SS_DEBUG("[BUFFER] Event " << ref_id << " acknowledged");
                entries_.erase(it);
                ++acked_;
                return true;
            }
        }
        return false;
    }

    inline void clear() noexcept {
        if (!entries_.empty()) {
            SS_INFO("[BUFFER] Cleared " << entries_.size() << " buffered event(s)");
        }
        entries_.clear();
    }

    [[nodiscard]]
    inline bool contains(std::string_view id) const noexcept {
        for (const auto& e : entries_) {
            if (e.id == id) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline bool in_flight(std::string_view id) const noexcept {
        for (const auto& e : entries_) {
            if (e.id == id) {
                return e.in_flight;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline std::size_t in_flight_count() const noexcept {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            n += e.in_flight ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline std::uint64_t evicted() const noexcept { return evicted_; }
    [[nodiscard]] inline std::uint64_t acked() const noexcept { return acked_; }

private:
    std::deque<PendingEvent> entries_;
    std::size_t capacity_;
    std::uint64_t evicted_{0};
    std::uint64_t acked_{0};

    inline PendingEvent* find_(std::string_view id) noexcept {
        for (auto& e : entries_) {
            if (e.id == id) {
                return &e;
            }
        }
        return nullptr;
    }

    inline void evict_one_() {
        auto victim = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->priority != protocol::Priority::High) {
                victim = it;
                break;
            }
        }
        SS_WARN("[BUFFER] Full (" << capacity_ << "), evicting " << to_string(victim->priority) << " event " << victim->id);
        entries_.erase(victim);
        ++evicted_;
    }
};

} // namespace statesync::core::sync
