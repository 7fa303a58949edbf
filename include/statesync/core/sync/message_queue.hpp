#pragma once

#include <array>
#include <deque>
#include <cstdint>
#include <string_view>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/priority.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

// Queued outbound message plus its send-attempt counter.
struct Outbound {
    protocol::Message message;
    std::uint32_t retries{0};
};

enum class Admission : std::uint8_t {
    Queued,            // stored, nothing displaced
    QueuedEvictedLow,  // stored after evicting the oldest low-priority message
    Dropped            // queue full with no low-priority candidate
};

[[nodiscard]]
inline constexpr std::string_view to_string(Admission a) noexcept {
    switch (a) {
        case Admission::Queued:           return "queued";
        case Admission::QueuedEvictedLow: return "queued_evicted_low";
        case Admission::Dropped:          return "dropped";
        default:                          return "unknown";
    }
}


/*
===============================================================================
 sync::MessageQueue
===============================================================================

Bounded, priority-tiered outbound buffer.

    tier 0 (high)   [ m3 m7 ]
    tier 1 (normal) [ m1 m2 m5 ]
    tier 2 (low)    [ m4 m6 ]

Ordering:
- drain() empties tier 0 before tier 1 before tier 2, FIFO within a tier.
- A message whose send fails goes back to the FRONT of its tier, so it is
  retried before newer peers of the same priority.

Capacity is shared by all tiers. When full, enqueue() evicts the oldest low
message to make room; with no low message to evict the incoming one is
dropped and the caller signals the overflow.

The queue never blocks and never talks to the transport itself: drain() takes
the send operation as a callable so the queue is testable in isolation.
===============================================================================
*/
class MessageQueue {
public:
    MessageQueue(std::size_t capacity, std::uint32_t max_send_retries) noexcept
        : capacity_(capacity)
        , max_send_retries_(max_send_retries)
    {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    // On QueuedEvictedLow `evicted` receives the displaced message; on
    // Dropped it receives the incoming one.
    [[nodiscard]]
    inline Admission enqueue(Outbound item, Outbound& evicted) {
        if (size_ >= capacity_) {
            auto& low = tiers_[protocol::tier(protocol::Priority::Low)];
            if (low.empty()) {
                ++dropped_;
                SS_WARN("[QUEUE] Full (" << capacity_ << "), dropping incoming '" << item.message.type_name()
                        << "' message " << item.message.id);
                evicted = std::move(item);
                return Admission::Dropped;
            }
            evicted = std::move(low.front());
            low.pop_front();
            --size_;
            ++evicted_;
            SS_DEBUG("[QUEUE] Full (" << capacity_ << "), evicted low-priority message " << evicted.message.id);
            push_back_(std::move(item));
            return Admission::QueuedEvictedLow;
        }
        push_back_(std::move(item));
        return Admission::Queued;
    }

    // Sends queued messages in priority order until the queue is empty or a
    // send fails.
    //
    //   send(const Outbound&) -> bool
    //   on_failed(Outbound&&)          retry budget exhausted, message dropped
    //
    // Returns the number of messages sent.
    template <typename SendFn, typename FailedFn>
    inline std::size_t drain(SendFn&& send, FailedFn&& on_failed) {
        std::size_t count = 0;
        for (auto& tier : tiers_) {
            while (!tier.empty()) {
                Outbound item = std::move(tier.front());
                tier.pop_front();
                --size_;
                if (send(item)) [[likely]] {
                    ++sent_;
                    ++count;
                    continue;
                }
                ++item.retries;
                if (item.retries < max_send_retries_) {
                    ++retried_;
                    SS_DEBUG("[QUEUE] Send failed for " << item.message.id << " (attempt " << item.retries
                             << "/" << max_send_retries_ << "), requeued");
                    tier.push_front(std::move(item));
                    ++size_;
                } else {
                    ++failed_;
                    SS_WARN("[QUEUE] Message " << item.message.id << " failed after " << item.retries << " attempt(s)");
                    on_failed(std::move(item));
                }
                // The connection just refused a frame; let the pool settle
                return count;
            }
        }
        return count;
    }

    [[nodiscard]]
    inline bool contains(std::string_view id) const noexcept {
        for (const auto& tier : tiers_) {
            for (const auto& item : tier) {
                if (item.message.id == id) {
                    return true;
                }
            }
        }
        return false;
    }

    // Copy of the queued messages in drain order.
    [[nodiscard]]
    inline std::deque<protocol::Message> snapshot() const {
        std::deque<protocol::Message> out;
        for (const auto& tier : tiers_) {
            for (const auto& item : tier) {
                out.push_back(item.message);
            }
        }
        return out;
    }

    inline void clear() noexcept {
        for (auto& tier : tiers_) {
            tier.clear();
        }
        size_ = 0;
    }

    // Accessors
    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline std::size_t size(protocol::Priority p) const noexcept { return tiers_[protocol::tier(p)].size(); }

    // Counters
    [[nodiscard]] inline std::uint64_t sent() const noexcept { return sent_; }
    [[nodiscard]] inline std::uint64_t retried() const noexcept { return retried_; }
    [[nodiscard]] inline std::uint64_t failed() const noexcept { return failed_; }
    [[nodiscard]] inline std::uint64_t evicted() const noexcept { return evicted_; }
    [[nodiscard]] inline std::uint64_t dropped() const noexcept { return dropped_; }

private:
    std::array<std::deque<Outbound>, protocol::PRIORITY_TIERS> tiers_;
    std::size_t size_{0};
    std::size_t capacity_;
    std::uint32_t max_send_retries_;

    std::uint64_t sent_{0};
    std::uint64_t retried_{0};
    std::uint64_t failed_{0};
    std::uint64_t evicted_{0};
    std::uint64_t dropped_{0};

    inline void push_back_(Outbound&& item) {
        tiers_[protocol::tier(item.message.priority)].push_back(std::move(item));
        ++size_;
    }
};

} // namespace statesync::core::sync
