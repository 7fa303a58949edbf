#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded fixed-capacity ring buffer.
//
// Two admission policies share the same storage:
//   • push()            rejects the item when the ring is full
//   • push_overwrite()  evicts the oldest item to make room
//
// The first fits bounded event channels where overflow must be observable,
// the second fits bounded sample histories where only the last N matter.
//
// Characteristics:
//   • O(1) push/pop, O(1) indexed access from either end
//   • Power-of-two capacity for modulo-free wraparound
//   • All Capacity slots are usable
//   • No dynamic allocation except in snapshot()
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//
// Example:
//   ring_buffer<double, 128> history;
//   history.push_overwrite(0.42);
//   double newest = history.from_newest(0);
//
// Template parameters:
//   T         - element type stored in the buffer
//   Capacity  - must be a power of two and >= 2
//------------------------------------------------------------------------------
template <typename T, std::size_t Capacity>
class ring_buffer {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");

public:
    ring_buffer() noexcept = default;

    // Non-copyable (snapshot() hands out copies)
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    // Returns false (and drops nothing) when full.
    inline bool push(const T& item) noexcept {
        if (size_ == Capacity) [[unlikely]] {
            return false;
        }
        buffer_[(tail_ + size_) & MASK] = item;
        ++size_;
        return true;
    }

    // Returns true if the oldest element was evicted to make room.
    inline bool push_overwrite(const T& item) noexcept {
        if (size_ == Capacity) {
            buffer_[tail_] = item;
            tail_ = (tail_ + 1) & MASK;
            return true;
        }
        buffer_[(tail_ + size_) & MASK] = item;
        ++size_;
        return false;
    }

    // Pops the oldest element.
    inline bool pop(T& out) noexcept {
        if (size_ == 0) [[unlikely]] {
            return false;
        }
        out = std::move(buffer_[tail_]);
        tail_ = (tail_ + 1) & MASK;
        --size_;
        return true;
    }

    // Element `age` positions back from the newest (0 = newest).
    // PRECONDITION: age < size()
    [[nodiscard]]
    inline const T& from_newest(std::size_t age) const noexcept {
        return buffer_[(tail_ + size_ - 1 - age) & MASK];
    }

    // Copies the retained elements, oldest first.
    [[nodiscard]]
    std::vector<T> snapshot() const {
        std::vector<T> out;
        out.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) {
            out.push_back(buffer_[(tail_ + i) & MASK]);
        }
        return out;
    }

    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] inline bool full() const noexcept { return size_ == Capacity; }
    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline constexpr std::size_t capacity() const noexcept { return Capacity; }

    inline void clear() noexcept {
        tail_ = 0;
        size_ = 0;
    }

private:
    static constexpr std::size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    std::size_t tail_{0};
    std::size_t size_{0};
};

} // namespace local
} // namespace lcr
