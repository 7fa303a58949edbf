#pragma once

/*
===============================================================================
 statesync::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport implementation and
drained by the owning Connection through poll_event().

This replaces cross-thread callbacks (on_open / on_error / on_close) with a
deterministic, poll-driven event channel.

    • Open   → Upgrade handshake completed, frames may be sent
    • Error  → Transport-level failure (always followed by Close)
    • Close  → Transport closed (local or remote), delivered exactly once

Data-plane frames travel through a separate inbox (poll_message()).

Event is a small trivially copyable value, safe to hand across the transport
IO thread and the poll thread through a locked queue.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "statesync/core/transport/error.hpp"

namespace statesync::core::transport::websocket {

enum class EventType : std::uint8_t {
    Open  = 0,
    Close = 1,
    Error = 2,
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // meaningful only if type == EventType::Error

    static constexpr Event make_open() noexcept {
        return Event{EventType::Open, transport::Error::None};
    }

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");

} // namespace statesync::core::transport::websocket
