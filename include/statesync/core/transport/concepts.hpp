#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "statesync/core/transport/error.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "statesync/core/transport/websocket/events.hpp"

namespace statesync::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Minimal contract required by the Connection layer. This is the single
// platform seam of the library: every binding (Boost.Beast in production,
// the scripted mock in tests) implements it and nothing above it knows which
// one is in use.
//
// The WebSocket implementation:
//
//   • connect() starts an attempt and returns immediately; completion is
//     reported as an Open (or Error + Close) control event
//   • Owns its IO thread, if it needs one
//   • Queues inbound text frames for poll_message()
//   • Queues control-plane events for poll_event()
//
// No callbacks cross the thread boundary.
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const ParsedUrl& url,
        std::string_view msg,
        std::string& inbound,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Sending
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // Pull-based delivery
    { ws.poll_message(inbound) } noexcept -> std::same_as<bool>;
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace statesync::core::transport
