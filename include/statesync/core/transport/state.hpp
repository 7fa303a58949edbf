#pragma once

#include <cstdint>
#include <string_view>


namespace statesync::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
//
// Connecting  transport attempt in progress (DNS, TCP, TLS, upgrade)
// Open        transport is up; the application handshake may still be pending
// Error       attempt or live connection failed (terminal for this instance)
// Closed      closed locally or by a graceful remote close (terminal)
//
enum class State : uint8_t {
    Connecting,
    Open,
    Error,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Connecting: return "connecting";
        case State::Open:       return "open";
        case State::Error:      return "error";
        case State::Closed:     return "closed";
        default:                return "unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportOpened,
    TransportFailed,
    TransportClosed,

    // --- Application handshake ---
    HandshakeAccepted,
    HandshakeRejected,
    HandshakeExpired,

    // --- Liveness ---
    LivenessExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:     return "OpenRequested";
        case Event::CloseRequested:    return "CloseRequested";
        case Event::TransportOpened:   return "TransportOpened";
        case Event::TransportFailed:   return "TransportFailed";
        case Event::TransportClosed:   return "TransportClosed";
        case Event::HandshakeAccepted: return "HandshakeAccepted";
        case Event::HandshakeRejected: return "HandshakeRejected";
        case Event::HandshakeExpired:  return "HandshakeExpired";
        case Event::LivenessExpired:   return "LivenessExpired";
        default:                       return "UnknownEvent";
    }
}

} // namespace statesync::core::transport
