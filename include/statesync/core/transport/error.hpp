#pragma once

#include <string_view>

namespace statesync::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Beast, Asio, OpenSSL).

Higher layers (transport::Connection, sync::ConnectionPool, the reconnection
supervisor) use this classification to decide whether and how to recover.
Connection-level errors never reach application code as exceptions; they
surface as pool events and status transitions.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Operation was intentionally aborted due to a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Connect, handshake or heartbeat window elapsed
    ConnectionFailed, // Connection attempt failed (DNS, refused, routing)
    HandshakeFailed,  // TLS, WebSocket upgrade or application handshake failure

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified transport failure
};


/// Optional helper for logging / diagnostics
[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace statesync::core
