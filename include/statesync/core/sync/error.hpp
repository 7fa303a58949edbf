#pragma once

#include <string>
#include <string_view>
#include <stdexcept>


namespace statesync::core::sync {

/*
===============================================================================
 sync::Error
===============================================================================

Failure taxonomy of the synchronization core.

    TransportError     connection-level, triggers failover / reconnect
    SendFailure        single message, triggers retry
    ResponseTimeout    single pending request, local only
    QueueOverflow      observable, non-fatal
    HandshakeRejected  connection attempt treated as failed
    HandlerError       caught at the dispatch boundary, logged, never fatal
    Disconnected       pending request cancelled by disconnect()
    NotConnected       operation requires an active connection
    InvalidMessage     payload does not match the declared type
    InvalidConfig      configuration rejected by validate()

Only operations the caller directly awaits (send_and_await, connect) report
errors back to the caller. Everything else surfaces as notices and metrics.
===============================================================================
*/
enum class Error {
    None = 0,
    TransportError,
    SendFailure,
    ResponseTimeout,
    QueueOverflow,
    HandshakeRejected,
    HandlerError,
    Disconnected,
    NotConnected,
    InvalidMessage,
    InvalidConfig,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::TransportError:    return "TransportError";
    case Error::SendFailure:       return "SendFailure";
    case Error::ResponseTimeout:   return "ResponseTimeout";
    case Error::QueueOverflow:     return "QueueOverflow";
    case Error::HandshakeRejected: return "HandshakeRejected";
    case Error::HandlerError:      return "HandlerError";
    case Error::Disconnected:      return "Disconnected";
    case Error::NotConnected:      return "NotConnected";
    case Error::InvalidMessage:    return "InvalidMessage";
    case Error::InvalidConfig:     return "InvalidConfig";
    default:                       return "Unknown";
    }
}

// Exception stored into the std::future returned by send_and_await() when
// the request ends without a response. Never thrown across the poll loop.
class SyncError : public std::runtime_error {
public:
    SyncError(Error code, const std::string& what)
        : std::runtime_error(what)
        , code_(code)
    {}

    [[nodiscard]]
    Error code() const noexcept { return code_; }

private:
    Error code_;
};

} // namespace statesync::core::sync
