#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <cstdint>

#include "statesync/core/transport/concepts.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "statesync/core/transport/state.hpp"
#include "statesync/core/transport/connection/signal.hpp"
#include "statesync/core/transport/websocket/events.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::transport {

/*
===============================================================================
 statesync::core::transport::Connection
===============================================================================

A single duplex message channel to one server endpoint, parameterized by a
WebSocket transport implementation conforming to transport::WebSocketConcept
and by a clock (std::chrono::steady_clock in production, a manual clock in
tests).

One Connection instance represents one connection attempt and, if it
succeeds, one transport lifetime. It never reconnects by itself: replacing a
failed member is the pool's and the reconnection supervisor's job.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Drive the transport attempt (connect, upgrade) and observe its completion
- Write the application handshake frame as soon as the transport opens
- Enforce the handshake window (no answer in time → failed attempt)
- Own its liveness: ping every heartbeat interval, fail after N missed pongs
- Track observability facts: last activity, sent / received / error counts

-------------------------------------------------------------------------------
 Observability Model
-------------------------------------------------------------------------------
The Connection exposes facts, not inferred health:

- state()            connecting | open | error | closed
- ready()            handshake accepted, eligible to carry traffic
- last_activity()    last successful send or receive
- sent() / received() / errors()
- connection::Signal edge-triggered notifications drained with poll_signal()

Counters are for observability only; correctness never depends on them.

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- No inheritance and no virtual functions (concept-based transport seam)
- No background threads; all logic is poll-driven
- Fully testable with a mock transport and a manual clock
===============================================================================
*/

struct ConnectionOptions {
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::uint32_t heartbeat_max_missed{2};
};

template <
    transport::WebSocketConcept WS,
    typename Clock = std::chrono::steady_clock
>
class Connection {
public:
    using time_point = typename Clock::time_point;

    Connection(std::uint32_t id, ConnectionOptions options) noexcept
        : id_(id)
        , options_(options)
    {
    }

    // Ensure transport is closed on destruction.
    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Starts the transport attempt. `hello` is written as soon as the
    // transport reports Open.
    [[nodiscard]]
    inline Error open(const ParsedUrl& url, std::string hello) noexcept {
        if (ws_) {
            SS_WARN("[CONN] #" << id_ << " open() called twice. Ignoring.");
            return Error::InvalidState;
        }
        SS_DEBUG("[CONN] #" << id_ << " connecting to " << url.host << ":" << url.port << url.path);
        hello_ = std::move(hello);
        transition_(Event::OpenRequested);
        ws_ = std::make_unique<WS>();
        last_error_ = ws_->connect(url);
        if (last_error_ != Error::None) {
            SS_WARN("[CONN] #" << id_ << " connection attempt failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportFailed, last_error_);
            return last_error_;
        }
        return Error::None;
    }

    // Manual close. Idempotent; emits no signal.
    inline void close() noexcept {
        if (state_ == State::Error || state_ == State::Closed) {
            return;
        }
        transition_(Event::CloseRequested);
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (state_ != State::Open) {
            SS_DEBUG("[CONN] #" << id_ << " send() while " << to_string(state_) << ". Rejected.");
            return false;
        }
        if (!ws_->send(text)) [[unlikely]] {
            ++errors_;
            SS_WARN("[CONN] #" << id_ << " send failed");
            return false;
        }
        ++sent_;
        last_activity_ = Clock::now();
        return true;
    }

    // Writes a ping frame on behalf of the heartbeat and counts it as
    // outstanding until on_pong().
    [[nodiscard]]
    inline bool send_heartbeat(std::string_view ping) noexcept {
        if (!ready_) {
            return false;
        }
        ++outstanding_pings_;
        return send(ping);
    }

    inline void on_pong() noexcept {
        outstanding_pings_ = 0;
    }

    inline void accept_handshake() noexcept {
        transition_(Event::HandshakeAccepted);
    }

    inline void reject_handshake() noexcept {
        transition_(Event::HandshakeRejected, Error::HandshakeFailed);
    }

    // Event loop
    inline void poll() noexcept {
        if (!ws_) {
            return;
        }
        // === Drain transport events ===
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            switch (ev.type) {
                case websocket::EventType::Open:
                    transition_(Event::TransportOpened);
                    break;
                case websocket::EventType::Error:
                    on_transport_error_(ev.error);
                    break;
                case websocket::EventType::Close:
                    transition_(Event::TransportClosed, last_error_);
                    break;
            }
        }
        if (state_ != State::Open) {
            return;
        }
        const auto now = Clock::now();
        // === Handshake window ===
        if (!ready_) {
            if (now >= handshake_deadline_) {
                SS_WARN("[CONN] #" << id_ << " handshake not answered within " << options_.handshake_timeout.count() << " ms");
                transition_(Event::HandshakeExpired, Error::Timeout);
            }
            return;
        }
        // === Heartbeat ===
        if (now >= next_heartbeat_) {
            if (outstanding_pings_ >= options_.heartbeat_max_missed) {
                SS_WARN("[CONN] #" << id_ << " missed " << outstanding_pings_ << " consecutive pongs. Forcing close.");
                transition_(Event::LivenessExpired, Error::Timeout);
                return;
            }
            next_heartbeat_ = now + options_.heartbeat_interval;
            emit_(connection::Signal::HeartbeatDue);
        }
    }

    // Pull one inbound text frame.
    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!ws_ || state_ != State::Open) {
            return false;
        }
        if (!ws_->poll_message(out)) {
            return false;
        }
        ++received_;
        last_activity_ = Clock::now();
        return true;
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // Accessors
    [[nodiscard]] inline std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool ready() const noexcept { return ready_; }
    [[nodiscard]] inline bool is_open() const noexcept { return state_ == State::Open; }
    [[nodiscard]] inline bool is_pending() const noexcept { return state_ == State::Connecting || (state_ == State::Open && !ready_); }
    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline time_point last_activity() const noexcept { return last_activity_; }
    [[nodiscard]] inline std::uint64_t sent() const noexcept { return sent_; }
    [[nodiscard]] inline std::uint64_t received() const noexcept { return received_; }
    [[nodiscard]] inline std::uint64_t errors() const noexcept { return errors_; }
    [[nodiscard]] inline std::uint32_t outstanding_pings() const noexcept { return outstanding_pings_; }

#ifdef SS_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }
#endif // SS_UNIT_TEST

private:
    std::uint32_t id_;
    ConnectionOptions options_;
    std::string hello_;
    std::unique_ptr<WS> ws_;

    State state_{State::Connecting};
    bool ready_{false};
    Error last_error_{Error::None};

    time_point handshake_deadline_{};
    time_point next_heartbeat_{};
    std::uint32_t outstanding_pings_{0};

    time_point last_activity_{};
    std::uint64_t sent_{0};
    std::uint64_t received_{0};
    std::uint64_t errors_{0};

    lcr::local::ring_buffer<connection::Signal, 16> signals_;

    inline void emit_(connection::Signal sig) noexcept {
        SS_TRACE("[CONN] #" << id_ << " signal: " << to_string(sig));
        if (!signals_.push(sig)) [[unlikely]] {
            // Terminal signals are emitted once; only HeartbeatDue can pile up
            SS_WARN("[CONN] #" << id_ << " signal queue full, dropping '" << to_string(sig) << "'");
        }
    }

    inline void set_state_(State next) noexcept {
        SS_TRACE("[CONN] #" << id_ << " state: " << to_string(state_) << " -> " << to_string(next));
        state_ = next;
    }

    inline void on_transport_error_(Error error) noexcept {
        SS_WARN("[CONN] #" << id_ << " transport error: " << to_string(error));
        ++errors_;
        last_error_ = error;
    }

    // Tears the transport down after a local decision (reject, timeout,
    // close). The Close event the transport may still queue is ignored
    // because the state is already terminal.
    inline void shutdown_transport_() noexcept {
        if (ws_) {
            ws_->close();
        }
    }

    // Resolves a failure into Failed (never became Ready) or Lost (was Ready).
    inline void fail_(Error error, State terminal) noexcept {
        const bool was_ready = ready_;
        last_error_ = error;
        ready_ = false;
        set_state_(terminal);
        emit_(was_ready ? connection::Signal::Lost : connection::Signal::Failed);
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        SS_TRACE("[FSM] #" << id_ << " (" << to_string(state_) << ") --" << to_string(event) << "-->");

        switch (state_) {

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::OpenRequested:
                break;

            case Event::TransportOpened:
                set_state_(State::Open);
                last_activity_ = Clock::now();
                handshake_deadline_ = last_activity_ + options_.handshake_timeout;
                emit_(connection::Signal::Opened);
                if (!send(hello_)) {
                    shutdown_transport_();
                    fail_(Error::HandshakeFailed, State::Error);
                }
                break;

            case Event::TransportFailed:
                ++errors_;
                fail_(error, State::Error);
                break;

            case Event::TransportClosed:
                // Closed before the upgrade completed
                fail_(error == Error::None ? Error::ConnectionFailed : error, State::Error);
                break;

            case Event::CloseRequested:
                shutdown_transport_();
                last_error_ = Error::LocalShutdown;
                set_state_(State::Closed);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Open:
            switch (event) {
            case Event::HandshakeAccepted:
                if (!ready_) {
                    ready_ = true;
                    outstanding_pings_ = 0;
                    next_heartbeat_ = Clock::now() + options_.heartbeat_interval;
                    emit_(connection::Signal::Ready);
                }
                break;

            case Event::HandshakeRejected:
            case Event::HandshakeExpired:
            case Event::LivenessExpired:
                ++errors_;
                shutdown_transport_();
                fail_(error, State::Error);
                break;

            case Event::TransportClosed:
                if (!ready_) {
                    SS_INFO("[CONN] #" << id_ << " closed by server during handshake");
                } else {
                    SS_INFO("[CONN] #" << id_ << " connection lost (" << to_string(error) << ")");
                }
                if (error == Error::None || error == Error::RemoteClosed) {
                    fail_(Error::RemoteClosed, State::Closed);
                } else {
                    fail_(error, State::Error);
                }
                break;

            case Event::CloseRequested:
                SS_DEBUG("[CONN] #" << id_ << " closing");
                shutdown_transport_();
                last_error_ = Error::LocalShutdown;
                ready_ = false;
                set_state_(State::Closed);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Error:
        case State::Closed:
            // Terminal: late transport events are ignored
            break;
        }
    }
};

} // namespace statesync::core::transport
