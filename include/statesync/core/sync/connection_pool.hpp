#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "statesync/core/sync/connection_info.hpp"
#include "statesync/core/transport/connection.hpp"
#include "statesync/core/transport/concepts.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

// ===============================================================
// POOL EVENTS
// ===============================================================
enum class PoolEventKind : std::uint8_t {
    Up,        // first member of a generation became active
    Switch,    // active role moved to another member
    Down,      // no ready member left and none still trying
    Rejected   // the authority refused a member's handshake
};

struct PoolEvent {
    PoolEventKind kind{PoolEventKind::Down};
    std::uint32_t from{0};     // connection id (Switch, Down)
    std::uint32_t to{0};       // connection id (Up, Switch, Rejected)
    bool was_up{false};        // Down: the generation had an active member at some point
    std::string detail;        // Rejected: reason
};

// One inbound frame and the member it came from.
struct Inbound {
    std::uint32_t connection{0};
    std::string raw;
};

/*
===============================================================================
 sync::ConnectionPool
===============================================================================

N parallel Connections to the same endpoint, exactly one of them active.

Generations:
  open() starts a generation of `size` members, each performing its own
  handshake. A generation ends with a Down event (every member failed or was
  lost) or close_all(). The reconnection supervisor starts the next one.

Selection and failover:
  - The first member to complete its handshake becomes active (Up). The
    others stay as warm standbys once they are ready.
  - When the active member is lost, the next ready standby after it (in pool
    order, wrapping) is promoted at once and a Switch event is queued.
  - With no ready standby, the pool waits for members still connecting; the
    first of them to become ready is promoted (Switch). If none is pending
    either, the generation is Down.
  - A lost standby is not replaced within the generation.

The pool never parses JSON: hello and ping frames come from factories the
session supplies, and inbound frames are handed out raw with the id of the
member they arrived on (needed to route auth_ack and pong back to it).

Ordering: frames are delivered in arrival order per member. There is no
ordering across members.
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    typename Clock = std::chrono::steady_clock
>
class ConnectionPool {
    using ConnectionT = transport::Connection<WS, Clock>;
    static constexpr std::size_t NONE = std::numeric_limits<std::size_t>::max();

public:
    using HelloFactory = std::function<std::string(std::uint32_t pool_index)>;
    using PingFactory = std::function<std::string()>;

    ConnectionPool(transport::ConnectionOptions options, HelloFactory hello, PingFactory ping)
        : options_(options)
        , make_hello_(std::move(hello))
        , make_ping_(std::move(ping))
    {}

    ~ConnectionPool() {
        close_all();
    }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Starts a new generation. Fails only if every member failed to start;
    // the Down event for that generation still follows on the next poll().
    [[nodiscard]]
    inline transport::Error open(const transport::ParsedUrl& url, std::uint32_t size) {
        close_all();
        SS_INFO("[POOL] Opening " << size << " connection(s) to " << url.host << ":" << url.port << url.path);
        generation_live_ = true;
        was_up_ = false;
        transport::Error last = transport::Error::None;
        std::uint32_t started = 0;
        members_.reserve(size);
        for (std::uint32_t i = 0; i < size; ++i) {
            auto conn = std::make_unique<ConnectionT>(next_id_++, options_);
            const auto err = conn->open(url, make_hello_(i));
            if (err == transport::Error::None) {
                ++started;
            } else {
                last = err;
            }
            members_.push_back(std::move(conn));
        }
        if (started == 0) {
            SS_ERROR("[POOL] All " << size << " connection attempt(s) failed (" << to_string(last) << ")");
            return last;
        }
        return transport::Error::None;
    }

    // Closes every member without emitting events.
    inline void close_all() noexcept {
        if (!members_.empty()) {
            SS_DEBUG("[POOL] Closing " << members_.size() << " connection(s)");
        }
        for (auto& conn : members_) {
            conn->close();
        }
        members_.clear();
        active_ = NONE;
        generation_live_ = false;
        cursor_ = 0;
    }

    inline void poll() {
        for (std::size_t i = 0; i < members_.size(); ++i) {
            auto& conn = *members_[i];
            conn.poll();
            transport::connection::Signal sig;
            while (conn.poll_signal(sig)) {
                on_signal_(i, sig);
            }
        }
        if (generation_live_ && active_ == NONE && !any_ready_or_pending_()) {
            SS_WARN("[POOL] No usable connection left");
            generation_live_ = false;
            PoolEvent ev;
            ev.kind = PoolEventKind::Down;
            ev.from = last_active_id_;
            ev.was_up = was_up_;
            events_.push_back(std::move(ev));
        }
    }

    // Pulls one inbound frame, visiting members round-robin.
    [[nodiscard]]
    inline bool poll_message(Inbound& out) {
        const std::size_t n = members_.size();
        for (std::size_t k = 0; k < n; ++k) {
            const std::size_t i = (cursor_ + k) % n;
            if (members_[i]->poll_message(out.raw)) {
                out.connection = members_[i]->id();
                cursor_ = (i + 1) % n;
                return true;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline bool poll_event(PoolEvent& out) {
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    // Sends through the active member.
    [[nodiscard]]
    inline bool send(std::string_view frame) noexcept {
        if (active_ == NONE) {
            return false;
        }
        return members_[active_]->send(frame);
    }

    // Sends on a specific member (replies that must go back where the
    // request came from).
    [[nodiscard]]
    inline bool send_on(std::uint32_t connection, std::string_view frame) noexcept {
        if (auto* conn = find_(connection)) {
            return conn->send(frame);
        }
        return false;
    }

    inline void on_auth_ack(std::uint32_t connection, bool accepted, const std::string& reason) {
        auto* conn = find_(connection);
        if (!conn) {
            return;
        }
        if (accepted) {
            conn->accept_handshake();
            return;
        }
        SS_WARN("[POOL] Handshake rejected on #" << connection << (reason.empty() ? "" : ": ") << reason);
        conn->reject_handshake();
        PoolEvent ev;
        ev.kind = PoolEventKind::Rejected;
        ev.to = connection;
        ev.detail = reason;
        events_.push_back(std::move(ev));
    }

    inline void on_pong(std::uint32_t connection) noexcept {
        if (auto* conn = find_(connection)) {
            conn->on_pong();
        }
    }

    [[nodiscard]]
    inline std::vector<ConnectionInfo> connections() const {
        std::vector<ConnectionInfo> out;
        out.reserve(members_.size());
        const auto now = Clock::now();
        for (std::size_t i = 0; i < members_.size(); ++i) {
            const auto& conn = *members_[i];
            ConnectionInfo info;
            info.id = conn.id();
            info.pool_index = static_cast<std::uint32_t>(i);
            info.state = conn.state();
            info.ready = conn.ready();
            info.active = (i == active_);
            info.sent = conn.sent();
            info.received = conn.received();
            info.errors = conn.errors();
            if (conn.sent() + conn.received() > 0) {
                info.idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - conn.last_activity());
            }
            out.push_back(info);
        }
        return out;
    }

    // Accessors
    [[nodiscard]] inline bool has_active() const noexcept { return active_ != NONE; }
    [[nodiscard]] inline bool live() const noexcept { return generation_live_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] inline std::uint64_t switches() const noexcept { return switches_; }

    [[nodiscard]]
    inline std::uint32_t active_id() const noexcept {
        return active_ == NONE ? 0 : members_[active_]->id();
    }

    [[nodiscard]]
    inline std::size_t open_count() const noexcept {
        std::size_t n = 0;
        for (const auto& conn : members_) {
            n += conn->is_open() ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    inline std::size_t ready_count() const noexcept {
        std::size_t n = 0;
        for (const auto& conn : members_) {
            n += conn->ready() ? 1 : 0;
        }
        return n;
    }

#ifdef SS_UNIT_TEST
public:
    ConnectionT& member(std::size_t index) {
        return *members_[index];
    }
#endif // SS_UNIT_TEST

private:
    transport::ConnectionOptions options_;
    HelloFactory make_hello_;
    PingFactory make_ping_;

    std::vector<std::unique_ptr<ConnectionT>> members_;
    std::size_t active_{NONE};
    std::uint32_t last_active_id_{0};
    std::uint32_t next_id_{1};
    bool generation_live_{false};
    bool was_up_{false};
    std::size_t cursor_{0};
    std::uint64_t switches_{0};

    std::deque<PoolEvent> events_;

    [[nodiscard]]
    inline ConnectionT* find_(std::uint32_t id) noexcept {
        for (auto& conn : members_) {
            if (conn->id() == id) {
                return conn.get();
            }
        }
        return nullptr;
    }

    [[nodiscard]]
    inline bool any_ready_or_pending_() const noexcept {
        for (const auto& conn : members_) {
            if (conn->ready() || conn->is_pending()) {
                return true;
            }
        }
        return false;
    }

    inline void on_signal_(std::size_t index, transport::connection::Signal sig) {
        auto& conn = *members_[index];
        switch (sig) {
        case transport::connection::Signal::Opened:
            SS_DEBUG("[POOL] #" << conn.id() << " transport open, handshake sent");
            break;

        case transport::connection::Signal::Ready:
            if (active_ == NONE) {
                promote_(index);
            } else {
                SS_DEBUG("[POOL] #" << conn.id() << " ready as standby");
            }
            break;

        case transport::connection::Signal::HeartbeatDue:
            if (!conn.send_heartbeat(make_ping_())) {
                SS_WARN("[POOL] #" << conn.id() << " heartbeat ping could not be sent");
            }
            break;

        case transport::connection::Signal::Lost:
        case transport::connection::Signal::Failed:
            if (index == active_) {
                SS_WARN("[POOL] Active connection #" << conn.id() << " lost (" << to_string(conn.last_error()) << ")");
                active_ = NONE;
                const std::size_t next = next_ready_after_(index);
                if (next != NONE) {
                    promote_(next);
                }
            } else {
                SS_DEBUG("[POOL] #" << conn.id() << " " << to_string(sig) << " (" << to_string(conn.last_error()) << ")");
            }
            break;

        default:
            break;
        }
    }

    [[nodiscard]]
    inline std::size_t next_ready_after_(std::size_t index) const noexcept {
        const std::size_t n = members_.size();
        for (std::size_t k = 1; k < n; ++k) {
            const std::size_t i = (index + k) % n;
            if (members_[i]->ready()) {
                return i;
            }
        }
        return NONE;
    }

    inline void promote_(std::size_t index) {
        active_ = index;
        const std::uint32_t id = members_[index]->id();
        PoolEvent ev;
        ev.to = id;
        if (!was_up_) {
            SS_INFO("[POOL] #" << id << " is active");
            ev.kind = PoolEventKind::Up;
            was_up_ = true;
        } else {
            SS_INFO("[POOL] Failover: #" << last_active_id_ << " -> #" << id);
            ev.kind = PoolEventKind::Switch;
            ev.from = last_active_id_;
            ++switches_;
        }
        last_active_id_ = id;
        events_.push_back(std::move(ev));
    }
};

} // namespace statesync::core::sync
