#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/message_type.hpp"
#include "statesync/core/protocol/payload.hpp"
#include "statesync/core/protocol/priority.hpp"
#include "statesync/core/sync/config.hpp"
#include "statesync/core/sync/connection_info.hpp"
#include "statesync/core/sync/error.hpp"
#include "statesync/core/sync/handler.hpp"
#include "statesync/core/sync/link_status.hpp"
#include "statesync/core/sync/metrics.hpp"
#include "statesync/core/sync/notice.hpp"
#include "statesync/core/sync/state_store.hpp"
#include "statesync/core/transport/error.hpp"


namespace statesync {

// Public vocabulary (stable aliases over core types)
using Config         = core::sync::Config;
using Message        = core::protocol::Message;
using MessageType    = core::protocol::MessageType;
using Payload        = core::protocol::Payload;
using Priority       = core::protocol::Priority;
using Notice         = core::sync::Notice;
using NoticeKind     = core::sync::NoticeKind;
using Metrics        = core::sync::Metrics;
using StateSnapshot  = core::sync::StateSnapshot;
using Trend          = core::sync::Trend;
using LinkStatus     = core::sync::LinkStatus;
using ConnectionInfo = core::sync::ConnectionInfo;
using HandlerId      = core::sync::HandlerId;
using SyncError      = core::sync::SyncError;
using ErrorCode      = core::sync::Error;
using TransportError = core::transport::Error;

namespace payload = core::protocol::payload;


/*
===============================================================================
statesync::Client - Public API
===============================================================================

Real-time state synchronization client over WebSocket (Boost.Beast).

    statesync::Client client({.endpoint_url = "wss://example.org/sync", .pool_size = 2});
    client.on(statesync::NoticeKind::Milestone, [](const statesync::Notice& n) { ... });
    if (client.connect() != statesync::TransportError::None) { ... }
    client.submit("user opened the editor", {{"source", "ui"}});
    client.run_while([&] { return running; });

Execution model:
  - Poll-driven. Nothing happens between poll() calls; every handler runs
    inside poll() on the caller's thread.
  - The only blocking calls are connect() (bounded by connect_timeout) and
    await() (bounded by its timeout). Both drive poll() while they wait.
  - Not thread-safe: use one Client from one thread.

Error reporting:
  - connect() returns a TransportError.
  - send_and_await() futures hold a SyncError on failure.
  - Everything else surfaces as notices and metrics; connection problems
    never reach the caller as exceptions.
===============================================================================
*/
class Client {
public:
    using message_handler = std::function<void(const Message&)>;
    using notice_handler  = std::function<void(const Notice&)>;

    explicit Client(Config cfg = {});
    explicit Client(std::string endpoint_url);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ~Client();

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Connects and blocks (polling) until a pool member is active, every
    // attempt failed, or connect_timeout elapsed. On failure the client keeps
    // reconnecting in the background of poll() per the reconnect policy;
    // call disconnect() to stop it.
    [[nodiscard]]
    TransportError connect();

    // Stops reconnection, closes all connections and rejects pending
    // send_and_await() futures with ErrorCode::Disconnected. Queued messages
    // and buffered events are kept for the next connect().
    void disconnect();

    void poll();

    // -------------------------------------------------------------------------
    // Operations
    // -------------------------------------------------------------------------

    // Non-blocking. Buffers offline. Returns the event id.
    std::string submit(std::string content, std::map<std::string, std::string> context = {},
                       Priority priority = Priority::Normal);

    [[nodiscard]]
    std::future<Message> send_and_await(MessageType type, Payload payload, std::chrono::milliseconds timeout);

    // Uses Config::message_timeout.
    [[nodiscard]]
    std::future<Message> send_and_await(MessageType type, Payload payload);

    std::string update_context(std::string conversation_id, std::vector<std::string> topics, std::string summary);

    void force_sync();

    // -------------------------------------------------------------------------
    // Observers (handlers run inside poll())
    // -------------------------------------------------------------------------
    HandlerId on(MessageType type, message_handler handler);
    HandlerId on(NoticeKind kind, notice_handler handler);
    bool off(MessageType type, HandlerId id);
    bool off(NoticeKind kind, HandlerId id);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------
    [[nodiscard]] StateSnapshot state() const;
    [[nodiscard]] Metrics metrics() const;
    [[nodiscard]] std::vector<ConnectionInfo> connections() const;
    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] LinkStatus status() const;
    [[nodiscard]] const std::string& instance_id() const;

    // -------------------------------------------------------------------------
    // Convenience execution loops
    // -------------------------------------------------------------------------
    //
    //   run_while(cond)  → polls while the user condition is true
    //   run_until(stop)  → polls until the user condition becomes true
    //   await(f, t)      → polls until the future is ready or t elapsed
    //
    // Termination is always owned by the caller. If tick == 0 the loops
    // busy-poll without sleeping.
    // -------------------------------------------------------------------------
    template <class Fn>
    void run_while(Fn&& should_continue, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (should_continue()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    template <class Fn>
    void run_until(Fn&& should_stop, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        run_while([&] { return !should_stop(); }, tick);
    }

    // Returns true if the future became ready in time.
    template <class T>
    bool await(const std::future<T>& future, std::chrono::milliseconds timeout,
               std::chrono::milliseconds tick = std::chrono::milliseconds{1}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            poll();
            if (tick.count() > 0) {
                std::this_thread::sleep_for(tick);
            }
        }
        return true;
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace statesync
