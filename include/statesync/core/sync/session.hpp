/*
===============================================================================
State synchronization Session
===============================================================================

The Session keeps a local mirror of a remote authority's state coherent over
an unreliable link, buffers local events while offline and replays them once
connectivity returns.

Architecture:
  - transport::*          → WebSocket binding (Beast, mockable)
  - transport::Connection → one channel: handshake window, heartbeat,
                            counters
  - sync::ConnectionPool  → N channels, one active, failover
  - sync::ReconnectSupervisor → exponential backoff, Offline give-up
  - sync::MessageQueue    → bounded priority tiers, send retries
  - sync::ResponseTable   → send_and_await() futures, timeouts
  - sync::StateStore      → mirrored state, history, milestones
  - sync::OfflineBuffer   → unacknowledged local events, replay
  - sync::Dispatcher      → typed handlers and lifecycle notices

Execution model:
  - Single-threaded and poll-driven. Every mutation of the queue, the store,
    the buffer and the pending table happens inside a Session method called
    from the owner's thread; the transport's IO thread only fills the
    per-connection inboxes.
  - Handlers run inside poll(). Lifecycle notices are queued while poll()
    works and delivered at its end, so a handler may call back into the
    Session.

poll() order:
  1. pool: drive connections, handshakes, heartbeats, failover
  2. inbound: parse, internal processing, pending resolution, dispatch
  3. pool events: Up / Switch / Down / Rejected
  4. supervisor: start a new generation when a retry is due
  5. pending table: expire overdue requests
  6. queue: drain through the active connection
  7. notices: deliver to handlers

Delivery guarantees:
  - Outbound: at-least-once for domain events (buffered until event_ack),
    best effort for everything else.
  - Inbound: arrival order per connection, none across connections.
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "statesync/core/protocol/id.hpp"
#include "statesync/core/protocol/message.hpp"
#include "statesync/core/protocol/parser/router.hpp"
#include "statesync/core/sync/config.hpp"
#include "statesync/core/sync/connection_pool.hpp"
#include "statesync/core/sync/dispatcher.hpp"
#include "statesync/core/sync/error.hpp"
#include "statesync/core/sync/message_queue.hpp"
#include "statesync/core/sync/metrics.hpp"
#include "statesync/core/sync/notice.hpp"
#include "statesync/core/sync/offline_buffer.hpp"
#include "statesync/core/sync/response_table.hpp"
#include "statesync/core/sync/state_store.hpp"
#include "statesync/core/sync/supervisor.hpp"
#include "statesync/core/transport/concepts.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

template <
    transport::WebSocketConcept WS,
    typename Clock = std::chrono::steady_clock
>
class Session {
public:
    explicit Session(Config config)
        : config_(std::move(config))
        , instance_id_(ids_.instance_id(config_.platform))
        , pool_(
            transport::ConnectionOptions{
                .handshake_timeout = config_.handshake_timeout,
                .heartbeat_interval = config_.heartbeat_interval,
                .heartbeat_max_missed = config_.heartbeat_max_missed
            },
            [this](std::uint32_t index) { return make_hello_(index); },
            [this]() { return make_ping_(); })
        , supervisor_(Backoff{config_.reconnect_base, config_.reconnect_cap}, config_.max_reconnect_attempts)
        , queue_(config_.queue_capacity, config_.max_send_retries)
        , store_(config_.heartbeat_interval)
        , buffer_(config_.buffer_capacity)
    {
        SS_DEBUG("[SESSION] Instance id " << instance_id_);
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Starts connecting. Returns once every pool member has started its
    // attempt; completion is observed through poll() (Connected notice,
    // is_connected()). An error means no member could even start; the
    // supervisor still retries according to the reconnect policy.
    [[nodiscard]]
    inline transport::Error connect() {
        if (transport::parse_url(config_.endpoint_url, url_) != transport::Error::None) {
            SS_ERROR("[SESSION] Invalid endpoint url: '" << config_.endpoint_url << "'");
            return transport::Error::InvalidUrl;
        }
        if (validate(config_) != Error::None) {
            return transport::Error::InvalidState;
        }
        if (supervisor_.status() == LinkStatus::Connected || supervisor_.status() == LinkStatus::Connecting) {
            SS_DEBUG("[SESSION] connect() while " << supervisor_.status_text() << ". Ignoring.");
            return transport::Error::None;
        }
        SS_INFO("[SESSION] Connecting to " << config_.endpoint_url << " (pool size " << config_.pool_size << ")");
        supervisor_.start();
        return pool_.open(url_, config_.pool_size);
    }

    // Stops reconnection, closes every connection and rejects all pending
    // requests with Disconnected. The queue and the offline buffer are kept
    // so a later connect() resumes where this one stopped.
    inline void disconnect() {
        const bool was_connected = pool_.has_active();
        SS_INFO("[SESSION] Disconnecting");
        supervisor_.stop();
        pool_.close_all();
        (void)pending_.reject_all(Error::Disconnected);
        release_unacked_();
        if (was_connected) {
            Notice n;
            n.kind = NoticeKind::Disconnected;
            n.error = Error::Disconnected;
            push_notice_(std::move(n));
        }
        collect_status_();
    }

    // -------------------------------------------------------------------------
    // Outbound
    // -------------------------------------------------------------------------

    // Submits a domain event. Never blocks and never fails for being
    // offline: every event is kept in the offline buffer until its
    // event_ack arrives. Without an active connection it waits there and is
    // replayed after reconnection; otherwise it is queued right away and
    // marked in flight. Returns the event id that the event_ack will
    // reference.
    inline std::string submit(std::string content, std::map<std::string, std::string> context = {},
                              protocol::Priority priority = protocol::Priority::Normal) {
        PendingEvent ev;
        ev.id = ids_.next();
        ev.content = std::move(content);
        ev.context = std::move(context);
        ev.created_at = protocol::wall_clock_ms();
        ev.priority = priority;
        std::string id = ev.id;
        if (!pool_.has_active()) {
            SS_DEBUG("[SESSION] Offline, buffering event " << id);
            (void)buffer_.add(std::move(ev));
            return id;
        }
        auto msg = make_event_message_(ev);
        (void)buffer_.add(std::move(ev));
        (void)buffer_.mark_in_flight(id);
        enqueue_(Outbound{std::move(msg), 0});
        return id;
    }

    // Sends `payload` as a message of `type` and returns a future fulfilled
    // by the first inbound message correlated with it (payload.ref_id or the
    // echoed envelope id). The future holds a SyncError on timeout
    // (ResponseTimeout), disconnect() (Disconnected), when the message
    // cannot be sent (QueueOverflow, SendFailure) or for a payload that
    // does not match `type` (InvalidMessage).
    //
    // A timeout is local: the request may still be processed remotely.
    [[nodiscard]]
    inline std::future<protocol::Message> send_and_await(protocol::MessageType type, protocol::Payload payload,
                                                         std::chrono::milliseconds timeout,
                                                         protocol::Priority priority = protocol::Priority::Normal) {
        if (!protocol::payload_matches(type, payload) || type == protocol::MessageType::Unknown) {
            SS_WARN("[SESSION] send_and_await(): payload does not match type '" << protocol::to_string(type) << "'");
            return rejected_(Error::InvalidMessage, "payload does not match message type");
        }
        if (supervisor_.status() == LinkStatus::Disconnected) {
            return rejected_(Error::NotConnected, "send_and_await() before connect()");
        }
        auto msg = protocol::make_message(ids_.next(), type, std::move(payload), priority);
        auto future = pending_.add(msg.id, timeout);
        enqueue_(Outbound{std::move(msg), 0});
        return future;
    }

    [[nodiscard]]
    inline std::future<protocol::Message> send_and_await(protocol::MessageType type, protocol::Payload payload) {
        return send_and_await(type, std::move(payload), config_.message_timeout);
    }

    // Shares the conversation context with the authority.
    inline std::string update_context(std::string conversation_id, std::vector<std::string> topics, std::string summary) {
        protocol::payload::ContextUpdate ctx;
        ctx.conversation_id = std::move(conversation_id);
        ctx.topics = std::move(topics);
        ctx.summary = std::move(summary);
        auto msg = protocol::make_message(ids_.next(), protocol::MessageType::ContextUpdate, std::move(ctx));
        std::string id = msg.id;
        enqueue_(Outbound{std::move(msg), 0});
        return id;
    }

    // Connected: replays the offline buffer and asks the authority to
    // re-broadcast its state. Otherwise: restarts the reconnection cycle
    // with a fresh attempt counter, leaving Offline if needed.
    inline void force_sync() {
        if (pool_.has_active()) {
            SS_INFO("[SESSION] Force sync");
            (void)replay();
            enqueue_(Outbound{protocol::make_message(ids_.next(), protocol::MessageType::SyncRequest,
                                                     protocol::payload::SyncRequest{}, protocol::Priority::High), 0});
            return;
        }
        if (url_.host.empty() && transport::parse_url(config_.endpoint_url, url_) != transport::Error::None) {
            SS_ERROR("[SESSION] force_sync(): invalid endpoint url '" << config_.endpoint_url << "'");
            return;
        }
        supervisor_.restart();
        collect_status_();
        if (pool_.open(url_, config_.pool_size) != transport::Error::None) {
            SS_WARN("[SESSION] force_sync(): connection attempt could not start");
        }
    }

    // Queues every buffered event that is not already in flight, in
    // submission order. Entries stay buffered until acknowledged. Returns
    // the number of events queued.
    inline std::size_t replay() {
        if (!pool_.has_active()) {
            return 0;
        }
        std::size_t count = 0;
        for (auto& ev : buffer_.pending_replay()) {
            (void)buffer_.mark_in_flight(ev.id);
            if (enqueue_(Outbound{make_event_message_(ev), 0})) {
                ++count;
            }
        }
        if (count > 0) {
            SS_INFO("[SESSION] Replaying " << count << " buffered event(s)");
        }
        return count;
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline HandlerId on(protocol::MessageType type, MessageHandler handler) {
        return dispatcher_.on(type, std::move(handler));
    }

    [[nodiscard]]
    inline HandlerId on(NoticeKind kind, NoticeHandler handler) {
        return dispatcher_.on(kind, std::move(handler));
    }

    inline bool off(protocol::MessageType type, HandlerId id) {
        return dispatcher_.off(type, id);
    }

    inline bool off(NoticeKind kind, HandlerId id) {
        return dispatcher_.off(kind, id);
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() {
        // === Connections ===
        pool_.poll();

        // === Inbound ===
        Inbound in;
        while (pool_.poll_message(in)) {
            handle_inbound_(in);
        }

        // === Pool lifecycle ===
        PoolEvent ev;
        while (pool_.poll_event(ev)) {
            handle_pool_event_(ev);
        }

        // === Reconnection ===
        const auto now = Clock::now();
        if (supervisor_.poll(now)) {
            SS_INFO("[SESSION] Reconnection attempt " << supervisor_.attempts());
            if (pool_.open(url_, config_.pool_size) != transport::Error::None) {
                SS_DEBUG("[SESSION] Reconnection attempt could not start");
            }
        }
        collect_status_();

        // === Pending requests ===
        (void)pending_.expire(now);

        // === Outbound ===
        if (pool_.has_active()) {
            drain_();
        }

        // === Notices ===
        flush_notices_();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline bool is_connected() const noexcept { return pool_.has_active(); }
    [[nodiscard]] inline LinkStatus status() const noexcept { return supervisor_.status(); }
    [[nodiscard]] inline std::string_view status_text() const noexcept { return supervisor_.status_text(); }
    [[nodiscard]] inline bool is_connecting() const noexcept { return pool_.live() && !pool_.has_active(); }
    [[nodiscard]] inline StateSnapshot state() const { return store_.snapshot(); }
    [[nodiscard]] inline double average(std::size_t n = DEFAULT_AVERAGE_WINDOW) const noexcept { return store_.average(n); }
    [[nodiscard]] inline Trend trend() const noexcept { return store_.trend(); }
    [[nodiscard]] inline std::vector<ConnectionInfo> connections() const { return pool_.connections(); }
    [[nodiscard]] inline const std::string& instance_id() const noexcept { return instance_id_; }
    [[nodiscard]] inline const Config& config() const noexcept { return config_; }
    [[nodiscard]] inline std::chrono::milliseconds last_reconnect_delay() const noexcept { return supervisor_.last_delay(); }

    [[nodiscard]]
    inline Metrics metrics() const {
        Metrics m;
        m.connected = pool_.has_active();
        m.queue_depth = queue_.size();
        m.buffered_count = buffer_.size();
        m.reconnect_attempts = supervisor_.attempts();
        m.status = std::string(supervisor_.status_text());
        m.active_connection = pool_.active_id();
        m.open_connections = pool_.open_count();
        m.connection_switches = pool_.switches();
        m.messages_sent = queue_.sent();
        m.send_retries = queue_.retried();
        m.messages_failed = queue_.failed();
        m.messages_evicted = queue_.evicted();
        m.messages_dropped = queue_.dropped();
        m.in_flight_events = buffer_.in_flight_count();
        m.messages_received = received_;
        m.invalid_messages = invalid_;
        m.unknown_messages = dispatcher_.unrouted();
        m.unhandled_messages = dispatcher_.unhandled();
        m.handler_errors = dispatcher_.handler_errors();
        m.pending_responses = pending_.size();
        m.responses_resolved = pending_.resolved();
        m.responses_timed_out = pending_.timed_out();
        return m;
    }

#ifdef SS_UNIT_TEST
public:
    ConnectionPool<WS, Clock>& pool() { return pool_; }
    MessageQueue& queue() { return queue_; }
    OfflineBuffer& buffer() { return buffer_; }
    ResponseTable<Clock>& pending() { return pending_; }
    ReconnectSupervisor<Clock>& supervisor() { return supervisor_; }
#endif // SS_UNIT_TEST

private:
    Config config_;
    protocol::IdGenerator ids_;
    std::string instance_id_;
    transport::ParsedUrl url_;

    ConnectionPool<WS, Clock> pool_;
    ReconnectSupervisor<Clock> supervisor_;
    MessageQueue queue_;
    ResponseTable<Clock> pending_;
    StateStore store_;
    OfflineBuffer buffer_;
    Dispatcher dispatcher_;
    protocol::parser::Router router_;

    std::deque<Notice> notices_;
    std::string frame_;             // reused outbound serialization buffer
    std::uint64_t received_{0};
    std::uint64_t invalid_{0};

    // -------------------------------------------------------------------------
    // Frame factories
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline std::string make_hello_(std::uint32_t pool_index) {
        protocol::payload::Auth auth;
        auth.instance_id = instance_id_;
        auth.platform = config_.platform;
        auth.capabilities = config_.capabilities;
        auth.pool_index = pool_index;
        return protocol::make_message(ids_.next(), protocol::MessageType::Auth, std::move(auth), protocol::Priority::High).to_json();
    }

    [[nodiscard]]
    inline std::string make_ping_() {
        return protocol::make_message(ids_.next(), protocol::MessageType::Ping, protocol::payload::Ping{}, protocol::Priority::High).to_json();
    }

    [[nodiscard]]
    inline protocol::Message make_event_message_(const PendingEvent& ev) const {
        protocol::payload::DomainEvent payload;
        payload.content = ev.content;
        payload.context = ev.context;
        payload.platform = config_.platform;
        payload.instance_id = instance_id_;
        auto msg = protocol::make_message(ev.id, protocol::MessageType::Event, std::move(payload), ev.priority);
        msg.timestamp = ev.created_at;
        return msg;
    }

    [[nodiscard]]
    static std::future<protocol::Message> rejected_(Error err, const std::string& why) {
        std::promise<protocol::Message> p;
        auto f = p.get_future();
        p.set_exception(std::make_exception_ptr(SyncError(err, why)));
        return f;
    }

    // -------------------------------------------------------------------------
    // Outbound path
    // -------------------------------------------------------------------------

    // Returns false if the message itself was dropped.
    inline bool enqueue_(Outbound item) {
        Outbound displaced;
        const Admission a = queue_.enqueue(std::move(item), displaced);
        switch (a) {
        case Admission::Queued:
            return true;
        case Admission::QueuedEvictedLow:
            on_discarded_(std::move(displaced), Error::QueueOverflow);
            return true;
        case Admission::Dropped:
        default:
            on_discarded_(std::move(displaced), Error::QueueOverflow);
            return false;
        }
    }

    // A message left the queue without being sent. Events fall back to the
    // offline buffer, requests are rejected, and the loss is observable.
    inline void on_discarded_(Outbound&& item, Error reason) {
        const auto& msg = item.message;
        Notice n;
        n.kind = (reason == Error::QueueOverflow) ? NoticeKind::QueueOverflow : NoticeKind::MessageFailed;
        n.message_id = msg.id;
        n.error = reason;
        n.detail = std::string(msg.type_name());
        if (msg.type == protocol::MessageType::Event) {
            if (buffer_.contains(msg.id)) {
                (void)buffer_.release(msg.id);
            } else if (const auto* ev = msg.get<protocol::payload::DomainEvent>()) {
                PendingEvent pending;
                pending.id = msg.id;
                pending.content = ev->content;
                pending.context = ev->context;
                pending.created_at = msg.timestamp;
                pending.priority = msg.priority;
                (void)buffer_.add(std::move(pending));
            }
        }
        (void)pending_.reject(msg.id, reason, std::string(to_string(reason)) + " for " + msg.id);
        push_notice_(std::move(n));
    }

    inline void drain_() {
        (void)queue_.drain(
            [this](const Outbound& item) {
                frame_.clear();
                item.message.write_json(frame_);
                return pool_.send(frame_);
            },
            [this](Outbound&& item) {
                on_discarded_(std::move(item), Error::SendFailure);
            });
    }

    // Sent but unacknowledged events become eligible for replay again.
    inline void release_unacked_() {
        const std::size_t released = buffer_.release_if([this](const PendingEvent& ev) {
            return !queue_.contains(ev.id);
        });
        if (released > 0) {
            SS_DEBUG("[SESSION] " << released << " unacknowledged event(s) will be replayed");
        }
    }

    // -------------------------------------------------------------------------
    // Inbound path
    // -------------------------------------------------------------------------
    inline void handle_inbound_(const Inbound& in) {
        protocol::Message msg;
        if (router_.parse(in.raw, msg) != protocol::parser::Result::Parsed) {
            ++invalid_;
            return;
        }
        ++received_;

        switch (msg.type) {
        case protocol::MessageType::AuthAck:
            if (const auto* ack = msg.get<protocol::payload::AuthAck>()) {
                pool_.on_auth_ack(in.connection, ack->accepted, ack->reason);
            }
            return; // handshake plumbing only

        case protocol::MessageType::Pong:
            pool_.on_pong(in.connection);
            break;

        case protocol::MessageType::Ping:
            reply_pong_(in.connection, msg);
            break;

        case protocol::MessageType::StateSync:
            if (const auto* sync = msg.get<protocol::payload::StateSync>()) {
                apply_state_(*sync, msg.timestamp);
            }
            break;

        case protocol::MessageType::ContextUpdate:
            if (const auto* ctx = msg.get<protocol::payload::ContextUpdate>()) {
                store_.apply_context(*ctx);
            }
            break;

        case protocol::MessageType::EventAck:
            if (const auto* ack = msg.get<protocol::payload::EventAck>()) {
                if (!buffer_.ack(ack->ref_id)) {
                    SS_TRACE("[SESSION] event_ack for unbuffered event " << ack->ref_id);
                }
            }
            break;

        case protocol::MessageType::Error:
            if (const auto* err = msg.get<protocol::payload::ErrorReport>()) {
                SS_WARN("[SESSION] Authority error " << err->code << ": " << err->message);
            }
            break;

        default:
            break;
        }

        // Correlated responses complete their request instead of reaching
        // the type handlers.
        if (pending_.resolve(msg)) {
            return;
        }
        (void)dispatcher_.dispatch(msg);
    }

    inline void apply_state_(const protocol::payload::StateSync& sync, std::int64_t timestamp) {
        const auto result = store_.apply(sync, timestamp);
        Notice changed;
        changed.kind = NoticeKind::StateChanged;
        changed.value = sync.value;
        changed.detail = store_.phase();
        push_notice_(std::move(changed));
        for (const auto& m : result.crossed) {
            Notice n;
            n.kind = NoticeKind::Milestone;
            n.detail = std::string(m.label);
            n.value = m.threshold;
            push_notice_(std::move(n));
        }
    }

    inline void reply_pong_(std::uint32_t connection, const protocol::Message& ping) {
        protocol::payload::Pong pong;
        pong.ref_id = ping.id;
        const auto frame = protocol::make_message(ids_.next(), protocol::MessageType::Pong, std::move(pong), protocol::Priority::High).to_json();
        if (!pool_.send_on(connection, frame)) {
            SS_DEBUG("[SESSION] pong to #" << connection << " could not be sent");
        }
    }

    // -------------------------------------------------------------------------
    // Pool lifecycle
    // -------------------------------------------------------------------------
    inline void handle_pool_event_(const PoolEvent& ev) {
        switch (ev.kind) {
        case PoolEventKind::Up: {
            supervisor_.on_connected();
            Notice n;
            n.kind = NoticeKind::Connected;
            n.to = ev.to;
            push_notice_(std::move(n));
            (void)replay();
            break;
        }
        case PoolEventKind::Switch: {
            Notice n;
            n.kind = NoticeKind::ConnectionSwitch;
            n.from = ev.from;
            n.to = ev.to;
            push_notice_(std::move(n));
            // Acks for events written to the lost member will never arrive
            release_unacked_();
            (void)replay();
            break;
        }
        case PoolEventKind::Down: {
            release_unacked_();
            if (ev.was_up) {
                Notice n;
                n.kind = NoticeKind::Disconnected;
                n.from = ev.from;
                n.error = Error::TransportError;
                push_notice_(std::move(n));
            }
            supervisor_.on_connection_lost(Clock::now());
            break;
        }
        case PoolEventKind::Rejected: {
            Notice n;
            n.kind = NoticeKind::HandshakeRejected;
            n.to = ev.to;
            n.detail = ev.detail;
            n.error = Error::HandshakeRejected;
            push_notice_(std::move(n));
            break;
        }
        }
    }

    // -------------------------------------------------------------------------
    // Notices
    // -------------------------------------------------------------------------
    inline void push_notice_(Notice n) {
        notices_.push_back(std::move(n));
    }

    inline void collect_status_() {
        LinkStatus status;
        if (supervisor_.take_status_change(status)) {
            Notice n;
            n.kind = NoticeKind::StatusChanged;
            n.detail = std::string(to_string(status));
            push_notice_(std::move(n));
        }
    }

    // Delivers the notices queued so far. Notices raised by the handlers
    // themselves wait for the next poll().
    inline void flush_notices_() {
        std::deque<Notice> batch;
        batch.swap(notices_);
        for (const auto& n : batch) {
            (void)dispatcher_.dispatch(n);
        }
    }
};

} // namespace statesync::core::sync
