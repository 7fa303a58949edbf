#include <thread>

#include "statesync/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "statesync/core/transport/beast/websocket.hpp"
#include "statesync/core/sync/session.hpp"
#include "lcr/log/logger.hpp"


namespace statesync {

namespace sync = core::sync;

using WS = core::transport::beast::WebSocket;

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    sync::Session<WS> session;

    explicit Impl(Config cfg)
        : session(std::move(cfg))
    {
    }

    TransportError connect() {
        const auto err = session.connect();
        if (err != TransportError::None) {
            return err;
        }
        // Block until the pool has an active member or the attempt is over
        const auto deadline = std::chrono::steady_clock::now() + session.config().connect_timeout;
        constexpr auto tick = std::chrono::milliseconds{10};
        while (true) {
            session.poll();
            if (session.is_connected()) {
                return TransportError::None;
            }
            if (session.status() != LinkStatus::Connecting) {
                SS_WARN("[SESSION] connect(): no connection could be established (" << session.status_text() << ")");
                return TransportError::ConnectionFailed;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                SS_WARN("[SESSION] connect(): timed out after " << session.config().connect_timeout.count() << " ms");
                return TransportError::Timeout;
            }
            std::this_thread::sleep_for(tick);
        }
    }
};

// -----------------------------
// Client methods
// -----------------------------

Client::Client(Config cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg))) {}

Client::Client(std::string endpoint_url)
    : Client(Config{ .endpoint_url = std::move(endpoint_url) }) {}

Client::~Client() {
    impl_->session.disconnect();
}

TransportError Client::connect() {
    return impl_->connect();
}

void Client::disconnect() {
    impl_->session.disconnect();
    // Deliver the resulting notices now rather than on the next poll()
    impl_->session.poll();
}

void Client::poll() {
    impl_->session.poll();
}

std::string Client::submit(std::string content, std::map<std::string, std::string> context, Priority priority) {
    return impl_->session.submit(std::move(content), std::move(context), priority);
}

std::future<Message> Client::send_and_await(MessageType type, Payload payload, std::chrono::milliseconds timeout) {
    return impl_->session.send_and_await(type, std::move(payload), timeout);
}

std::future<Message> Client::send_and_await(MessageType type, Payload payload) {
    return impl_->session.send_and_await(type, std::move(payload));
}

std::string Client::update_context(std::string conversation_id, std::vector<std::string> topics, std::string summary) {
    return impl_->session.update_context(std::move(conversation_id), std::move(topics), std::move(summary));
}

void Client::force_sync() {
    impl_->session.force_sync();
}

HandlerId Client::on(MessageType type, message_handler handler) {
    return impl_->session.on(type, std::move(handler));
}

HandlerId Client::on(NoticeKind kind, notice_handler handler) {
    return impl_->session.on(kind, std::move(handler));
}

bool Client::off(MessageType type, HandlerId id) {
    return impl_->session.off(type, id);
}

bool Client::off(NoticeKind kind, HandlerId id) {
    return impl_->session.off(kind, id);
}

StateSnapshot Client::state() const {
    return impl_->session.state();
}

Metrics Client::metrics() const {
    return impl_->session.metrics();
}

std::vector<ConnectionInfo> Client::connections() const {
    return impl_->session.connections();
}

bool Client::is_connected() const {
    return impl_->session.is_connected();
}

LinkStatus Client::status() const {
    return impl_->session.status();
}

const std::string& Client::instance_id() const {
    return impl_->session.instance_id();
}

} // namespace statesync
