#include "statesync/core/transport/beast/websocket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "lcr/log/logger.hpp"


namespace statesync::core::transport::beast {

namespace net = boost::asio;
namespace bb = boost::beast;
namespace bws = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::seconds CONNECT_TIMEOUT{10};
constexpr std::chrono::seconds CLOSE_TIMEOUT{2};
constexpr std::size_t READ_MESSAGE_MAX = 4 * 1024 * 1024;

using PlainStream = bws::stream<bb::tcp_stream>;
using TlsStream = bws::stream<bb::ssl_stream<bb::tcp_stream>>;

[[nodiscard]]
Error map_error(const bb::error_code& ec, Error fallback) noexcept {
    if (ec == bb::error::timeout) {
        return Error::Timeout;
    }
    if (ec == net::error::operation_aborted) {
        return Error::Cancelled;
    }
    if (ec == net::error::eof || ec == net::error::connection_reset || ec == bws::error::closed) {
        return Error::RemoteClosed;
    }
    return fallback;
}

// -----------------------------------------------------------------------------
// Hand-off point between the IO thread (producer) and the owner (consumer).
// -----------------------------------------------------------------------------
struct Mailbox {
    std::mutex mutex;
    std::deque<std::string> messages;
    std::deque<websocket::Event> events;
    bool close_emitted{false};
    std::atomic<bool> open{false};

    void push_message(std::string&& text) {
        std::lock_guard lock(mutex);
        messages.push_back(std::move(text));
    }

    void opened() {
        std::lock_guard lock(mutex);
        open.store(true, std::memory_order_release);
        events.push_back(websocket::Event::make_open());
    }

    // Error followed by Close, at most once per transport lifetime.
    void failed(Error error) {
        std::lock_guard lock(mutex);
        open.store(false, std::memory_order_release);
        if (close_emitted) {
            return;
        }
        close_emitted = true;
        events.push_back(websocket::Event::make_error(error));
        events.push_back(websocket::Event::make_close());
    }

    void closed() {
        std::lock_guard lock(mutex);
        open.store(false, std::memory_order_release);
        if (close_emitted) {
            return;
        }
        close_emitted = true;
        events.push_back(websocket::Event::make_close());
    }
};


// -----------------------------------------------------------------------------
// One transport lifetime on the IO thread: resolve → connect → [TLS] →
// upgrade → read loop. All members are touched from the IO thread only,
// except through the Mailbox.
// -----------------------------------------------------------------------------
template <class Stream>
class Channel : public std::enable_shared_from_this<Channel<Stream>> {
    static constexpr bool TLS = std::is_same_v<Stream, TlsStream>;

public:
    Channel(net::io_context& ioc, net::ssl::context& tls, std::shared_ptr<Mailbox> mailbox, ParsedUrl url)
        : resolver_(ioc)
        , ws_(make_stream_(ioc, tls))
        , mailbox_(std::move(mailbox))
        , url_(std::move(url))
    {}

    void start() {
        SS_DEBUG("[WS] Resolving " << url_.host << ":" << url_.port);
        resolver_.async_resolve(url_.host, url_.port,
            bb::bind_front_handler(&Channel::on_resolve_, this->shared_from_this()));
    }

    void write(std::string frame) {
        if (!open_ || closing_) {
            return;
        }
        outbox_.push_back(std::move(frame));
        if (outbox_.size() == 1) {
            write_next_();
        }
    }

    void shutdown() {
        if (closing_) {
            return;
        }
        closing_ = true;
        if (open_) {
            SS_DEBUG("[WS] Closing " << url_.host);
            ws_.async_close(bws::close_code::normal,
                [self = this->shared_from_this()](bb::error_code ec) {
                    if (ec) {
                        SS_DEBUG("[WS] Close handshake: " << ec.message());
                    }
                    self->open_ = false;
                    self->mailbox_->closed();
                });
            return;
        }
        // Attempt still in progress: abort it
        resolver_.cancel();
        bb::get_lowest_layer(ws_).close();
        mailbox_->closed();
    }

private:
    tcp::resolver resolver_;
    Stream ws_;
    std::shared_ptr<Mailbox> mailbox_;
    ParsedUrl url_;
    bb::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    bool open_{false};
    bool closing_{false};

    static Stream make_stream_(net::io_context& ioc, net::ssl::context& tls) {
        if constexpr (TLS) {
            return Stream(ioc, tls);
        } else {
            (void)tls;
            return Stream(ioc);
        }
    }

    void fail_(const char* what, const bb::error_code& ec, Error fallback) {
        open_ = false;
        if (closing_) {
            mailbox_->closed();
            return;
        }
        const Error error = map_error(ec, fallback);
        if (error == Error::RemoteClosed) {
            SS_INFO("[WS] Connection closed by peer (" << what << ": " << ec.message() << ")");
        } else {
            SS_WARN("[WS] " << what << " failed: " << ec.message());
        }
        bb::get_lowest_layer(ws_).close();
        mailbox_->failed(error);
    }

    void on_resolve_(bb::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail_("resolve", ec, Error::ConnectionFailed);
        }
        bb::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
        bb::get_lowest_layer(ws_).async_connect(results,
            bb::bind_front_handler(&Channel::on_connect_, this->shared_from_this()));
    }

    void on_connect_(bb::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail_("connect", ec, Error::ConnectionFailed);
        }
        if constexpr (TLS) {
            // SNI, required by most virtual-hosted endpoints
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
                const bb::error_code sni(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                return fail_("tls sni", sni, Error::HandshakeFailed);
            }
            ws_.next_layer().set_verify_callback(net::ssl::host_name_verification(url_.host));
            bb::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
            ws_.next_layer().async_handshake(net::ssl::stream_base::client,
                bb::bind_front_handler(&Channel::on_tls_handshake_, this->shared_from_this()));
        } else {
            upgrade_();
        }
    }

    void on_tls_handshake_(bb::error_code ec) {
        if (ec) {
            return fail_("tls handshake", ec, Error::HandshakeFailed);
        }
        upgrade_();
    }

    void upgrade_() {
        // The websocket stream has its own timeouts from here on
        bb::get_lowest_layer(ws_).expires_never();
        ws_.set_option(bws::stream_base::timeout::suggested(bb::role_type::client));
        ws_.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(bb::http::field::user_agent, "statesync");
        }));
        ws_.read_message_max(READ_MESSAGE_MAX);
        const std::string host = url_.host + ":" + url_.port;
        ws_.async_handshake(host, url_.path,
            bb::bind_front_handler(&Channel::on_upgrade_, this->shared_from_this()));
    }

    void on_upgrade_(bb::error_code ec) {
        if (ec) {
            return fail_("websocket upgrade", ec, Error::HandshakeFailed);
        }
        if (closing_) {
            return shutdown_after_upgrade_();
        }
        SS_INFO("[WS] Connected to " << (TLS ? "wss://" : "ws://") << url_.host << ":" << url_.port << url_.path);
        open_ = true;
        mailbox_->opened();
        read_();
    }

    // close() raced with the upgrade: finish the close handshake instead
    void shutdown_after_upgrade_() {
        open_ = true;
        closing_ = false;
        shutdown();
    }

    void read_() {
        ws_.async_read(buffer_, bb::bind_front_handler(&Channel::on_read_, this->shared_from_this()));
    }

    void on_read_(bb::error_code ec, std::size_t) {
        if (ec) {
            if (ec == bws::error::closed) {
                SS_INFO("[WS] Closed by peer (" << ws_.reason().reason.c_str() << ")");
                open_ = false;
                mailbox_->closed();
                return;
            }
            return fail_("read", ec, Error::TransportFailure);
        }
        if (ws_.got_text()) {
            mailbox_->push_message(bb::buffers_to_string(buffer_.data()));
        } else {
            SS_DEBUG("[WS] Ignoring binary frame (" << buffer_.size() << " bytes)");
        }
        buffer_.consume(buffer_.size());
        read_();
    }

    void write_next_() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
            bb::bind_front_handler(&Channel::on_write_, this->shared_from_this()));
    }

    void on_write_(bb::error_code ec, std::size_t) {
        if (ec) {
            outbox_.clear();
            return fail_("write", ec, Error::TransportFailure);
        }
        outbox_.pop_front();
        if (!outbox_.empty() && open_ && !closing_) {
            write_next_();
        }
    }
};

} // namespace


// ===============================================================================
// WebSocket::Impl
// ===============================================================================
struct WebSocket::Impl {
    // Declaration order matters: the io_context must outlive the channel and
    // be destroyed before the TLS context.
    net::ssl::context tls{net::ssl::context::tls_client};
    net::io_context ioc{1};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::shared_ptr<Mailbox> mailbox = std::make_shared<Mailbox>();
    std::variant<std::monostate, std::shared_ptr<Channel<PlainStream>>, std::shared_ptr<Channel<TlsStream>>> channel;
    std::thread thread;
    std::promise<void> finished;                    // set when run() returns
    std::future<void> finished_future = finished.get_future();

    ~Impl() {
        stop();
    }

    // Lets the channel finish its close handshake (or abort its attempt)
    // before the IO thread is torn down. Once the channel is done and the
    // work guard is gone, run() returns by itself; an unresponsive peer is
    // cut off after CLOSE_TIMEOUT.
    void stop() noexcept {
        if (thread.joinable()) {
            try {
                post_to_channel([](auto& ch) { ch.shutdown(); });
            }
            catch (const std::exception& e) {
                SS_WARN("[WS] Could not request close: " << e.what());
            }
            work.reset();
            if (finished_future.wait_for(CLOSE_TIMEOUT) != std::future_status::ready) {
                SS_WARN("[WS] Close did not complete within " << CLOSE_TIMEOUT.count() << " s, aborting");
            }
        }
        work.reset();
        ioc.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }

    template <typename Fn>
    void post_to_channel(Fn&& fn) {
        std::visit([&fn, this](auto& ch) {
            using T = std::decay_t<decltype(ch)>;
            if constexpr (!std::is_same_v<T, std::monostate>) {
                net::post(ioc, [ch, fn]() mutable { fn(*ch); });
            }
        }, channel);
    }

    void run() noexcept {
        try {
            ioc.run();
        }
        catch (const std::exception& e) {
            SS_ERROR("[WS] IO thread terminated: " << e.what());
            mailbox->failed(Error::TransportFailure);
        }
        finished.set_value();
    }
};


WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{
}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const ParsedUrl& url) noexcept {
    if (impl_->thread.joinable()) {
        SS_WARN("[WS] connect() called twice");
        return Error::InvalidState;
    }
    try {
        impl_->work.emplace(net::make_work_guard(impl_->ioc));
        if (url.secure) {
            bb::error_code ec;
            impl_->tls.set_default_verify_paths(ec);
            if (ec) {
                SS_WARN("[WS] Could not load default CA paths: " << ec.message());
            }
            impl_->tls.set_verify_mode(net::ssl::verify_peer);
            auto ch = std::make_shared<Channel<TlsStream>>(impl_->ioc, impl_->tls, impl_->mailbox, url);
            impl_->channel = ch;
            net::post(impl_->ioc, [ch]() { ch->start(); });
        } else {
            auto ch = std::make_shared<Channel<PlainStream>>(impl_->ioc, impl_->tls, impl_->mailbox, url);
            impl_->channel = ch;
            net::post(impl_->ioc, [ch]() { ch->start(); });
        }
        impl_->thread = std::thread([impl = impl_.get()]() { impl->run(); });
    }
    catch (const std::exception& e) {
        SS_ERROR("[WS] Could not start connection attempt: " << e.what());
        return Error::TransportFailure;
    }
    return Error::None;
}

void WebSocket::close() noexcept {
    try {
        impl_->post_to_channel([](auto& ch) { ch.shutdown(); });
    }
    catch (const std::exception& e) {
        SS_ERROR("[WS] close() failed: " << e.what());
    }
}

bool WebSocket::send(std::string_view text) noexcept {
    if (!impl_->mailbox->open.load(std::memory_order_acquire)) {
        return false;
    }
    try {
        impl_->post_to_channel([frame = std::string(text)](auto& ch) mutable { ch.write(std::move(frame)); });
    }
    catch (const std::exception& e) {
        SS_ERROR("[WS] send() failed: " << e.what());
        return false;
    }
    return true;
}

bool WebSocket::poll_message(std::string& out) noexcept {
    std::lock_guard lock(impl_->mailbox->mutex);
    auto& q = impl_->mailbox->messages;
    if (q.empty()) {
        return false;
    }
    out = std::move(q.front());
    q.pop_front();
    return true;
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    std::lock_guard lock(impl_->mailbox->mutex);
    auto& q = impl_->mailbox->events;
    if (q.empty()) {
        return false;
    }
    out = q.front();
    q.pop_front();
    return true;
}

} // namespace statesync::core::transport::beast
