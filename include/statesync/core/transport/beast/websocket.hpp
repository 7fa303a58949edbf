#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "statesync/core/transport/concepts.hpp"
#include "statesync/core/transport/error.hpp"
#include "statesync/core/transport/parse_url.hpp"
#include "statesync/core/transport/websocket/events.hpp"


namespace statesync::core::transport::beast {

/*
===============================================================================
 transport::beast::WebSocket
===============================================================================

Boost.Beast binding of transport::WebSocketConcept (ws:// and wss://).

Threading:
  Each instance owns one io_context and the thread running it. Resolve,
  TCP connect, TLS handshake (with SNI and peer verification) and the
  WebSocket upgrade run asynchronously on that thread; connect() returns as
  soon as the attempt is started.

Delivery:
  Inbound text frames and control events are pushed by the IO thread into
  mutex-protected queues and pulled by the owner with poll_message() /
  poll_event(). No callback ever runs on the owner's thread.

    Open                      upgrade completed
    Error(e) then Close       failure (resolve, connect, handshake, read, write)
    Close                     orderly close, local or remote (exactly once)

send() copies the frame and hands it to the IO thread, which writes frames
one at a time in submission order. send() fails only when the socket is not
open (or is closing).

Boost.Asio and Beast types stay in the implementation file.
===============================================================================
*/
class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const ParsedUrl& url) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool send(std::string_view text) noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace statesync::core::transport::beast
