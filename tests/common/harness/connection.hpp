/*
===============================================================================
 Connection Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
statesync::core::transport::Connection FSM behavior.

Design:
-------
- Connection lifetime is explicit and controllable
- Connection signals are drained deterministically into a vector
- Time only moves through ManualClock::advance()
- No callbacks, no threads, no hidden behavior
===============================================================================
*/
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "statesync/core/transport/connection.hpp"
#include "statesync/core/transport/connection/signal.hpp"
#include "common/mock_websocket.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace statesync::core;
using namespace statesync::core::transport;

using WebSocketUnderTest = transport::test::MockWebSocket;
using ClockUnderTest = statesync::test::ManualClock;
using ConnectionUnderTest = Connection<WebSocketUnderTest, ClockUnderTest>;


namespace statesync::core::transport::test {
namespace harness {

inline ConnectionOptions make_options() {
    ConnectionOptions opts;
    opts.handshake_timeout = std::chrono::milliseconds{200};
    opts.heartbeat_interval = std::chrono::milliseconds{1000};
    opts.heartbeat_max_missed = 2;
    return opts;
}

inline ParsedUrl make_url() {
    ParsedUrl url;
    TEST_CHECK(parse_url("ws://authority.test:8765/sync", url) == Error::None);
    return url;
}

// Hello frame in the shape the authority expects
inline std::string hello() {
    protocol::payload::Auth auth;
    auth.instance_id = "test_0000abcd";
    auth.platform = "test";
    return protocol::make_message("hello-1", protocol::MessageType::Auth, std::move(auth)).to_json();
}

struct Connection {
    ConnectionUnderTest connection;
    std::vector<connection::Signal> signals;

    explicit Connection(std::uint32_t id = 1, ConnectionOptions opts = make_options())
        : connection(id, opts)
    {}

    // Polls once and collects the signals emitted.
    inline void poll() {
        connection.poll();
        connection::Signal sig;
        while (connection.poll_signal(sig)) {
            signals.push_back(sig);
        }
    }

    [[nodiscard]]
    inline std::size_t count(connection::Signal sig) const {
        std::size_t n = 0;
        for (auto s : signals) {
            n += (s == sig) ? 1 : 0;
        }
        return n;
    }

    // Opens and lets the (mock) authority accept the handshake.
    inline void open_ready() {
        TEST_CHECK(connection.open(make_url(), hello()) == Error::None);
        poll(); // Open → hello written
        std::string frame;
        while (connection.poll_message(frame)) {
            connection.accept_handshake();
        }
        poll();
        TEST_CHECK(connection.ready());
    }
};

} // namespace harness
} // namespace statesync::core::transport::test
