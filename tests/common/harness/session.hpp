/*
===============================================================================
 Session Test Harness
===============================================================================

Session<MockWebSocket, ManualClock> plus the plumbing every session test
needs: a small-timeout configuration, a notice recorder and helpers that
poll the session until the mock authority has answered the handshake.
===============================================================================
*/
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "statesync/core/sync/session.hpp"
#include "common/mock_websocket.hpp"
#include "common/manual_clock.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace statesync::core;
using namespace statesync::core::sync;

using WebSocketUnderTest = transport::test::MockWebSocket;
using ClockUnderTest = statesync::test::ManualClock;
using SessionUnderTest = Session<WebSocketUnderTest, ClockUnderTest>;


namespace statesync::core::sync::test {
namespace harness {

inline Config make_config(std::uint32_t pool_size = 1) {
    Config cfg;
    cfg.endpoint_url = "ws://authority.test:8765/sync";
    cfg.pool_size = pool_size;
    cfg.reconnect_base = std::chrono::milliseconds{100};
    cfg.reconnect_cap = std::chrono::milliseconds{1000};
    cfg.max_reconnect_attempts = -1;
    cfg.heartbeat_interval = std::chrono::milliseconds{1000};
    cfg.heartbeat_max_missed = 2;
    cfg.message_timeout = std::chrono::milliseconds{500};
    cfg.handshake_timeout = std::chrono::milliseconds{200};
    cfg.queue_capacity = 100;
    cfg.buffer_capacity = 50;
    cfg.max_send_retries = 3;
    cfg.platform = "test";
    return cfg;
}

// Records every notice the session delivers.
struct NoticeLog {
    std::vector<Notice> notices;

    inline void attach(SessionUnderTest& session) {
        for (std::size_t k = 0; k < NOTICE_KIND_COUNT; ++k) {
            (void)session.on(static_cast<NoticeKind>(k), [this](const Notice& n) {
                notices.push_back(n);
            });
        }
    }

    [[nodiscard]]
    inline std::size_t count(NoticeKind kind) const {
        std::size_t n = 0;
        for (const auto& notice : notices) {
            n += (notice.kind == kind) ? 1 : 0;
        }
        return n;
    }

    [[nodiscard]]
    inline const Notice* last(NoticeKind kind) const {
        for (auto it = notices.rbegin(); it != notices.rend(); ++it) {
            if (it->kind == kind) {
                return &*it;
            }
        }
        return nullptr;
    }

    [[nodiscard]]
    inline bool has_status(const std::string& status) const {
        for (const auto& notice : notices) {
            if (notice.kind == NoticeKind::StatusChanged && notice.detail == status) {
                return true;
            }
        }
        return false;
    }

    inline void clear() { notices.clear(); }
};

inline void pump(SessionUnderTest& session, int rounds = 3) {
    for (int i = 0; i < rounds; ++i) {
        session.poll();
    }
}

// connect() and poll until the first member is active.
inline void connect_ready(SessionUnderTest& session) {
    TEST_CHECK(session.connect() == transport::Error::None);
    pump(session);
    TEST_CHECK(session.is_connected());
}

// Advances the clock in steps, polling after each one.
template <typename Duration>
inline void advance(SessionUnderTest& session, Duration total, std::chrono::milliseconds step = std::chrono::milliseconds{10}) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(total);
    while (remaining.count() > 0) {
        const auto d = remaining < step ? remaining : step;
        ClockUnderTest::advance(d);
        session.poll();
        remaining -= d;
    }
}

// Mock transport of pool member `index`.
inline WebSocketUnderTest& ws(SessionUnderTest& session, std::size_t index = 0) {
    return session.pool().member(index).ws();
}

// Resets the shared mock state and the clock.
inline void reset() {
    WebSocketUnderTest::reset();
    ClockUnderTest::reset();
}

} // namespace harness
} // namespace statesync::core::sync::test
