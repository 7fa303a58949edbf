/*
===============================================================================
 statesync Public Vocabulary Tests
===============================================================================

Covered:
- statesync/client.hpp is self-contained through the standalone vocabulary
  headers (no transport or pool machinery needed to name the public types)
- LinkStatus names, ConnectionInfo and Metrics defaults, handler ids
===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <type_traits>

#include "statesync/client.hpp"
#include "common/test_check.hpp"


void test_link_status_names() {
    std::cout << "[TEST] link status names\n";
    using statesync::LinkStatus;
    TEST_CHECK(to_string(LinkStatus::Disconnected) == "disconnected");
    TEST_CHECK(to_string(LinkStatus::Connecting) == "connecting");
    TEST_CHECK(to_string(LinkStatus::Connected) == "connected");
    TEST_CHECK(to_string(LinkStatus::Reconnecting) == "reconnecting");
    TEST_CHECK(to_string(LinkStatus::Offline) == "offline");
    std::cout << "[TEST] OK\n";
}

void test_snapshot_defaults() {
    std::cout << "[TEST] snapshot defaults\n";
    const statesync::ConnectionInfo info;
    TEST_CHECK(info.id == 0);
    TEST_CHECK(!info.ready);
    TEST_CHECK(!info.active);
    TEST_CHECK(info.state == statesync::core::transport::State::Connecting);

    const statesync::Metrics m;
    TEST_CHECK(!m.connected);
    TEST_CHECK(m.status == "disconnected");
    TEST_CHECK(m.buffered_count == 0);
    TEST_CHECK(m.unknown_messages == 0);
    TEST_CHECK(m.unhandled_messages == 0);
    std::cout << "[TEST] OK\n";
}

void test_handler_types() {
    std::cout << "[TEST] handler types\n";
    static_assert(std::is_same_v<statesync::HandlerId, std::uint64_t>);
    static_assert(std::is_same_v<statesync::Client::message_handler, statesync::core::sync::MessageHandler>);
    static_assert(std::is_same_v<statesync::Client::notice_handler, statesync::core::sync::NoticeHandler>);
    TEST_CHECK(statesync::core::sync::INVALID_HANDLER == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_link_status_names();
    test_snapshot_defaults();
    test_handler_types();

    std::cout << "\n[CLIENT VOCABULARY TESTS PASSED]\n";
    return 0;
}
