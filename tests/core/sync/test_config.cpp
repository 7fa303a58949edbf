/*
===============================================================================
 sync::Config validation Unit Tests
===============================================================================
*/

#include <chrono>
#include <iostream>

#include "statesync/core/sync/config.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace statesync::core::sync;


void test_defaults_are_valid() {
    std::cout << "[TEST] defaults\n";
    const Config cfg;
    TEST_CHECK(validate(cfg) == Error::None);
    TEST_CHECK(cfg.pool_size == 1);
    TEST_CHECK(cfg.reconnect_base == 1000ms);
    TEST_CHECK(cfg.reconnect_cap == 30000ms);
    TEST_CHECK(cfg.max_reconnect_attempts == -1);
    TEST_CHECK(cfg.heartbeat_interval == 30000ms);
    TEST_CHECK(cfg.message_timeout == 10000ms);
    TEST_CHECK(cfg.queue_capacity == 1000);
    TEST_CHECK(cfg.buffer_capacity == 500);
    std::cout << "[TEST] OK\n";
}

void test_invalid_values() {
    std::cout << "[TEST] invalid values\n";
    const Config base;

    auto cfg = base;
    cfg.endpoint_url = "http://example.com";
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.pool_size = 0;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.reconnect_base = 0ms;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.reconnect_cap = 500ms; // below base
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.max_reconnect_attempts = -2;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.heartbeat_max_missed = 0;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.message_timeout = 0ms;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.queue_capacity = 0;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.max_send_retries = 0;
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    cfg = base;
    cfg.platform.clear();
    TEST_CHECK(validate(cfg) == Error::InvalidConfig);

    // Zero attempts is a valid "never retry" policy
    cfg = base;
    cfg.max_reconnect_attempts = 0;
    TEST_CHECK(validate(cfg) == Error::None);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_defaults_are_valid();
    test_invalid_values();

    std::cout << "\n[CONFIG TESTS PASSED]\n";
    return 0;
}
