/*
===============================================================================
 sync::Dispatcher Unit Tests
===============================================================================

Covered:
- Typed handlers in registration order, off() by handler id
- Catch-all: Unknown handlers receive unknown types only; with none, the
  message is counted unrouted. Known types without a handler are counted
  unhandled and never reach the catch-all
- A throwing handler is counted and does not stop the others
- Handlers may unregister themselves while being dispatched
- Notice handlers per kind
===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "statesync/core/sync/dispatcher.hpp"
#include "common/test_check.hpp"

using namespace statesync::core;
using namespace statesync::core::sync;
using protocol::MessageType;


namespace {

protocol::Message message(MessageType type) {
    protocol::Message msg;
    msg.id = "m";
    msg.type = type;
    if (type == MessageType::Unknown) {
        msg.raw_type = "custom";
    }
    return msg;
}

} // namespace


void test_typed_handlers() {
    std::cout << "[TEST] typed handlers\n";
    Dispatcher d;
    std::vector<int> calls;
    const auto a = d.on(MessageType::StateSync, [&](const protocol::Message&) { calls.push_back(1); });
    const auto b = d.on(MessageType::StateSync, [&](const protocol::Message&) { calls.push_back(2); });
    TEST_CHECK(a != INVALID_HANDLER);
    TEST_CHECK(a != b);
    TEST_CHECK(d.handler_count(MessageType::StateSync) == 2);

    TEST_CHECK(d.dispatch(message(MessageType::StateSync)) == 2);
    TEST_CHECK((calls == std::vector<int>{1, 2}));

    TEST_CHECK(d.off(MessageType::StateSync, a));
    TEST_CHECK(!d.off(MessageType::StateSync, a));
    TEST_CHECK(!d.off(MessageType::Event, b)); // wrong type
    calls.clear();
    TEST_CHECK(d.dispatch(message(MessageType::StateSync)) == 1);
    TEST_CHECK((calls == std::vector<int>{2}));
    std::cout << "[TEST] OK\n";
}

void test_catch_all() {
    std::cout << "[TEST] catch-all handlers\n";
    Dispatcher d;
    TEST_CHECK(d.dispatch(message(MessageType::Unknown)) == 0);
    TEST_CHECK(d.unrouted() == 1);

    std::vector<std::string> seen;
    (void)d.on(MessageType::Unknown, [&](const protocol::Message& m) { seen.emplace_back(m.type_name()); });
    (void)d.on(MessageType::EventAck, [&](const protocol::Message&) { seen.emplace_back("typed"); });

    TEST_CHECK(d.dispatch(message(MessageType::Unknown)) == 1);
    TEST_CHECK(d.dispatch(message(MessageType::ContextUpdate)) == 0); // no typed handler
    TEST_CHECK(d.dispatch(message(MessageType::Pong)) == 0);
    TEST_CHECK(d.dispatch(message(MessageType::EventAck)) == 1);
    TEST_CHECK((seen == std::vector<std::string>{"custom", "typed"}));
    TEST_CHECK(d.unrouted() == 1);
    TEST_CHECK(d.unhandled() == 2);
    std::cout << "[TEST] OK\n";
}

void test_throwing_handler_isolated() {
    std::cout << "[TEST] throwing handler\n";
    Dispatcher d;
    int after = 0;
    (void)d.on(MessageType::Event, [](const protocol::Message&) { throw std::runtime_error("boom"); });
    (void)d.on(MessageType::Event, [](const protocol::Message&) { throw 42; });
    (void)d.on(MessageType::Event, [&](const protocol::Message&) { ++after; });

    TEST_CHECK(d.dispatch(message(MessageType::Event)) == 3);
    TEST_CHECK(after == 1);
    TEST_CHECK(d.handler_errors() == 2);

    (void)d.on(NoticeKind::Connected, [](const Notice&) { throw std::logic_error("notice"); });
    TEST_CHECK(d.dispatch(Notice{NoticeKind::Connected}) == 1);
    TEST_CHECK(d.handler_errors() == 3);
    std::cout << "[TEST] OK\n";
}

void test_self_removal() {
    std::cout << "[TEST] handler removes itself\n";
    Dispatcher d;
    int calls = 0;
    HandlerId self = INVALID_HANDLER;
    self = d.on(NoticeKind::Milestone, [&](const Notice&) {
        ++calls;
        (void)d.off(NoticeKind::Milestone, self);
    });
    Notice n;
    n.kind = NoticeKind::Milestone;
    TEST_CHECK(d.dispatch(n) == 1);
    TEST_CHECK(d.dispatch(n) == 0);
    TEST_CHECK(calls == 1);
    TEST_CHECK(d.handler_count(NoticeKind::Milestone) == 0);
    std::cout << "[TEST] OK\n";
}

void test_notices_per_kind() {
    std::cout << "[TEST] notice kinds\n";
    Dispatcher d;
    std::vector<std::string> seen;
    (void)d.on(NoticeKind::StatusChanged, [&](const Notice& n) { seen.push_back(n.detail); });
    Notice status;
    status.kind = NoticeKind::StatusChanged;
    status.detail = "reconnecting";
    TEST_CHECK(d.dispatch(status) == 1);

    Notice other;
    other.kind = NoticeKind::QueueOverflow;
    TEST_CHECK(d.dispatch(other) == 0);
    TEST_CHECK((seen == std::vector<std::string>{"reconnecting"}));
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_typed_handlers();
    test_catch_all();
    test_throwing_handler_isolated();
    test_self_removal();
    test_notices_per_kind();

    std::cout << "\n[DISPATCHER TESTS PASSED]\n";
    return 0;
}
