/*
===============================================================================
 sync::ResponseTable Unit Tests
===============================================================================

Covered:
- resolve() by payload.ref_id and by echoed envelope id
- Timeout isolation: an expiring request rejects only its own future; a
  concurrently pending request with a later deadline stays pending and can
  still be resolved
- reject() / reject_all() / destruction reject with the given error
- Duplicate ids are refused without disturbing the original entry
===============================================================================
*/

#include <chrono>
#include <future>
#include <iostream>
#include <string>

#include "statesync/core/sync/response_table.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace statesync::core;
using namespace statesync::core::sync;
using ClockUnderTest = statesync::test::ManualClock;
using TableUnderTest = ResponseTable<ClockUnderTest>;


namespace {

bool is_ready(const std::future<protocol::Message>& f) {
    return f.wait_for(0s) == std::future_status::ready;
}

protocol::Message reply_to(const std::string& ref) {
    protocol::Message msg;
    msg.id = "srv-1";
    msg.type = protocol::MessageType::ContextUpdate;
    msg.ref_id = ref;
    return msg;
}

} // namespace


void test_resolve_by_ref_id() {
    std::cout << "[TEST] resolve by ref_id\n";
    ClockUnderTest::reset();
    TableUnderTest table;
    auto f = table.add("req-1", 1000ms);
    TEST_CHECK(table.contains("req-1"));
    TEST_CHECK(!is_ready(f));

    TEST_CHECK(!table.resolve(reply_to("other")));
    TEST_CHECK(table.resolve(reply_to("req-1")));
    TEST_CHECK(is_ready(f));
    const auto msg = f.get();
    TEST_CHECK(msg.ref_id == "req-1");
    TEST_CHECK(table.empty());
    TEST_CHECK(table.resolved() == 1);

    // A second reply for the same id is not a response any more
    TEST_CHECK(!table.resolve(reply_to("req-1")));
    std::cout << "[TEST] OK\n";
}

void test_resolve_by_envelope_id() {
    std::cout << "[TEST] resolve by echoed envelope id\n";
    ClockUnderTest::reset();
    TableUnderTest table;
    auto f = table.add("req-2", 1000ms);

    protocol::Message echo;
    echo.id = "req-2";
    echo.type = protocol::MessageType::Unknown;
    echo.raw_type = "custom_reply";
    TEST_CHECK(table.resolve(echo));
    TEST_CHECK(f.get().raw_type == "custom_reply");

    // Messages without any id never resolve anything
    TEST_CHECK(!table.resolve(protocol::Message{}));
    std::cout << "[TEST] OK\n";
}

void test_timeout_isolation() {
    std::cout << "[TEST] timeout isolation\n";
    ClockUnderTest::reset();
    TableUnderTest table;
    auto short_f = table.add("short", 100ms);
    auto long_f = table.add("long", 1000ms);

    ClockUnderTest::advance(99ms);
    TEST_CHECK(table.expire(ClockUnderTest::now()) == 0);

    ClockUnderTest::advance(1ms);
    TEST_CHECK(table.expire(ClockUnderTest::now()) == 1);
    TEST_CHECK(is_ready(short_f));
    TEST_CHECK_SYNC_ERROR(short_f, Error::ResponseTimeout);

    // The other request is untouched
    TEST_CHECK(!is_ready(long_f));
    TEST_CHECK(table.contains("long"));
    TEST_CHECK(table.size() == 1);
    TEST_CHECK(table.timed_out() == 1);

    TEST_CHECK(table.resolve(reply_to("long")));
    TEST_CHECK(long_f.get().ref_id == "long");

    // A reply arriving after the timeout is ignored
    TEST_CHECK(!table.resolve(reply_to("short")));
    std::cout << "[TEST] OK\n";
}

void test_reject_variants() {
    std::cout << "[TEST] reject, reject_all, destruction\n";
    ClockUnderTest::reset();
    std::future<protocol::Message> orphan;
    {
        TableUnderTest table;
        auto a = table.add("a", 1000ms);
        auto b = table.add("b", 1000ms);
        auto c = table.add("c", 1000ms);
        orphan = table.add("d", 1000ms);

        TEST_CHECK(table.reject("a", Error::QueueOverflow, "queue full"));
        TEST_CHECK(!table.reject("a", Error::QueueOverflow, "again"));
        TEST_CHECK_SYNC_ERROR(a, Error::QueueOverflow);

        TEST_CHECK(table.reject("b", Error::SendFailure, "send failed"));
        TEST_CHECK_SYNC_ERROR(b, Error::SendFailure);

        (void)c;
        TEST_CHECK(table.size() == 2);
        TEST_CHECK(table.reject_all(Error::Disconnected) == 2);
        TEST_CHECK_SYNC_ERROR(c, Error::Disconnected);
        TEST_CHECK_SYNC_ERROR(orphan, Error::Disconnected);

        orphan = table.add("e", 1000ms);
    }
    // Destroying the table rejects what is left
    TEST_CHECK_SYNC_ERROR(orphan, Error::Disconnected);
    std::cout << "[TEST] OK\n";
}

void test_duplicate_id() {
    std::cout << "[TEST] duplicate id\n";
    ClockUnderTest::reset();
    TableUnderTest table;
    auto first = table.add("dup", 1000ms);
    auto second = table.add("dup", 1000ms);
    TEST_CHECK_SYNC_ERROR(second, Error::InvalidMessage);
    TEST_CHECK(table.size() == 1);
    TEST_CHECK(table.resolve(reply_to("dup")));
    TEST_CHECK(first.get().ref_id == "dup");
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_resolve_by_ref_id();
    test_resolve_by_envelope_id();
    test_timeout_isolation();
    test_reject_variants();
    test_duplicate_id();

    std::cout << "\n[RESPONSE TABLE TESTS PASSED]\n";
    return 0;
}
