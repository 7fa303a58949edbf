/*
===============================================================================
 transport::parse_url Unit Tests
===============================================================================

Covered:
- ws:// and wss:// with and without port and path
- Default ports (80 / 443) and default path "/"
- Rejection of unsupported schemes, empty hosts and invalid ports
===============================================================================
*/

#include <iostream>

#include "statesync/core/transport/parse_url.hpp"
#include "common/test_check.hpp"

using namespace statesync::core::transport;


void test_plain_with_port_and_path() {
    std::cout << "[TEST] ws:// with port and path\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("ws://localhost:8765/sync/v1", url) == Error::None);
    TEST_CHECK(!url.secure);
    TEST_CHECK(url.host == "localhost");
    TEST_CHECK(url.port == "8765");
    TEST_CHECK(url.path == "/sync/v1");
    std::cout << "[TEST] OK\n";
}

void test_secure_defaults() {
    std::cout << "[TEST] wss:// defaults\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("wss://sync.example.com", url) == Error::None);
    TEST_CHECK(url.secure);
    TEST_CHECK(url.host == "sync.example.com");
    TEST_CHECK(url.port == "443");
    TEST_CHECK(url.path == "/");

    TEST_CHECK(parse_url("ws://sync.example.com/", url) == Error::None);
    TEST_CHECK(url.port == "80");
    TEST_CHECK(url.path == "/");
    std::cout << "[TEST] OK\n";
}

void test_rejections() {
    std::cout << "[TEST] malformed urls\n";
    ParsedUrl url;
    TEST_CHECK(parse_url("http://example.com", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("example.com:8765", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://:8765/path", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:/path", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:abc", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:0", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://host:65536", url) == Error::InvalidUrl);
    TEST_CHECK(parse_url("", url) == Error::InvalidUrl);
    std::cout << "[TEST] OK\n";
}

int main() {
    test_plain_with_port_and_path();
    test_secure_defaults();
    test_rejections();

    std::cout << "\n[PARSE URL TESTS PASSED]\n";
    return 0;
}
