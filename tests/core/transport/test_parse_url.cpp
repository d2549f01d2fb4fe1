#include <iostream>

#include "arbwire/core/transport/parse_url.hpp"
#include "common/test_check.hpp"

using namespace arbwire::core::transport;


void test_plain_ws() {
    std::cout << "[TEST] parse_url: ws:// with port and path..." << std::endl;
    ParsedUrl u;
    TEST_CHECK(parse_url("ws://localhost:3002/feed", u) == Error::None);
    TEST_CHECK(!u.secure);
    TEST_CHECK(u.host == "localhost");
    TEST_CHECK(u.port == "3002");
    TEST_CHECK(u.target == "/feed");
    std::cout << "[TEST] OK" << std::endl;
}

void test_default_ports_and_target() {
    std::cout << "[TEST] parse_url: default ports and target..." << std::endl;
    ParsedUrl u;
    TEST_CHECK(parse_url("ws://feed.example.com", u) == Error::None);
    TEST_CHECK(u.port == "80");
    TEST_CHECK(u.target == "/");

    TEST_CHECK(parse_url("wss://feed.example.com", u) == Error::None);
    TEST_CHECK(u.secure);
    TEST_CHECK(u.port == "443");
    std::cout << "[TEST] OK" << std::endl;
}

void test_query_and_fragment() {
    std::cout << "[TEST] parse_url: query kept, fragment dropped..." << std::endl;
    ParsedUrl u;
    TEST_CHECK(parse_url("wss://feed.example.com/v1/stream?token=abc#top", u) == Error::None);
    TEST_CHECK(u.target == "/v1/stream?token=abc");

    TEST_CHECK(parse_url("ws://localhost:3002?x=1", u) == Error::None);
    TEST_CHECK(u.host == "localhost");
    TEST_CHECK(u.target == "/?x=1");
    std::cout << "[TEST] OK" << std::endl;
}

void test_rejections() {
    std::cout << "[TEST] parse_url: malformed inputs rejected..." << std::endl;
    ParsedUrl u;
    TEST_CHECK(parse_url("", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("http://localhost:3002", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://:3002/", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://localhost:/", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://localhost:abc/", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://localhost:0/", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://localhost:65536/", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("ws://user@host/", u) == Error::InvalidUrl);
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_plain_ws();
    test_default_ports_and_target();
    test_query_and_fragment();
    test_rejections();

    std::cout << "\n[PARSE_URL TESTS PASSED]\n";
    return 0;
}
