/*
===============================================================================
 transport::Connection - Group A Unit Tests
===============================================================================

Scope:
------
Construction and lifecycle guarantees of
arbwire::core::transport::Connection<WS, Clock>.

Covered Requirements:
---------------------
A1. Default construction
    - Initial state is Disconnected
    - No transport instance is created implicitly
    - close() on a fresh connection is safe

A2. Destructor closes transport
    - Connection destruction closes the transport exactly once

A3. open() rejects malformed URLs before the FSM starts

A4. open() is rejected while a connection is active

===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// Group A1: Default construction
// -----------------------------------------------------------------------------
void test_default_construction() {
    std::cout << "[TEST] Group A1: default construction\n";
    test::ConnectionHarness h;

    TEST_CHECK(h.connection->state() == ConnectionState::Disconnected);
    TEST_CHECK(!h.connection->has_pending_retry());
    TEST_CHECK(h.connection->epoch() == 0);

    // Cannot send while disconnected
    TEST_CHECK(h.connection->send("ping") == false);

    // close() on a fresh connection must be safe and idempotent
    h.connection->close();
    h.connection->close();
    h.poll();

    TEST_CHECK(h.connection->state() == ConnectionState::Disconnected);
    TEST_CHECK(h.connection->disconnect_reason() == DisconnectReason::None);
    TEST_CHECK(WebSocketUnderTest::instances() == 0);
    TEST_CHECK(WebSocketUnderTest::close_count() == 0);
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A2: Destructor closes transport
// -----------------------------------------------------------------------------
void test_destructor_closes_transport() {
    std::cout << "[TEST] Group A2: destructor closes transport\n";
    test::ConnectionHarness h;

    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::None);
    TEST_CHECK(h.connection->ws().is_connected());

    h.destroy_connection();

    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A3: Invalid URL
// -----------------------------------------------------------------------------
void test_open_invalid_url() {
    std::cout << "[TEST] Group A3: open() rejects malformed URLs\n";
    test::ConnectionHarness h;

    TEST_CHECK(h.connection->open("http://localhost:3002/") == Error::InvalidUrl);
    TEST_CHECK(h.connection->open("ws://") == Error::InvalidUrl);
    TEST_CHECK(h.connection->open("ws://localhost:99999/") == Error::InvalidUrl);
    h.poll();

    // Nothing was attempted, nothing is scheduled
    TEST_CHECK(h.connection->state() == ConnectionState::Disconnected);
    TEST_CHECK(!h.connection->has_pending_retry());
    TEST_CHECK(WebSocketUnderTest::instances() == 0);
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A4: open() while Connected
// -----------------------------------------------------------------------------
void test_open_while_connected() {
    std::cout << "[TEST] Group A4: open() while Connected is rejected\n";
    test::ConnectionHarness h;

    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::None);
    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::InvalidState);

    // Original connection untouched
    TEST_CHECK(h.connection->state() == ConnectionState::Connected);
    TEST_CHECK(h.connection->epoch() == 1);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_default_construction();
    test_destructor_closes_transport();
    test_open_invalid_url();
    test_open_while_connected();

    std::cout << "\n[GROUP A - CONSTRUCTION & LIFECYCLE TESTS PASSED]\n";
    return 0;
}
