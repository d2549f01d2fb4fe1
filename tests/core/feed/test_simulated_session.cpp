/*
===============================================================================
 Session over feed::SimulatedWebSocket - Integration Tests
===============================================================================

Runs the real Session, Connection, Router and Scanner against the in-process
feed with the steady clock. Timings are short but generous.

Covered Requirements:
---------------------
SS1. Defaults are subscribed on connect and the stores fill up
SS2. Execution intents come back as execution updates
SS3. An abnormal server close reconnects and re-subscribes
SS4. A clean server close does not reconnect
SS5. A refusing server exhausts the retry budget

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>

#include "arbwire/core/feed/simulated_websocket.hpp"
#include "arbwire/core/protocol/session.hpp"
#include "arbwire/core/protocol/schema/intent/execute_arbitrage.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"

using namespace arbwire::core;
using namespace std::chrono_literals;

using SimSession = protocol::Session<feed::SimulatedWebSocket>;

static const std::string URL = "ws://localhost:3002/";

static protocol::SessionConfig fast_config() {
    protocol::SessionConfig cfg;
    cfg.retry.base_delay = 10ms;
    cfg.retry.max_delay = 40ms;
    cfg.retry.max_attempts = 3;
    return cfg;
}

static feed::SimulatedWebSocket::Options fast_feed(bool refuse = false) {
    feed::SimulatedWebSocket::Options opts;
    opts.simulator.interval = 5ms;
    opts.simulator.mev_probability = 1.0;
    opts.refuse_connect = refuse;
    return opts;
}

// Poll until `done` holds or the deadline passes
template <class Pred>
static bool poll_until(SimSession& s, Pred done, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        (void)s.poll();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return false;
}


void test_stores_fill_up() {
    std::cout << "[TEST] SS1: defaults subscribed, stores fill up..." << std::endl;
    SimSession s(fast_config(), fast_feed());

    TEST_CHECK(s.connect(URL) == transport::Error::None);
    (void)s.poll();
    TEST_CHECK(s.is_connected());
    TEST_CHECK(s.ws().simulator().subscribed("prices"));
    TEST_CHECK(s.ws().simulator().subscribed("depth"));

    const std::size_t expected_quotes = s.ws().simulator().options().pairs.size() * feed::exchanges().size();
    TEST_CHECK(poll_until(s, [&] {
        return s.quotes().size() == expected_quotes && !s.mev_alerts().empty() && !s.depth().empty();
    }));
    TEST_CHECK(s.stats().messages_received > 0);
    TEST_CHECK(s.stats().last_message_time_ms > 0);
    TEST_CHECK(s.quotes().evicted_total() == 0);
    std::cout << "[TEST] OK" << std::endl;
}

void test_execution_round_trip() {
    std::cout << "[TEST] SS2: execution intents are answered..." << std::endl;
    SimSession s(fast_config(), fast_feed());
    TEST_CHECK(s.connect(URL) == transport::Error::None);
    (void)s.poll();

    protocol::schema::intent::ExecuteArbitrage exec;
    exec.opportunity_id = "arb_test_1";
    exec.amount = 1000.0;
    TEST_CHECK(s.send_intent(exec) == protocol::dispatch::Result::Sent);
    TEST_CHECK(poll_until(s, [&] { return s.executions().contains("arb_test_1"); }));
    TEST_CHECK(s.executions().find("arb_test_1").value().status == protocol::ExecutionStatus::Completed);
    std::cout << "[TEST] OK" << std::endl;
}

void test_abnormal_close_reconnects() {
    std::cout << "[TEST] SS3: abnormal close reconnects..." << std::endl;
    SimSession s(fast_config(), fast_feed());
    TEST_CHECK(s.connect(URL) == transport::Error::None);
    TEST_CHECK(poll_until(s, [&] { return !s.quotes().empty(); }));

    s.ws().inject_close(false);
    (void)s.poll();
    TEST_CHECK(s.state() == transport::ConnectionState::Disconnected);
    TEST_CHECK(s.has_pending_retry());
    TEST_CHECK(s.stats().reconnect_attempts == 1);

    TEST_CHECK(poll_until(s, [&] { return s.is_connected(); }));
    TEST_CHECK(s.transport_epoch() == 2);
    TEST_CHECK(s.stats().reconnect_attempts == 0);

    // Fresh server instance, subscriptions replayed
    TEST_CHECK(s.ws().simulator().subscribed("prices"));
    TEST_CHECK(s.ws().simulator().subscribed("alpha"));

    // Transport error takes the same road
    s.ws().inject_error(transport::Error::TransportFailure);
    (void)s.poll();
    TEST_CHECK(s.state() == transport::ConnectionState::Error);
    TEST_CHECK(s.has_pending_retry());
    TEST_CHECK(poll_until(s, [&] { return s.is_connected(); }));
    TEST_CHECK(s.transport_epoch() == 3);

    s.close();
    TEST_CHECK(s.state() == transport::ConnectionState::Disconnected);
    TEST_CHECK(!s.has_pending_retry());
    std::cout << "[TEST] OK" << std::endl;
}

void test_clean_close_stays_down() {
    std::cout << "[TEST] SS4: clean close does not reconnect..." << std::endl;
    SimSession s(fast_config(), fast_feed());
    TEST_CHECK(s.connect(URL) == transport::Error::None);
    (void)s.poll();

    s.ws().inject_close(true);
    (void)s.poll();
    TEST_CHECK(s.state() == transport::ConnectionState::Disconnected);
    TEST_CHECK(!s.has_pending_retry());

    std::this_thread::sleep_for(50ms);
    (void)s.poll();
    TEST_CHECK(s.transport_epoch() == 1);

    // Explicit connect() brings it back
    TEST_CHECK(s.connect(URL) == transport::Error::None);
    TEST_CHECK(s.transport_epoch() == 2);
    std::cout << "[TEST] OK" << std::endl;
}

void test_refused_connection() {
    std::cout << "[TEST] SS5: refused connection exhausts retries..." << std::endl;
    SimSession s(fast_config(), fast_feed(true));

    TEST_CHECK(s.connect(URL) == transport::Error::ConnectionFailed);
    TEST_CHECK(s.state() == transport::ConnectionState::Error);
    TEST_CHECK(s.has_pending_retry());

    TEST_CHECK(poll_until(s, [&] { return !s.has_pending_retry(); }));
    TEST_CHECK(s.state() == transport::ConnectionState::Error);
    TEST_CHECK(s.transport_epoch() == 0);
    TEST_CHECK(s.stats().reconnect_attempts == 3);

    s.close();
    TEST_CHECK(s.state() == transport::ConnectionState::Disconnected);
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_stores_fill_up();
    test_execution_round_trip();
    test_abnormal_close_reconnects();
    test_clean_close_stays_down();
    test_refused_connection();

    std::cout << "\n[SIMULATED SESSION TESTS PASSED]\n";
    return 0;
}
