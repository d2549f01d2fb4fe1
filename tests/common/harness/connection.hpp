/*
===============================================================================
 Connection Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
arbwire::core::transport::Connection FSM behavior.

Design:
-------
- Telemetry outlives Connection
- Connection lifetime is explicit and controllable
- Connection signals are drained deterministically
- Time only moves through ManualClock::advance()

===============================================================================
*/
#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <chrono>

#include "arbwire/core/transport/connection.hpp"
#include "arbwire/core/transport/connection/signal.hpp"
#include "arbwire/core/transport/connection/retry.hpp"
#include "arbwire/core/transport/telemetry/connection.hpp"
#include "common/mock_websocket.hpp"
#include "common/manual_clock.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace arbwire::core;
using namespace arbwire::core::transport;

using WebSocketUnderTest  = test::MockWebSocket;
using ConnectionUnderTest = Connection<WebSocketUnderTest, test::ManualClock>;


namespace arbwire::core::transport::test {
namespace harness {

struct Connection {
    // Persistent telemetry (must outlive Connection)
    telemetry::Connection telemetry;

    std::unique_ptr<ConnectionUnderTest> connection;

    // Event counters
    std::uint32_t connect_signals{0};
    std::uint32_t disconnect_signals{0};
    std::uint32_t retry_schedule_signals{0};
    std::uint32_t retry_exhausted_signals{0};

    // Ordered signal log
    std::vector<connection::Signal> signals;

    explicit Connection(connection::RetryPolicy policy = {}) {
        WebSocketUnderTest::reset();
        ManualClock::reset();
        make_connection(policy);
    }

    inline void make_connection(connection::RetryPolicy policy = {}) {
        connection = std::make_unique<ConnectionUnderTest>(telemetry, policy);
    }

    // ~Connection() runs here
    inline void destroy_connection() {
        connection.reset();
    }

    inline void poll() {
        connection->poll();
        drain_signals();
    }

    // Advance the manual clock, then poll once
    inline void advance_and_poll(std::chrono::milliseconds d) {
        ManualClock::advance(d);
        poll();
    }

    inline void drain_signals() noexcept {
        if (!connection) {
            return;
        }
        connection::Signal sig;
        while (connection->poll_signal(sig)) {
            switch (sig) {
            case connection::Signal::Connected:
                ++connect_signals;
                break;
            case connection::Signal::Disconnected:
                ++disconnect_signals;
                break;
            case connection::Signal::RetryScheduled:
                ++retry_schedule_signals;
                break;
            case connection::Signal::RetryExhausted:
                ++retry_exhausted_signals;
                break;
            case connection::Signal::None:
            default:
                break;
            }
            signals.push_back(sig);
        }
    }

    inline void reset_counters() noexcept {
        connect_signals = 0;
        disconnect_signals = 0;
        retry_schedule_signals = 0;
        retry_exhausted_signals = 0;
        signals.clear();
    }
};

} // namespace harness

using ConnectionHarness = harness::Connection;

} // namespace arbwire::core::transport::test
