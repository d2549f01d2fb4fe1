#pragma once

#include <ostream>
#include <type_traits>

#include "arbwire/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace arbwire::core::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level state transitions and decisions.
// Does NOT duplicate WebSocket telemetry.
// Mechanical facts only.
// ============================================================================

struct alignas(64) Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle & state transitions
    // ---------------------------------------------------------------------

    // open() invoked by user
    lcr::metrics::atomic::counter32 open_calls_total;

    // Successfully reached ConnectionState::Connected
    lcr::metrics::atomic::counter32 connect_success_total;

    // Connection attempt failed (initial or reconnect)
    lcr::metrics::atomic::counter32 connect_failure_total;

    // Explicit close() invoked by user
    lcr::metrics::atomic::counter32 close_calls_total;

    // Transport closed while connected (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // ---------------------------------------------------------------------
    // Retry mechanics (decisions, not timing)
    // ---------------------------------------------------------------------

    // Reconnect timer armed
    lcr::metrics::atomic::counter32 retry_scheduled_total;

    // Reconnect attempt initiated on timer expiry
    lcr::metrics::atomic::counter32 retry_attempts_total;

    // Retry budget spent, connection entered terminal Error
    lcr::metrics::atomic::counter32 retry_exhausted_total;

    // ---------------------------------------------------------------------
    // Message handoff (WS -> user boundary)
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 messages_forwarded_total;

    // ---------------------------------------------------------------------
    // Send gating
    // ---------------------------------------------------------------------

    // send() called by user
    lcr::metrics::atomic::counter64 send_calls_total;

    // send() rejected due to non-connected state or transport refusal
    lcr::metrics::atomic::counter64 send_rejected_total;

    // ---------------------------------------------------------------------
    // Sub-telemetry
    // ---------------------------------------------------------------------

    transport::telemetry::WebSocket websocket;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Connection& other) const noexcept {
        open_calls_total.copy_to(other.open_calls_total);
        connect_success_total.copy_to(other.connect_success_total);
        connect_failure_total.copy_to(other.connect_failure_total);
        close_calls_total.copy_to(other.close_calls_total);
        disconnect_events_total.copy_to(other.disconnect_events_total);

        retry_scheduled_total.copy_to(other.retry_scheduled_total);
        retry_attempts_total.copy_to(other.retry_attempts_total);
        retry_exhausted_total.copy_to(other.retry_exhausted_total);

        messages_forwarded_total.copy_to(other.messages_forwarded_total);

        send_calls_total.copy_to(other.send_calls_total);
        send_rejected_total.copy_to(other.send_rejected_total);

        websocket.copy_to(other.websocket);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Connection Telemetry ===\n";

        os << "Lifecycle\n";
        os << "  Open calls            : " << lcr::format_number_exact(open_calls_total.load()) << '\n';
        os << "  Connect success       : " << lcr::format_number_exact(connect_success_total.load()) << '\n';
        os << "  Connect failure       : " << lcr::format_number_exact(connect_failure_total.load()) << '\n';
        os << "  Close calls           : " << lcr::format_number_exact(close_calls_total.load()) << '\n';
        os << "  Disconnect events     : " << lcr::format_number_exact(disconnect_events_total.load()) << '\n';

        os << "\nRetry\n";
        os << "  Retry scheduled       : " << lcr::format_number_exact(retry_scheduled_total.load()) << '\n';
        os << "  Retry attempts        : " << lcr::format_number_exact(retry_attempts_total.load()) << '\n';
        os << "  Retry exhausted       : " << lcr::format_number_exact(retry_exhausted_total.load()) << '\n';

        os << "\nMessage handoff\n";
        os << "  Messages forwarded    : " << lcr::format_number_exact(messages_forwarded_total.load()) << '\n';

        os << "\nSend\n";
        os << "  Send calls            : " << lcr::format_number_exact(send_calls_total.load()) << '\n';
        os << "  Send rejected         : " << lcr::format_number_exact(send_rejected_total.load()) << '\n';

        websocket.debug_dump(os);
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Connection>, "telemetry::Connection must be standard layout");
static_assert(std::is_trivially_destructible_v<Connection>, "telemetry::Connection must be trivially destructible");
static_assert(!std::is_polymorphic_v<Connection>, "telemetry::Connection must not be polymorphic");
static_assert(alignof(Connection) == 64, "telemetry::Connection must be cache-line aligned");

} // namespace arbwire::core::transport::telemetry
