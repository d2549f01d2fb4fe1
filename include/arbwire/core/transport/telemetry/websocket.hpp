#pragma once

#include <cstdint>
#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace arbwire::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Transport-level observability shared by all WebSocket backends
// (Boost.Beast, simulated feed, test mocks).
// Captures ONLY mechanical socket behavior: no clocks, no rates, no policy.
//
// Throughput is derived exclusively via snapshot deltas.
// ============================================================================

struct alignas(64) WebSocket final {
    // ---------------------------------------------------------------------
    // Throughput (cumulative, monotonic)
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;

    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // ---------------------------------------------------------------------
    // Errors & lifecycle
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 send_errors_total;
    lcr::metrics::atomic::counter32 close_events_total;

    // ---------------------------------------------------------------------
    // Pressure
    // ---------------------------------------------------------------------

    // Inbound messages dropped because the frame ring was full
    lcr::metrics::atomic::counter64 rx_dropped_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(WebSocket& other) const noexcept {
        bytes_rx_total.copy_to(other.bytes_rx_total);
        bytes_tx_total.copy_to(other.bytes_tx_total);
        messages_rx_total.copy_to(other.messages_rx_total);
        messages_tx_total.copy_to(other.messages_tx_total);

        receive_errors_total.copy_to(other.receive_errors_total);
        send_errors_total.copy_to(other.send_errors_total);
        close_events_total.copy_to(other.close_events_total);

        rx_dropped_total.copy_to(other.rx_dropped_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n";
        os << "Traffic\n";
        os << "  RX bytes:         " << lcr::format_bytes(bytes_rx_total.load()) << '\n';
        os << "  TX bytes:         " << lcr::format_bytes(bytes_tx_total.load()) << '\n';
        os << "  RX messages:      " << lcr::format_number_exact(messages_rx_total.load()) << '\n';
        os << "  TX messages:      " << lcr::format_number_exact(messages_tx_total.load()) << '\n';

        os << "\nErrors / lifecycle\n";
        os << "  Receive errors:   " << lcr::format_number_exact(receive_errors_total.load()) << '\n';
        os << "  Send errors   :   " << lcr::format_number_exact(send_errors_total.load()) << '\n';
        os << "  Close events  :   " << lcr::format_number_exact(close_events_total.load()) << '\n';

        os << "\nPressure\n";
        os << "  RX dropped    :   " << lcr::format_number_exact(rx_dropped_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(std::is_trivially_destructible_v<WebSocket>, "telemetry::WebSocket must be trivially destructible");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");
static_assert(alignof(WebSocket) == 64, "telemetry::WebSocket must be cache-line aligned");

} // namespace arbwire::core::transport::telemetry
