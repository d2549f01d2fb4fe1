/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents **externally observable, edge-triggered facts**
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Deterministic and poll-driven
  - Allocation-free and callback-free

The Session reacts to Connected by replaying the subscription registry.
All other signals are informational; ConnectionState remains the source of
truth.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  Handshake completed. Emitted once per transport lifetime and increments
  the transport epoch.

Disconnected
  A connected transport became unusable (local close, remote close or
  failure).

RetryScheduled
  A reconnect timer was armed after an abnormal termination.

RetryExhausted
  The reconnect budget is spent. The connection is in terminal Error and
  only an explicit open() recovers it.

===============================================================================
*/


#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::transport::connection {


enum class Signal : std::uint8_t {
    None,
    Connected,
    Disconnected,
    RetryScheduled,
    RetryExhausted,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:           return "None";
        case Signal::Connected:      return "Connected";
        case Signal::Disconnected:   return "Disconnected";
        case Signal::RetryScheduled: return "RetryScheduled";
        case Signal::RetryExhausted: return "RetryExhausted";
        default:                     return "Unknown";
    }
}

} // namespace arbwire::core::transport::connection
