#pragma once

/*
===============================================================================
 arbwire::core::transport::websocket::Event
===============================================================================

Control-plane event type emitted by a WebSocket transport implementation
and delivered to the owning Connection via a lock-free SPSC ring buffer.

The transport IO thread never calls back into the Connection. Close and
Error facts are pushed into the ring and drained by Connection::poll() on
the owner thread.

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

  - Close is emitted exactly once per transport instance.
  - Error (if any) precedes the Close it caused.
  - `clean` is true only when the peer completed the close handshake with
    a normal close code (1000). Everything else is an abnormal termination.

===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "arbwire/core/transport/error.hpp"

namespace arbwire::core::transport::websocket {

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------

struct Event {

    EventType type{EventType::Close};

    transport::Error error{transport::Error::None}; // valid only if type == EventType::Error

    bool clean{false};                                // valid only if type == EventType::Close

    // -------------------------------------------------------------------------
    // Factory: Close
    // -------------------------------------------------------------------------

    static constexpr Event make_close(bool clean) noexcept {
        Event ev;
        ev.type  = EventType::Close;
        ev.clean = clean;
        return ev;
    }

    // -------------------------------------------------------------------------
    // Factory: Error
    // -------------------------------------------------------------------------

    static constexpr Event make_error(transport::Error e) noexcept {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

// Ensure SPSC-safety properties
static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");
static_assert(sizeof(Event) <= 8, "websocket::Event should remain small");

} // namespace arbwire::core::transport::websocket
