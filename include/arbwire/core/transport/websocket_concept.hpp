/*
===============================================================================
 WebSocketConcept (Pull-Based)
===============================================================================

Defines the minimal transport contract required by transport::Connection.

The WebSocket implementation:

  - Owns its receive thread (if any)
  - Queues complete text messages into an internal SPSC ring
  - Pushes control-plane events (Close / Error) into an SPSC ring
  - Is fully lifecycle-managed by Connection (one instance per attempt)

No callbacks. No dynamic dispatch.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------

Producer thread:
  - WebSocket receive thread
  - Pushes messages and events

Consumer thread:
  - Connection::poll() caller thread
  - Drains poll_event() and poll_message()

Single-producer / single-consumer only.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "arbwire/core/transport/error.hpp"
#include "arbwire/core/transport/parse_url.hpp"
#include "arbwire/core/transport/websocket/events.hpp"
#include "arbwire/core/transport/telemetry/websocket.hpp"


namespace arbwire::core::transport {

template<class WS>
concept WebSocketConcept =
    requires { typename WS::Options; } &&
    std::constructible_from<WS, telemetry::WebSocket&, const typename WS::Options&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        std::string_view msg,
        std::string& out,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Data-plane polling
    // ---------------------------------------------------------------------

    { ws.poll_message(out) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Control-plane polling
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace arbwire::core::transport
