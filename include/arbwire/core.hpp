#pragma once

/*
================================================================================
arbwire Core
================================================================================

Primary entry point of the arbwire client:

    arbwire::core::protocol::Session<WS>

a thin, explicit composition of a transport-level Connection, the message
router with its retention stores, the subscription registry, the command
dispatcher and the arbitrage scanner.

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

    [1] Transport thread (Boost.Beast IO thread, live transport only)
          - receives complete text frames
          - pushes them into a bounded SPSC frame ring
          - pushes Close / Error facts into an SPSC event ring
          - NEVER touches protocol state, NEVER calls user code

    [2] Application thread (user-owned)
          - calls Session::poll()
          - drives reconnects, classification, store updates and scans
          - owns every protocol-level side effect

The simulated feed runs entirely on the application thread.

If progress occurs, it is because poll() was called.

-------------------------------------------------------------------------------
Provided aliases
-------------------------------------------------------------------------------

    transport::LiveConnectionT   Connection over Boost.Beast
    protocol::LiveSessionT       Session over Boost.Beast
    protocol::SimulatedSessionT  Session over the in-process simulated feed

================================================================================
*/

#include "arbwire/core/transport/websocket_concept.hpp"
#include "arbwire/core/transport/beast/websocket.hpp"
#include "arbwire/core/transport/connection.hpp"
#include "arbwire/core/feed/simulated_websocket.hpp"
#include "arbwire/core/protocol/session.hpp"
#include "arbwire/core/protocol/schema/intent/execute_arbitrage.hpp"
#include "arbwire/core/protocol/schema/intent/execute_trade.hpp"
#include "arbwire/core/protocol/schema/intent/cancel_execution.hpp"
#include "arbwire/core/protocol/schema/intent/toggle_auto_trading.hpp"
#include "arbwire/core/protocol/schema/intent/wallet.hpp"


namespace arbwire::core {

namespace transport {

    // Assert that the live transport conforms to transport::WebSocketConcept
    static_assert(WebSocketConcept<beast::WebSocket>);

    using LiveConnectionT = Connection<beast::WebSocket>;

} // namespace transport

namespace protocol {

    using LiveSessionT      = Session<transport::beast::WebSocket>;
    using SimulatedSessionT = Session<feed::SimulatedWebSocket>;

} // namespace protocol

} // namespace arbwire::core
