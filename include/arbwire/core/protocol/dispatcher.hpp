#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/request/subscription.hpp"
#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol {

namespace dispatch {

enum class Result : std::uint8_t {
    Sent,               // frame handed to the transport
    NotConnected,       // connection is not in Connected state, nothing queued
    TransportRejected   // transport refused the frame
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Sent:              return "Sent";
        case Result::NotConnected:      return "NotConnected";
        case Result::TransportRejected: return "TransportRejected";
        default:                        return "unknown";
    }
}

} // namespace dispatch

/*
===============================================================================
 protocol::Dispatcher
===============================================================================

Serializes outbound commands (subscription requests and execution intents)
and writes them to the connection.

- Gated on the current connection state: while not Connected every command
  is rejected immediately with dispatch::Result::NotConnected. Nothing is
  buffered; subscription intent survives in the Registry and is replayed on
  the next handshake.
- Stateless apart from the connection reference.
===============================================================================
*/
template <class ConnectionT>
class Dispatcher {
public:
    explicit Dispatcher(ConnectionT& connection) noexcept
        : connection_(connection)
    {}

    [[nodiscard]]
    inline dispatch::Result send_subscription(const schema::request::Subscription& req) {
        if (!connection_.is_connected()) {
            AW_WARN("[DISPATCH] Cannot send '" << schema::request::to_string(req.action) << "' while not connected.");
            return dispatch::Result::NotConnected;
        }
        return send_raw_(schema::request::to_string(req.action), req.to_json());
    }

    template <schema::intent::Intent IntentT>
    [[nodiscard]]
    inline dispatch::Result send_intent(const IntentT& intent) {
        if (!connection_.is_connected()) {
            AW_WARN("[DISPATCH] Cannot send intent '" << IntentT::name << "' while not connected.");
            return dispatch::Result::NotConnected;
        }
        return send_raw_(IntentT::name, intent.to_json());
    }

private:
    ConnectionT& connection_;

    [[nodiscard]]
    inline dispatch::Result send_raw_(std::string_view what, const std::string& json) {
        AW_DEBUG("[DISPATCH] Sending '" << what << "': " << json);
        if (!connection_.send(json)) {
            AW_WARN("[DISPATCH] Transport rejected '" << what << "'.");
            return dispatch::Result::TransportRejected;
        }
        return dispatch::Result::Sent;
    }
};

} // namespace arbwire::core::protocol
