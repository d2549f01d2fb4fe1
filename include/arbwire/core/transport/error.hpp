#pragma once

#include <cstdint>
#include <string_view>

namespace arbwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Asio / Beast, OpenSSL).

Higher layers (transport::Connection, protocol::Session) use this
classification to decide whether and how to recover.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current connection state
    Cancelled,        // Operation aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout (resolve, connect, handshake)
    ConnectionFailed, // DNS resolution or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket upgrade failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or unexpected binary payload

    // --- Unspecified transport failure --------------------------------------
    TransportFailure, // Unclassified read / write failure

    // --- Backpressure -------------------------------------------------------
    Backpressure,     // Inbound frame ring full (poll() not called often enough)
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace arbwire::core
