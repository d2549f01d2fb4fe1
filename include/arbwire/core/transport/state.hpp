#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
// The only externally visible lifecycle state. A pending reconnect timer is
// tracked separately by the Connection (see Connection::has_pending_retry()).
enum class ConnectionState : std::uint8_t {
    Connecting,
    Connected,
    Disconnected,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(ConnectionState s) noexcept {
    switch (s) {
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Error:        return "Error";
        default:                            return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportConnected,       // handshake completed
    TransportConnectFailed,   // handshake failed (open or reconnect)
    TransportClosedClean,     // normal close frame while connected
    TransportClosedAbnormal,  // socket dropped or non-normal close code
    TransportError,           // read / write failure while connected

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:           return "OpenRequested";
        case Event::CloseRequested:          return "CloseRequested";
        case Event::TransportConnected:      return "TransportConnected";
        case Event::TransportConnectFailed:  return "TransportConnectFailed";
        case Event::TransportClosedClean:    return "TransportClosedClean";
        case Event::TransportClosedAbnormal: return "TransportClosedAbnormal";
        case Event::TransportError:          return "TransportError";
        case Event::RetryTimerExpired:       return "RetryTimerExpired";
        default:                             return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,        // explicit close() by user
    RemoteClose,       // peer sent a normal close frame
    TransportError,    // handshake failure, socket error or abnormal close
    RetryExhausted     // reconnect budget spent
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "None";
        case DisconnectReason::LocalClose:     return "LocalClose";
        case DisconnectReason::RemoteClose:    return "RemoteClose";
        case DisconnectReason::TransportError: return "TransportError";
        case DisconnectReason::RetryExhausted: return "RetryExhausted";
        default:                               return "Unknown";
    }
}

} // namespace arbwire::core::transport
