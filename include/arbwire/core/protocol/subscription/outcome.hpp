#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::protocol::subscription {

// Result of a subscribe / unsubscribe request issued through the Session
enum class Outcome : std::uint8_t {
    Unchanged,      // registry already covered the request, nothing sent
    Pending,        // registry updated, flushed on the next handshake
    Sent,           // registry updated and the command was sent
    SendFailed      // registry updated, transport rejected the frame
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Unchanged:  return "Unchanged";
        case Outcome::Pending:    return "Pending";
        case Outcome::Sent:       return "Sent";
        case Outcome::SendFailed: return "SendFailed";
        default:                  return "unknown";
    }
}

} // namespace arbwire::core::protocol::subscription
