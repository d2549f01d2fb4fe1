#pragma once

#include <cstdint>
#include <ostream>


namespace arbwire::core::protocol {

// Session-level counters exposed to consumers
struct Stats {
    std::uint64_t messages_received{0};     // frames accepted by the router (parsed envelope)
    std::int64_t last_message_time_ms{0};   // wall clock of the last accepted frame, 0 = never
    std::uint32_t reconnect_attempts{0};    // mirrors Connection::reconnect_attempts()

    inline void dump(std::ostream& os) const {
        os << "[STATS] { messages=" << messages_received
           << ", last_message_ms=" << last_message_time_ms
           << ", reconnect_attempts=" << reconnect_attempts << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Stats& s) {
    s.dump(os);
    return os;
}

} // namespace arbwire::core::protocol
