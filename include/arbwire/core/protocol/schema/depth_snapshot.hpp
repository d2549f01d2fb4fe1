#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 DepthSnapshot
===============================================================================

Order book depth of one pair ("market_depth"). Levels may be objects
({"price":p,"size":q,"total":t}) or [price, quantity] pairs.
No identity: every snapshot is a new retained entry.
===============================================================================
*/

struct DepthSnapshot {
    struct Level {
        double price{0.0};
        double quantity{0.0};
    };

    std::string pair;
    std::string exchange;               // empty when the feed aggregates venues
    std::vector<Level> bids;
    std::vector<Level> asks;
    std::int64_t timestamp_ms{0};

    inline void dump(std::ostream& os) const {
        os << "[DEPTH] { "
           << "pair=" << pair << ", "
           << "exchange=" << (exchange.empty() ? "-" : exchange) << ", "
           << "bids=" << bids.size() << ", "
           << "asks=" << asks.size() << ", "
           << "ts=" << timestamp_ms
           << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const DepthSnapshot& d) {
    d.dump(os);
    return os;
}

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
