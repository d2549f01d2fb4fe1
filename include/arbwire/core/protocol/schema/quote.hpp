#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <string_view>

#include "lcr/optional.hpp"
#include "lcr/format.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 Quote
===============================================================================

Top of book of one pair on one exchange, as carried by "price_update".

Single form:
{
  "pair": "SOL/USDT", "exchange": "Binance", "price": 171.12,
  "bid": 171.03, "ask": 171.21, "volume_24h": 75000000,
  "liquidity": 150000000, "fee": 0.1, "change_24h": 2.4, "timestamp": 1700000000000
}

bid / ask fall back to price when the feed only publishes a last price.
Identity key = (pair, exchange).
===============================================================================
*/

struct Quote {
    std::string pair;
    std::string exchange;
    double price{0.0};
    double bid{0.0};
    double ask{0.0};
    double volume_24h{0.0};
    double liquidity{0.0};
    double change_24h{0.0};
    lcr::optional<double> fee{};        // percent, per side
    std::int64_t timestamp_ms{0};

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[QUOTE] { "
           << "pair=" << pair << ", "
           << "exchange=" << exchange << ", "
           << "bid=" << lcr::format_price(bid) << ", "
           << "ask=" << lcr::format_price(ask) << ", "
           << "liquidity=" << liquidity << ", "
           << "fee=" << lcr::to_string(fee) << ", "
           << "ts=" << timestamp_ms
           << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Quote& q) {
    q.dump(os);
    return os;
}

// Identity of a quote in the retention store
struct QuoteKey {
    [[nodiscard]]
    inline std::pair<std::string_view, std::string_view> operator()(const Quote& q) const noexcept {
        return {q.pair, q.exchange};
    }
};

// A stored quote is replaced only by one that is not older
struct NewerQuote {
    [[nodiscard]]
    inline bool operator()(const Quote& existing, const Quote& incoming) const noexcept {
        return incoming.timestamp_ms >= existing.timestamp_ms;
    }
};

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
