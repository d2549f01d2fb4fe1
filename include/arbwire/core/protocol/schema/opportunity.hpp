#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>

#include "arbwire/core/protocol/enums/risk_level.hpp"
#include "lcr/optional.hpp"
#include "lcr/format.hpp"
#include "lcr/json.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 Opportunity
===============================================================================

A cross-exchange arbitrage record: buy `pair` on buy.exchange at its ask,
sell on sell.exchange at its bid.

Produced locally by arbitrage::Scanner, or received from the feed as
"opportunity_update":
{
  "id": "arb_SOL/USDT_1700000000000_1", "pair": "SOL/USDT",
  "profit_percentage": 0.42, "estimated_profit": 42.0,
  "exchanges": ["Binance", "Orca"], "risk_level": "low",
  "timestamp": 1700000000000
}
Identity key = id.
===============================================================================
*/

struct Opportunity {
    struct Side {
        std::string exchange;
        double price{0.0};
        double liquidity{0.0};
        lcr::optional<double> fee{};    // percent
    };

    std::string id;
    std::string pair;
    Side buy;
    Side sell;
    double profit_percentage{0.0};      // (sell.price - buy.price) / buy.price * 100
    double net_profit{0.0};             // profit_percentage minus fees (percent)
    double estimated_profit{0.0};       // quote currency on required_capital
    double required_capital{0.0};
    double confidence{0.0};             // 0..100
    RiskLevel risk_level{RiskLevel::Unknown};
    std::int64_t timestamp_ms{0};
    std::int64_t expires_at_ms{0};
    std::vector<std::string> execution_path;

    [[nodiscard]]
    inline bool is_expired(std::int64_t now_ms) const noexcept {
        return now_ms >= expires_at_ms;
    }

    // ------------------------------------------------------------
    // JSON (used by the execute_trade intent)
    // ------------------------------------------------------------
    inline void write_json(std::string& out) const {
        using namespace lcr::json;
        out.push_back('{');
        append_key(out, "id");                append_string(out, id);                 out.push_back(',');
        append_key(out, "pair");              append_string(out, pair);               out.push_back(',');
        append_key(out, "buy_exchange");      append_string(out, buy.exchange);       out.push_back(',');
        append_key(out, "sell_exchange");     append_string(out, sell.exchange);      out.push_back(',');
        append_key(out, "buy_price");         append(out, buy.price);                 out.push_back(',');
        append_key(out, "sell_price");        append(out, sell.price);                out.push_back(',');
        append_key(out, "profit_percentage"); append(out, profit_percentage);         out.push_back(',');
        append_key(out, "net_profit");        append(out, net_profit);                out.push_back(',');
        append_key(out, "estimated_profit");  append(out, estimated_profit);          out.push_back(',');
        append_key(out, "required_capital");  append(out, required_capital);          out.push_back(',');
        append_key(out, "confidence");        append(out, confidence);                out.push_back(',');
        append_key(out, "risk_level");        append_string(out, to_string(risk_level)); out.push_back(',');
        append_key(out, "timestamp");         append(out, static_cast<std::int64_t>(timestamp_ms)); out.push_back(',');
        append_key(out, "expires_at");        append(out, static_cast<std::int64_t>(expires_at_ms)); out.push_back(',');
        append_key(out, "execution_path");
        out.push_back('[');
        for (std::size_t i = 0; i < execution_path.size(); ++i) {
            if (i > 0) out.push_back(',');
            append_string(out, execution_path[i]);
        }
        out += "]}";
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(512);
        write_json(out);
        return out;
    }

    // ------------------------------------------------------------
    // Debug / diagnostic dump
    // ------------------------------------------------------------
    inline void dump(std::ostream& os) const {
        os << "[OPPORTUNITY] { "
           << "id=" << id << ", "
           << "pair=" << pair << ", "
           << "buy=" << buy.exchange << "@" << lcr::format_price(buy.price) << ", "
           << "sell=" << sell.exchange << "@" << lcr::format_price(sell.price) << ", "
           << "profit=" << lcr::format_percent(profit_percentage) << ", "
           << "net=" << lcr::format_percent(net_profit) << ", "
           << "confidence=" << confidence << ", "
           << "expires_at=" << expires_at_ms
           << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Opportunity& o) {
    o.dump(os);
    return os;
}

struct OpportunityKey {
    [[nodiscard]]
    inline const std::string& operator()(const Opportunity& o) const noexcept {
        return o.id;
    }
};

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
