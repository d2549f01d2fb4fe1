#include "arbwire/core/arbitrage/scanner.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "arbwire/core/config/scanner.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/format.hpp"


namespace arbwire::core::arbitrage {

namespace schema = protocol::schema;

namespace {

// Lower ask wins, equal asks go to the smaller exchange name
[[nodiscard]]
inline bool better_buy(const schema::Quote& candidate, const schema::Quote& current) noexcept {
    if (candidate.ask != current.ask) {
        return candidate.ask < current.ask;
    }
    return candidate.exchange < current.exchange;
}

// Higher bid wins, equal bids go to the smaller exchange name
[[nodiscard]]
inline bool better_sell(const schema::Quote& candidate, const schema::Quote& current) noexcept {
    if (candidate.bid != current.bid) {
        return candidate.bid > current.bid;
    }
    return candidate.exchange < current.exchange;
}

[[nodiscard]]
inline protocol::RiskLevel risk_for(double profit_percentage) noexcept {
    if (profit_percentage > config::RISK_LOW_PROFIT_ABOVE) {
        return protocol::RiskLevel::Low;
    }
    if (profit_percentage > config::RISK_MEDIUM_PROFIT_ABOVE) {
        return protocol::RiskLevel::Medium;
    }
    return protocol::RiskLevel::High;
}

} // namespace

// ---------------------------------
// Scanner
// ---------------------------------

Scanner::Scanner(Config cfg) noexcept
    : cfg_(cfg)
{
}

lcr::optional<schema::Opportunity> Scanner::scan(std::string_view pair, const std::vector<schema::Quote>& quotes, std::int64_t now_ms) {
    const schema::Quote* buy = nullptr;
    const schema::Quote* sell = nullptr;

    for (const auto& q : quotes) {
        if (q.pair != pair || q.bid <= 0.0 || q.ask <= 0.0) {
            continue;
        }
        if (buy == nullptr || better_buy(q, *buy)) {
            buy = &q;
        }
        if (sell == nullptr || better_sell(q, *sell)) {
            sell = &q;
        }
    }

    if (buy == nullptr || sell == nullptr) {
        return {};
    }
    if (buy->exchange == sell->exchange) {
        // Pair the shared venue with the best opposite side elsewhere
        const schema::Quote* alt_buy = nullptr;
        const schema::Quote* alt_sell = nullptr;
        for (const auto& q : quotes) {
            if (q.pair != pair || q.bid <= 0.0 || q.ask <= 0.0 || q.exchange == buy->exchange) {
                continue;
            }
            if (alt_buy == nullptr || better_buy(q, *alt_buy)) {
                alt_buy = &q;
            }
            if (alt_sell == nullptr || better_sell(q, *alt_sell)) {
                alt_sell = &q;
            }
        }
        if (alt_buy == nullptr || alt_sell == nullptr) {
            AW_TRACE("[SCANNER] " << pair << ": single exchange quoted (" << buy->exchange << ")");
            return {};
        }
        const double keep_sell = (sell->bid - alt_buy->ask) / alt_buy->ask;
        const double keep_buy = (alt_sell->bid - buy->ask) / buy->ask;
        if (keep_sell >= keep_buy) {
            buy = alt_buy;
        }
        else {
            sell = alt_sell;
        }
    }
    if (sell->bid <= buy->ask) {
        return {};
    }

    const double spread = sell->bid - buy->ask;
    const double profit_percentage = spread / buy->ask * 100.0;
    if (profit_percentage <= cfg_.min_profit_percentage) {
        return {};
    }

    const double half_default_fee = cfg_.default_fee_percentage / 2.0;
    const double total_fee = buy->fee.value_or(half_default_fee) + sell->fee.value_or(half_default_fee);
    const double min_liquidity = std::min(buy->liquidity, sell->liquidity);
    const double raw_confidence = config::CONFIDENCE_BASE
                                + config::CONFIDENCE_PER_PROFIT * profit_percentage
                                + min_liquidity / config::CONFIDENCE_LIQUIDITY_UNIT;

    schema::Opportunity opp;
    opp.id = "arb_" + std::string(pair) + "_" + std::to_string(now_ms) + "_" + std::to_string(++sequence_);
    opp.pair.assign(pair);
    opp.buy = schema::Opportunity::Side{buy->exchange, buy->ask, buy->liquidity, buy->fee};
    opp.sell = schema::Opportunity::Side{sell->exchange, sell->bid, sell->liquidity, sell->fee};
    opp.profit_percentage = profit_percentage;
    opp.net_profit = profit_percentage - total_fee;
    opp.required_capital = cfg_.required_capital;
    opp.estimated_profit = cfg_.required_capital * profit_percentage / 100.0;
    opp.confidence = std::min(cfg_.confidence_cap, std::max(0.0, raw_confidence));
    opp.risk_level = risk_for(profit_percentage);
    opp.timestamp_ms = now_ms;
    opp.expires_at_ms = now_ms + cfg_.expiry.count();
    opp.execution_path = {
        "Buy on " + buy->exchange,
        "Transfer",
        "Sell on " + sell->exchange
    };

    AW_DEBUG("[SCANNER] " << pair << ": buy " << buy->exchange << "@" << lcr::format_price(buy->ask)
             << " sell " << sell->exchange << "@" << lcr::format_price(sell->bid)
             << " -> " << lcr::format_percent(profit_percentage));
    return opp;
}

std::vector<schema::Opportunity> Scanner::scan_all(const std::set<std::string>& pairs, const std::vector<schema::Quote>& quotes, std::int64_t now_ms) {
    std::vector<schema::Opportunity> out;
    for (const auto& pair : pairs) {
        auto opp = scan(pair, quotes, now_ms);
        if (opp.has()) {
            out.push_back(std::move(opp.value()));
        }
    }
    rank(out);
    return out;
}

void Scanner::rank(std::vector<schema::Opportunity>& opportunities) {
    std::sort(opportunities.begin(), opportunities.end(), [](const schema::Opportunity& a, const schema::Opportunity& b) {
        if (a.profit_percentage != b.profit_percentage) {
            return a.profit_percentage > b.profit_percentage;
        }
        if (a.confidence != b.confidence) {
            return a.confidence > b.confidence;
        }
        return a.id < b.id;
    });
}

} // namespace arbwire::core::arbitrage
