#pragma once

#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include <string_view>

#include "arbwire/core/arbitrage/config.hpp"
#include "arbwire/core/protocol/schema/quote.hpp"
#include "arbwire/core/protocol/schema/opportunity.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core::arbitrage {

/*
===============================================================================
 arbitrage::Scanner
===============================================================================

Cross-exchange scanner over the live quote set of one or more pairs.

For a pair P:
  - best buy  = quote with the lowest ask
  - best sell = quote with the highest bid
  - ties resolve to the lexically smallest exchange name
  - quotes with a non-positive bid or ask are ignored
  - both sides must be on different exchanges; when one exchange holds both
    best sides, the wider of its two cross-venue pairings is taken

An opportunity exists when best_sell.bid > best_buy.ask and

  profit_percentage = (bid - ask) / ask * 100 > min_profit_percentage

Derived fields:
  net_profit  = profit_percentage - (fee_buy + fee_sell), a side without a
                recorded fee counts as half of default_fee_percentage
  confidence  = min(cap, max(0, 50 + 10 * profit_percentage + min_liquidity / 1e6))
  expires_at  = now + expiry
  id          = "arb_<pair>_<now_ms>_<sequence>"

The scanner is pure apart from its id sequence. It never reads stores and
never runs on its own; the Session feeds it the quotes of the pairs touched
since the last scan.
===============================================================================
*/
class Scanner {
public:
    explicit Scanner(Config cfg = {}) noexcept;

    // Scan a single pair. `quotes` may contain other pairs; they are skipped.
    [[nodiscard]]
    lcr::optional<protocol::schema::Opportunity> scan(std::string_view pair, const std::vector<protocol::schema::Quote>& quotes, std::int64_t now_ms);

    // Scan every pair and return the results ranked (see rank()).
    [[nodiscard]]
    std::vector<protocol::schema::Opportunity> scan_all(const std::set<std::string>& pairs, const std::vector<protocol::schema::Quote>& quotes, std::int64_t now_ms);

    // Profit percentage descending, then confidence descending, then id
    static void rank(std::vector<protocol::schema::Opportunity>& opportunities);

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return cfg_;
    }

    inline void set_config(const Config& cfg) noexcept {
        cfg_ = cfg;
    }

    [[nodiscard]]
    inline std::uint64_t sequence() const noexcept {
        return sequence_;
    }

private:
    Config cfg_;
    std::uint64_t sequence_{0};
};

[[nodiscard]]
inline bool is_expired(const protocol::schema::Opportunity& opp, std::int64_t now_ms) noexcept {
    return opp.is_expired(now_ms);
}

} // namespace arbwire::core::arbitrage
