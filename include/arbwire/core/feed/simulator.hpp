#pragma once

#include <map>
#include <set>
#include <array>
#include <chrono>
#include <random>
#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <string_view>

#include <simdjson.h>

#include "lcr/optional.hpp"


namespace arbwire::core::feed {

enum class VenueKind : std::uint8_t {
    Cex,
    Dex
};

// Static description of one simulated exchange
struct ExchangeProfile {
    std::string_view name;
    VenueKind kind;
    double price_adjustment;    // multiplier applied to the pair base price
    double spread;              // half spread (fraction): bid = p * (1 - s), ask = p * (1 + s)
    double volume_min;
    double volume_range;
    double liquidity_min;
    double liquidity_range;
};

struct PairProfile {
    std::string_view pair;
    double base_price;
};

// Every exchange the simulator quotes on
[[nodiscard]] const std::array<ExchangeProfile, 17>& exchanges() noexcept;

// Every pair the simulator knows a base price for
[[nodiscard]] const std::array<PairProfile, 12>& pairs() noexcept;

[[nodiscard]] lcr::optional<double> base_price(std::string_view pair) noexcept;


struct SimulatorOptions {
    // Quoted pairs. Five pairs on 17 exchanges stay within the quote store.
    std::vector<std::string> pairs{"SOL/USDT", "ETH/USDT", "BTC/USDT", "BNB/USDT", "XRP/USDT"};
    std::chrono::milliseconds interval{2000};
    std::uint32_t seed{42};
    double jitter{0.002};               // peak-to-peak relative price noise
    double mev_probability{0.1};        // per tick
    bool emit_opportunities{true};
    bool emit_depth{true};
    std::size_t depth_levels{3};

    inline void dump(std::ostream& os) const {
        os << "[SIMULATOR] { pairs=" << pairs.size()
           << ", interval=" << interval.count() << "ms"
           << ", seed=" << seed
           << ", jitter=" << jitter
           << ", mev_p=" << mev_probability
           << ", opportunities=" << (emit_opportunities ? "on" : "off")
           << ", depth=" << (emit_depth ? "on" : "off") << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const SimulatorOptions& o) {
    o.dump(os);
    return os;
}

/*
===============================================================================
 feed::Simulator
===============================================================================

Synthetic arbitrage feed server. Produces the same envelopes as the live
feed:

  - price_update      : one batch per tick, every configured pair on every
                        exchange ({"prices": {pair: [quote, ...]}})
  - opportunity_update: best cross-exchange spread per pair above 0.1 %
  - mev_alert         : with probability mev_probability per tick
  - market_depth      : one snapshot per tick around the first pair's mid

Emission honours the channels the client subscribed to ("prices",
"opportunities", "mev", "depth"). Replies to execute_arbitrage and
execute_trade with a completed execution_update.

Deterministic for a given seed and timestamp sequence.
===============================================================================
*/
class Simulator {
public:
    explicit Simulator(SimulatorOptions options = {});

    // Frames of one emission tick
    [[nodiscard]]
    std::vector<std::string> tick(std::int64_t now_ms);

    // Handle a frame sent by the client. Returns the reply frame, if any.
    [[nodiscard]]
    lcr::optional<std::string> handle(std::string_view frame, std::int64_t now_ms);

    [[nodiscard]]
    inline const SimulatorOptions& options() const noexcept {
        return options_;
    }

    [[nodiscard]]
    inline bool subscribed(const std::string& channel) const {
        return channels_.find(channel) != channels_.end();
    }

    [[nodiscard]]
    inline std::uint64_t ticks() const noexcept {
        return ticks_;
    }

private:
    struct Level {
        std::string exchange;
        double price;
        double bid;
        double ask;
        double volume_24h;
        double liquidity;
    };

    SimulatorOptions options_;
    std::mt19937 rng_;
    simdjson::dom::parser parser_;

    // channel -> pair filter (absent = every pair)
    std::map<std::string, lcr::optional<std::set<std::string>>> channels_;

    std::uint64_t ticks_{0};
    std::uint64_t sequence_{0};

private:
    [[nodiscard]] double uniform_(double lo, double hi);
    [[nodiscard]] std::string hex_(std::size_t digits);
    [[nodiscard]] bool wants_(const std::string& channel, const std::string& pair) const;

    [[nodiscard]] std::vector<Level> quote_pair_(double base);

    void write_price_update_(std::string& out, const std::map<std::string, std::vector<Level>>& book, std::int64_t now_ms) const;
    [[nodiscard]] lcr::optional<std::string> make_opportunity_(const std::string& pair, const std::vector<Level>& levels, std::int64_t now_ms);
    [[nodiscard]] std::string make_mev_alert_(std::int64_t now_ms);
    [[nodiscard]] std::string make_depth_(const std::string& pair, const std::vector<Level>& levels, std::int64_t now_ms);

    void apply_subscription_(const simdjson::dom::element& root, bool subscribe);
    [[nodiscard]] std::string make_execution_update_(std::string_view opportunity_id, std::int64_t now_ms);
};

} // namespace arbwire::core::feed
