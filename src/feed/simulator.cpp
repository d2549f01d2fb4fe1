#include "arbwire/core/feed/simulator.hpp"

#include <cmath>
#include <algorithm>
#include <utility>

#include "arbwire/core/config/scanner.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::feed {

namespace {

constexpr std::array<ExchangeProfile, 17> EXCHANGES = {{
    // name            kind             adj     spread   vol_min  vol_rng  liq_min   liq_rng
    {"Binance",       VenueKind::Cex, 1.0000, 0.0005, 50e6, 50e6, 100e6, 100e6},
    {"Coinbase",      VenueKind::Cex, 1.0002, 0.0005, 30e6, 30e6,  80e6,  50e6},
    {"Kraken",        VenueKind::Cex, 0.9998, 0.0010, 30e6, 30e6,  80e6,  50e6},
    {"OKX",           VenueKind::Cex, 1.0001, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"Bybit",         VenueKind::Cex, 0.9999, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"Gate.io",       VenueKind::Cex, 1.0003, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"KuCoin",        VenueKind::Cex, 1.0001, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"Bitfinex",      VenueKind::Cex, 1.0002, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"Gemini",        VenueKind::Cex, 1.0004, 0.0010, 10e6, 20e6,  30e6,  30e6},
    {"Jupiter",       VenueKind::Dex, 1.0005, 0.0030,  5e6, 15e6,  20e6,  30e6},
    {"Raydium",       VenueKind::Dex, 1.0003, 0.0030,  5e6, 15e6,  20e6,  30e6},
    {"Orca",          VenueKind::Dex, 1.0006, 0.0030,  5e6, 15e6,  20e6,  30e6},
    {"Uniswap V3",    VenueKind::Dex, 1.0008, 0.0030, 20e6, 30e6,  50e6,  50e6},
    {"SushiSwap",     VenueKind::Dex, 1.0007, 0.0030,  5e6, 15e6,  20e6,  30e6},
    {"PancakeSwap",   VenueKind::Dex, 1.0004, 0.0030, 20e6, 30e6,  50e6,  50e6},
    {"Curve",         VenueKind::Dex, 0.9997, 0.0003,  5e6, 15e6,  20e6,  30e6},
    {"Balancer",      VenueKind::Dex, 1.0005, 0.0030,  5e6, 15e6,  20e6,  30e6},
}};

constexpr std::array<PairProfile, 12> PAIRS = {{
    {"SOL/USDT",   171.12},
    {"ETH/USDT",  3400.00},
    {"BTC/USDT", 95000.00},
    {"BNB/USDT",   580.50},
    {"XRP/USDT",     0.52},
    {"ADA/USDT",     0.98},
    {"AVAX/USDT",   38.75},
    {"DOT/USDT",     7.82},
    {"MATIC/USDT",   0.89},
    {"LINK/USDT",   14.25},
    {"UNI/USDT",    11.45},
    {"ATOM/USDT",   10.15},
}};

constexpr std::array<std::string_view, 3> THREAT_TYPES = {"Frontrunning", "Sandwiching", "JIT Arbitrage"};
constexpr std::array<std::string_view, 3> THREAT_RISKS = {"High", "Medium", "Low"};
constexpr std::array<std::string_view, 5> THREAT_TOKENS = {"SOL", "ETH", "USDC", "RAY", "ORCA"};

// Server-side opportunities report this fee per side (percent)
constexpr double SIMULATED_FEE_PERCENTAGE = 0.1;

[[nodiscard]]
inline double round4(double v) noexcept {
    return std::round(v * 10000.0) / 10000.0;
}

[[nodiscard]]
inline std::string_view risk_for(double profit_percentage) noexcept {
    if (profit_percentage > config::RISK_LOW_PROFIT_ABOVE) {
        return "low";
    }
    if (profit_percentage > config::RISK_MEDIUM_PROFIT_ABOVE) {
        return "medium";
    }
    return "high";
}

inline void begin_envelope(std::string& out, std::string_view kind) {
    out += "{\"message_type\":";
    lcr::json::append_string(out, kind);
    out += ",\"data\":";
}

inline void end_envelope(std::string& out, std::int64_t now_ms) {
    out += ",\"timestamp\":";
    lcr::json::append(out, now_ms);
    out.push_back('}');
}

} // namespace

const std::array<ExchangeProfile, 17>& exchanges() noexcept {
    return EXCHANGES;
}

const std::array<PairProfile, 12>& pairs() noexcept {
    return PAIRS;
}

lcr::optional<double> base_price(std::string_view pair) noexcept {
    for (const auto& p : PAIRS) {
        if (p.pair == pair) {
            return p.base_price;
        }
    }
    return {};
}

// ---------------------------------
// Simulator
// ---------------------------------

Simulator::Simulator(SimulatorOptions options)
    : options_(std::move(options))
    , rng_(options_.seed)
{
}

std::vector<std::string> Simulator::tick(std::int64_t now_ms) {
    ++ticks_;
    std::vector<std::string> frames;

    // Quote every configured pair, even when prices are not subscribed:
    // opportunities and depth derive from the same book.
    std::map<std::string, std::vector<Level>> book;
    for (const auto& pair : options_.pairs) {
        auto base = base_price(pair);
        if (!base.has()) {
            AW_WARN("[SIM] No base price for pair '" << pair << "' -> skipped.");
            continue;
        }
        book.emplace(pair, quote_pair_(base.value()));
    }

    std::map<std::string, std::vector<Level>> published;
    for (const auto& [pair, levels] : book) {
        if (wants_("prices", pair)) {
            published.emplace(pair, levels);
        }
    }
    if (!published.empty()) {
        std::string out;
        out.reserve(256 * published.size() * EXCHANGES.size() / 4);
        write_price_update_(out, published, now_ms);
        frames.push_back(std::move(out));
    }

    if (options_.emit_opportunities) {
        for (const auto& [pair, levels] : book) {
            if (!wants_("opportunities", pair)) {
                continue;
            }
            auto frame = make_opportunity_(pair, levels, now_ms);
            if (frame.has()) {
                frames.push_back(std::move(frame.value()));
            }
        }
    }

    if (subscribed("mev") && uniform_(0.0, 1.0) < options_.mev_probability) {
        frames.push_back(make_mev_alert_(now_ms));
    }

    if (options_.emit_depth) {
        for (const auto& [pair, levels] : book) {
            if (wants_("depth", pair)) {
                frames.push_back(make_depth_(pair, levels, now_ms));
                break;
            }
        }
    }

    AW_TRACE("[SIM] Tick " << ticks_ << ": " << frames.size() << " frame(s)");
    return frames;
}

lcr::optional<std::string> Simulator::handle(std::string_view frame, std::int64_t now_ms) {
    simdjson::dom::element root;
    if (parser_.parse(frame.data(), frame.size()).get(root)) {
        AW_WARN("[SIM] Client sent invalid JSON: " << frame);
        return {};
    }

    std::string_view action;
    if (!root["action"].get(action)) {
        if (action == "subscribe" || action == "unsubscribe") {
            apply_subscription_(root, action == "subscribe");
        }
        else {
            AW_WARN("[SIM] Unknown action '" << action << "' -> ignored.");
        }
        return {};
    }

    std::string_view type;
    if (root["type"].get(type)) {
        AW_WARN("[SIM] Client frame without 'action' or 'type': " << frame);
        return {};
    }

    if (type == "execute_arbitrage" || type == "execute_trade") {
        std::string_view id;
        bool found = !root["data"]["opportunityId"].get(id);
        if (!found) {
            found = !root["opportunity"]["id"].get(id);
        }
        std::string fallback;
        if (!found || id.empty()) {
            fallback = "trade_" + std::to_string(now_ms);
            id = fallback;
        }
        AW_INFO("[SIM] Simulating execution of '" << id << "'");
        return make_execution_update_(id, now_ms);
    }

    AW_DEBUG("[SIM] Intent '" << type << "' acknowledged without reply.");
    return {};
}

double Simulator::uniform_(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

std::string Simulator::hex_(std::size_t digits) {
    static constexpr char hex[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(digits);
    for (std::size_t i = 0; i < digits; ++i) {
        out.push_back(hex[dist(rng_)]);
    }
    return out;
}

bool Simulator::wants_(const std::string& channel, const std::string& pair) const {
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
        return false;
    }
    const auto& filter = it->second;
    return !filter.has() || filter.value().count(pair) > 0;
}

std::vector<Simulator::Level> Simulator::quote_pair_(double base) {
    std::vector<Level> levels;
    levels.reserve(EXCHANGES.size());
    for (const auto& ex : EXCHANGES) {
        const double variation = (uniform_(0.0, 1.0) - 0.5) * options_.jitter;
        const double price = base * ex.price_adjustment * (1.0 + variation);
        Level l;
        l.exchange.assign(ex.name);
        l.price = round4(price);
        l.bid = round4(price * (1.0 - ex.spread));
        l.ask = round4(price * (1.0 + ex.spread));
        l.volume_24h = std::floor(ex.volume_min + uniform_(0.0, 1.0) * ex.volume_range);
        l.liquidity = std::floor(ex.liquidity_min + uniform_(0.0, 1.0) * ex.liquidity_range);
        levels.push_back(std::move(l));
    }
    return levels;
}

void Simulator::write_price_update_(std::string& out, const std::map<std::string, std::vector<Level>>& book, std::int64_t now_ms) const {
    using namespace lcr::json;
    begin_envelope(out, "price_update");
    out += "{\"prices\":{";
    bool first_pair = true;
    for (const auto& [pair, levels] : book) {
        if (!first_pair) out.push_back(',');
        first_pair = false;
        append_string(out, pair);
        out += ":[";
        for (std::size_t i = 0; i < levels.size(); ++i) {
            const auto& l = levels[i];
            if (i > 0) out.push_back(',');
            out.push_back('{');
            append_key(out, "exchange");  append_string(out, l.exchange); out.push_back(',');
            append_key(out, "price");     append(out, l.price);           out.push_back(',');
            append_key(out, "bid");       append(out, l.bid);             out.push_back(',');
            append_key(out, "ask");       append(out, l.ask);             out.push_back(',');
            append_key(out, "volume24h"); append(out, l.volume_24h);      out.push_back(',');
            append_key(out, "liquidity"); append(out, l.liquidity);
            out.push_back('}');
        }
        out.push_back(']');
    }
    out += "}}";
    end_envelope(out, now_ms);
}

lcr::optional<std::string> Simulator::make_opportunity_(const std::string& pair, const std::vector<Level>& levels, std::int64_t now_ms) {
    const Level* buy = nullptr;
    const Level* sell = nullptr;
    for (const auto& l : levels) {
        if (buy == nullptr || l.ask < buy->ask) buy = &l;
        if (sell == nullptr || l.bid > sell->bid) sell = &l;
    }
    if (buy == nullptr || sell == nullptr || buy == sell) {
        return {};
    }
    const double profit = (sell->bid - buy->ask) / buy->ask * 100.0;
    if (profit <= config::MIN_PROFIT_PERCENTAGE) {
        return {};
    }

    using namespace lcr::json;
    const double capital = config::REQUIRED_CAPITAL;
    std::string out;
    out.reserve(512);
    begin_envelope(out, "opportunity_update");
    out.push_back('{');
    append_key(out, "id");                append_string(out, "arb_" + std::to_string(now_ms) + "_" + hex_(9)); out.push_back(',');
    append_key(out, "pair");              append_string(out, pair);                         out.push_back(',');
    append_key(out, "exchanges");
    out.push_back('[');
    append_string(out, buy->exchange);
    out.push_back(',');
    append_string(out, sell->exchange);
    out += "],";
    append_key(out, "buy_price");         append(out, buy->ask);                            out.push_back(',');
    append_key(out, "sell_price");        append(out, sell->bid);                           out.push_back(',');
    append_key(out, "profit_percentage"); append(out, profit);                              out.push_back(',');
    append_key(out, "net_profit");        append(out, profit - 2.0 * SIMULATED_FEE_PERCENTAGE); out.push_back(',');
    append_key(out, "required_capital");  append(out, capital);                             out.push_back(',');
    append_key(out, "estimated_profit");  append(out, capital * profit / 100.0);            out.push_back(',');
    append_key(out, "confidence");        append(out, 70.0 + uniform_(0.0, 30.0));          out.push_back(',');
    append_key(out, "risk_level");        append_string(out, risk_for(profit));             out.push_back(',');
    append_key(out, "expires_at");        append(out, now_ms + config::OPPORTUNITY_TTL.count()); out.push_back(',');
    append_key(out, "execution_path");
    out.push_back('[');
    append_string(out, "Buy on " + buy->exchange);
    out.push_back(',');
    append_string(out, "Transfer");
    out.push_back(',');
    append_string(out, "Sell on " + sell->exchange);
    out += "]}";
    end_envelope(out, now_ms);
    return out;
}

std::string Simulator::make_mev_alert_(std::int64_t now_ms) {
    using namespace lcr::json;
    std::uniform_int_distribution<std::size_t> threat_dist(0, THREAT_TYPES.size() - 1);
    std::uniform_int_distribution<std::size_t> risk_dist(0, THREAT_RISKS.size() - 1);
    std::uniform_int_distribution<std::size_t> token_dist(0, THREAT_TOKENS.size() - 1);

    const std::string_view threat = THREAT_TYPES[threat_dist(rng_)];
    const std::string_view risk = THREAT_RISKS[risk_dist(rng_)];
    const std::string_view token_a = THREAT_TOKENS[token_dist(rng_)];
    const std::string_view token_b = THREAT_TOKENS[token_dist(rng_)];

    std::string description;
    description.append(threat).append(" attack detected - ").append(risk).append(" risk");

    std::string out;
    out.reserve(256);
    begin_envelope(out, "mev_alert");
    out.push_back('{');
    append_key(out, "id");          append_string(out, "mev_" + std::to_string(now_ms) + "_" + std::to_string(++sequence_)); out.push_back(',');
    append_key(out, "threat_type"); append_string(out, threat);      out.push_back(',');
    append_key(out, "risk_level");  append_string(out, risk);        out.push_back(',');
    append_key(out, "description"); append_string(out, description); out.push_back(',');
    append_key(out, "affected_tokens");
    out.push_back('[');
    append_string(out, token_a);
    out.push_back(',');
    append_string(out, token_b);
    out += "]}";
    end_envelope(out, now_ms);
    return out;
}

std::string Simulator::make_depth_(const std::string& pair, const std::vector<Level>& levels, std::int64_t now_ms) {
    using namespace lcr::json;
    const Level& ref = levels.front();
    const double tick_size = std::max(round4(ref.price * 0.0001), 0.0001);

    std::string out;
    out.reserve(512);
    begin_envelope(out, "market_depth");
    out.push_back('{');
    append_key(out, "pair");     append_string(out, pair);         out.push_back(',');
    append_key(out, "exchange"); append_string(out, ref.exchange); out.push_back(',');

    double total = 0.0;
    append_key(out, "bids");
    out.push_back('[');
    for (std::size_t i = 0; i < options_.depth_levels; ++i) {
        const double size = std::floor(uniform_(500.0, 1000.0));
        total += size;
        if (i > 0) out.push_back(',');
        out.push_back('{');
        append_key(out, "price"); append(out, round4(ref.bid - tick_size * static_cast<double>(i))); out.push_back(',');
        append_key(out, "size");  append(out, size);  out.push_back(',');
        append_key(out, "total"); append(out, total);
        out.push_back('}');
    }
    out += "],";

    total = 0.0;
    append_key(out, "asks");
    out.push_back('[');
    for (std::size_t i = 0; i < options_.depth_levels; ++i) {
        const double size = std::floor(uniform_(500.0, 1000.0));
        total += size;
        if (i > 0) out.push_back(',');
        out.push_back('{');
        append_key(out, "price"); append(out, round4(ref.ask + tick_size * static_cast<double>(i))); out.push_back(',');
        append_key(out, "size");  append(out, size);  out.push_back(',');
        append_key(out, "total"); append(out, total);
        out.push_back('}');
    }
    out += "]}";
    end_envelope(out, now_ms);
    return out;
}

void Simulator::apply_subscription_(const simdjson::dom::element& root, bool subscribe) {
    simdjson::dom::array channels;
    if (root["channels"].get(channels)) {
        AW_WARN("[SIM] Subscription command without 'channels' -> ignored.");
        return;
    }

    lcr::optional<std::set<std::string>> filter;
    simdjson::dom::array pairs;
    if (subscribe && !root["pairs"].get(pairs)) {
        std::set<std::string> tmp;
        for (simdjson::dom::element p : pairs) {
            std::string_view sv;
            if (!p.get(sv)) {
                tmp.emplace(sv);
            }
        }
        filter = std::move(tmp);
    }

    for (simdjson::dom::element c : channels) {
        std::string_view sv;
        if (c.get(sv)) {
            continue;
        }
        std::string channel(sv);
        if (!subscribe) {
            channels_.erase(channel);
            AW_DEBUG("[SIM] Unsubscribed '" << channel << "'");
            continue;
        }
        auto it = channels_.find(channel);
        if (it == channels_.end()) {
            channels_.emplace(channel, filter);
        }
        else if (!filter.has()) {
            it->second.reset();
        }
        else if (it->second.has()) {
            it->second.value().insert(filter.value().begin(), filter.value().end());
        }
        AW_DEBUG("[SIM] Subscribed '" << channel << "'");
    }
}

std::string Simulator::make_execution_update_(std::string_view opportunity_id, std::int64_t now_ms) {
    using namespace lcr::json;
    std::string out;
    out.reserve(256);
    begin_envelope(out, "execution_update");
    out.push_back('{');
    append_key(out, "opportunityId"); append_string(out, opportunity_id);                             out.push_back(',');
    append_key(out, "status");        append_string(out, "completed");                                out.push_back(',');
    append_key(out, "message");       append_string(out, "Trade executed successfully (simulated)");  out.push_back(',');
    append_key(out, "txHash");        append_string(out, "0x" + hex_(64));
    out.push_back('}');
    end_envelope(out, now_ms);
    return out;
}

} // namespace arbwire::core::feed
