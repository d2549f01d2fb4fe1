#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "arbwire/core/protocol/schema/quote.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol::parser {

class price_update {
public:
    // Parse the "data" payload of a price_update envelope.
    //
    // Accepted shapes:
    //   single : { "pair": ..., "exchange": ..., "price": ..., [bid, ask, ...] }
    //   batch  : { "prices": { "<pair>": [ { "exchange": ..., "price": ... }, ... ] } }
    //
    // Quotes are appended to `out`. A malformed entry inside a batch is
    // skipped; the remaining entries are still delivered.
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, std::int64_t envelope_ts_ms, std::vector<schema::Quote>& out) noexcept {
        using namespace simdjson;

        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] price_update payload is not an object -> ignore message.");
            return r;
        }

        // Batch form
        dom::element prices;
        bool batch = false;
        r = helper::parse_object_optional(data, "prices", prices, batch);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'prices' is not an object in price_update -> ignore message.");
            return r;
        }
        if (batch) {
            return parse_batch_(prices, envelope_ts_ms, out);
        }

        // Single form
        schema::Quote q;
        r = parse_quote_(data, std::string_view{}, envelope_ts_ms, q);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(q));
        return Result::Parsed;
    }

private:
    [[nodiscard]]
    static inline Result parse_batch_(const simdjson::dom::element& prices, std::int64_t envelope_ts_ms, std::vector<schema::Quote>& out) noexcept {
        using namespace simdjson;

        dom::object by_pair = prices.get_object().value_unsafe();
        std::size_t accepted = 0;
        std::size_t rejected = 0;
        for (auto [pair, quotes] : by_pair) {
            dom::array arr;
            if (quotes.get(arr)) {
                AW_DEBUG("[PARSER] Quotes of pair '" << pair << "' are not an array -> skip pair.");
                ++rejected;
                continue;
            }
            for (dom::element entry : arr) {
                schema::Quote q;
                if (parse_quote_(entry, pair, envelope_ts_ms, q) != Result::Parsed) {
                    ++rejected;
                    continue;
                }
                out.push_back(std::move(q));
                ++accepted;
            }
        }
        if (accepted == 0 && rejected > 0) {
            return Result::InvalidSchema;
        }
        if (rejected > 0) {
            AW_DEBUG("[PARSER] price_update batch: " << rejected << " malformed quote(s) skipped.");
        }
        return Result::Parsed;
    }

    // `pair_hint` is the batch key; single quotes carry their own "pair"
    [[nodiscard]]
    static inline Result parse_quote_(const simdjson::dom::element& obj, std::string_view pair_hint, std::int64_t envelope_ts_ms, schema::Quote& out) noexcept {
        auto r = helper::require_object(obj);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Quote is not an object -> ignore quote.");
            return r;
        }

        // pair (required unless given by the batch key)
        std::string_view pair_sv = pair_hint;
        if (pair_sv.empty()) {
            r = adapter::parse_name_required(obj, "pair", pair_sv);
            if (r != Result::Parsed) {
                AW_DEBUG("[PARSER] Field 'pair' missing or empty in quote -> ignore quote.");
                return r;
            }
        }
        out.pair.assign(pair_sv);

        // exchange (required)
        std::string_view exchange_sv;
        r = adapter::parse_name_required(obj, "exchange", exchange_sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'exchange' missing or empty in quote for '" << pair_sv << "' -> ignore quote.");
            return r;
        }
        out.exchange.assign(exchange_sv);

        // price (required, positive)
        r = adapter::parse_price_required(obj, "price", out.price);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'price' missing or invalid in quote " << pair_sv << "@" << exchange_sv << " -> ignore quote.");
            return r;
        }

        // bid / ask (optional, default to price)
        lcr::optional<double> bid, ask;
        r = helper::parse_number_optional(obj, "bid", bid);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::parse_number_optional(obj, "ask", ask);
        if (r != Result::Parsed) {
            return r;
        }
        out.bid = bid.value_or(out.price);
        out.ask = ask.value_or(out.price);

        // volume / liquidity (optional)
        r = adapter::parse_amount_optional(obj, {"volume_24h", "volume24h"}, out.volume_24h);
        if (r != Result::Parsed) {
            return r;
        }
        r = adapter::parse_amount_optional(obj, {"liquidity"}, out.liquidity);
        if (r != Result::Parsed) {
            return r;
        }

        // change_24h (optional, signed)
        lcr::optional<double> change;
        r = helper::parse_number_optional_any(obj, {"change_24h", "change24h"}, change);
        if (r != Result::Parsed) {
            return r;
        }
        out.change_24h = change.value_or(0.0);

        // fee (optional, percent)
        r = helper::parse_number_optional_any(obj, {"fee", "fee_percentage"}, out.fee);
        if (r != Result::Parsed) {
            return r;
        }

        // timestamp (optional, envelope timestamp otherwise)
        r = adapter::parse_timestamp_optional(obj, "timestamp", envelope_ts_ms, out.timestamp_ms);
        if (r != Result::Parsed) {
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace arbwire::core::protocol::parser
