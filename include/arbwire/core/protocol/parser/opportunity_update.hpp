#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "arbwire/core/config/scanner.hpp"
#include "arbwire/core/protocol/schema/opportunity.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol::parser {

class opportunity_update {
public:
    // Parse the "data" payload of an opportunity_update envelope.
    //
    // Required: id, pair, profit_percentage
    // Optional: exchanges [buy, sell] or buy_exchange / sell_exchange,
    //           buy_price, sell_price, estimated_profit, net_profit,
    //           required_capital, confidence, risk_level, timestamp,
    //           expires_at, execution_path
    //
    // A missing expires_at defaults to timestamp + ttl.
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, std::int64_t envelope_ts_ms, schema::Opportunity& out,
                               std::chrono::milliseconds ttl = config::OPPORTUNITY_TTL) noexcept {
        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] opportunity_update payload is not an object -> ignore message.");
            return r;
        }

        // id (required)
        std::string_view sv;
        r = adapter::parse_name_required(data, "id", sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'id' missing or empty in opportunity_update -> ignore message.");
            return r;
        }
        out.id.assign(sv);

        // pair (required)
        r = adapter::parse_name_required(data, "pair", sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'pair' missing or empty in opportunity_update -> ignore message.");
            return r;
        }
        out.pair.assign(sv);

        // profit_percentage (required)
        r = helper::parse_number_required(data, "profit_percentage", out.profit_percentage);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'profit_percentage' missing or invalid in opportunity_update -> ignore message.");
            return r;
        }

        // venues
        r = parse_venues_(data, out);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Exchange fields invalid in opportunity_update '" << out.id << "' -> ignore message.");
            return r;
        }

        // numbers (optional)
        lcr::optional<double> v;
        if ((r = helper::parse_number_optional(data, "buy_price", v)) != Result::Parsed) return r;
        out.buy.price = v.value_or(0.0);
        if ((r = helper::parse_number_optional(data, "sell_price", v)) != Result::Parsed) return r;
        out.sell.price = v.value_or(0.0);
        if ((r = helper::parse_number_optional(data, "estimated_profit", v)) != Result::Parsed) return r;
        out.estimated_profit = v.value_or(0.0);
        if ((r = helper::parse_number_optional(data, "net_profit", v)) != Result::Parsed) return r;
        out.net_profit = v.value_or(out.profit_percentage);
        if ((r = helper::parse_number_optional(data, "required_capital", v)) != Result::Parsed) return r;
        out.required_capital = v.value_or(0.0);
        if ((r = helper::parse_number_optional(data, "confidence", v)) != Result::Parsed) return r;
        out.confidence = v.value_or(0.0);
        if (out.confidence < 0.0 || out.confidence > 100.0) {
            AW_DEBUG("[PARSER] Field 'confidence' out of range in opportunity_update '" << out.id << "' -> ignore message.");
            return Result::InvalidValue;
        }

        // risk_level (optional)
        r = adapter::parse_risk_level_optional(data, "risk_level", out.risk_level);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'risk_level' invalid in opportunity_update '" << out.id << "' -> ignore message.");
            return r;
        }

        // timestamp / expires_at (optional)
        r = adapter::parse_timestamp_optional(data, "timestamp", envelope_ts_ms, out.timestamp_ms);
        if (r != Result::Parsed) {
            return r;
        }
        const std::int64_t default_expiry = out.timestamp_ms + ttl.count();
        r = adapter::parse_timestamp_optional(data, "expires_at", default_expiry, out.expires_at_ms);
        if (r != Result::Parsed) {
            return r;
        }

        // execution_path (optional)
        bool present = false;
        r = helper::parse_string_list_optional(data, "execution_path", out.execution_path, present);
        if (r != Result::Parsed) {
            return r;
        }
        return Result::Parsed;
    }

private:
    [[nodiscard]]
    static inline Result parse_venues_(const simdjson::dom::element& data, schema::Opportunity& out) noexcept {
        std::vector<std::string> exchanges;
        bool present = false;
        auto r = helper::parse_string_list_optional(data, "exchanges", exchanges, present);
        if (r != Result::Parsed) {
            return r;
        }
        if (present && exchanges.size() >= 2) {
            out.buy.exchange = std::move(exchanges[0]);
            out.sell.exchange = std::move(exchanges[1]);
            return Result::Parsed;
        }
        std::string_view sv;
        r = helper::parse_string_optional_any(data, {"buy_exchange", "buyExchange"}, sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        out.buy.exchange.assign(sv);
        r = helper::parse_string_optional_any(data, {"sell_exchange", "sellExchange"}, sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        out.sell.exchange.assign(sv);
        return Result::Parsed;
    }
};

} // namespace arbwire::core::protocol::parser
