#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "arbwire/core/protocol/schema/depth_snapshot.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol::parser {

class market_depth {
public:
    // Required: pair, bids, asks
    // Optional: exchange, timestamp
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, std::int64_t envelope_ts_ms, schema::DepthSnapshot& out) noexcept {
        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] market_depth payload is not an object -> ignore message.");
            return r;
        }

        std::string_view sv;
        r = adapter::parse_name_required(data, "pair", sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'pair' missing or empty in market_depth -> ignore message.");
            return r;
        }
        out.pair.assign(sv);

        bool present = false;
        r = helper::parse_string_optional(data, "exchange", sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        out.exchange.assign(sv);

        r = parse_side_(data, "bids", out.bids);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'bids' missing or invalid in market_depth '" << out.pair << "' -> ignore message.");
            return r;
        }
        r = parse_side_(data, "asks", out.asks);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'asks' missing or invalid in market_depth '" << out.pair << "' -> ignore message.");
            return r;
        }

        return adapter::parse_timestamp_optional(data, "timestamp", envelope_ts_ms, out.timestamp_ms);
    }

private:
    [[nodiscard]]
    static inline Result parse_side_(const simdjson::dom::element& data, const char* key, std::vector<schema::DepthSnapshot::Level>& out) noexcept {
        simdjson::dom::array levels;
        auto r = helper::parse_array_required(data, key, levels);
        if (r != Result::Parsed) {
            return r;
        }
        out.clear();
        out.reserve(levels.size());
        for (simdjson::dom::element el : levels) {
            schema::DepthSnapshot::Level level;
            r = adapter::parse_depth_level(el, level);
            if (r != Result::Parsed) {
                return r;
            }
            out.push_back(level);
        }
        return Result::Parsed;
    }
};

} // namespace arbwire::core::protocol::parser
