#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include <simdjson.h>

#include "arbwire/core/protocol/context.hpp"
#include "arbwire/core/protocol/enums/message_kind.hpp"
#include "arbwire/core/protocol/schema/envelope.hpp"
#include "arbwire/core/protocol/parser/result.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "arbwire/core/protocol/parser/price_update.hpp"
#include "arbwire/core/protocol/parser/opportunity_update.hpp"
#include "arbwire/core/protocol/parser/mev_alert.hpp"
#include "arbwire/core/protocol/parser/market_depth.hpp"
#include "arbwire/core/protocol/parser/execution_update.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core {
namespace protocol {
namespace parser {

/*
================================================================================
Feed Parsing Architecture
================================================================================

The parser layer is structured into four roles.

1) Router (message dispatch)
   Parses the frame, validates the envelope, updates session statistics and
   selects the message parser by "message_type". It performs no field-level
   parsing and owns no domain logic.

2) Message parsers (price_update, opportunity_update, ...)
   Validate required vs optional fields of one payload kind and populate
   strongly-typed schema records. They log parsing failures and decide
   whether a payload is rejected.

3) Adapters
   Convert primitive fields into domain types (names, prices, risk levels,
   epoch timestamps) and separate invalid schema from invalid values.

4) Helpers
   Low-level JSON primitives. Strict about structure, never log, never
   allocate.

Routing is total: every frame ends in exactly one Result and touches nothing
but its target store and the session statistics.
================================================================================
*/

class Router {
public:
    explicit Router(ContextView& ctx)
        : ctx_view_(ctx)
    {
    }

    // Main entry point. `now_ms` is the receive wall clock (epoch ms).
    [[nodiscard]]
    inline Result parse_and_route(std::string_view raw_msg, std::int64_t now_ms) noexcept {
        schema::Envelope env;
        auto r = parse_envelope_(raw_msg, now_ms, env);
        if (r != Result::Parsed) {
            return r;
        }

        ctx_view_.stats.messages_received++;
        ctx_view_.stats.last_message_time_ms = now_ms;

        switch (env.kind) {
            case MessageKind::PriceUpdate:
                return route_price_update_(env);
            case MessageKind::OpportunityUpdate:
                return route_opportunity_update_(env);
            case MessageKind::MevAlert:
                return route_mev_alert_(env);
            case MessageKind::MarketDepth:
                return route_market_depth_(env);
            case MessageKind::ExecutionUpdate:
                return route_execution_update_(env);
            default:
                AW_WARN("[PARSER] Unhandled message_type '" << env.kind_name << "' -> ignore");
                break;
        }
        return Result::Ignored;
    }

private:
    // Context view (non-owning)
    ContextView& ctx_view_;

    // Underlying simdjson parser
    simdjson::dom::parser parser_;

    // Reused between price updates
    std::vector<schema::Quote> quote_buffer_;

private:
    // =========================================================================
    // Envelope
    // =========================================================================

    [[nodiscard]]
    inline Result parse_envelope_(std::string_view raw_msg, std::int64_t now_ms, schema::Envelope& env) noexcept {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg).get(root);
        if (error) {
            AW_WARN("[PARSER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            AW_WARN("[PARSER] Frame is not a JSON object: " << raw_msg);
            return Result::InvalidSchema;
        }
        auto r = adapter::parse_message_kind_required(root, env.kind, env.kind_name);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Field 'message_type' missing or invalid in message: " << raw_msg);
            return r;
        }
        r = helper::parse_object_required(root, "data", env.data);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Field 'data' missing or not an object in '" << env.kind_name << "' message -> ignore message.");
            return r;
        }
        r = adapter::parse_timestamp_optional(root, "timestamp", now_ms, env.timestamp_ms);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Field 'timestamp' invalid in '" << env.kind_name << "' message -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }

    // =========================================================================
    // Per-kind routing
    // =========================================================================

    // PRICE UPDATE
    [[nodiscard]]
    inline Result route_price_update_(const schema::Envelope& env) noexcept {
        quote_buffer_.clear();
        auto r = price_update::parse(env.data, env.timestamp_ms, quote_buffer_);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Failed to parse price_update (" << to_string(r) << ").");
            return r;
        }
        std::size_t stale = 0;
        for (auto& q : quote_buffer_) {
            std::string pair = q.pair;
            if (ctx_view_.quotes.upsert(std::move(q)) == store::UpsertResult::Stale) {
                ++stale;
                continue;
            }
            ctx_view_.dirty_pairs.insert(std::move(pair));
        }
        if (stale > 0) {
            AW_DEBUG("[PARSER] price_update: " << stale << " out-of-order quote(s) discarded.");
        }
        return Result::Delivered;
    }

    // OPPORTUNITY UPDATE
    [[nodiscard]]
    inline Result route_opportunity_update_(const schema::Envelope& env) noexcept {
        schema::Opportunity opp;
        auto r = opportunity_update::parse(env.data, env.timestamp_ms, opp, ctx_view_.opportunity_ttl);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Failed to parse opportunity_update (" << to_string(r) << ").");
            return r;
        }
        (void)ctx_view_.opportunities.upsert(std::move(opp));
        return Result::Delivered;
    }

    // MEV ALERT
    [[nodiscard]]
    inline Result route_mev_alert_(const schema::Envelope& env) noexcept {
        schema::MevAlert alert;
        auto r = mev_alert::parse(env.data, env.timestamp_ms, alert);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Failed to parse mev_alert (" << to_string(r) << ").");
            return r;
        }
        (void)ctx_view_.mev_alerts.upsert(std::move(alert));
        return Result::Delivered;
    }

    // MARKET DEPTH
    [[nodiscard]]
    inline Result route_market_depth_(const schema::Envelope& env) noexcept {
        schema::DepthSnapshot snapshot;
        auto r = market_depth::parse(env.data, env.timestamp_ms, snapshot);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Failed to parse market_depth (" << to_string(r) << ").");
            return r;
        }
        (void)ctx_view_.depth.upsert(std::move(snapshot));
        return Result::Delivered;
    }

    // EXECUTION UPDATE
    [[nodiscard]]
    inline Result route_execution_update_(const schema::Envelope& env) noexcept {
        schema::ExecutionUpdate update;
        auto r = execution_update::parse(env.data, env.timestamp_ms, update);
        if (r != Result::Parsed) {
            AW_WARN("[PARSER] Failed to parse execution_update (" << to_string(r) << ").");
            return r;
        }
        (void)ctx_view_.executions.upsert(std::move(update));
        return Result::Delivered;
    }
};

} // namespace parser
} // namespace protocol
} // namespace arbwire::core
