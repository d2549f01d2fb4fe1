#pragma once

#include <cstdint>
#include <string_view>

#include "arbwire/core/config/protocol.hpp"
#include "arbwire/core/protocol/enums/message_kind.hpp"
#include "arbwire/core/protocol/enums/risk_level.hpp"
#include "arbwire/core/protocol/enums/execution_status.hpp"
#include "arbwire/core/protocol/schema/depth_snapshot.hpp"
#include "arbwire/core/protocol/parser/result.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"

#include <simdjson.h>

/*
================================================================================
Parsing Adapters (Domain-Level Converters)
================================================================================

Adapters sit between low-level JSON helpers (helper::parse_*) and the message
parsers responsible for logging and routing.

  • Convert primitive JSON fields into domain types (kinds, risk levels,
    execution statuses, timestamps, depth levels)
  • Enforce semantic constraints (non-empty strings, positive prices)
  • Distinguish between invalid schema and invalid values

Adapters do NOT log and do NOT inspect message-level structure.
================================================================================
*/


namespace arbwire::core::protocol::parser::adapter {

// ------------------------------------------------------------
// Timestamps
// ------------------------------------------------------------
// Producers disagree on the epoch unit. Values below EPOCH_SECONDS_LIMIT are
// read as seconds, everything else as milliseconds.
[[nodiscard]]
inline constexpr std::int64_t normalize_epoch_ms(std::int64_t ts) noexcept {
    if (ts > 0 && ts < config::EPOCH_SECONDS_LIMIT) {
        return ts * 1000;
    }
    return ts;
}

static_assert(normalize_epoch_ms(1'700'000'000) == 1'700'000'000'000);
static_assert(normalize_epoch_ms(1'700'000'000'000) == 1'700'000'000'000);

[[nodiscard]]
inline Result parse_timestamp_optional(const simdjson::dom::element& obj, const char* key, std::int64_t fallback_ms, std::int64_t& out) noexcept {
    lcr::optional<std::int64_t> ts;
    auto r = helper::parse_int64_optional(obj, key, ts);
    if (r != Result::Parsed) {
        return r;
    }
    if (!ts.has()) {
        out = fallback_ms;
        return Result::Parsed;
    }
    if (ts.value() < 0) {
        return Result::InvalidValue;
    }
    out = normalize_epoch_ms(ts.value());
    return Result::Parsed;
}

// ------------------------------------------------------------
// Message kind
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_message_kind_required(const simdjson::dom::element& root, MessageKind& out, std::string_view& name) noexcept {
    auto r = helper::parse_string_required(root, "message_type", name);
    if (r != Result::Parsed) {
        return r;
    }
    out = to_message_kind_enum(name);
    return Result::Parsed;
}

// ------------------------------------------------------------
// Non-empty string
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_name_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    auto r = helper::parse_string_required(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    return out.empty() ? Result::InvalidValue : Result::Parsed;
}

// ------------------------------------------------------------
// Prices and sizes
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_price_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    auto r = helper::parse_number_required(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    return (out > 0.0) ? Result::Parsed : Result::InvalidValue;
}

// Missing non-negative amount defaults to zero
[[nodiscard]]
inline Result parse_amount_optional(const simdjson::dom::element& obj, std::initializer_list<const char*> keys, double& out) noexcept {
    lcr::optional<double> v;
    auto r = helper::parse_number_optional_any(obj, keys, v);
    if (r != Result::Parsed) {
        return r;
    }
    out = v.value_or(0.0);
    return (out >= 0.0) ? Result::Parsed : Result::InvalidValue;
}

// ------------------------------------------------------------
// RiskLevel (optional, unknown spellings are rejected)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_risk_level_optional(const simdjson::dom::element& obj, const char* key, RiskLevel& out) noexcept {
    std::string_view sv;
    bool present = false;
    auto r = helper::parse_string_optional(obj, key, sv, present);
    if (r != Result::Parsed) {
        return r;
    }
    if (!present) {
        out = RiskLevel::Unknown;
        return Result::Parsed;
    }
    out = to_risk_level_enum(sv);
    return (out == RiskLevel::Unknown) ? Result::InvalidValue : Result::Parsed;
}

// ------------------------------------------------------------
// ExecutionStatus
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_execution_status_required(const simdjson::dom::element& obj, const char* key, ExecutionStatus& out) noexcept {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    out = to_execution_status_enum(sv);
    return (out == ExecutionStatus::Unknown) ? Result::InvalidValue : Result::Parsed;
}

// ------------------------------------------------------------
// Depth level: {"price":p,"size":q} / {"price":p,"quantity":q} / [p, q]
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_depth_level(const simdjson::dom::element& el, schema::DepthSnapshot::Level& out) noexcept {
    if (el.type() == simdjson::dom::element_type::ARRAY) {
        simdjson::dom::array arr = el.get_array().value_unsafe();
        if (arr.size() < 2) {
            return Result::InvalidSchema;
        }
        auto r = helper::element_to_number(arr.at(0).value_unsafe(), out.price);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::element_to_number(arr.at(1).value_unsafe(), out.quantity);
        if (r != Result::Parsed) {
            return r;
        }
    }
    else {
        auto r = helper::parse_number_required(el, "price", out.price);
        if (r != Result::Parsed) {
            return r;
        }
        r = parse_amount_optional(el, {"size", "quantity", "amount"}, out.quantity);
        if (r != Result::Parsed) {
            return r;
        }
    }
    return (out.price > 0.0 && out.quantity >= 0.0) ? Result::Parsed : Result::InvalidValue;
}

} // namespace arbwire::core::protocol::parser::adapter
