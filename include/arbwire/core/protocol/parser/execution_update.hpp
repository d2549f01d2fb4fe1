#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "arbwire/core/protocol/schema/execution_update.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol::parser {

class execution_update {
public:
    // Required: opportunity_id (or opportunityId), status
    // Optional: message, tx_hash (or txHash), timestamp
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, std::int64_t envelope_ts_ms, schema::ExecutionUpdate& out) noexcept {
        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] execution_update payload is not an object -> ignore message.");
            return r;
        }

        std::string_view sv;
        bool present = false;
        r = helper::parse_string_optional_any(data, {"opportunity_id", "opportunityId"}, sv, present);
        if (r != Result::Parsed || !present || sv.empty()) {
            AW_DEBUG("[PARSER] Field 'opportunity_id' missing or empty in execution_update -> ignore message.");
            return (r != Result::Parsed) ? r : Result::InvalidSchema;
        }
        out.opportunity_id.assign(sv);

        r = adapter::parse_execution_status_required(data, "status", out.status);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'status' missing or invalid in execution_update '" << out.opportunity_id << "' -> ignore message.");
            return r;
        }

        r = helper::parse_string_optional(data, "message", sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        out.message.assign(sv);

        r = helper::parse_string_optional_any(data, {"tx_hash", "txHash"}, sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        if (present) {
            out.tx_hash = std::string(sv);
        }
        else {
            out.tx_hash.reset();
        }

        return adapter::parse_timestamp_optional(data, "timestamp", envelope_ts_ms, out.timestamp_ms);
    }
};

} // namespace arbwire::core::protocol::parser
