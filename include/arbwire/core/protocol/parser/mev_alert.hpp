#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "arbwire/core/protocol/schema/mev_alert.hpp"
#include "arbwire/core/protocol/parser/helpers.hpp"
#include "arbwire/core/protocol/parser/adapters.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::protocol::parser {

class mev_alert {
public:
    // Required: id, threat_type, risk_level
    // Optional: description, affected_tokens, timestamp
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& data, std::int64_t envelope_ts_ms, schema::MevAlert& out) noexcept {
        auto r = helper::require_object(data);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] mev_alert payload is not an object -> ignore message.");
            return r;
        }

        std::string_view sv;
        r = adapter::parse_name_required(data, "id", sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'id' missing or empty in mev_alert -> ignore message.");
            return r;
        }
        out.id.assign(sv);

        r = adapter::parse_name_required(data, "threat_type", sv);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'threat_type' missing or empty in mev_alert '" << out.id << "' -> ignore message.");
            return r;
        }
        out.threat_type.assign(sv);

        r = adapter::parse_risk_level_optional(data, "risk_level", out.risk_level);
        if (r != Result::Parsed || out.risk_level == RiskLevel::Unknown) {
            AW_DEBUG("[PARSER] Field 'risk_level' missing or invalid in mev_alert '" << out.id << "' -> ignore message.");
            return (r != Result::Parsed) ? r : Result::InvalidSchema;
        }

        bool present = false;
        r = helper::parse_string_optional(data, "description", sv, present);
        if (r != Result::Parsed) {
            return r;
        }
        out.description.assign(sv);

        std::vector<std::string> tokens;
        r = helper::parse_string_list_optional(data, "affected_tokens", tokens, present);
        if (r != Result::Parsed) {
            AW_DEBUG("[PARSER] Field 'affected_tokens' invalid in mev_alert '" << out.id << "' -> ignore message.");
            return r;
        }
        out.affected_tokens.clear();
        out.affected_tokens.insert(tokens.begin(), tokens.end());

        return adapter::parse_timestamp_optional(data, "timestamp", envelope_ts_ms, out.timestamp_ms);
    }
};

} // namespace arbwire::core::protocol::parser
