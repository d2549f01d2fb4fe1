#pragma once

#include <set>
#include <string>
#include <cstdint>
#include <ostream>

#include "arbwire/core/protocol/enums/risk_level.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 MevAlert
===============================================================================

Example payload ("mev_alert"):
{
  "id": "mev_1700000000000", "threat_type": "Sandwiching", "risk_level": "High",
  "description": "Sandwiching attack detected - High risk",
  "affected_tokens": ["SOL", "USDC"], "timestamp": 1700000000000
}
===============================================================================
*/

struct MevAlert {
    std::string id;
    std::string threat_type;
    RiskLevel risk_level{RiskLevel::Unknown};
    std::string description;
    std::set<std::string> affected_tokens;
    std::int64_t timestamp_ms{0};

    inline void dump(std::ostream& os) const {
        os << "[MEV] { "
           << "id=" << id << ", "
           << "threat=" << threat_type << ", "
           << "risk=" << to_string(risk_level) << ", "
           << "tokens=[";
        bool first = true;
        for (const auto& t : affected_tokens) {
            if (!first) os << ",";
            os << t;
            first = false;
        }
        os << "], ts=" << timestamp_ms << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const MevAlert& a) {
    a.dump(os);
    return os;
}

struct MevAlertKey {
    [[nodiscard]]
    inline const std::string& operator()(const MevAlert& a) const noexcept {
        return a.id;
    }
};

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
