#pragma once

#include <string>
#include <cstdint>
#include <ostream>

#include "arbwire/core/protocol/enums/execution_status.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 ExecutionUpdate
===============================================================================

Reply of the execution service to an execute / cancel intent
("execution_update"):
{
  "opportunityId": "arb_SOL/USDT_1700000000000_1", "status": "completed",
  "message": "Trade executed successfully (simulated)", "txHash": "0x..."
}
Identity key = opportunity_id (one live status per request).
===============================================================================
*/

struct ExecutionUpdate {
    std::string opportunity_id;
    ExecutionStatus status{ExecutionStatus::Unknown};
    std::string message;
    lcr::optional<std::string> tx_hash{};
    std::int64_t timestamp_ms{0};

    inline void dump(std::ostream& os) const {
        os << "[EXECUTION] { "
           << "opportunity=" << opportunity_id << ", "
           << "status=" << to_string(status) << ", "
           << "message=" << message << ", "
           << "tx=" << lcr::to_string(tx_hash) << ", "
           << "ts=" << timestamp_ms
           << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const ExecutionUpdate& u) {
    u.dump(os);
    return os;
}

struct ExecutionUpdateKey {
    [[nodiscard]]
    inline const std::string& operator()(const ExecutionUpdate& u) const noexcept {
        return u.opportunity_id;
    }
};

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
