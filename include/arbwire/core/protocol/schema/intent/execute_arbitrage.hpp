#pragma once

#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "lcr/json.hpp"


namespace arbwire::core::protocol::schema::intent {

// {"type":"execute_arbitrage","data":{"opportunityId":"...","amount":1000,"slippage":0.5}}
struct ExecuteArbitrage {
    static constexpr std::string_view name = "execute_arbitrage";

    std::string opportunity_id;
    double amount{0.0};         // quote currency
    double slippage{0.5};       // percent tolerated

    [[nodiscard]]
    inline std::string to_json() const {
        using namespace lcr::json;
        std::string out;
        out.reserve(128);
        out += "{\"type\":\"execute_arbitrage\",\"data\":{";
        append_key(out, "opportunityId"); append_string(out, opportunity_id); out.push_back(',');
        append_key(out, "amount");        append(out, amount);                out.push_back(',');
        append_key(out, "slippage");      append(out, slippage);
        out += "}}";
        return out;
    }
};

static_assert(Intent<ExecuteArbitrage>);

} // namespace arbwire::core::protocol::schema::intent
