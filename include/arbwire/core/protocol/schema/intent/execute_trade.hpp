#pragma once

#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "arbwire/core/protocol/schema/opportunity.hpp"


namespace arbwire::core::protocol::schema::intent {

// {"type":"execute_trade","opportunity":{...}}
struct ExecuteTrade {
    static constexpr std::string_view name = "execute_trade";

    Opportunity opportunity;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(640);
        out += "{\"type\":\"execute_trade\",\"opportunity\":";
        opportunity.write_json(out);
        out.push_back('}');
        return out;
    }
};

static_assert(Intent<ExecuteTrade>);

} // namespace arbwire::core::protocol::schema::intent
