#pragma once

#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "lcr/json.hpp"


namespace arbwire::core::protocol::schema::intent {

// {"type":"cancel_execution","data":{"opportunityId":"..."}}
struct CancelExecution {
    static constexpr std::string_view name = "cancel_execution";

    std::string opportunity_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(96);
        out += "{\"type\":\"cancel_execution\",\"data\":{";
        lcr::json::append_key(out, "opportunityId");
        lcr::json::append_string(out, opportunity_id);
        out += "}}";
        return out;
    }
};

static_assert(Intent<CancelExecution>);

} // namespace arbwire::core::protocol::schema::intent
