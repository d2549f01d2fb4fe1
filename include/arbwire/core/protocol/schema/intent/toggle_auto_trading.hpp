#pragma once

#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "lcr/json.hpp"


namespace arbwire::core::protocol::schema::intent {

// {"type":"toggle_auto_trading","enabled":true}
struct ToggleAutoTrading {
    static constexpr std::string_view name = "toggle_auto_trading";

    bool enabled{false};

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out = "{\"type\":\"toggle_auto_trading\",";
        lcr::json::append_key(out, "enabled");
        lcr::json::append_bool(out, enabled);
        out.push_back('}');
        return out;
    }
};

static_assert(Intent<ToggleAutoTrading>);

} // namespace arbwire::core::protocol::schema::intent
