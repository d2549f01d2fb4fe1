#pragma once

#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include <string_view>

#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {
namespace request {

enum class Action : std::uint8_t {
    Subscribe,
    Unsubscribe
};

[[nodiscard]]
inline constexpr std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::Subscribe:   return "subscribe";
        case Action::Unsubscribe: return "unsubscribe";
        default:                  return "unknown";
    }
}

/*
===============================================================================
 Subscription command
===============================================================================

{"action":"subscribe","channels":["prices","opportunities"],"pairs":["SOL/USDT"]}

An absent "pairs" means every pair.
===============================================================================
*/

struct Subscription {
    Action action{Action::Subscribe};
    std::vector<std::string> channels;
    lcr::optional<std::set<std::string>> pairs{};

    inline void write_json(std::string& out) const {
        using namespace lcr::json;
        out.push_back('{');
        append_key(out, "action");
        append_string(out, to_string(action));
        out.push_back(',');
        append_key(out, "channels");
        out.push_back('[');
        for (std::size_t i = 0; i < channels.size(); ++i) {
            if (i > 0) out.push_back(',');
            append_string(out, channels[i]);
        }
        out.push_back(']');
        if (pairs.has()) {
            out.push_back(',');
            append_key(out, "pairs");
            out.push_back('[');
            bool first = true;
            for (const auto& p : pairs.value()) {
                if (!first) out.push_back(',');
                append_string(out, p);
                first = false;
            }
            out.push_back(']');
        }
        out.push_back('}');
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(128);
        write_json(out);
        return out;
    }
};

} // namespace request
} // namespace schema
} // namespace protocol
} // namespace arbwire::core
