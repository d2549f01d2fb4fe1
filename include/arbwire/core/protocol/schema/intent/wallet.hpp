#pragma once

#include <string>
#include <string_view>

#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "lcr/json.hpp"


namespace arbwire::core::protocol::schema::intent {

// {"type":"wallet_connect","wallet_type":"phantom","address":"..."}
struct WalletConnect {
    static constexpr std::string_view name = "wallet_connect";

    std::string wallet_type;
    std::string address;

    [[nodiscard]]
    inline std::string to_json() const {
        using namespace lcr::json;
        std::string out;
        out.reserve(128);
        out += "{\"type\":\"wallet_connect\",";
        append_key(out, "wallet_type"); append_string(out, wallet_type); out.push_back(',');
        append_key(out, "address");     append_string(out, address);
        out.push_back('}');
        return out;
    }
};

// {"type":"wallet_disconnect","address":"..."}
struct WalletDisconnect {
    static constexpr std::string_view name = "wallet_disconnect";

    std::string address;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(96);
        out += "{\"type\":\"wallet_disconnect\",";
        lcr::json::append_key(out, "address");
        lcr::json::append_string(out, address);
        out.push_back('}');
        return out;
    }
};

static_assert(Intent<WalletConnect>);
static_assert(Intent<WalletDisconnect>);

} // namespace arbwire::core::protocol::schema::intent
