#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "arbwire/core/feed/simulator.hpp"


namespace arbwire::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Pair validator
// -------------------------------------------------------------
inline auto pair_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto slash = value.find('/');
        if (slash != std::string::npos && slash > 0 && slash + 1 < value.size()) {
            return {};
        }
        return "Pair must be in format BASE/QUOTE (e.g. SOL/USDT)";
    },
    "Trading pair validator"
);


// -------------------------------------------------------------
// Simulated pair validator (pairs with a known base price)
// -------------------------------------------------------------
inline auto simulated_pair_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (core::feed::base_price(value).has()) {
            return {};
        }
        std::string known;
        for (const auto& p : core::feed::pairs()) {
            if (!known.empty()) known += ", ";
            known.append(p.pair);
        }
        return "Simulated feed only quotes: " + known;
    },
    "Simulated pair validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"});

} // namespace arbwire::examples::cli
