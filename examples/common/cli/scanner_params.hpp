#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <iostream>
#include <cstdlib>
#include <cstdint>

#include <CLI/CLI.hpp>

#include "arbwire/core/config/protocol.hpp"
#include "arbwire/core/config/scanner.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace arbwire::cli::scanner {

struct Params {
    std::string url                = std::string(core::config::DEFAULT_URL);
    bool simulate                  = false;
    std::vector<std::string> pairs = {"SOL/USDT", "ETH/USDT", "BTC/USDT", "BNB/USDT", "XRP/USDT"};
    double min_profit              = core::config::MIN_PROFIT_PERCENTAGE;
    std::int64_t interval_ms       = 2000;
    std::uint32_t seed             = 42;
    int duration_s                 = 30;
    std::size_t top                = 5;
    std::string log_level          = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL        : " << url << (simulate ? " (simulated)" : "") << "\n"
           << "  Pairs      : ";
        for (const auto& p : pairs) {
            os << p << " ";
        }
        os << "\n  Min profit : " << min_profit << " %"
           << "\n  Interval   : " << interval_ms << " ms"
           << "\n  Seed       : " << seed
           << "\n  Duration   : " << duration_s << " s"
           << "\n  Top        : " << top
           << "\n  Log Level  : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "WebSocket endpoint")->check(examples::cli::ws_url_validator)->default_val(params.url);
    app.add_flag("--simulate", params.simulate, "Use the in-process simulated feed instead of the network");
    app.add_option("-p,--pair", params.pairs, "Pair(s) to watch (e.g. -p SOL/USDT)")->check(examples::cli::pair_validator)->default_val(params.pairs);
    app.add_option("--min-profit", params.min_profit, "Minimum profit percentage of a reported opportunity")->check(CLI::PositiveNumber)->default_val(params.min_profit);
    app.add_option("--interval-ms", params.interval_ms, "Simulated feed emission interval (ms)")->check(CLI::Range(50, 60000))->default_val(params.interval_ms);
    app.add_option("--seed", params.seed, "Simulated feed random seed")->default_val(params.seed);
    app.add_option("--duration", params.duration_s, "Run time in seconds")->check(CLI::Range(1, 86400))->default_val(params.duration_s);
    app.add_option("--top", params.top, "Opportunities printed per report")->check(CLI::Range(1, 20))->default_val(params.top);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(examples::cli::log_level_validator)->default_val(params.log_level);

    app.footer(
        "Quotes are classified into bounded stores and scanned once per poll.\n"
        "Ranked opportunities are printed every feed interval."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    examples::set_log_level(params.log_level);
    return params;
}

} // namespace arbwire::cli::scanner
