#pragma once

#include <string>
#include <ostream>
#include <iostream>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "arbwire/core/config/protocol.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace arbwire::cli::minimal {

struct Params {
    std::string url       = std::string(core::config::DEFAULT_URL);
    bool simulate         = false;
    std::string log_level = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  URL       : " << url << (simulate ? " (simulated)" : "")
           << "\n  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description, std::string default_url = {}, bool allow_simulate = true) {
    CLI::App app{std::string(description)};
    Params params{};
    if (!default_url.empty()) {
        params.url = std::move(default_url);
    }

    app.add_option("--url", params.url, "WebSocket endpoint")->check(examples::cli::ws_url_validator)->default_val(params.url);
    if (allow_simulate) {
        app.add_flag("--simulate", params.simulate, "Use the in-process simulated feed instead of the network");
    }
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(examples::cli::log_level_validator)->default_val(params.log_level);

    app.footer(
        "This example demonstrates a Core contract.\n"
        "Behavior is observable via logs."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    examples::set_log_level(params.log_level);
    return params;
}

} // namespace arbwire::cli::minimal
