// ============================================================================
// reconnect
//
// Demonstrates the reconnect policy against an endpoint that refuses every
// connection (by default a closed local port):
// - exponential backoff: 3 s, 6 s, 12 s, 24 s, 30 s
// - terminal Error state once the retry budget is spent
// - close() cancelling a pending retry
//
// Use --fast to scale the policy down to milliseconds.
// ============================================================================

#include <chrono>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include "arbwire/core.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"
#include "lcr/format.hpp"


int main(int argc, char** argv) {
    using namespace arbwire::core;

    std::string url = "ws://127.0.0.1:1/";
    std::string log_level = "info";
    bool fast = false;
    int max_attempts = transport::connection::RetryPolicy{}.max_attempts;

    CLI::App app{"arbwire reconnect policy demo"};
    app.add_option("--url", url, "Unreachable WebSocket endpoint")->check(arbwire::examples::cli::ws_url_validator)->default_val(url);
    app.add_flag("--fast", fast, "Use 30 ms / 300 ms backoff instead of 3 s / 30 s");
    app.add_option("--max-attempts", max_attempts, "Retry budget")->check(CLI::Range(0, 20))->default_val(max_attempts);
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error")->check(arbwire::examples::cli::log_level_validator)->default_val(log_level);
    CLI11_PARSE(app, argc, argv);

    arbwire::examples::set_log_level(log_level);
    arbwire::examples::enable_color();

    protocol::SessionConfig cfg;
    cfg.retry.max_attempts = max_attempts;
    if (fast) {
        cfg.retry.base_delay = std::chrono::milliseconds(30);
        cfg.retry.max_delay = std::chrono::milliseconds(300);
    }
    std::cout << cfg << std::endl;

    protocol::LiveSessionT session{cfg};
    const auto err = session.connect(url);
    std::cout << "[arbwire] connect() -> " << transport::to_string(err) << std::endl;

    const auto start = std::chrono::steady_clock::now();
    auto last_state = session.state();
    while (session.has_pending_retry()) {
        session.poll();
        if (session.state() != last_state) {
            last_state = session.state();
            std::cout << "[arbwire] state -> " << transport::to_string(last_state) << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "\n========== SUMMARY ==========" << std::endl;
    std::cout << "Final state       : " << transport::to_string(session.state()) << std::endl;
    std::cout << "Retry pending     : " << (session.has_pending_retry() ? "yes" : "no") << std::endl;
    std::cout << "Elapsed           : " << lcr::format_duration(elapsed) << std::endl;
    session.telemetry().debug_dump(std::cout);

    // Terminal: only an explicit connect() starts over. close() is still safe.
    session.close();

    if (session.state() == transport::ConnectionState::Disconnected) {
        std::cout << "[arbwire] Reconnect policy demo PASSED" << std::endl;
        return 0;
    }
    std::cout << "[arbwire] Reconnect policy demo FAILED" << std::endl;
    return 1;
}
