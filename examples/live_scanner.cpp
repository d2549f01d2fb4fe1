// ============================================================================
// live_scanner
//
// Demonstrates:
// - Connecting a Session to the live feed or the simulated feed
// - Default channel subscription replayed on every handshake
// - Quotes classified into bounded stores, scanned once per poll
// - Ranked, time-bounded opportunities printed every feed interval
// - Graceful shutdown using Ctrl+C
// ============================================================================

#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>

#include "arbwire/core.hpp"

#include "common/cli/scanner_params.hpp"
#include "common/loop/helpers.hpp"

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

template <typename Session>
int run(Session& session, const arbwire::cli::scanner::Params& params) {
    using namespace arbwire::core;

    if (session.connect(params.url) != transport::Error::None) {
        std::cerr << "[arbwire] Initial connection failed, retrying in the background" << std::endl;
    }

    const auto report_every = std::chrono::milliseconds(params.interval_ms);
    const auto start = std::chrono::steady_clock::now();
    auto next_report = start + report_every;
    int idle_spins = 0;

    while (running.load(std::memory_order_relaxed) &&
           std::chrono::steady_clock::now() - start < std::chrono::seconds(params.duration_s)) {
        const auto rx_before = session.rx_messages();
        session.poll();
        bool did_work = session.rx_messages() != rx_before;

        if (std::chrono::steady_clock::now() >= next_report) {
            loop::print_ranked(session, Session::wall_clock_ms(), params.top);
            next_report += report_every;
        }

        if (session.state() == transport::ConnectionState::Error && !session.has_pending_retry()) {
            std::cerr << "[arbwire] Reconnection budget exhausted" << std::endl;
            break;
        }
        loop::manage_idle_spins(did_work, idle_spins);
    }

    std::cout << "\n[arbwire] Shutting down..." << std::endl;
    session.close();

    std::cout << "\n========== SUMMARY ==========" << std::endl;
    std::cout << session.stats() << std::endl;
    std::cout << "Quotes retained       : " << session.quotes().size() << std::endl;
    std::cout << "Opportunities retained: " << session.opportunities().size() << std::endl;
    std::cout << "MEV alerts retained   : " << session.mev_alerts().size() << std::endl;
    std::cout << "Local scans produced  : " << session.scanner().sequence() << std::endl;
    session.telemetry().debug_dump(std::cout);
    return 0;
}

int main(int argc, char** argv) {
    using namespace arbwire::core;

    const auto params = arbwire::cli::scanner::configure(argc, argv, "arbwire live arbitrage scanner");
    params.dump("=== Scanner Parameters ===", std::cout);
    arbwire::examples::enable_color();

    std::signal(SIGINT, on_signal);

    protocol::SessionConfig cfg;
    cfg.scanner.min_profit_percentage = params.min_profit;

    if (params.simulate) {
        feed::SimulatedWebSocket::Options ws_options;
        ws_options.simulator.pairs = params.pairs;
        ws_options.simulator.interval = std::chrono::milliseconds(params.interval_ms);
        ws_options.simulator.seed = params.seed;
        protocol::SimulatedSessionT session{cfg, ws_options};
        return run(session, params);
    }

    protocol::LiveSessionT session{cfg};
    return run(session, params);
}
