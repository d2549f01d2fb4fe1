// ============================================================================
// intents
//
// Demonstrates the command dispatcher:
// - intents rejected with NotConnected before the handshake
// - execute_arbitrage on the best ranked opportunity
// - the execution_update reply routed into the execution store
// - subscription changes sent as deltas
//
// Use --simulate to run against the in-process feed.
// ============================================================================

#include <chrono>
#include <iostream>
#include <thread>

#include "arbwire/core.hpp"

#include "common/cli/minimal.hpp"
#include "common/loop/helpers.hpp"


template <typename Session>
int run(Session& session, const std::string& url) {
    using namespace arbwire::core;
    using namespace arbwire::core::protocol::schema;

    // Before connect(): nothing is queued
    auto r = session.send_intent(intent::ToggleAutoTrading{.enabled = true});
    std::cout << "[arbwire] toggle_auto_trading before connect -> " << protocol::dispatch::to_string(r) << std::endl;

    // Registry accepts intent while disconnected, replayed on handshake
    auto outcome = session.subscribe({"prices"}, protocol::subscription::PairSet{"SOL/USDT"});
    std::cout << "[arbwire] subscribe(prices, SOL/USDT) before connect -> " << protocol::subscription::to_string(outcome) << std::endl;

    if (session.connect(url) != transport::Error::None) {
        std::cerr << "[arbwire] Failed to connect" << std::endl;
        return 1;
    }

    // Wait for the first opportunity
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
    while (session.ranked_opportunities(Session::wall_clock_ms()).empty() && std::chrono::steady_clock::now() < deadline) {
        session.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const auto ranked = session.ranked_opportunities(Session::wall_clock_ms());
    if (ranked.empty()) {
        std::cerr << "[arbwire] No opportunity observed" << std::endl;
        session.close();
        return 1;
    }
    const auto& best = ranked.front();
    std::cout << "[arbwire] Best: " << best << std::endl;

    r = session.send_intent(intent::ExecuteArbitrage{.opportunity_id = best.id, .amount = 1000.0, .slippage = 0.5});
    std::cout << "[arbwire] execute_arbitrage -> " << protocol::dispatch::to_string(r) << std::endl;

    r = session.send_intent(intent::WalletConnect{.wallet_type = "phantom", .address = "DemoWa11et1111111111111111111111111111111111"});
    std::cout << "[arbwire] wallet_connect -> " << protocol::dispatch::to_string(r) << std::endl;

    // Subscription already covered by the defaults: nothing sent
    outcome = session.subscribe({"opportunities"});
    std::cout << "[arbwire] subscribe(opportunities) again -> " << protocol::subscription::to_string(outcome) << std::endl;

    const auto reply_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (session.executions().empty() && std::chrono::steady_clock::now() < reply_deadline) {
        session.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    arbwire::core::loop::print_alerts(session);

    outcome = session.unsubscribe({"mev", "depth"});
    std::cout << "[arbwire] unsubscribe(mev, depth) -> " << protocol::subscription::to_string(outcome) << std::endl;

    const bool ok = !session.executions().empty() && session.executions().contains(best.id);
    session.close();
    std::cout << "[arbwire] Intents demo " << (ok ? "PASSED" : "FAILED (no execution reply)") << std::endl;
    return ok ? 0 : 1;
}

int main(int argc, char** argv) {
    using namespace arbwire::core;

    auto params = arbwire::cli::minimal::configure(argc, argv, "arbwire intents demo");
    params.dump("=== Intents Parameters ===", std::cout);
    arbwire::examples::enable_color();

    if (params.simulate) {
        protocol::SimulatedSessionT session;
        return run(session, params.url);
    }
    protocol::LiveSessionT session;
    return run(session, params.url);
}
