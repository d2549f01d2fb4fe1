#pragma once

#include <thread>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <iostream>

#include "arbwire/core.hpp"
#include "lcr/format.hpp"


namespace arbwire::core::loop {

// Manages idle spins to avoid busy-waiting.
// If no work was done, it increments idle_spins. Once idle_spins exceeds
// max_idle_spins, it sleeps for a millisecond and resets the counter.
inline void manage_idle_spins(bool& did_work, int& idle_spins, int max_idle_spins = 100) {
    if (did_work) {
        idle_spins = 0;
        did_work = false;
    } else {
        if (++idle_spins > max_idle_spins) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            idle_spins = 0;
        }
    }
}

// -----------------------------------------------------------------------------
// Print the best non-expired opportunities
// -----------------------------------------------------------------------------
template<typename Session>
inline void print_ranked(const Session& session, std::int64_t now_ms, std::size_t top) {
    const auto ranked = session.ranked_opportunities(now_ms);
    std::cout << "\n--- " << ranked.size() << " live opportunit" << (ranked.size() == 1 ? "y" : "ies")
              << " (" << session.quotes().size() << " quotes) ---" << std::endl;
    std::size_t n = 0;
    for (const auto& opp : ranked) {
        if (n++ == top) {
            break;
        }
        std::cout << " " << n << ". " << opp.pair
                  << "  buy " << opp.buy.exchange << " @ " << lcr::format_price(opp.buy.price)
                  << "  sell " << opp.sell.exchange << " @ " << lcr::format_price(opp.sell.price)
                  << "  profit " << lcr::format_percent(opp.profit_percentage)
                  << "  net " << lcr::format_percent(opp.net_profit)
                  << "  conf " << static_cast<int>(opp.confidence)
                  << "  risk " << to_string(opp.risk_level) << std::endl;
    }
}

// -----------------------------------------------------------------------------
// Print the latest MEV alerts and execution updates
// -----------------------------------------------------------------------------
template<typename Session>
inline void print_alerts(const Session& session) {
    for (const auto& alert : session.mev_alerts().entries()) {
        std::cout << " -> " << alert << std::endl;
    }
    for (const auto& update : session.executions().entries()) {
        std::cout << " -> " << update << std::endl;
    }
}

} // namespace arbwire::core::loop
