#pragma once

#include <chrono>
#include <ostream>

#include "arbwire/core/config/scanner.hpp"
#include "lcr/format.hpp"


namespace arbwire::core::arbitrage {

// Runtime scanner parameters. Defaults come from config/scanner.hpp.
struct Config {
    double min_profit_percentage{config::MIN_PROFIT_PERCENTAGE};
    double default_fee_percentage{config::DEFAULT_FEE_PERCENTAGE};  // both sides together
    double required_capital{config::REQUIRED_CAPITAL};
    std::chrono::milliseconds expiry{config::OPPORTUNITY_TTL};
    double confidence_cap{config::CONFIDENCE_CAP};

    inline void dump(std::ostream& os) const {
        os << "[SCANNER CONFIG] { min_profit=" << lcr::format_percent(min_profit_percentage)
           << ", default_fee=" << lcr::format_percent(default_fee_percentage)
           << ", capital=" << required_capital
           << ", expiry=" << lcr::format_duration(expiry)
           << ", confidence_cap=" << confidence_cap << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Config& c) {
    c.dump(os);
    return os;
}

} // namespace arbwire::core::arbitrage
