#pragma once

#include <chrono>


namespace arbwire::core::config {

// Arbitrage scanner defaults
inline constexpr double MIN_PROFIT_PERCENTAGE   = 0.1;     // emit only above this spread (percent)
inline constexpr double DEFAULT_FEE_PERCENTAGE  = 0.1;     // aggregate fee when a side does not report one
inline constexpr double REQUIRED_CAPITAL        = 10000.0; // quote currency
inline constexpr double CONFIDENCE_BASE         = 50.0;
inline constexpr double CONFIDENCE_PER_PROFIT   = 10.0;    // points per profit percent
inline constexpr double CONFIDENCE_LIQUIDITY_UNIT = 1e6;   // one point per unit of min liquidity
inline constexpr double CONFIDENCE_CAP          = 95.0;
inline constexpr std::chrono::milliseconds OPPORTUNITY_TTL{60000};

// Risk level by gross profit percentage: above LOW -> low, above MEDIUM -> medium, else high
inline constexpr double RISK_LOW_PROFIT_ABOVE    = 1.5;
inline constexpr double RISK_MEDIUM_PROFIT_ABOVE = 0.8;

} // namespace arbwire::core::config
