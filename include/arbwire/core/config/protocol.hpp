#pragma once

#include <array>
#include <chrono>
#include <string_view>


namespace arbwire::core::config {

// Default endpoint of the arbitrage feed server
inline constexpr std::string_view DEFAULT_URL = "ws://localhost:3002/";

// Channels subscribed on every successful connection
inline constexpr std::array<std::string_view, 5> DEFAULT_CHANNELS = {
    "prices", "opportunities", "mev", "depth", "alpha"
};

// Reconnect policy defaults
inline constexpr std::chrono::milliseconds RETRY_BASE_DELAY{3000};
inline constexpr std::chrono::milliseconds RETRY_MAX_DELAY{30000};
inline constexpr int RETRY_MAX_ATTEMPTS = 5;

// Envelope timestamps below this value are read as epoch seconds
inline constexpr long long EPOCH_SECONDS_LIMIT = 100'000'000'000LL;

} // namespace arbwire::core::config
