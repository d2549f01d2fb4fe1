#pragma once

#include <cstddef>


namespace arbwire::core::config {

// ===============================================
// Retention store capacities
// ===============================================
// Every data kind is retained in a bounded store. Once a store is full the
// oldest entry is evicted on the next insertion.

inline constexpr std::size_t QUOTE_STORE_CAPACITY       = 100; // one live quote per (pair, exchange)
inline constexpr std::size_t OPPORTUNITY_STORE_CAPACITY = 20;  // most recent first, unique id
inline constexpr std::size_t MEV_STORE_CAPACITY         = 10;  // most recent first
inline constexpr std::size_t DEPTH_STORE_CAPACITY       = 5;   // most recent first, no identity
inline constexpr std::size_t EXECUTION_STORE_CAPACITY   = 20;  // one status per opportunity id

} // namespace arbwire::core::config
