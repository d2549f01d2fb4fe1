#pragma once

#include <chrono>
#include <algorithm>
#include <ostream>

#include "arbwire/core/config/protocol.hpp"


namespace arbwire::core::transport::connection {

// -----------------------------------------------------------------------------
// Reconnect policy
// -----------------------------------------------------------------------------
// delay(n) = min(base_delay * 2^n, max_delay), where n is the number of
// reconnect attempts already scheduled since the last successful connection.
// Once n reaches max_attempts the connection stops retrying.
struct RetryPolicy {
    std::chrono::milliseconds base_delay{config::RETRY_BASE_DELAY};
    std::chrono::milliseconds max_delay{config::RETRY_MAX_DELAY};
    int max_attempts{config::RETRY_MAX_ATTEMPTS};

    inline void dump(std::ostream& os) const {
        os << "[RETRY] { base=" << base_delay.count() << "ms"
           << ", max=" << max_delay.count() << "ms"
           << ", attempts=" << max_attempts << " }";
    }
};

inline std::ostream& operator<<(std::ostream& os, const RetryPolicy& p) {
    p.dump(os);
    return os;
}

// Backoff delay for the given number of prior attempts
[[nodiscard]]
inline constexpr std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempts) noexcept {
    if (attempts < 0) {
        attempts = 0;
    }
    // Past 2^20 every realistic base already exceeds the cap
    attempts = std::min(attempts, 20);
    const auto delay = policy.base_delay * (1LL << attempts);
    return std::min<std::chrono::milliseconds>(delay, policy.max_delay);
}

static_assert(backoff_delay(RetryPolicy{}, 0) == std::chrono::milliseconds{3000});
static_assert(backoff_delay(RetryPolicy{}, 3) == std::chrono::milliseconds{24000});
static_assert(backoff_delay(RetryPolicy{}, 4) == std::chrono::milliseconds{30000});

} // namespace arbwire::core::transport::connection
