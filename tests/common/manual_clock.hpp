#pragma once

#include <chrono>

#include "arbwire/core/transport/clock.hpp"


namespace arbwire::core::transport::test {

// -----------------------------------------------------------------------------
// ManualClock
// -----------------------------------------------------------------------------
// Process-wide clock that only moves when a test advances it. Lets the
// reconnect timer be asserted to the millisecond without sleeping.
struct ManualClock {
    using duration   = std::chrono::steady_clock::duration;
    using rep        = duration::rep;
    using period     = duration::period;
    using time_point = std::chrono::time_point<ManualClock, duration>;
    static constexpr bool is_steady = true;

    static time_point now() noexcept {
        return now_;
    }

    static void advance(std::chrono::milliseconds d) noexcept {
        now_ += std::chrono::duration_cast<duration>(d);
    }

    static void reset() noexcept {
        now_ = time_point{} + std::chrono::hours(1);
    }

private:
    static inline time_point now_{time_point{} + std::chrono::hours(1)};
};

static_assert(ClockConcept<ManualClock>);

} // namespace arbwire::core::transport::test
