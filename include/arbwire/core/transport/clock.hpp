#pragma once

#include <chrono>
#include <concepts>


namespace arbwire::core::transport {

// -----------------------------------------------------------------------------
// ClockConcept
// -----------------------------------------------------------------------------
//
// Time source used by Connection for reconnect scheduling.
// Production code uses std::chrono::steady_clock. Tests inject a manual clock
// so backoff delays can be asserted without sleeping.
//
// -----------------------------------------------------------------------------

template<class Clock>
concept ClockConcept =
    requires {
        typename Clock::time_point;
        typename Clock::duration;
        { Clock::now() } -> std::same_as<typename Clock::time_point>;
    };

static_assert(ClockConcept<std::chrono::steady_clock>);

} // namespace arbwire::core::transport
