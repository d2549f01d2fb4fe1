#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::store {

// ===============================================
// RETENTION ORDERING
// ===============================================
// MostRecentFirst : new and updated entries move to the front, eviction from the back
// InsertionOrder  : new and updated entries move to the back, eviction from the front
enum class Ordering : std::uint8_t {
    MostRecentFirst,
    InsertionOrder
};

[[nodiscard]]
inline constexpr std::string_view to_string(Ordering o) noexcept {
    switch (o) {
        case Ordering::MostRecentFirst: return "MostRecentFirst";
        case Ordering::InsertionOrder:  return "InsertionOrder";
        default:                        return "Unknown";
    }
}

// ===============================================
// UPSERT RESULT
// ===============================================
enum class UpsertResult : std::uint8_t {
    Inserted,   // new identity (may have evicted the oldest entry)
    Replaced,   // existing identity updated in place of the old entry
    Stale       // existing identity kept, incoming item rejected by the supersede rule
};

[[nodiscard]]
inline constexpr std::string_view to_string(UpsertResult r) noexcept {
    switch (r) {
        case UpsertResult::Inserted: return "Inserted";
        case UpsertResult::Replaced: return "Replaced";
        case UpsertResult::Stale:    return "Stale";
        default:                     return "Unknown";
    }
}

} // namespace arbwire::core::store
