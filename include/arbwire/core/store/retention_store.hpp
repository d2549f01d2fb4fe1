#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include "arbwire/core/store/ordering.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core::store {

// Key function tag: every item is a new entry (no deduplication)
struct no_identity {};

// Default supersede rule: a newer message always replaces the stored entry
struct always_replace {
    template <class T>
    [[nodiscard]] constexpr bool operator()(const T&, const T&) const noexcept {
        return true;
    }
};

/*
===============================================================================
 store::RetentionStore
===============================================================================

Bounded, identity-deduplicated, ordered collection used for every data kind
the session retains (quotes, opportunities, MEV alerts, depth, executions).

Template parameters:
  T          - stored record (copyable)
  KeyFn      - functor T -> key, or store::no_identity
  Order      - where new / updated entries go and which end is evicted
  Capacity   - hard upper bound on size()
  Supersedes - predicate (existing, incoming) -> bool deciding whether an
               update for a known key replaces the stored entry

Invariants:
  - size() <= Capacity at all times
  - a key appears at most once
  - a Snapshot never changes after it was handed out

Threading:
  Mutations and find() belong to the owner (poll) thread. snapshot() may be
  called from any thread; each mutation publishes a fresh immutable vector
  under a mutex.
===============================================================================
*/
template <
    class T,
    class KeyFn,
    Ordering Order,
    std::size_t Capacity,
    class Supersedes = always_replace
>
class RetentionStore {
    static_assert(Capacity > 0, "RetentionStore capacity must be positive");

public:
    using value_type = T;
    using Snapshot   = std::shared_ptr<const std::vector<T>>;

    static constexpr bool has_identity = !std::is_same_v<KeyFn, no_identity>;
    static constexpr std::size_t capacity = Capacity;
    static constexpr Ordering ordering = Order;

    RetentionStore()
        : snapshot_(std::make_shared<const std::vector<T>>())
    {
        entries_.reserve(Capacity + 1);
    }

    RetentionStore(const RetentionStore&) = delete;
    RetentionStore& operator=(const RetentionStore&) = delete;

    // Insert a new entry or replace the one sharing its key, then enforce the cap
    [[nodiscard]]
    inline UpsertResult upsert(T item) {
        UpsertResult result = UpsertResult::Inserted;
        if constexpr (has_identity) {
            auto it = find_(KeyFn{}(item));
            if (it != entries_.end()) {
                if (!Supersedes{}(*it, item)) {
                    return UpsertResult::Stale;
                }
                entries_.erase(it);
                result = UpsertResult::Replaced;
            }
        }
        if constexpr (Order == Ordering::MostRecentFirst) {
            entries_.insert(entries_.begin(), std::move(item));
        }
        else {
            entries_.push_back(std::move(item));
        }
        // Evict the oldest entries
        while (entries_.size() > Capacity) {
            if constexpr (Order == Ordering::MostRecentFirst) {
                entries_.pop_back();
            }
            else {
                entries_.erase(entries_.begin());
            }
            ++evicted_total_;
        }
        publish_();
        return result;
    }

    template <class Key>
        requires has_identity
    [[nodiscard]]
    inline lcr::optional<T> find(const Key& key) const {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const T& e) { return KeyFn{}(e) == key; });
        if (it == entries_.end()) {
            return {};
        }
        return *it;
    }

    template <class Key>
        requires has_identity
    [[nodiscard]]
    inline bool contains(const Key& key) const {
        return find_(key) != entries_.end();
    }

    // Immutable view, safe to hold and read from any thread
    [[nodiscard]]
    inline Snapshot snapshot() const {
        std::lock_guard lock(mutex_);
        return snapshot_;
    }

    // Owner-thread view of the live entries
    [[nodiscard]]
    inline const std::vector<T>& entries() const noexcept {
        return entries_;
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return entries_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return entries_.empty();
    }

    [[nodiscard]]
    inline std::uint64_t evicted_total() const noexcept {
        return evicted_total_;
    }

    inline void clear() {
        entries_.clear();
        publish_();
    }

private:
    std::vector<T> entries_;
    std::uint64_t evicted_total_{0};

    mutable std::mutex mutex_;
    Snapshot snapshot_;

    template <class Key>
    inline auto find_(const Key& key) {
        return std::find_if(entries_.begin(), entries_.end(), [&](const T& e) { return KeyFn{}(e) == key; });
    }

    template <class Key>
    inline auto find_(const Key& key) const {
        return std::find_if(entries_.begin(), entries_.end(), [&](const T& e) { return KeyFn{}(e) == key; });
    }

    inline void publish_() {
        auto next = std::make_shared<const std::vector<T>>(entries_);
        std::lock_guard lock(mutex_);
        snapshot_ = std::move(next);
    }
};

} // namespace arbwire::core::store
