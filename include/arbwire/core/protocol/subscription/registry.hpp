// ============================================================================
// Subscription Registry
// ============================================================================
//
// Stores the channel subscriptions the client wants to hold, so that they can
// be deterministically replayed after a transport reconnect.
//
// • Keyed by channel name, one entry per channel
// • An entry without a pair set means "every pair"
// • Widening only: subscribe() unions pair sets, an "every pair" request
//   overrides any explicit set
// • Delta-driven: subscribe() / unsubscribe() return the command covering
//   the entries that actually changed, nothing when the request is already
//   covered
// • Replay groups entries by identical pair set, one command per group, in
//   channel-name order
//
// The registry never touches the transport. The Session decides whether a
// returned command is sent now (Connected) or left to the next replay.
//
// Owned and used exclusively by the Session event loop. Not thread-safe.
// ============================================================================

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <utility>
#include <string_view>

#include "arbwire/core/config/protocol.hpp"
#include "arbwire/core/protocol/schema/request/subscription.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core::protocol::subscription {

using PairSet = std::set<std::string>;

// One registry entry
struct Subscription {
    std::string channel;
    lcr::optional<PairSet> pairs{};     // absent = every pair
};

class Registry {
public:
    Registry() = default;

    // Add or widen entries. Returns the subscribe command for the changed
    // channels, or nothing when every channel was already covered.
    [[nodiscard]]
    inline lcr::optional<schema::request::Subscription> subscribe(const std::vector<std::string>& channels, const lcr::optional<PairSet>& pairs) {
        schema::request::Subscription delta;
        delta.action = schema::request::Action::Subscribe;
        if (pairs.has()) {
            delta.pairs = pairs.value();
        }
        for (const auto& channel : channels) {
            if (channel.empty()) {
                continue;
            }
            if (merge_(channel, pairs)) {
                delta.channels.push_back(channel);
            }
        }
        if (delta.channels.empty()) {
            AW_DEBUG("[SUBS] Subscribe request already covered -> nothing to send.");
            return {};
        }
        return delta;
    }

    // Remove entries. Returns the unsubscribe command for the channels that
    // were actually registered.
    [[nodiscard]]
    inline lcr::optional<schema::request::Subscription> unsubscribe(const std::vector<std::string>& channels) {
        schema::request::Subscription delta;
        delta.action = schema::request::Action::Unsubscribe;
        for (const auto& channel : channels) {
            if (entries_.erase(channel) > 0) {
                delta.channels.push_back(channel);
            }
        }
        if (delta.channels.empty()) {
            AW_DEBUG("[SUBS] Unsubscribe request matched no entry -> nothing to send.");
            return {};
        }
        return delta;
    }

    // Register the default channel set for every pair.
    // Existing entries are widened, never narrowed.
    inline void ensure_defaults() {
        for (std::string_view channel : config::DEFAULT_CHANNELS) {
            (void)merge_(std::string(channel), lcr::optional<PairSet>{});
        }
    }

    // One subscribe command per distinct pair set, in channel-name order
    [[nodiscard]]
    inline std::vector<schema::request::Subscription> replay() const {
        std::vector<schema::request::Subscription> out;
        for (const auto& [channel, pairs] : entries_) {
            auto it = out.begin();
            for (; it != out.end(); ++it) {
                if (it->pairs == pairs) {
                    break;
                }
            }
            if (it == out.end()) {
                schema::request::Subscription cmd;
                cmd.action = schema::request::Action::Subscribe;
                cmd.pairs = pairs;
                out.push_back(std::move(cmd));
                it = std::prev(out.end());
            }
            it->channels.push_back(channel);
        }
        return out;
    }

    [[nodiscard]]
    inline bool contains(const std::string& channel) const {
        return entries_.find(channel) != entries_.end();
    }

    [[nodiscard]]
    inline lcr::optional<Subscription> find(const std::string& channel) const {
        auto it = entries_.find(channel);
        if (it == entries_.end()) {
            return {};
        }
        return Subscription{it->first, it->second};
    }

    [[nodiscard]]
    inline std::vector<Subscription> entries() const {
        std::vector<Subscription> out;
        out.reserve(entries_.size());
        for (const auto& [channel, pairs] : entries_) {
            out.push_back(Subscription{channel, pairs});
        }
        return out;
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return entries_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return entries_.empty();
    }

    inline void clear() noexcept {
        entries_.clear();
    }

private:
    std::map<std::string, lcr::optional<PairSet>> entries_;

private:
    // Returns true when the entry for `channel` changed
    inline bool merge_(const std::string& channel, const lcr::optional<PairSet>& pairs) {
        auto it = entries_.find(channel);
        if (it == entries_.end()) {
            entries_.emplace(channel, pairs);
            return true;
        }
        auto& current = it->second;
        if (!current.has()) {
            return false;   // already every pair
        }
        if (!pairs.has()) {
            current.reset();
            return true;
        }
        bool changed = false;
        for (const auto& p : pairs.value()) {
            changed |= current.value().insert(p).second;
        }
        return changed;
    }
};

} // namespace arbwire::core::protocol::subscription
