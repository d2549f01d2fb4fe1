#pragma once

#include <chrono>
#include <set>
#include <string>

#include "arbwire/core/config/scanner.hpp"
#include "arbwire/core/protocol/stats.hpp"
#include "arbwire/core/protocol/stores.hpp"


namespace arbwire::core::protocol {

/*
===============================================================================
Context (OWNING STORE)
===============================================================================

Owns all parser-visible state:
- Retention stores, one per data kind
- Session statistics
- Pairs touched by price updates since the last scan
- Lifetime given to server opportunities without expires_at

The Context lifetime is controlled by the Session.
Parsers NEVER own this object, they only receive ContextView.
===============================================================================
*/
struct Context {
    QuoteStore quotes{};
    OpportunityStore opportunities{};
    MevStore mev_alerts{};
    DepthStore depth{};
    ExecutionStore executions{};

    Stats stats{};

    // Pairs with new quotes, consumed by the scanner on the next poll
    std::set<std::string> dirty_pairs{};

    // Configuration, survives clear()
    std::chrono::milliseconds opportunity_ttl{config::OPPORTUNITY_TTL};

    Context() = default;
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    inline void clear() {
        quotes.clear();
        opportunities.clear();
        mev_alerts.clear();
        depth.clear();
        executions.clear();
        dirty_pairs.clear();
        stats = Stats{};
    }
};


/*
===============================================================================
Parser ContextView (Non-owning)
===============================================================================

Lightweight, non-nullable view over Context.
Passed to the router.

- No ownership
- No heap
- No null checks
- Enforced validity at construction
===============================================================================
*/
struct ContextView {
    QuoteStore& quotes;
    OpportunityStore& opportunities;
    MevStore& mev_alerts;
    DepthStore& depth;
    ExecutionStore& executions;

    Stats& stats;

    std::set<std::string>& dirty_pairs;

    const std::chrono::milliseconds& opportunity_ttl;

    // ------------------------------------------------------------
    // Construction from owning Context
    // ------------------------------------------------------------
    explicit ContextView(Context& ctx) noexcept
        : quotes(ctx.quotes)
        , opportunities(ctx.opportunities)
        , mev_alerts(ctx.mev_alerts)
        , depth(ctx.depth)
        , executions(ctx.executions)
        , stats(ctx.stats)
        , dirty_pairs(ctx.dirty_pairs)
        , opportunity_ttl(ctx.opportunity_ttl)
    {}
};

} // namespace arbwire::core::protocol
