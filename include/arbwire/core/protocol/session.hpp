/*
===============================================================================
arbwire protocol Session
===============================================================================

Composition root of the live data synchronization layer.

Architecture:
  - transport::*              → WebSocket transport (Boost.Beast, simulated feed, mocks)
  - transport::Connection     → connection lifecycle FSM
                                 • open / close
                                 • reconnection with exponential backoff
                                 • raw frame delivery
  - protocol::parser::Router  → message classification into retention stores
  - subscription::Registry    → channel subscriptions replayed on reconnect
  - protocol::Dispatcher      → outbound commands gated on connection state
  - arbitrage::Scanner        → opportunities derived from the quote store

The Session:
  - Owns exactly one Connection and every store
  - Replays the subscription registry on every successful handshake
  - Runs the scanner once per poll() for the pairs touched in that poll
  - Exposes typed state, never transport hooks

Data-plane model:
  - One cooperative loop: everything happens inside poll()
  - Stores are read through snapshot() from any thread, or through
    entries() on the poll thread
  - No callbacks, observers, or implicit dispatch
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "arbwire/core/config/ring_sizes.hpp"
#include "arbwire/core/transport/connection.hpp"
#include "arbwire/core/transport/telemetry/connection.hpp"
#include "arbwire/core/protocol/context.hpp"
#include "arbwire/core/protocol/dispatcher.hpp"
#include "arbwire/core/protocol/parser/router.hpp"
#include "arbwire/core/protocol/subscription/outcome.hpp"
#include "arbwire/core/protocol/subscription/registry.hpp"
#include "arbwire/core/protocol/schema/intent/intent.hpp"
#include "arbwire/core/arbitrage/config.hpp"
#include "arbwire/core/arbitrage/scanner.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace arbwire::core {
namespace protocol {

struct SessionConfig {
    transport::connection::RetryPolicy retry{};
    arbitrage::Config scanner{};
    bool scan_locally{true};        // derive opportunities from the quote store

    inline void dump(std::ostream& os) const {
        os << "[SESSION CONFIG]\n"
           << "  " << retry << "\n"
           << "  " << scanner << "\n"
           << "  local scan: " << (scan_locally ? "on" : "off");
    }
};

inline std::ostream& operator<<(std::ostream& os, const SessionConfig& c) {
    c.dump(os);
    return os;
}

template<
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class Session {
public:
    using connection_type = transport::Connection<WS, Clock>;

    explicit Session(SessionConfig cfg = {}, typename WS::Options ws_options = {})
        : cfg_(cfg)
        , connection_(telemetry_, cfg.retry, std::move(ws_options))
        , ctx_view_(ctx_)
        , router_(ctx_view_)
        , dispatcher_(connection_)
        , scanner_(cfg.scanner)
    {
        ctx_.opportunity_ttl = cfg.scanner.expiry;
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // open connection
    [[nodiscard]]
    inline transport::Error connect(const std::string& url) {
        return connection_.open(url);
    }

    // close connection, cancels any pending reconnect
    inline void close() {
        connection_.close();
    }

    // -----------------------------------------------------------------------------
    // Event loop
    // -----------------------------------------------------------------------------
    // One step of the cooperative loop:
    //   1) connection progress (control events, reconnect timer)
    //   2) connection signals (replay on Connected)
    //   3) up to MAX_FRAMES_PER_POLL inbound frames, classified in arrival order
    //   4) one scan over the pairs touched by this batch
    // Returns the transport epoch.
    inline std::uint64_t poll() {
        return poll(wall_clock_ms());
    }

    // Same as poll(), with an explicit receive time (epoch ms)
    inline std::uint64_t poll(std::int64_t now_ms) {
        connection_.poll();

        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_connection_signal_(sig);
        }

        std::size_t frames = 0;
        while (frames < config::MAX_FRAMES_PER_POLL && connection_.poll_message(frame_)) {
            ++frames;
            (void)router_.parse_and_route(frame_, now_ms);
        }

        if (cfg_.scan_locally && !ctx_.dirty_pairs.empty()) {
            scan_(now_ms);
        }
        ctx_.dirty_pairs.clear();

        ctx_.stats.reconnect_attempts = static_cast<std::uint32_t>(connection_.reconnect_attempts());
        return connection_.epoch();
    }

    // -----------------------------------------------------------------------------
    // Subscriptions
    // -----------------------------------------------------------------------------
    // The registry is updated regardless of the connection state. Commands are
    // sent only while Connected; otherwise the next handshake replays them.

    [[nodiscard]]
    inline subscription::Outcome subscribe(const std::vector<std::string>& channels,
                                           const lcr::optional<subscription::PairSet>& pairs = {}) {
        auto delta = registry_.subscribe(channels, pairs);
        return flush_(delta);
    }

    [[nodiscard]]
    inline subscription::Outcome unsubscribe(const std::vector<std::string>& channels) {
        auto delta = registry_.unsubscribe(channels);
        return flush_(delta);
    }

    // -----------------------------------------------------------------------------
    // Outbound intents
    // -----------------------------------------------------------------------------
    template <schema::intent::Intent IntentT>
    [[nodiscard]]
    inline dispatch::Result send_intent(const IntentT& intent) {
        return dispatcher_.send_intent(intent);
    }

    // -----------------------------------------------------------------------------
    // State access
    // -----------------------------------------------------------------------------

    // Non-expired opportunities, best first
    [[nodiscard]]
    inline std::vector<schema::Opportunity> ranked_opportunities(std::int64_t now_ms) const {
        std::vector<schema::Opportunity> out;
        out.reserve(ctx_.opportunities.size());
        for (const auto& opp : ctx_.opportunities.entries()) {
            if (!arbitrage::is_expired(opp, now_ms)) {
                out.push_back(opp);
            }
        }
        arbitrage::Scanner::rank(out);
        return out;
    }

    [[nodiscard]] inline const QuoteStore& quotes() const noexcept { return ctx_.quotes; }
    [[nodiscard]] inline const OpportunityStore& opportunities() const noexcept { return ctx_.opportunities; }
    [[nodiscard]] inline const MevStore& mev_alerts() const noexcept { return ctx_.mev_alerts; }
    [[nodiscard]] inline const DepthStore& depth() const noexcept { return ctx_.depth; }
    [[nodiscard]] inline const ExecutionStore& executions() const noexcept { return ctx_.executions; }

    [[nodiscard]]
    inline const Stats& stats() const noexcept {
        return ctx_.stats;
    }

    [[nodiscard]]
    inline const subscription::Registry& registry() const noexcept {
        return registry_;
    }

    [[nodiscard]]
    inline const arbitrage::Scanner& scanner() const noexcept {
        return scanner_;
    }

    inline void set_scanner_config(const arbitrage::Config& cfg) noexcept {
        cfg_.scanner = cfg;
        scanner_.set_config(cfg);
        ctx_.opportunity_ttl = cfg.expiry;
    }

    [[nodiscard]]
    inline transport::ConnectionState state() const noexcept {
        return connection_.state();
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return connection_.is_connected();
    }

    [[nodiscard]]
    inline bool has_pending_retry() const noexcept {
        return connection_.has_pending_retry();
    }

    [[nodiscard]]
    inline std::chrono::milliseconds next_retry_in() const noexcept {
        return connection_.next_retry_in();
    }

    [[nodiscard]]
    inline std::uint64_t transport_epoch() const noexcept {
        return connection_.epoch();
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return connection_.rx_messages();
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return connection_.tx_messages();
    }

    [[nodiscard]]
    inline const transport::telemetry::Connection& telemetry() const noexcept {
        return telemetry_;
    }

    [[nodiscard]]
    static inline std::int64_t wall_clock_ms() noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

#ifdef AW_UNIT_TEST
public:
    connection_type& connection() {
        return connection_;
    }

    WS& ws() {
        return connection_.ws();
    }

    Context& context() {
        return ctx_;
    }
#endif // AW_UNIT_TEST

private:
    SessionConfig cfg_;

    transport::telemetry::Connection telemetry_;
    connection_type connection_;

    Context ctx_;
    ContextView ctx_view_;
    parser::Router router_;

    subscription::Registry registry_;
    Dispatcher<connection_type> dispatcher_;

    arbitrage::Scanner scanner_;

    // Reused receive buffer
    std::string frame_;

private:
    inline void handle_connect_() {
        AW_TRACE("[SESSION] handle connect (transport_epoch = " << transport_epoch() << ")");
        registry_.ensure_defaults();
        const auto commands = registry_.replay();
        AW_DEBUG("[REPLAY] Replaying " << commands.size() << " subscription command(s) over " << registry_.size() << " channel(s)");
        for (const auto& cmd : commands) {
            const auto r = dispatcher_.send_subscription(cmd);
            if (r != dispatch::Result::Sent) {
                AW_WARN("[REPLAY] Subscription replay interrupted (" << dispatch::to_string(r) << ")");
                break;
            }
        }
    }

    inline void handle_connection_signal_(transport::connection::Signal sig) {
        switch (sig) {
        case transport::connection::Signal::Connected:
            handle_connect_();
            break;
        case transport::connection::Signal::Disconnected:
            AW_TRACE("[SESSION] handle disconnect (transport_epoch = " << transport_epoch() << ")");
            break;
        case transport::connection::Signal::RetryScheduled:
            break;
        case transport::connection::Signal::RetryExhausted:
            AW_ERROR("[SESSION] Connection lost for good, call connect() to start over.");
            break;
        default:
            break;
        }
    }

    [[nodiscard]]
    inline subscription::Outcome flush_(const lcr::optional<schema::request::Subscription>& delta) {
        if (!delta.has()) {
            return subscription::Outcome::Unchanged;
        }
        if (!connection_.is_connected()) {
            AW_DEBUG("[SUBS] Not connected, '" << schema::request::to_string(delta.value().action) << "' deferred to next handshake.");
            return subscription::Outcome::Pending;
        }
        switch (dispatcher_.send_subscription(delta.value())) {
            case dispatch::Result::Sent:
                return subscription::Outcome::Sent;
            case dispatch::Result::NotConnected:
                return subscription::Outcome::Pending;
            default:
                return subscription::Outcome::SendFailed;
        }
    }

    // Best record ends at the front of the most-recent-first store
    inline void scan_(std::int64_t now_ms) {
        auto found = scanner_.scan_all(ctx_.dirty_pairs, ctx_.quotes.entries(), now_ms);
        for (auto it = found.rbegin(); it != found.rend(); ++it) {
            (void)ctx_.opportunities.upsert(std::move(*it));
        }
        if (!found.empty()) {
            AW_DEBUG("[SCANNER] " << found.size() << " opportunit" << (found.size() == 1 ? "y" : "ies")
                     << " over " << ctx_.dirty_pairs.size() << " pair(s)");
        }
    }
};

} // namespace protocol
} // namespace arbwire::core
