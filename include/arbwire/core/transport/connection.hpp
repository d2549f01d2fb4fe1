#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <utility>

#include "arbwire/core/transport/websocket_concept.hpp"
#include "arbwire/core/transport/clock.hpp"
#include "arbwire/core/transport/telemetry/connection.hpp"
#include "arbwire/core/transport/parse_url.hpp"
#include "arbwire/core/transport/state.hpp"
#include "arbwire/core/transport/connection/signal.hpp"
#include "arbwire/core/transport/connection/retry.hpp"
#include "arbwire/core/transport/websocket/events.hpp"
#include "arbwire/core/config/ring_sizes.hpp"
#include "arbwire/core/telemetry.hpp"
#include "lcr/optional.hpp"
#include "lcr/format.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::transport {

/*
===============================================================================
 arbwire::core::transport::Connection
===============================================================================

Generic transport-level connection abstraction, parameterized by a WebSocket
transport implementation conforming to transport::WebSocketConcept and by a
time source conforming to transport::ClockConcept.

A Connection represents a *logical* connection whose identity remains stable
across transport failures and automatic reconnections. It knows nothing about
message formats; the protocol layer (protocol::Session) composes it.

-------------------------------------------------------------------------------
 Lifecycle
-------------------------------------------------------------------------------

            open()                 handshake ok
  Disconnected ----> Connecting ----------------> Connected
       ^  ^              |                          |  |  |
       |  |              | handshake failed         |  |  | clean close
       |  |              v                          |  |  +------------> Disconnected
       |  |            Error <----------------------+  |                 (no retry)
       |  |              |      transport error        |
       |  |              |                             | abnormal close
       |  +--------------)-----------------------------+  -> Disconnected + retry
       |                 |
       +-- close() ------+   (from any state, cancels the retry timer)

- Every abnormal termination runs the retry policy: while
  reconnect_attempts < max_attempts a timer is armed for
  min(base * 2^reconnect_attempts, max) and the counter is incremented.
- When the budget is spent the connection stays in Error with no timer armed
  (terminal) and emits Signal::RetryExhausted. Only open() recovers it.
- A successful handshake resets reconnect_attempts to zero and increments the
  transport epoch.

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
- Call open(url) to activate the connection
- Drive all progress by calling poll() regularly
- Pull frames with poll_message(), edges with poll_signal()
- No background threads; all logic is poll-driven on the caller thread

===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class Connection {
public:
    using time_point = typename Clock::time_point;

    explicit Connection(telemetry::Connection& telemetry,
                        connection::RetryPolicy policy = {},
                        typename WS::Options ws_options = {}) noexcept
        : telemetry_(telemetry)
        , policy_(policy)
        , ws_options_(std::move(ws_options))
    {}

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Connection() {
        if (ws_) {
            ws_->close();
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Connection lifecycle
    [[nodiscard]]
    inline Error open(const std::string& url) noexcept {
        AW_DEBUG("[CONN] Connecting to: " << url);
        AW_TL1( telemetry_.open_calls_total.inc() );

        // --- Synchronous preconditions (must succeed before FSM starts) ---

        // 0) PRECONDITION: must be disconnected or in error
        if (state_ != ConnectionState::Disconnected && state_ != ConnectionState::Error) {
            AW_WARN("[CONN] open() called while " << to_string(state_) << ". Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl tmp;
        const Error err = parse_url(url, tmp);
        if (err != Error::None) {
            AW_ERROR("[CONN] Invalid URL '" << url << "'");
            return err;
        }
        last_url_ = url;
        parsed_url_ = std::move(tmp);
        // 2) Explicit open grants a fresh retry budget
        retry_attempts_ = 0;
        // 3) Enter FSM and attempt the handshake
        transition_(Event::OpenRequested);
        return connect_();
    }

    // Manual disconnect - close() performs an unconditional shutdown and
    // cancels any pending reconnection attempt before returning.
    inline void close() noexcept {
        AW_TL1( telemetry_.close_calls_total.inc() );
        transition_(Event::CloseRequested);
    }

    // Sending
    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        AW_TL1( telemetry_.send_calls_total.inc() );
        if (state_ != ConnectionState::Connected) {
            AW_WARN("[CONN] send() called while " << to_string(state_) << ". Ignoring.");
            AW_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!ws_->send(text)) {
            AW_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // Event loop
    inline void poll() noexcept {
        // === Drain transport events ===
        if (ws_) {
            websocket::Event ev;
            while (ws_->poll_event(ev)) {
                switch (ev.type) {
                    case websocket::EventType::Close:
                        on_transport_closed_(ev.clean);
                        break;

                    case websocket::EventType::Error:
                        on_transport_error_(ev.error);
                        break;
                }
            }
        }
        // === Reconnection logic ===
        if (retry_pending_ && Clock::now() >= next_retry_) {
            retry_pending_ = false;
            (void)reconnect_();
        }
    }

    // Hands the next received frame (if any) to the caller
    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!ws_ || state_ != ConnectionState::Connected) {
            return false;
        }
        if (!ws_->poll_message(out)) {
            return false;
        }
        AW_TL1( telemetry_.messages_forwarded_total.inc() );
        ++rx_messages_;
        return true;
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // Accessors
    [[nodiscard]]
    inline ConnectionState state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return state_ == ConnectionState::Connected;
    }

    [[nodiscard]]
    inline int reconnect_attempts() const noexcept {
        return retry_attempts_;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline bool has_pending_retry() const noexcept {
        return retry_pending_;
    }

    // Remaining time until the armed reconnect fires (zero if none or overdue)
    [[nodiscard]]
    inline std::chrono::milliseconds next_retry_in() const noexcept {
        if (!retry_pending_) {
            return std::chrono::milliseconds{0};
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(next_retry_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    [[nodiscard]]
    inline DisconnectReason disconnect_reason() const noexcept {
        return disconnect_reason_;
    }

    [[nodiscard]]
    inline Error last_error() const noexcept {
        return last_error_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

    [[nodiscard]]
    inline const std::string& url() const noexcept {
        return last_url_;
    }

    [[nodiscard]]
    inline const connection::RetryPolicy& retry_policy() const noexcept {
        return policy_;
    }

    inline void set_retry_policy(const connection::RetryPolicy& policy) noexcept {
        policy_ = policy;
    }

#ifdef AW_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    [[nodiscard]]
    bool has_transport() const noexcept {
        return static_cast<bool>(ws_);
    }
#endif // AW_UNIT_TEST

private:
    std::string last_url_;                          // for logging / reconnects
    lcr::optional<ParsedUrl> parsed_url_;           // Invariant: parsed_url_.has() == true -> valid endpoint

    transport::telemetry::Connection& telemetry_;   // Telemetry reference (not owned)
    connection::RetryPolicy policy_;
    typename WS::Options ws_options_;
    std::unique_ptr<WS> ws_;                        // WebSocket instance (owned, one per attempt)

    // Current transport epoch (incremented on each successful handshake)
    std::uint64_t epoch_{0};

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    Error last_error_{Error::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};

    // State machine
    ConnectionState state_{ConnectionState::Disconnected};

    // Reconnect timer
    bool retry_pending_{false};
    time_point next_retry_{};
    int retry_attempts_{0}; // retries scheduled since the last successful handshake

    // The pending observable edges
    lcr::lockfree::spsc_ring<connection::Signal, config::SIGNAL_RING_CAPACITY> signals_;

    inline void emit_(connection::Signal sig) noexcept {
        AW_TRACE("[CONN] Emitting signal: " << to_string(sig));
        if (signals_.push(sig)) [[likely]] {
            return;
        }
        AW_ERROR("[CONN] Signal ring full, dropping '" << to_string(sig) << "' (poll_signal() is not drained)");
    }

    inline void set_state_(ConnectionState new_state) noexcept {
        AW_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    inline void cancel_retry_() noexcept {
        retry_pending_ = false;
        next_retry_ = time_point{};
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        const ConnectionState state = state_;

        AW_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        // Local close wins from every state
        if (event == Event::CloseRequested) {
            cancel_retry_();
            if (ws_) {
                ws_->close();
            }
            if (state == ConnectionState::Connected) {
                AW_TL1( telemetry_.disconnect_events_total.inc() );
                emit_(connection::Signal::Disconnected);
                AW_INFO("[CONN] Disconnected from server: " << last_url_);
            }
            if (state != ConnectionState::Disconnected) {
                disconnect_reason_ = DisconnectReason::LocalClose;
            }
            set_state_(ConnectionState::Disconnected);
            return;
        }

        switch (state) {

        // ================================================================
        case ConnectionState::Disconnected:
        case ConnectionState::Error:
            switch (event) {
            case Event::OpenRequested:
                // Explicit open() overrides any pending retry cycle
                cancel_retry_();
                set_state_(ConnectionState::Connecting);
                break;

            case Event::RetryTimerExpired:
                set_state_(ConnectionState::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(ConnectionState::Connected);
                AW_TL1( telemetry_.connect_success_total.inc() );
                retry_attempts_ = 0;
                last_error_ = Error::None;
                disconnect_reason_ = DisconnectReason::None;
                // Only increment on Connected (never on retries or disconnections)
                ++epoch_;
                emit_(connection::Signal::Connected);
                break;

            case Event::TransportConnectFailed:
                AW_TL1( telemetry_.connect_failure_total.inc() );
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                set_state_(ConnectionState::Error);
                schedule_retry_(error);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case ConnectionState::Connected:
            switch (event) {
            case Event::TransportClosedClean:
                AW_TL1( telemetry_.disconnect_events_total.inc() );
                disconnect_reason_ = DisconnectReason::RemoteClose;
                set_state_(ConnectionState::Disconnected);
                emit_(connection::Signal::Disconnected);
                AW_INFO("[CONN] Connection closed by server: " << last_url_);
                break;

            case Event::TransportClosedAbnormal:
                AW_TL1( telemetry_.disconnect_events_total.inc() );
                last_error_ = Error::RemoteClosed;
                disconnect_reason_ = DisconnectReason::TransportError;
                set_state_(ConnectionState::Disconnected);
                emit_(connection::Signal::Disconnected);
                AW_WARN("[CONN] Connection lost: " << last_url_);
                schedule_retry_(Error::RemoteClosed);
                break;

            case Event::TransportError:
                AW_TL1( telemetry_.disconnect_events_total.inc() );
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                set_state_(ConnectionState::Error);
                emit_(connection::Signal::Disconnected);
                ws_->close();
                AW_WARN("[CONN] Transport error (" << to_string(error) << "): " << last_url_);
                schedule_retry_(error);
                break;

            default:
                break;
            }
            break;
        }
    }

    inline void create_transport_() {
        // If exists, ensure old transport is torn down deterministically
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        ws_ = std::make_unique<WS>(telemetry_.websocket, ws_options_);
    }

    [[nodiscard]]
    inline Error connect_() noexcept {
        create_transport_();
        const Error err = ws_->connect(parsed_url_.value());
        if (err != Error::None) {
            AW_ERROR("[CONN] Connection to '" << last_url_ << "' failed (" << to_string(err) << ")");
            transition_(Event::TransportConnectFailed, err);
            return err;
        }
        transition_(Event::TransportConnected);
        AW_INFO("[CONN] Connected to server: " << last_url_);
        return Error::None;
    }

    inline void on_transport_error_(Error error) noexcept {
        // Only a live connection can fail; late events from a dead transport are stale
        if (state_ != ConnectionState::Connected) {
            return;
        }
        transition_(Event::TransportError, error);
    }

    inline void on_transport_closed_(bool clean) noexcept {
        if (state_ != ConnectionState::Connected) {
            return;
        }
        transition_(clean ? Event::TransportClosedClean : Event::TransportClosedAbnormal);
    }

    // Every runtime transport failure is worth another attempt. Contract
    // errors never reach here: they are rejected before the FSM starts.
    [[nodiscard]]
    inline bool should_retry_(Error error) const noexcept {
        switch (error) {
            case Error::InvalidUrl:
            case Error::InvalidState:
            case Error::Cancelled:
            case Error::LocalShutdown:
                return false;
            default:
                return true;
        }
    }

    inline void schedule_retry_(Error error) noexcept {
        if (!should_retry_(error)) {
            cancel_retry_();
            return;
        }
        if (retry_attempts_ >= policy_.max_attempts) {
            cancel_retry_();
            set_state_(ConnectionState::Error);
            disconnect_reason_ = DisconnectReason::RetryExhausted;
            AW_TL1( telemetry_.retry_exhausted_total.inc() );
            emit_(connection::Signal::RetryExhausted);
            AW_ERROR("[CONN] Giving up on '" << last_url_ << "' after " << retry_attempts_ << " reconnection attempts");
            return;
        }
        const auto delay = connection::backoff_delay(policy_, retry_attempts_);
        ++retry_attempts_;
        retry_pending_ = true;
        next_retry_ = Clock::now() + std::chrono::duration_cast<typename Clock::duration>(delay);
        AW_TL1( telemetry_.retry_scheduled_total.inc() );
        emit_(connection::Signal::RetryScheduled);
        AW_INFO("[CONN] Reconnection attempt " << retry_attempts_ << "/" << policy_.max_attempts
                << " in " << lcr::format_duration(delay));
    }

    inline bool reconnect_() noexcept {
        AW_DEBUG("[CONN] Reconnecting to: " << last_url_ << " (attempt " << retry_attempts_ << ")");
        AW_TL1( telemetry_.retry_attempts_total.inc() );
        if (!parsed_url_.has()) {
            return false;
        }
        transition_(Event::RetryTimerExpired);
        return connect_() == Error::None;
    }
};

} // namespace arbwire::core::transport
