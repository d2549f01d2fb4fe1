#pragma once

#include <chrono>
#include <deque>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "arbwire/core/feed/simulator.hpp"
#include "arbwire/core/transport/error.hpp"
#include "arbwire/core/transport/parse_url.hpp"
#include "arbwire/core/transport/websocket/events.hpp"
#include "arbwire/core/transport/websocket_concept.hpp"
#include "arbwire/core/transport/telemetry/websocket.hpp"
#include "arbwire/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::feed {

/*
===============================================================================
 feed::SimulatedWebSocket
===============================================================================

In-process transport backed by feed::Simulator. Satisfies
transport::WebSocketConcept, so Session<SimulatedWebSocket> runs the exact
core code path of the live transport.

  - connect() always succeeds unless Options::refuse_connect is set
  - frames are produced lazily: poll_message() runs a simulator tick when the
    emission interval has elapsed and the queue is empty
  - send() hands the frame to the simulator; replies are queued ahead of the
    next tick
  - inject_close() / inject_error() / inject_frame() script server behaviour

Single-threaded: everything runs on the poll thread.
===============================================================================
*/
class SimulatedWebSocket {
public:
    using clock = std::chrono::steady_clock;

    struct Options {
        SimulatorOptions simulator{};
        bool refuse_connect{false};     // every connect() fails with ConnectionFailed
    };

public:
    SimulatedWebSocket(transport::telemetry::WebSocket& telemetry, const Options& options)
        : telemetry_(telemetry)
        , options_(options)
        , simulator_(options.simulator)
    {}

    SimulatedWebSocket(const SimulatedWebSocket&) = delete;
    SimulatedWebSocket& operator=(const SimulatedWebSocket&) = delete;

    [[nodiscard]]
    inline transport::Error connect(const transport::ParsedUrl& url) noexcept {
        if (options_.refuse_connect) {
            AW_DEBUG("[SIM] Refusing connection to " << url.host << ":" << url.port);
            return transport::Error::ConnectionFailed;
        }
        AW_INFO("[SIM] Simulated feed attached (" << url.host << ":" << url.port << url.target << ")");
        open_ = true;
        next_tick_ = clock::now();
        return transport::Error::None;
    }

    inline void close() noexcept {
        if (!open_) {
            return;
        }
        open_ = false;
        frames_.clear();
        signal_close_(true);
    }

    [[nodiscard]]
    inline bool send(std::string_view msg) noexcept {
        if (!open_) {
            AW_TL1( telemetry_.send_errors_total.inc() );
            return false;
        }
        AW_TL1( telemetry_.messages_tx_total.inc() );
        AW_TL1( telemetry_.bytes_tx_total.inc(msg.size()) );
        try {
            auto reply = simulator_.handle(msg, now_ms_());
            if (reply.has()) {
                frames_.push_back(std::move(reply.value()));
            }
        }
        catch (const std::exception& e) {
            AW_ERROR("[SIM] Failed to handle client frame: " << e.what());
            AW_TL1( telemetry_.send_errors_total.inc() );
            return false;
        }
        return true;
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!open_) {
            return false;
        }
        if (frames_.empty() && clock::now() >= next_tick_) {
            try {
                for (auto& frame : simulator_.tick(now_ms_())) {
                    frames_.push_back(std::move(frame));
                }
            }
            catch (const std::exception& e) {
                AW_ERROR("[SIM] Tick failed: " << e.what());
                AW_TL1( telemetry_.receive_errors_total.inc() );
            }
            next_tick_ = clock::now() + options_.simulator.interval;
        }
        if (frames_.empty()) {
            return false;
        }
        out = std::move(frames_.front());
        frames_.pop_front();
        AW_TL1( telemetry_.messages_rx_total.inc() );
        AW_TL1( telemetry_.bytes_rx_total.inc(out.size()) );
        return true;
    }

    [[nodiscard]]
    inline bool poll_event(transport::websocket::Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = events_.front();
        events_.pop_front();
        return true;
    }

    // ------------------------------------------------------------
    // Scripting
    // ------------------------------------------------------------

    // Server drops the connection (clean = normal close frame)
    inline void inject_close(bool clean) {
        if (!open_) {
            return;
        }
        open_ = false;
        frames_.clear();
        signal_close_(clean);
    }

    inline void inject_error(transport::Error error) {
        if (!open_) {
            return;
        }
        AW_TL1( telemetry_.receive_errors_total.inc() );
        events_.push_back(transport::websocket::Event::make_error(error));
        inject_close(false);
    }

    inline void inject_frame(std::string frame) {
        frames_.push_back(std::move(frame));
    }

    [[nodiscard]]
    inline const Simulator& simulator() const noexcept {
        return simulator_;
    }

    [[nodiscard]]
    inline bool is_open() const noexcept {
        return open_;
    }

private:
    transport::telemetry::WebSocket& telemetry_;
    Options options_;
    Simulator simulator_;

    bool open_{false};
    bool close_signaled_{false};
    clock::time_point next_tick_{};

    std::deque<std::string> frames_;
    std::deque<transport::websocket::Event> events_;

    [[nodiscard]]
    static inline std::int64_t now_ms_() noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // Close is reported exactly once per instance
    inline void signal_close_(bool clean) noexcept {
        if (close_signaled_) {
            return;
        }
        close_signaled_ = true;
        AW_TL1( telemetry_.close_events_total.inc() );
        events_.push_back(transport::websocket::Event::make_close(clean));
    }
};

static_assert(transport::WebSocketConcept<SimulatedWebSocket>);

} // namespace arbwire::core::feed
