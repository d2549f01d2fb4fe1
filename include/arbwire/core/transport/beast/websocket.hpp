#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "arbwire/core/transport/error.hpp"
#include "arbwire/core/transport/parse_url.hpp"
#include "arbwire/core/transport/websocket/events.hpp"
#include "arbwire/core/transport/telemetry/websocket.hpp"


/*
================================================================================
 WebSocket Transport (Boost.Beast)
================================================================================

Live ws:// and wss:// transport built on Boost.Beast and OpenSSL, following a
strict separation between *transport mechanics* and *connection policy*.

  - Single-connection transport primitive: no retries, no reconnection logic.
    Recovery and subscription replay live in Connection and Session.
  - connect() performs resolve, TCP connect, TLS handshake (with SNI) and the
    WebSocket upgrade synchronously, each step bounded by connect_timeout.
  - After a successful handshake an internal IO thread runs the read loop.
    Complete text frames are queued into an SPSC frame ring, control events
    (Error / Close) into an SPSC event ring. Nothing is called back.
  - Close is signaled exactly once. It is clean only when the peer sent a
    close frame with the normal close code.
  - If the frame ring overflows the transport fails with Error::Backpressure
    instead of silently dropping data.

Boost.Beast types stay out of this header (pimpl).
================================================================================
*/

namespace arbwire::core::transport::beast {

class WebSocket {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{10000};  // per handshake step
        std::chrono::milliseconds close_timeout{3000};     // closing handshake
        bool verify_peer{true};                            // wss:// certificate + host name check
        std::string user_agent{"arbwire/1.0"};
    };

public:
    WebSocket(telemetry::WebSocket& telemetry, const Options& options);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const ParsedUrl& url) noexcept;

    // Idempotent. Performs the closing handshake and joins the IO thread.
    void close() noexcept;

    // Queues a text frame for the IO thread. A boolean "accepted / not
    // accepted" is the honest signal; write failures arrive as Error events.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arbwire::core::transport::beast
