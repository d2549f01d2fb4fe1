#include "arbwire/core/transport/beast/websocket.hpp"

#include <atomic>
#include <deque>
#include <exception>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "arbwire/core/config/ring_sizes.hpp"
#include "arbwire/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace arbwire::core::transport::beast {

namespace asio = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace bb   = boost::beast;
namespace bws  = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;


struct WebSocket::Impl {
    using plain_stream = bws::stream<bb::tcp_stream>;
    using tls_stream   = bws::stream<bb::ssl_stream<bb::tcp_stream>>;

    Impl(telemetry::WebSocket& telemetry, const Options& options)
        : telemetry_(telemetry)
        , options_(options)
    {}

    ~Impl() {
        close();
    }

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    [[nodiscard]]
    Error connect(const ParsedUrl& url) {
        if (started_) {
            AW_WARN("[BEAST] connect() called on a used transport");
            return Error::InvalidState;
        }
        // 1) Resolve
        bb::error_code ec;
        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(url.host, url.port, ec);
        if (ec) {
            AW_ERROR("[BEAST] Resolve '" << url.host << ":" << url.port << "' failed: " << ec.message());
            return Error::ConnectionFailed;
        }
        // 2) Build the stream stack
        if (url.secure) {
            ssl_ctx_.set_default_verify_paths(ec);
            if (ec) {
                AW_WARN("[BEAST] Could not load default CA paths: " << ec.message());
            }
            ssl_ctx_.set_verify_mode(options_.verify_peer ? ssl::verify_peer : ssl::verify_none);
            tls_ = std::make_unique<tls_stream>(ioc_, ssl_ctx_);
            return handshake_(*tls_, url, results);
        }
        plain_ = std::make_unique<plain_stream>(ioc_);
        return handshake_(*plain_, url, results);
    }

    void close() noexcept {
        if (io_thread_.joinable()) {
            closing_.store(true, std::memory_order_release);
            asio::post(ioc_, [this]() {
                with_stream_([](auto& ws) {
                    if (!ws.is_open()) {
                        return;
                    }
                    ws.async_close(bws::close_code::normal, [](bb::error_code ec) {
                        if (ec) {
                            AW_DEBUG("[BEAST] Closing handshake ended with: " << ec.message());
                        }
                    });
                });
            });
            io_thread_.join();
        }
        signal_close_(true);
    }

    // ---------------------------------------------------------------------
    // Data path
    // ---------------------------------------------------------------------

    [[nodiscard]]
    bool send(std::string_view msg) {
        if (!running_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            AW_WARN("[BEAST] send() called on a closed transport");
            return false;
        }
        asio::post(ioc_, [this, payload = std::string(msg)]() mutable {
            tx_queue_.push_back(std::move(payload));
            if (tx_queue_.size() == 1) {
                write_next_();
            }
        });
        return true;
    }

    [[nodiscard]]
    bool poll_message(std::string& out) {
        return rx_ring_.pop(out);
    }

    [[nodiscard]]
    bool poll_event(websocket::Event& out) {
        return events_.pop(out);
    }

private:
    telemetry::WebSocket& telemetry_;
    Options options_;

    // Destruction order matters: streams go before the context they run on
    asio::io_context ioc_;
    ssl::context ssl_ctx_{ssl::context::tls_client};
    std::unique_ptr<plain_stream> plain_;
    std::unique_ptr<tls_stream> tls_;

    bb::flat_buffer rx_buffer_;
    std::deque<std::string> tx_queue_;                  // IO thread only

    lcr::lockfree::spsc_ring<std::string, config::RX_FRAME_RING_CAPACITY> rx_ring_;
    lcr::lockfree::spsc_ring<websocket::Event, config::CONTROL_RING_CAPACITY> events_;

    std::thread io_thread_;
    bool started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> closed_{false};

    template <class F>
    void with_stream_(F&& f) {
        if (tls_) {
            f(*tls_);
        }
        else if (plain_) {
            f(*plain_);
        }
    }

    // Runs the io_context on the caller thread until the pending operation completes
    template <class Op>
    [[nodiscard]]
    bb::error_code run_step_(Op&& op) {
        bb::error_code result = asio::error::would_block;
        op([&result](bb::error_code ec, auto&&...) { result = ec; });
        ioc_.run();
        ioc_.restart();
        return result;
    }

    template <class Stream>
    [[nodiscard]]
    Error handshake_(Stream& ws, const ParsedUrl& url, const tcp::resolver::results_type& results) {
        started_ = true;
        auto& lowest = bb::get_lowest_layer(ws);

        // TCP connect
        lowest.expires_after(options_.connect_timeout);
        bb::error_code ec = run_step_([&](auto handler) { lowest.async_connect(results, std::move(handler)); });
        if (ec) {
            AW_ERROR("[BEAST] TCP connect to '" << url.host << ":" << url.port << "' failed: " << ec.message());
            return (ec == bb::error::timeout) ? Error::Timeout : Error::ConnectionFailed;
        }

        // TLS handshake (SNI must be set before it starts)
        if constexpr (std::is_same_v<Stream, tls_stream>) {
            if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), url.host.c_str())) {
                AW_ERROR("[BEAST] Failed to set SNI host name '" << url.host << "'");
                return Error::HandshakeFailed;
            }
            if (options_.verify_peer) {
                ws.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
            }
            lowest.expires_after(options_.connect_timeout);
            ec = run_step_([&](auto handler) { ws.next_layer().async_handshake(ssl::stream_base::client, std::move(handler)); });
            if (ec) {
                AW_ERROR("[BEAST] TLS handshake with '" << url.host << "' failed: " << ec.message());
                return (ec == bb::error::timeout) ? Error::Timeout : Error::HandshakeFailed;
            }
        }

        // WebSocket upgrade (the websocket stream manages its own timeouts from here on)
        lowest.expires_never();
        bws::stream_base::timeout opt{};
        opt.handshake_timeout = options_.connect_timeout;
        opt.idle_timeout = bws::stream_base::none();
        opt.keep_alive_pings = false;
        ws.set_option(opt);
        ws.set_option(bws::stream_base::decorator([ua = options_.user_agent](bws::request_type& req) {
            req.set(bb::http::field::user_agent, ua);
        }));
        const bool default_port = (url.secure && url.port == "443") || (!url.secure && url.port == "80");
        const std::string host_header = default_port ? url.host : url.host + ":" + url.port;
        ec = run_step_([&](auto handler) { ws.async_handshake(host_header, url.target, std::move(handler)); });
        if (ec) {
            AW_ERROR("[BEAST] WebSocket upgrade with '" << host_header << url.target << "' failed: " << ec.message());
            return (ec == bb::error::timeout) ? Error::Timeout : Error::HandshakeFailed;
        }

        // Closing handshake bound
        opt.handshake_timeout = options_.close_timeout;
        ws.set_option(opt);

        // Start the read loop on the IO thread
        running_.store(true, std::memory_order_release);
        read_(ws);
        io_thread_ = std::thread([this]() { io_loop_(); });
        AW_DEBUG("[BEAST] Handshake complete with '" << host_header << url.target << "'");
        return Error::None;
    }

    void io_loop_() noexcept {
        try {
            ioc_.run();
        }
        catch (const std::exception& e) {
            AW_ERROR("[BEAST] IO thread terminated: " << e.what());
            push_event_(websocket::Event::make_error(Error::TransportFailure));
            signal_close_(false);
        }
    }

    template <class Stream>
    void read_(Stream& ws) {
        ws.async_read(rx_buffer_, [this, &ws](bb::error_code ec, std::size_t bytes) {
            on_read_(ws, ec, bytes);
        });
    }

    template <class Stream>
    void on_read_(Stream& ws, bb::error_code ec, std::size_t bytes) {
        if (ec) {
            on_read_error_(ws, ec);
            return;
        }
        AW_TL1( telemetry_.bytes_rx_total.inc(bytes) );
        AW_TL1( telemetry_.messages_rx_total.inc() );
        std::string frame = bb::buffers_to_string(rx_buffer_.data());
        rx_buffer_.consume(rx_buffer_.size());
        if (!rx_ring_.push(std::move(frame))) [[unlikely]] {
            AW_TL1( telemetry_.rx_dropped_total.inc() );
            AW_ERROR("[BEAST] Frame ring full (poll() not called often enough), failing transport");
            push_event_(websocket::Event::make_error(Error::Backpressure));
            signal_close_(false);
            bb::get_lowest_layer(ws).close();
            return;
        }
        read_(ws);
    }

    template <class Stream>
    void on_read_error_(Stream& ws, bb::error_code ec) {
        running_.store(false, std::memory_order_release);
        // Peer completed the closing handshake (or answered ours)
        if (ec == bws::error::closed) {
            const bool clean = ws.reason().code == bws::close_code::normal;
            AW_INFO("[BEAST] Close frame received (code " << ws.reason().code << ")");
            signal_close_(clean);
            return;
        }
        // Local shutdown in progress
        if (closing_.load(std::memory_order_acquire) || ec == asio::error::operation_aborted) {
            signal_close_(true);
            return;
        }
        // Socket dropped without a close frame
        if (ec == asio::error::eof || ec == asio::error::connection_reset || ec == ssl::error::stream_truncated) {
            AW_WARN("[BEAST] Connection dropped by peer: " << ec.message());
            signal_close_(false);
            return;
        }
        AW_TL1( telemetry_.receive_errors_total.inc() );
        AW_ERROR("[BEAST] Read failed: " << ec.message());
        push_event_(websocket::Event::make_error(ec == bb::error::timeout ? Error::Timeout : Error::TransportFailure));
        signal_close_(false);
    }

    void write_next_() {
        with_stream_([this](auto& ws) {
            ws.text(true);
            ws.async_write(asio::buffer(tx_queue_.front()), [this](bb::error_code ec, std::size_t bytes) {
                if (ec) {
                    tx_queue_.clear();
                    if (!closing_.load(std::memory_order_acquire)) {
                        AW_TL1( telemetry_.send_errors_total.inc() );
                        AW_ERROR("[BEAST] Write failed: " << ec.message());
                        push_event_(websocket::Event::make_error(Error::TransportFailure));
                    }
                    return;
                }
                AW_TL1( telemetry_.bytes_tx_total.inc(bytes) );
                AW_TL1( telemetry_.messages_tx_total.inc() );
                tx_queue_.pop_front();
                if (!tx_queue_.empty()) {
                    write_next_();
                }
            });
        });
    }

    void push_event_(const websocket::Event& ev) noexcept {
        if (!events_.push(ev)) [[unlikely]] {
            AW_FATAL("[BEAST] Control event ring full, transport correctness compromised");
        }
    }

    // Close is always signaled exactly once
    void signal_close_(bool clean) noexcept {
        if (closed_.exchange(true)) {
            return;
        }
        running_.store(false, std::memory_order_release);
        AW_TL1( telemetry_.close_events_total.inc() );
        push_event_(websocket::Event::make_close(clean));
    }
};


// ============================================================================
// WebSocket
// ============================================================================

WebSocket::WebSocket(telemetry::WebSocket& telemetry, const Options& options)
    : impl_(std::make_unique<Impl>(telemetry, options))
{}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const ParsedUrl& url) noexcept {
    try {
        return impl_->connect(url);
    }
    catch (const std::exception& e) {
        AW_ERROR("[BEAST] connect() failed: " << e.what());
        return Error::TransportFailure;
    }
}

void WebSocket::close() noexcept {
    impl_->close();
}

bool WebSocket::send(std::string_view msg) noexcept {
    try {
        return impl_->send(msg);
    }
    catch (const std::exception& e) {
        AW_ERROR("[BEAST] send() failed: " << e.what());
        return false;
    }
}

bool WebSocket::poll_message(std::string& out) noexcept {
    return impl_->poll_message(out);
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return impl_->poll_event(out);
}

} // namespace arbwire::core::transport::beast
