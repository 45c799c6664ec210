#pragma once

#include "iflow/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace iflow {

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket URL
// ═══════════════════════════════════════════════════════════════════════════

struct WebSocketUrl {
    std::string host;
    std::uint16_t port{80};
    std::string target{"/"};  ///< Path plus query, e.g. "/acp?peer=iflow"

    /// Accepts ws://host[:port][/path][?query]. wss:// is rejected.
    [[nodiscard]] static TransportResult<WebSocketUrl> parse(std::string_view url);

    [[nodiscard]] bool is_local() const noexcept {
        return (host == "localhost") || (host == "127.0.0.1");
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct WebSocketTransportConfig {
    std::string url;
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds write_timeout{10'000};  ///< Bounds one send_text() when the peer stops reading
    std::size_t max_message_size{16 * 1024 * 1024};
};

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport
// ═══════════════════════════════════════════════════════════════════════════
// Text frames over Boost.Beast. All I/O runs on a private io_context driven
// from the calling thread: a read stays pending across receive_with_timeout()
// calls, so a poll that times out never loses a partially received frame.

class WebSocketTransport final : public ITransport {
public:
    explicit WebSocketTransport(WebSocketTransportConfig config);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;
    WebSocketTransport(WebSocketTransport&&) = delete;
    WebSocketTransport& operator=(WebSocketTransport&&) = delete;

    [[nodiscard]] TransportResult<void> connect() override;
    [[nodiscard]] TransportResult<void> send_text(std::string_view text) override;
    [[nodiscard]] TransportResult<Frame> receive() override;
    [[nodiscard]] TransportResult<std::optional<Frame>> receive_with_timeout(std::chrono::milliseconds timeout) override;
    TransportResult<void> close() override;
    [[nodiscard]] bool is_connected() const noexcept override;

    [[nodiscard]] const std::string& url() const noexcept { return config_.url; }

private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void start_read();
    [[nodiscard]] TransportResult<Frame> take_read_result();
    void reset_stream();

    WebSocketTransportConfig config_;
    boost::asio::io_context ioc_;
    std::optional<Stream> ws_;
    boost::beast::flat_buffer read_buffer_;
    bool connected_{false};
    bool read_pending_{false};
    bool read_done_{false};
    boost::beast::error_code read_error_;
};

}  // namespace iflow
