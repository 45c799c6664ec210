#include "iflow/transport/websocket_transport.hpp"
#include "iflow/log/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cctype>
#include <charconv>
#include <format>

namespace iflow {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

constexpr std::string_view kScheme{"ws://"};
constexpr std::string_view kSecureScheme{"wss://"};
constexpr std::chrono::milliseconds kCloseHandshakeTimeout{1'000};
constexpr std::chrono::milliseconds kBlockingPollInterval{1'000};

TransportError make_error(TransportError::Category category, std::string message) {
    return TransportError{category, std::move(message)};
}

// Some agents prefix frames with stray control bytes
void strip_leading_control_bytes(std::string& text) {
    std::size_t count = 0;
    while (count < text.size()) {
        const auto c = static_cast<unsigned char>(text[count]);
        const bool is_control = (c < 0x20) && (std::isspace(c) == 0);
        if (is_control == false) {
            break;
        }
        ++count;
    }
    text.erase(0, count);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// WebSocketUrl
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<WebSocketUrl> WebSocketUrl::parse(std::string_view url) {
    if (url.starts_with(kSecureScheme)) {
        return tl::unexpected(make_error(TransportError::Category::Protocol,
            "Secure WebSocket URLs are not supported: " + std::string(url)));
    }
    if (url.starts_with(kScheme) == false) {
        return tl::unexpected(make_error(TransportError::Category::Protocol,
            "Invalid WebSocket URL (expected ws://): " + std::string(url)));
    }

    const std::string_view rest = url.substr(kScheme.size());
    const auto target_pos = rest.find_first_of("/?");
    const std::string_view authority = rest.substr(0, target_pos);

    WebSocketUrl parsed;
    if (target_pos != std::string_view::npos) {
        parsed.target = std::string(rest.substr(target_pos));
        if (parsed.target.front() == '?') {
            parsed.target.insert(parsed.target.begin(), '/');
        }
    }

    const auto colon = authority.rfind(':');
    parsed.host = std::string(authority.substr(0, colon));
    if (colon != std::string_view::npos) {
        const std::string_view port_text = authority.substr(colon + 1);
        unsigned int port = 0;
        const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        const bool valid_port = (ec == std::errc{}) && (end == port_text.data() + port_text.size())
            && (port > 0) && (port <= 65535);
        if (valid_port == false) {
            return tl::unexpected(make_error(TransportError::Category::Protocol,
                "Invalid port in WebSocket URL: " + std::string(url)));
        }
        parsed.port = static_cast<std::uint16_t>(port);
    }

    if (parsed.host.empty()) {
        return tl::unexpected(make_error(TransportError::Category::Protocol,
            "Missing host in WebSocket URL: " + std::string(url)));
    }
    return parsed;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

WebSocketTransport::WebSocketTransport(WebSocketTransportConfig config)
    : config_(std::move(config))
{}

WebSocketTransport::~WebSocketTransport() {
    close();
}

TransportResult<void> WebSocketTransport::connect() {
    if (connected_) {
        return {};
    }

    auto url = WebSocketUrl::parse(config_.url);
    if (url.has_value() == false) {
        return tl::unexpected(url.error());
    }

    reset_stream();
    ws_.emplace(ioc_);
    auto& lowest = beast::get_lowest_layer(*ws_);

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    const auto endpoints = resolver.resolve(url->host, std::to_string(url->port), ec);
    if (ec) {
        reset_stream();
        return tl::unexpected(make_error(TransportError::Category::Network,
            std::format("Failed to resolve {}: {}", url->host, ec.message())));
    }

    // TCP connect, bounded by the connect timeout
    beast::error_code connect_ec;
    lowest.expires_after(config_.connect_timeout);
    lowest.async_connect(endpoints, [&connect_ec](beast::error_code e, const tcp::endpoint&) {
        connect_ec = e;
    });
    ioc_.restart();
    ioc_.run();

    if (connect_ec) {
        reset_stream();
        if (connect_ec == beast::error::timeout) {
            return tl::unexpected(make_error(TransportError::Category::Timeout,
                std::format("Connecting to {} timed out after {}ms", config_.url, config_.connect_timeout.count())));
        }
        return tl::unexpected(make_error(TransportError::Category::Network,
            std::format("Failed to connect to {}: {}", config_.url, connect_ec.message())));
    }

    // WebSocket upgrade, bounded by the same timeout
    beast::error_code handshake_ec;
    lowest.expires_after(config_.connect_timeout);
    ws_->read_message_max(config_.max_message_size);
    const std::string host_header = url->host + ":" + std::to_string(url->port);
    ws_->async_handshake(host_header, url->target, [&handshake_ec](beast::error_code e) {
        handshake_ec = e;
    });
    ioc_.restart();
    ioc_.run();

    if (handshake_ec) {
        reset_stream();
        if (handshake_ec == beast::error::timeout) {
            return tl::unexpected(make_error(TransportError::Category::Timeout,
                std::format("WebSocket handshake with {} timed out", config_.url)));
        }
        return tl::unexpected(make_error(TransportError::Category::Network,
            std::format("WebSocket handshake with {} rejected: {}", config_.url, handshake_ec.message())));
    }

    // The websocket stream manages its own timeouts from here on
    lowest.expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->text(true);

    connected_ = true;
    IFLOW_LOG_INFO("Connected to " + config_.url);
    return {};
}

TransportResult<void> WebSocketTransport::close() {
    if (ws_.has_value() == false) {
        connected_ = false;
        return {};
    }

    if (connected_) {
        connected_ = false;
        bool close_done = false;
        beast::error_code close_ec;
        ws_->async_close(websocket::close_code::normal, [&close_done, &close_ec](beast::error_code e) {
            close_done = true;
            close_ec = e;
        });
        const auto deadline = std::chrono::steady_clock::now() + kCloseHandshakeTimeout;
        ioc_.restart();
        while ((close_done == false) && (ioc_.run_one_until(deadline) > 0)) {
        }

        if (close_done == false) {
            IFLOW_LOG_DEBUG("Close handshake did not complete, dropping the socket");
        } else if (close_ec && (close_ec != websocket::error::closed)) {
            IFLOW_LOG_DEBUG("Close handshake failed: " + close_ec.message());
        }
    }

    // Must run before the locals captured above go out of scope
    reset_stream();
    IFLOW_LOG_DEBUG("WebSocket transport closed");
    return {};
}

bool WebSocketTransport::is_connected() const noexcept {
    return connected_;
}

void WebSocketTransport::reset_stream() {
    if (ws_.has_value()) {
        beast::error_code ignored;
        auto& socket = beast::get_lowest_layer(*ws_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    // Run the handlers of aborted operations so nothing refers to this state later
    ioc_.restart();
    while (ioc_.poll() > 0) {
    }

    ws_.reset();
    read_buffer_.clear();
    read_pending_ = false;
    read_done_ = false;
    read_error_ = {};
    connected_ = false;
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> WebSocketTransport::send_text(std::string_view text) {
    if ((connected_ == false) || (ws_.has_value() == false)) {
        return tl::unexpected(make_error(TransportError::Category::Network, "WebSocket is not connected"));
    }

    bool write_done = false;
    beast::error_code write_ec;
    ws_->async_write(asio::buffer(text.data(), text.size()), [&write_done, &write_ec](beast::error_code e, std::size_t) {
        write_done = true;
        write_ec = e;
    });

    // May also complete a pending read; its result is kept for the next receive
    const auto deadline = std::chrono::steady_clock::now() + config_.write_timeout;
    ioc_.restart();
    while ((write_done == false) && (ioc_.run_one_until(deadline) > 0)) {
    }

    if (write_done == false) {
        // A half-written frame leaves the stream unusable
        reset_stream();
        return tl::unexpected(make_error(TransportError::Category::Timeout,
            std::format("WebSocket write to {} timed out after {}ms", config_.url, config_.write_timeout.count())));
    }
    if (write_ec) {
        connected_ = false;
        const auto category = (write_ec == websocket::error::closed)
            ? TransportError::Category::Closed
            : TransportError::Category::Network;
        return tl::unexpected(make_error(category, "WebSocket write failed: " + write_ec.message()));
    }
    return {};
}

TransportResult<Frame> WebSocketTransport::receive() {
    while (true) {
        auto frame = receive_with_timeout(kBlockingPollInterval);
        if (frame.has_value() == false) {
            return tl::unexpected(frame.error());
        }
        if (frame->has_value()) {
            return std::move(**frame);
        }
    }
}

TransportResult<std::optional<Frame>> WebSocketTransport::receive_with_timeout(std::chrono::milliseconds timeout) {
    if (ws_.has_value() == false) {
        return tl::unexpected(make_error(TransportError::Category::Network, "WebSocket is not connected"));
    }
    if ((connected_ == false) && (read_done_ == false)) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "WebSocket connection closed"));
    }

    if ((read_pending_ == false) && (read_done_ == false)) {
        start_read();
    }
    if (read_done_ == false) {
        // Stop on completion rather than draining the context
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        ioc_.restart();
        while ((read_done_ == false) && (ioc_.run_one_until(deadline) > 0)) {
        }
    }
    if (read_done_ == false) {
        return std::optional<Frame>{};
    }

    auto frame = take_read_result();
    if (frame.has_value() == false) {
        return tl::unexpected(frame.error());
    }
    return std::optional<Frame>(std::move(*frame));
}

void WebSocketTransport::start_read() {
    read_pending_ = true;
    read_done_ = false;
    ws_->async_read(read_buffer_, [this](beast::error_code ec, std::size_t /*bytes*/) {
        read_pending_ = false;
        read_done_ = true;
        read_error_ = ec;
    });
}

TransportResult<Frame> WebSocketTransport::take_read_result() {
    read_done_ = false;

    if (read_error_) {
        const auto ec = read_error_;
        read_error_ = {};
        connected_ = false;

        if (ec == websocket::error::closed) {
            const auto& reason = ws_->reason().reason;
            return Frame::closed(std::string(reason.data(), reason.size()));
        }
        if ((ec == asio::error::eof) || (ec == asio::error::connection_reset)) {
            return tl::unexpected(make_error(TransportError::Category::Closed,
                "Connection closed by peer: " + ec.message()));
        }
        return tl::unexpected(make_error(TransportError::Category::Network,
            "WebSocket read failed: " + ec.message()));
    }

    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    strip_leading_control_bytes(text);
    return Frame::text(std::move(text));
}

}  // namespace iflow
