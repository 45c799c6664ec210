#include "iflow/connection/websocket_connection.hpp"
#include "iflow/log/logger.hpp"
#include "iflow/transport/backoff_policy.hpp"
#include "iflow/transport/websocket_transport.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace iflow {

TransportFactory websocket_transport_factory() {
    return [](const std::string& url, std::chrono::milliseconds connect_timeout) -> std::unique_ptr<ITransport> {
        WebSocketTransportConfig config;
        config.url = url;
        config.connect_timeout = connect_timeout;
        config.write_timeout = connect_timeout;
        return std::make_unique<WebSocketTransport>(std::move(config));
    };
}

WebSocketConnection::WebSocketConnection(std::shared_ptr<EventChannel> events, TransportFactory transport_factory)
    : ProtocolConnection(std::move(events))
    , transport_factory_(std::move(transport_factory))
{}

WebSocketConnection::~WebSocketConnection() {
    close();
}

Result<void> WebSocketConnection::initialize(const IFlowOptions& options) {
    if (options.websocket.has_value() == false) {
        return tl::unexpected(Error::connection("WebSocket configuration not provided"));
    }

    auto url = resolve_url(options);
    if (url.has_value() == false) {
        return tl::unexpected(url.error());
    }
    url_ = *url;

    auto transport = connect_with_retry(url_, *options.websocket);
    if (transport.has_value() == false) {
        return tl::unexpected(transport.error());
    }

    IFLOW_LOG_INFO("Connected to agent at " + url_);
    return run_handshake(std::move(*transport), options, true);
}

void WebSocketConnection::close() {
    close_protocol();
    if (process_ != nullptr) {
        process_->stop();
        process_.reset();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// URL resolution and auto-start
// ─────────────────────────────────────────────────────────────────────────────

Result<std::string> WebSocketConnection::resolve_url(const IFlowOptions& options) {
    const WebSocketConfig& config = *options.websocket;

    if (options.process.auto_start == false) {
        if (config.url.has_value() == false) {
            return tl::unexpected(Error::connection("WebSocket URL must be provided when auto-start is disabled"));
        }
        return *config.url;
    }

    if (config.url.has_value() == false) {
        return start_agent(options, options.process.effective_port());
    }

    const std::string& url = *config.url;
    auto parsed = WebSocketUrl::parse(url);
    if (parsed.has_value() == false) {
        return tl::unexpected(Error::connection("Invalid WebSocket URL " + url + ": " + parsed.error().message));
    }
    if (parsed->is_local() == false) {
        return url;
    }

    // An agent may already be running on the local port
    auto probe = transport_factory_(url, config.connect_timeout);
    auto probed = probe->connect();
    if (probed.has_value()) {
        auto closed = probe->close();
        if (closed.has_value() == false) {
            IFLOW_LOG_DEBUG("Closing probe connection failed: " + closed.error().message);
        }
        IFLOW_LOG_DEBUG("Reusing running agent at " + url);
        return url;
    }

    if (ProcessManager::is_port_listening(parsed->port)) {
        return tl::unexpected(Error::connection(std::format(
            "Failed to connect to existing agent at {}: {}. Port {} is in use, so no new agent was started",
            url, probed.error().message, parsed->port)));
    }

    IFLOW_LOG_DEBUG(std::format("No agent on port {}, starting one", parsed->port));
    return start_agent(options, parsed->port);
}

Result<std::string> WebSocketConnection::start_agent(const IFlowOptions& options, std::uint16_t port) {
    process_ = std::make_unique<ProcessManager>(ProcessManagerConfig::from(options.process));
    auto started = process_->start_websocket(port);
    if (started.has_value() == false) {
        process_.reset();
        return tl::unexpected(started.error());
    }
    return started;
}

Result<std::unique_ptr<ITransport>> WebSocketConnection::connect_with_retry(
    const std::string& url,
    const WebSocketConfig& config
) {
    const std::size_t attempts = std::max<std::size_t>(config.reconnect_attempts, 1);
    ConstantBackoff backoff(config.reconnect_interval);
    std::string last_error;

    for (std::size_t attempt = 0; attempt < attempts; ++attempt) {
        auto transport = transport_factory_(url, config.connect_timeout);
        auto connected = transport->connect();
        if (connected.has_value()) {
            return transport;
        }

        last_error = connected.error().message;
        IFLOW_LOG_WARN(std::format("Connection attempt {}/{} to {} failed: {}", attempt + 1, attempts, url, last_error));
        if (attempt + 1 < attempts) {
            std::this_thread::sleep_for(backoff.next_delay(attempt));
        }
    }

    return tl::unexpected(Error::connection(std::format(
        "Failed to connect to {} after {} attempts: {}", url, attempts, last_error)));
}

}  // namespace iflow
