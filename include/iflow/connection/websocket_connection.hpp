#pragma once

#include "iflow/connection/protocol_connection.hpp"
#include "iflow/process/process_manager.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace iflow {

using TransportFactory = std::function<std::unique_ptr<ITransport>(
    const std::string& url,
    std::chrono::milliseconds connect_timeout
)>;

/// Creates WebSocketTransport instances
[[nodiscard]] TransportFactory websocket_transport_factory();

// ═══════════════════════════════════════════════════════════════════════════
// WebSocketConnection
// ═══════════════════════════════════════════════════════════════════════════
// Auto-start (process.auto_start):
//   local URL, agent answers     -> reuse it
//   local URL, port busy         -> Connection error, nothing is spawned
//   local URL, port free         -> spawn the agent on that port
//   no URL                       -> spawn the agent on process.start_port
//   non-local URL                -> connect directly
// Without auto-start the URL is required.

class WebSocketConnection final : public ProtocolConnection {
public:
    explicit WebSocketConnection(
        std::shared_ptr<EventChannel> events,
        TransportFactory transport_factory = websocket_transport_factory()
    );
    ~WebSocketConnection() override;

    [[nodiscard]] Result<void> initialize(const IFlowOptions& options) override;
    void close() override;

    /// The URL the connection resolved to, once initialized
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    /// Present when this connection started the agent itself
    [[nodiscard]] ProcessManager* process() noexcept { return process_.get(); }

private:
    [[nodiscard]] Result<std::string> resolve_url(const IFlowOptions& options);
    [[nodiscard]] Result<std::string> start_agent(const IFlowOptions& options, std::uint16_t port);
    [[nodiscard]] Result<std::unique_ptr<ITransport>> connect_with_retry(const std::string& url, const WebSocketConfig& config);

    TransportFactory transport_factory_;
    std::unique_ptr<ProcessManager> process_;
    std::string url_;
};

}  // namespace iflow
