#include "iflow/connection/stdio_connection.hpp"
#include "iflow/connection/websocket_connection.hpp"
#include "iflow/log/logger.hpp"
#include "iflow/transport/pipe_transport.hpp"

namespace iflow {

StdioConnection::StdioConnection(std::shared_ptr<EventChannel> events)
    : ProtocolConnection(std::move(events))
{}

StdioConnection::~StdioConnection() {
    close();
}

Result<void> StdioConnection::initialize(const IFlowOptions& options) {
    if (process_ != nullptr) {
        return tl::unexpected(Error::connection("Stdio connection already initialized"));
    }

    process_ = std::make_unique<ProcessManager>(ProcessManagerConfig::from(options.process));
    auto started = process_->start_stdio();
    if (started.has_value() == false) {
        process_.reset();
        return started;
    }

    const auto write_fd = process_->take_stdin();
    const auto read_fd = process_->take_stdout();
    if ((write_fd.has_value() == false) || (read_fd.has_value() == false)) {
        return tl::unexpected(Error::process_manager("Agent stdio descriptors are not available"));
    }

    PipeTransportConfig config;
    config.read_fd = *read_fd;
    config.write_fd = *write_fd;

    IFLOW_LOG_INFO("Agent started in stdio mode");
    return run_handshake(std::make_unique<PipeTransport>(config), options, false);
}

void StdioConnection::close() {
    close_protocol();
    if (process_ != nullptr) {
        process_->stop();
        process_.reset();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<IConnection> make_connection(const IFlowOptions& options, std::shared_ptr<EventChannel> events) {
    if (options.uses_websocket()) {
        return std::make_unique<WebSocketConnection>(std::move(events));
    }
    return std::make_unique<StdioConnection>(std::move(events));
}

}  // namespace iflow
