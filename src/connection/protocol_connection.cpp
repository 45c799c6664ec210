#include "iflow/connection/protocol_connection.hpp"
#include "iflow/log/logger.hpp"

#include <format>

namespace iflow {

ProtocolConnection::ProtocolConnection(std::shared_ptr<EventChannel> events)
    : events_(std::move(events))
{}

AcpProtocolConfig ProtocolConnection::protocol_config(const IFlowOptions& options, bool wait_for_ready) {
    AcpProtocolConfig config;
    config.timeout = options.timeout;
    config.wait_for_ready = wait_for_ready;
    config.permission_mode = options.permission_mode;
    config.file_access = options.file_access;
    return config;
}

Result<void> ProtocolConnection::run_handshake(
    std::unique_ptr<ITransport> transport,
    const IFlowOptions& options,
    bool wait_for_ready
) {
    protocol_ = std::make_unique<AcpProtocol>(std::move(transport), events_, protocol_config(options, wait_for_ready));

    auto connected = protocol_->connect();
    if (connected.has_value() == false) {
        return connected;
    }

    auto initialized = protocol_->initialize(mcp_servers_to_json(options.mcp_servers));
    if (initialized.has_value() == false) {
        return initialized;
    }

    if (protocol_->is_authenticated()) {
        IFLOW_LOG_DEBUG("Agent reports the client as already authenticated");
        return {};
    }

    const std::string method_id = options.effective_auth_method_id();
    IFLOW_LOG_INFO("Authenticating with method " + method_id);
    return protocol_->authenticate(method_id);
}

Result<std::string> ProtocolConnection::create_session(const IFlowOptions& options) {
    if (protocol_ == nullptr) {
        return tl::unexpected(Error::not_connected());
    }

    auto session = protocol_->create_session(options.cwd, mcp_servers_to_json(options.mcp_servers));
    if (session.has_value() == false) {
        return tl::unexpected(session.error());
    }

    session_id_ = *session;
    IFLOW_LOG_INFO("Created session " + *session);
    return session;
}

Result<void> ProtocolConnection::send_message(std::string_view session_id, std::string_view text) {
    if (protocol_ == nullptr) {
        return tl::unexpected(Error::not_connected());
    }

    auto sent = protocol_->send_prompt(session_id, text);
    if (sent.has_value() == false) {
        return tl::unexpected(sent.error());
    }
    IFLOW_LOG_DEBUG(std::format("Prompt {} completed", *sent));
    return {};
}

void ProtocolConnection::cancel() noexcept {
    if (protocol_ != nullptr) {
        protocol_->request_cancel();
    }
}

void ProtocolConnection::close_protocol() {
    if (protocol_ != nullptr) {
        protocol_->close();
    }
}

bool ProtocolConnection::is_initialized() const noexcept {
    return (protocol_ != nullptr) && protocol_->is_initialized();
}

bool ProtocolConnection::is_authenticated() const noexcept {
    return (protocol_ != nullptr) && protocol_->is_authenticated();
}

std::optional<std::string> ProtocolConnection::session_id() const {
    return session_id_;
}

}  // namespace iflow
