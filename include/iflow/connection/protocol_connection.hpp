#pragma once

#include "iflow/connection/connection.hpp"
#include "iflow/protocol/acp_protocol.hpp"

#include <memory>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolConnection - session and prompt handling shared by both transports
// ─────────────────────────────────────────────────────────────────────────────
// Subclasses obtain a connected transport and hand it to run_handshake().

class ProtocolConnection : public IConnection {
public:
    ~ProtocolConnection() override = default;

    ProtocolConnection(const ProtocolConnection&) = delete;
    ProtocolConnection& operator=(const ProtocolConnection&) = delete;

    [[nodiscard]] Result<std::string> create_session(const IFlowOptions& options) override;
    [[nodiscard]] Result<void> send_message(std::string_view session_id, std::string_view text) override;
    void cancel() noexcept override;

    [[nodiscard]] bool is_initialized() const noexcept override;
    [[nodiscard]] bool is_authenticated() const noexcept override;
    [[nodiscard]] std::optional<std::string> session_id() const override;

protected:
    explicit ProtocolConnection(std::shared_ptr<EventChannel> events);

    /// Build the engine over `transport`, then initialize and authenticate.
    [[nodiscard]] Result<void> run_handshake(
        std::unique_ptr<ITransport> transport,
        const IFlowOptions& options,
        bool wait_for_ready
    );

    void close_protocol();

    [[nodiscard]] static AcpProtocolConfig protocol_config(const IFlowOptions& options, bool wait_for_ready);

    std::shared_ptr<EventChannel> events_;
    std::unique_ptr<AcpProtocol> protocol_;
    std::optional<std::string> session_id_;
};

}  // namespace iflow
