#pragma once

#include "iflow/connection/protocol_connection.hpp"
#include "iflow/process/process_manager.hpp"

#include <memory>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// StdioConnection - agent spawned as a child, protocol over its stdin/stdout
// ─────────────────────────────────────────────────────────────────────────────
// The agent emits no ready token on stdio, so the handshake starts at once.

class StdioConnection final : public ProtocolConnection {
public:
    explicit StdioConnection(std::shared_ptr<EventChannel> events);
    ~StdioConnection() override;

    [[nodiscard]] Result<void> initialize(const IFlowOptions& options) override;
    void close() override;

    [[nodiscard]] ProcessManager* process() noexcept { return process_.get(); }

private:
    std::unique_ptr<ProcessManager> process_;
};

}  // namespace iflow
