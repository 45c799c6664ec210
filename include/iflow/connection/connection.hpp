#pragma once

#include "iflow/client/event_channel.hpp"
#include "iflow/config/options.hpp"
#include "iflow/error.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace iflow {

// ═══════════════════════════════════════════════════════════════════════════
// IConnection - one agent connection, either transport
// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle: initialize() -> create_session() -> send_message()* -> close().
// Events produced while a message runs are pushed to the EventChannel the
// connection was built with.

class IConnection {
public:
    virtual ~IConnection() = default;

    /// Bring the agent up (if needed), connect, initialize and authenticate.
    [[nodiscard]] virtual Result<void> initialize(const IFlowOptions& options) = 0;

    [[nodiscard]] virtual Result<std::string> create_session(const IFlowOptions& options) = 0;

    /// Blocks until the agent finishes the prompt.
    [[nodiscard]] virtual Result<void> send_message(std::string_view session_id, std::string_view text) = 0;

    /// Make a send_message() blocked on another thread return early.
    virtual void cancel() noexcept = 0;

    /// Close the connection and stop any agent process it started. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_initialized() const noexcept = 0;
    [[nodiscard]] virtual bool is_authenticated() const noexcept = 0;
    [[nodiscard]] virtual std::optional<std::string> session_id() const = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<IConnection>(
    const IFlowOptions& options,
    std::shared_ptr<EventChannel> events
)>;

/// WebSocketConnection when options.websocket is set, StdioConnection otherwise.
[[nodiscard]] std::unique_ptr<IConnection> make_connection(
    const IFlowOptions& options,
    std::shared_ptr<EventChannel> events
);

}  // namespace iflow
