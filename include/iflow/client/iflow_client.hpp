#pragma once

#include "iflow/client/event_channel.hpp"
#include "iflow/config/options.hpp"
#include "iflow/connection/connection.hpp"
#include "iflow/error.hpp"
#include "iflow/log/message_logger.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace iflow {

// ═══════════════════════════════════════════════════════════════════════════
// IFlow Client
// ═══════════════════════════════════════════════════════════════════════════
// Session facade over one agent connection. Prompts run on a background
// thread; their events are read with receive_message() on the caller's.
//
// Usage:
//   IFlowClient client(IFlowOptions{}.with_websocket(WebSocketConfig{}));
//   client.connect();
//   client.send_message("Explain this repository");
//   while (auto event = client.receive_message()) {
//       if (auto text = event_text(*event)) std::cout << *text;
//       if (is_task_finished(*event)) break;
//   }
//   client.disconnect();

class IFlowClient {
public:
    explicit IFlowClient(IFlowOptions options);
    IFlowClient(IFlowOptions options, ConnectionFactory connection_factory);
    ~IFlowClient();

    IFlowClient(const IFlowClient&) = delete;
    IFlowClient& operator=(const IFlowClient&) = delete;
    IFlowClient(IFlowClient&&) = delete;
    IFlowClient& operator=(IFlowClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect, initialize and authenticate. A no-op when already connected.
    [[nodiscard]] Result<void> connect();

    /// Cancel any running prompt, close the connection, then close the
    /// event channel so a blocked receive_message() returns. Idempotent.
    void disconnect();

    [[nodiscard]] bool is_connected() const noexcept { return connected_.load(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Messaging
    // ─────────────────────────────────────────────────────────────────────────

    /// Start a prompt. The session is created on first use and reused after.
    /// Waits for the previous prompt to finish first.
    [[nodiscard]] Result<void> send_message(std::string_view text);

    /// Next event; nullopt once the channel is closed and drained.
    [[nodiscard]] std::optional<Event> receive_message();

    /// Next event within `timeout`; nullopt if none arrived.
    [[nodiscard]] std::optional<Event> receive_message_for(std::chrono::milliseconds timeout);

    /// Emit TaskFinished{"interrupted"} so the consumer stops reading.
    [[nodiscard]] Result<void> interrupt();

    [[nodiscard]] std::shared_ptr<EventChannel> messages() const noexcept { return channel_; }
    [[nodiscard]] std::optional<std::string> session_id() const { return session_id_; }
    [[nodiscard]] const IFlowOptions& options() const noexcept { return options_; }

private:
    void join_worker();
    void record(const std::optional<Event>& event);

    IFlowOptions options_;
    ConnectionFactory connection_factory_;

    std::shared_ptr<EventChannel> channel_;
    std::unique_ptr<IConnection> connection_;
    std::unique_ptr<MessageLogger> message_logger_;
    std::optional<std::string> session_id_;

    std::thread worker_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> stopping_{false};
};

}  // namespace iflow
