#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by all transport implementations.
//
// For the WebSocket transport, use: #include "iflow/transport/websocket_transport.hpp"
// For the agent's piped stdio, use: #include "iflow/transport/pipe_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace iflow {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// Frame - one complete text message
// ─────────────────────────────────────────────────────────────────────────────

enum class FrameKind {
    Text,    ///< A text payload (JSON-RPC object or control token)
    Closed   ///< The peer sent a close frame (graceful shutdown)
};

struct Frame {
    FrameKind kind{FrameKind::Text};
    std::string payload;

    [[nodiscard]] static Frame text(std::string payload) {
        return Frame{FrameKind::Text, std::move(payload)};
    }

    [[nodiscard]] static Frame closed(std::string reason = {}) {
        return Frame{FrameKind::Closed, std::move(reason)};
    }

    [[nodiscard]] bool is_closed() const noexcept {
        return kind == FrameKind::Closed;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ITransport - frame-oriented byte carrier with no protocol knowledge
// ─────────────────────────────────────────────────────────────────────────────
// Implementations are driven by a single task; send() calls must not overlap.

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Establish the connection. Succeeds immediately when already connected.
    [[nodiscard]] virtual TransportResult<void> connect() = 0;

    /// Write one text frame.
    [[nodiscard]] virtual TransportResult<void> send_text(std::string_view text) = 0;

    /// Serialize and write one JSON message as a single text frame.
    [[nodiscard]] TransportResult<void> send(const Json& message) {
        std::string text;
        try {
            text = message.dump();
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(TransportError{
                TransportError::Category::Protocol,
                "Failed to serialize message: " + std::string(e.what())
            });
        }
        return send_text(text);
    }

    /// Block until exactly one frame arrives.
    [[nodiscard]] virtual TransportResult<Frame> receive() = 0;

    /// Wait at most `timeout` for one frame. std::nullopt means nothing arrived.
    [[nodiscard]] virtual TransportResult<std::optional<Frame>> receive_with_timeout(
        std::chrono::milliseconds timeout
    ) = 0;

    /// Close the connection. Closing an already closed transport succeeds.
    virtual TransportResult<void> close() = 0;

    [[nodiscard]] virtual bool is_connected() const noexcept = 0;
};

}  // namespace iflow
