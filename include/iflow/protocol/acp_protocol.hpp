#pragma once

#include "iflow/client/event_channel.hpp"
#include "iflow/config/options.hpp"
#include "iflow/error.hpp"
#include "iflow/protocol/json_rpc.hpp"
#include "iflow/protocol/notification_dispatcher.hpp"
#include "iflow/transport.hpp"
#include "iflow/transport/backoff_policy.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace iflow {

// Client -> server methods
inline constexpr std::string_view kMethodInitialize{"initialize"};
inline constexpr std::string_view kMethodAuthenticate{"authenticate"};
inline constexpr std::string_view kMethodSessionNew{"session/new"};
inline constexpr std::string_view kMethodSessionPrompt{"session/prompt"};

inline constexpr int kAcpProtocolVersion = 1;

enum class ProtocolState {
    Disconnected,
    AwaitingReady,
    Initializing,
    Initialized,     ///< Initialized but not authenticated
    Authenticated,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(ProtocolState state) noexcept {
    switch (state) {
        case ProtocolState::Disconnected:  return "Disconnected";
        case ProtocolState::AwaitingReady: return "AwaitingReady";
        case ProtocolState::Initializing:  return "Initializing";
        case ProtocolState::Initialized:   return "Initialized";
        case ProtocolState::Authenticated: return "Authenticated";
        case ProtocolState::Closed:        return "Closed";
    }
    return "Unknown";
}

/// How a blocking wait treats a permission request that shares the awaited id
enum class WaitMode {
    Plain,             ///< Any frame with the awaited id is the response
    NotificationAware  ///< Permission requests are answered, never returned
};

struct AcpProtocolConfig {
    /// Budget for every blocking exchange (ready wait, each request)
    std::chrono::milliseconds timeout{120'000};
    /// Upper bound of a single receive inside a wait
    std::chrono::milliseconds poll_interval{1'000};
    /// The stdio agent emits no ready token
    bool wait_for_ready{true};
    std::chrono::milliseconds ready_settle_delay{100};
    std::size_t initialize_send_attempts{3};
    std::shared_ptr<IBackoffPolicy> send_backoff = std::make_shared<ConstantBackoff>(std::chrono::milliseconds{500});
    PermissionMode permission_mode{PermissionMode::Auto};
    FileAccessConfig file_access;
};

// ═══════════════════════════════════════════════════════════════════════════
// AcpProtocol
// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC correlation engine for one connection. Owns the transport, the
// request counter and the handshake state; state only moves forward, so a
// fresh connection needs a fresh instance. Not thread-safe: a single task
// drives it.
//
// Usage:
//   AcpProtocol protocol(std::move(transport), events, config);
//   protocol.connect();
//   protocol.initialize(mcp_servers_to_json(servers));
//   if (protocol.is_authenticated() == false) protocol.authenticate("iflow");
//   auto session = protocol.create_session(cwd, Json::array());
//   protocol.send_prompt(*session, "hello");   // events arrive on `events`

class AcpProtocol {
public:
    AcpProtocol(
        std::unique_ptr<ITransport> transport,
        std::shared_ptr<EventChannel> events,
        AcpProtocolConfig config = {}
    );
    ~AcpProtocol();

    AcpProtocol(const AcpProtocol&) = delete;
    AcpProtocol& operator=(const AcpProtocol&) = delete;
    AcpProtocol(AcpProtocol&&) = delete;
    AcpProtocol& operator=(AcpProtocol&&) = delete;

    /// Connect the transport (if needed): Disconnected -> AwaitingReady.
    [[nodiscard]] Result<void> connect();

    /// Wait for the ready token, then run `initialize`. `mcp_servers` is a JSON
    /// array; it is omitted from the request when empty.
    [[nodiscard]] Result<void> initialize(const Json& mcp_servers = Json::array());

    [[nodiscard]] Result<void> authenticate(
        std::string_view method_id,
        std::optional<Json> method_info = std::nullopt
    );

    /// Returns the agent's session id, or "session_<request id>" if it sent none.
    [[nodiscard]] Result<std::string> create_session(std::string_view cwd, const Json& mcp_servers = Json::array());

    /// Blocks until the prompt's terminal response, dispatching streamed
    /// updates meanwhile, then emits TaskFinished. Returns the request id.
    [[nodiscard]] Result<RequestId> send_prompt(std::string_view session_id, std::string_view text);

    /// Close the transport. Idempotent.
    void close();

    /// Ask a wait running on another thread to give up at its next poll.
    /// The interrupted call fails with a Connection error.
    void request_cancel() noexcept { cancelled_.store(true); }

    /// Block until the response to `id` arrives or the timeout elapses.
    [[nodiscard]] Result<Json> wait_for_response(RequestId id, WaitMode mode);

    [[nodiscard]] ProtocolState state() const noexcept { return state_; }
    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_authenticated() const noexcept { return state_ == ProtocolState::Authenticated; }
    [[nodiscard]] PermissionMode permission_mode() const noexcept { return dispatcher_.permission_mode(); }
    void set_permission_mode(PermissionMode mode) noexcept { dispatcher_.set_permission_mode(mode); }
    [[nodiscard]] const AcpProtocolConfig& config() const noexcept { return config_; }
    [[nodiscard]] ITransport& transport() noexcept { return *transport_; }

private:
    [[nodiscard]] Result<void> wait_for_ready();
    [[nodiscard]] Result<Frame> next_frame(std::chrono::steady_clock::time_point deadline, std::string_view awaiting);
    [[nodiscard]] Result<RequestId> send_request(std::string_view method, Json params);
    [[nodiscard]] Result<RequestId> send_request_with_retry(std::string_view method, Json params, std::size_t attempts);
    [[nodiscard]] Result<void> require_state(ProtocolState required, std::string_view operation) const;
    [[nodiscard]] RequestId next_request_id() noexcept;

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<EventChannel> events_;
    AcpProtocolConfig config_;
    NotificationDispatcher dispatcher_;
    ProtocolState state_{ProtocolState::Disconnected};
    RequestId next_id_{1};
    std::atomic<bool> cancelled_{false};
};

}  // namespace iflow
