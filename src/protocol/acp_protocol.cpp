#include "iflow/protocol/acp_protocol.hpp"
#include "iflow/log/logger.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace iflow {

namespace {

using Clock = std::chrono::steady_clock;

std::optional<std::string> string_member(const Json& node, const char* key) {
    if (node.is_object() == false) {
        return std::nullopt;
    }
    const auto it = node.find(key);
    if ((it == node.end()) || (it->is_string() == false)) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool bool_member(const Json& node, const char* key, bool fallback) {
    if (node.is_object() == false) {
        return fallback;
    }
    const auto it = node.find(key);
    if ((it == node.end()) || (it->is_boolean() == false)) {
        return fallback;
    }
    return it->get<bool>();
}

bool is_non_empty_array(const Json& node) {
    return node.is_array() && (node.empty() == false);
}

}  // namespace

AcpProtocol::AcpProtocol(
    std::unique_ptr<ITransport> transport,
    std::shared_ptr<EventChannel> events,
    AcpProtocolConfig config
)
    : transport_(std::move(transport))
    , events_(std::move(events))
    , config_(std::move(config))
    , dispatcher_(events_, config_.permission_mode, config_.file_access)
{
    if (config_.send_backoff == nullptr) {
        config_.send_backoff = std::make_shared<NoBackoff>();
    }
    config_.poll_interval = std::max(config_.poll_interval, std::chrono::milliseconds{1});
}

AcpProtocol::~AcpProtocol() {
    close();
}

bool AcpProtocol::is_initialized() const noexcept {
    return (state_ == ProtocolState::Initialized) || (state_ == ProtocolState::Authenticated);
}

// ─────────────────────────────────────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────────────────────────────────────

Result<void> AcpProtocol::connect() {
    if (state_ == ProtocolState::Closed) {
        return tl::unexpected(Error::connection("Protocol engine is closed; a new connection needs a new engine"));
    }
    if (state_ != ProtocolState::Disconnected) {
        return {};
    }

    if (transport_->is_connected() == false) {
        auto connected = transport_->connect();
        if (connected.has_value() == false) {
            return tl::unexpected(Error::from_transport(connected.error()));
        }
    }

    state_ = ProtocolState::AwaitingReady;
    IFLOW_LOG_DEBUG("Transport connected, awaiting ready signal");
    return {};
}

Result<void> AcpProtocol::initialize(const Json& mcp_servers) {
    if ((state_ == ProtocolState::Disconnected) || (state_ == ProtocolState::Closed)) {
        return tl::unexpected(Error::not_connected());
    }
    if (is_initialized()) {
        IFLOW_LOG_DEBUG("initialize() called on an initialized connection");
        return {};
    }

    if (state_ == ProtocolState::AwaitingReady) {
        if (config_.wait_for_ready) {
            auto ready = wait_for_ready();
            if (ready.has_value() == false) {
                return ready;
            }
            // The agent needs a moment between the ready token and the first request
            std::this_thread::sleep_for(config_.ready_settle_delay);
        }
        state_ = ProtocolState::Initializing;
    }

    Json params = {
        {"protocolVersion", kAcpProtocolVersion},
        {"clientCapabilities", {{"fs", dispatcher_.file_access().capabilities()}}}
    };
    if (is_non_empty_array(mcp_servers)) {
        params["mcpServers"] = mcp_servers;
    }

    auto id = send_request_with_retry(kMethodInitialize, std::move(params), config_.initialize_send_attempts);
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    auto response = wait_for_response(*id, WaitMode::Plain);
    if (response.has_value() == false) {
        return tl::unexpected(response.error());
    }

    if (response->contains("error")) {
        return tl::unexpected(Error::from_rpc_error(
            ErrorCode::Protocol, "Initialize failed", JsonRpcError::from_json(response->at("error"))));
    }
    if (response->contains("result") == false) {
        return tl::unexpected(Error::protocol("Invalid initialize response"));
    }

    const bool pre_authenticated = bool_member(response->at("result"), "isAuthenticated", false);
    state_ = pre_authenticated ? ProtocolState::Authenticated : ProtocolState::Initialized;
    IFLOW_LOG_INFO(std::format("Initialized (agent reports authenticated: {})", pre_authenticated));
    return {};
}

Result<void> AcpProtocol::authenticate(std::string_view method_id, std::optional<Json> method_info) {
    if (state_ == ProtocolState::Authenticated) {
        IFLOW_LOG_DEBUG("authenticate() called on an authenticated connection");
        return {};
    }
    auto allowed = require_state(ProtocolState::Initialized, "authenticate");
    if (allowed.has_value() == false) {
        return allowed;
    }

    Json params = {{"methodId", method_id}};
    if (method_info.has_value()) {
        params["methodInfo"] = std::move(*method_info);
    }

    auto id = send_request(kMethodAuthenticate, std::move(params));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    auto response = wait_for_response(*id, WaitMode::Plain);
    if (response.has_value() == false) {
        return tl::unexpected(response.error());
    }

    if (response->contains("error")) {
        return tl::unexpected(Error::from_rpc_error(
            ErrorCode::Authentication, "Authentication failed", JsonRpcError::from_json(response->at("error"))));
    }
    if (response->contains("result") == false) {
        return tl::unexpected(Error::protocol("Invalid authenticate response"));
    }

    // The agent is authoritative: a differing echoed method id is still success
    const auto echoed = string_member(response->at("result"), "methodId");
    if (echoed.has_value() && (*echoed != method_id)) {
        IFLOW_LOG_WARN(std::format("Authenticated with method '{}' but requested '{}'", *echoed, method_id));
    }

    state_ = ProtocolState::Authenticated;
    IFLOW_LOG_INFO("Authenticated");
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────────────────────────────────────

Result<std::string> AcpProtocol::create_session(std::string_view cwd, const Json& mcp_servers) {
    auto allowed = require_state(ProtocolState::Authenticated, "create a session");
    if (allowed.has_value() == false) {
        return tl::unexpected(allowed.error());
    }

    Json params = {
        {"cwd", cwd},
        {"mcpServers", mcp_servers.is_array() ? mcp_servers : Json::array()}
    };

    auto id = send_request(kMethodSessionNew, std::move(params));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    auto response = wait_for_response(*id, WaitMode::Plain);
    if (response.has_value() == false) {
        return tl::unexpected(response.error());
    }

    if (response->contains("error")) {
        return tl::unexpected(Error::from_rpc_error(
            ErrorCode::Protocol, "Failed to create session", JsonRpcError::from_json(response->at("error"))));
    }
    if (response->contains("result") == false) {
        return tl::unexpected(Error::protocol("Invalid session/new response"));
    }

    if (auto session_id = string_member(response->at("result"), "sessionId")) {
        IFLOW_LOG_INFO("Created session " + *session_id);
        return *session_id;
    }

    std::string fallback = "session_" + std::to_string(*id);
    IFLOW_LOG_WARN("Agent returned no session id, using local fallback " + fallback);
    return fallback;
}

Result<RequestId> AcpProtocol::send_prompt(std::string_view session_id, std::string_view text) {
    auto allowed = require_state(ProtocolState::Authenticated, "send a prompt");
    if (allowed.has_value() == false) {
        return tl::unexpected(allowed.error());
    }
    if (session_id.empty()) {
        return tl::unexpected(Error::session_not_found());
    }

    Json params = {
        {"sessionId", session_id},
        {"prompt", Json::array({{{"type", "text"}, {"text", text}}})}
    };

    auto id = send_request(kMethodSessionPrompt, std::move(params));
    if (id.has_value() == false) {
        return tl::unexpected(id.error());
    }

    auto response = wait_for_response(*id, WaitMode::NotificationAware);
    if (response.has_value() == false) {
        return tl::unexpected(response.error());
    }

    if (response->contains("error")) {
        return tl::unexpected(Error::from_rpc_error(
            ErrorCode::Protocol, "Prompt failed", JsonRpcError::from_json(response->at("error"))));
    }
    if (response->contains("result") == false) {
        return tl::unexpected(Error::protocol("Invalid session/prompt response"));
    }

    auto reason = string_member(response->at("result"), "stopReason").value_or("completed");
    IFLOW_LOG_DEBUG("Prompt finished: " + reason);
    if (events_ != nullptr) {
        events_->push(TaskFinished{std::move(reason)});
    }
    return *id;
}

void AcpProtocol::close() {
    if (state_ == ProtocolState::Closed) {
        return;
    }
    auto closed = transport_->close();
    if (closed.has_value() == false) {
        IFLOW_LOG_WARN("Error while closing transport: " + closed.error().message);
    }
    state_ = ProtocolState::Closed;
    IFLOW_LOG_DEBUG("Protocol engine closed");
}

// ─────────────────────────────────────────────────────────────────────────────
// Waits
// ─────────────────────────────────────────────────────────────────────────────
// Both waits chain short polls against one wall-clock deadline. A poll that
// yields nothing is not an error; any transport failure ends the wait.

Result<Frame> AcpProtocol::next_frame(Clock::time_point deadline, std::string_view awaiting) {
    while (true) {
        if (cancelled_.load()) {
            return tl::unexpected(Error::connection(std::format("Cancelled while waiting for {}", awaiting)));
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return tl::unexpected(Error::timeout(std::format(
                "Timed out after {}ms waiting for {}", config_.timeout.count(), awaiting)));
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto poll = std::clamp(remaining, std::chrono::milliseconds{1}, config_.poll_interval);

        auto received = transport_->receive_with_timeout(poll);
        if (received.has_value() == false) {
            if (received.error().category == TransportError::Category::Timeout) {
                continue;
            }
            IFLOW_LOG_ERROR(std::format("Transport error while waiting for {}: {}", awaiting, received.error().message));
            return tl::unexpected(Error::from_transport(received.error()));
        }
        if (received->has_value() == false) {
            continue;
        }

        Frame frame = std::move(**received);
        if (frame.is_closed()) {
            std::string message = "Connection closed by agent";
            if (frame.payload.empty() == false) {
                message += ": " + frame.payload;
            }
            return tl::unexpected(Error::connection(std::move(message)));
        }

        IFLOW_LOG_TRACE("<- " + frame.payload);
        return frame;
    }
}

Result<void> AcpProtocol::wait_for_ready() {
    const auto deadline = Clock::now() + config_.timeout;
    while (true) {
        auto frame = next_frame(deadline, "ready signal");
        if (frame.has_value() == false) {
            return tl::unexpected(frame.error());
        }

        const auto classified = classify_frame(frame->payload);
        if (const auto* control = std::get_if<ControlFrame>(&classified)) {
            if (control->is_ready()) {
                IFLOW_LOG_DEBUG("Agent is ready");
                return {};
            }
            IFLOW_LOG_DEBUG("Control frame before ready: " + control->token);
            continue;
        }
        IFLOW_LOG_DEBUG("Ignoring frame before ready: " + frame->payload);
    }
}

Result<Json> AcpProtocol::wait_for_response(RequestId id, WaitMode mode) {
    const auto deadline = Clock::now() + config_.timeout;
    const std::string awaiting = std::format("response to request {}", id);

    while (true) {
        auto frame = next_frame(deadline, awaiting);
        if (frame.has_value() == false) {
            return tl::unexpected(frame.error());
        }

        auto classified = classify_frame(frame->payload);

        if (const auto* control = std::get_if<ControlFrame>(&classified)) {
            IFLOW_LOG_DEBUG("Control frame: " + control->token);
            continue;
        }
        if (const auto* malformed = std::get_if<MalformedFrame>(&classified)) {
            IFLOW_LOG_DEBUG(std::format("Skipping frame ({}): {}", malformed->reason, malformed->raw));
            continue;
        }
        if (auto* response = std::get_if<ResponseFrame>(&classified)) {
            if (id_matches(response->id, id)) {
                return std::move(response->message);
            }
            dispatcher_.route_unmatched_response(*response);
            continue;
        }

        auto& call = std::get<ServerCallFrame>(classified);
        const bool carries_awaited_id = call.id.has_value() && id_matches(*call.id, id);
        const bool answer_instead = (mode == WaitMode::NotificationAware) && (call.method == kMethodRequestPermission);
        if (carries_awaited_id && (answer_instead == false)) {
            return std::move(call.message);
        }

        auto dispatched = dispatcher_.dispatch(call, *transport_);
        if (dispatched.has_value() == false) {
            return tl::unexpected(Error::from_transport(dispatched.error()));
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

Result<RequestId> AcpProtocol::send_request(std::string_view method, Json params) {
    const JsonRpcRequest request(std::string(method), next_request_id(), std::move(params));
    IFLOW_LOG_TRACE("-> " + std::string(method));

    auto sent = transport_->send(request.to_json());
    if (sent.has_value() == false) {
        return tl::unexpected(Error::connection(std::format("Failed to send {}: {}", method, sent.error().message)));
    }
    return request.id();
}

Result<RequestId> AcpProtocol::send_request_with_retry(std::string_view method, Json params, std::size_t attempts) {
    attempts = std::max<std::size_t>(attempts, 1);
    const JsonRpcRequest request(std::string(method), next_request_id(), std::move(params));
    const Json message = request.to_json();

    std::string last_error;
    for (std::size_t attempt = 0; attempt < attempts; ++attempt) {
        auto sent = transport_->send(message);
        if (sent.has_value()) {
            return request.id();
        }
        last_error = sent.error().message;
        IFLOW_LOG_WARN(std::format("Sending {} failed (attempt {}/{}): {}", method, attempt + 1, attempts, last_error));

        const bool has_more_attempts = (attempt + 1 < attempts);
        if (has_more_attempts) {
            std::this_thread::sleep_for(config_.send_backoff->next_delay(attempt));
        }
    }

    return tl::unexpected(Error::protocol(std::format(
        "Failed to send {} request after {} attempts: {}", method, attempts, last_error)));
}

Result<void> AcpProtocol::require_state(ProtocolState required, std::string_view operation) const {
    if (state_ == required) {
        return {};
    }
    if ((state_ == ProtocolState::Disconnected) || (state_ == ProtocolState::Closed)) {
        return tl::unexpected(Error::not_connected());
    }
    const std::string_view missing = (required == ProtocolState::Authenticated) ? "not authenticated" : "not initialized";
    return tl::unexpected(Error::protocol(std::format(
        "Cannot {}: {} (state: {})", operation, missing, to_string(state_))));
}

RequestId AcpProtocol::next_request_id() noexcept {
    return next_id_++;
}

}  // namespace iflow
