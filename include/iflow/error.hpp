#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// iFlow Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type for the protocol engine, connections and client facade.

#include "iflow/protocol/json_rpc.hpp"
#include "iflow/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace iflow {

/// Error kinds surfaced to callers
enum class ErrorCode {
    Connection,       ///< Transport failure or peer closed the connection
    Protocol,         ///< Malformed or out-of-sequence JSON-RPC exchange
    Authentication,   ///< The agent rejected authentication
    Timeout,          ///< A bounded wait was exceeded
    ProcessManager,   ///< Spawning or polling the agent process failed
    NotConnected,     ///< Operation attempted before connect()
    SessionNotFound,  ///< Prompt attempted before a session exists
    InvalidMessage    ///< Payload failed to parse
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Connection:      return "Connection";
        case ErrorCode::Protocol:        return "Protocol";
        case ErrorCode::Authentication:  return "Authentication";
        case ErrorCode::Timeout:         return "Timeout";
        case ErrorCode::ProcessManager:  return "ProcessManager";
        case ErrorCode::NotConnected:    return "NotConnected";
        case ErrorCode::SessionNotFound: return "SessionNotFound";
        case ErrorCode::InvalidMessage:  return "InvalidMessage";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Original RPC error if from the agent

    /// "Protocol: message" form for logs and CLI output
    [[nodiscard]] std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error connection(std::string msg) {
        return {ErrorCode::Connection, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error protocol(std::string msg) {
        return {ErrorCode::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error authentication(std::string msg) {
        return {ErrorCode::Authentication, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error timeout(std::string msg) {
        return {ErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error process_manager(std::string msg) {
        return {ErrorCode::ProcessManager, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error not_connected() {
        return {ErrorCode::NotConnected, "Not connected", std::nullopt};
    }

    [[nodiscard]] static Error session_not_found() {
        return {ErrorCode::SessionNotFound, "No active session", std::nullopt};
    }

    [[nodiscard]] static Error invalid_message(std::string msg) {
        return {ErrorCode::InvalidMessage, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static Error from_rpc_error(ErrorCode code, std::string_view context, const JsonRpcError& err) {
        return {code, std::string(context) + ": " + err.message, err};
    }

    /// Transport timeouts stay timeouts; every other transport failure is a connection error.
    [[nodiscard]] static Error from_transport(const TransportError& err) {
        const bool is_timeout = (err.category == TransportError::Category::Timeout);
        return {is_timeout ? ErrorCode::Timeout : ErrorCode::Connection, err.message, std::nullopt};
    }
};

/// Result type for fallible operations
template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace iflow
