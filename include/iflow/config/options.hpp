#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Options
// ═══════════════════════════════════════════════════════════════════════════
// Plain aggregates with fluent with_* setters.
//
// Usage:
//   auto options = IFlowOptions{}
//       .with_timeout(std::chrono::seconds{30})
//       .with_permission_mode(PermissionMode::Selective)
//       .with_websocket(WebSocketConfig{}.with_url("ws://localhost:8090/acp?peer=iflow"));

#include "iflow/log/logger.hpp"
#include "iflow/protocol/permission.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace iflow {

using Json = nlohmann::json;

inline constexpr const char* kDefaultWebSocketUrl = "ws://localhost:8090/acp?peer=iflow";
inline constexpr std::uint16_t kDefaultAgentPort = 8090;
inline constexpr const char* kDefaultAuthMethodId = "iflow";
inline constexpr std::size_t kDefaultMaxFileSize = 10 * 1024 * 1024;

// ─────────────────────────────────────────────────────────────────────────────
// Auxiliary tool servers forwarded to the agent
// ─────────────────────────────────────────────────────────────────────────────

struct NameValue {
    std::string name;
    std::string value;
};

struct McpServerConfig {
    enum class Kind { Stdio, Http, Sse };

    Kind kind{Kind::Stdio};
    std::string name;

    // Stdio
    std::string command;
    std::vector<std::string> args;
    std::vector<NameValue> env;

    // Http / Sse
    std::string url;
    std::vector<NameValue> headers;

    [[nodiscard]] static McpServerConfig stdio(
        std::string name,
        std::string command,
        std::vector<std::string> args = {},
        std::vector<NameValue> env = {}
    );
    [[nodiscard]] static McpServerConfig http(std::string name, std::string url, std::vector<NameValue> headers = {});
    [[nodiscard]] static McpServerConfig sse(std::string name, std::string url, std::vector<NameValue> headers = {});

    [[nodiscard]] Json to_json() const;
};

[[nodiscard]] Json mcp_servers_to_json(const std::vector<McpServerConfig>& servers);

// ─────────────────────────────────────────────────────────────────────────────
// Transport and process settings
// ─────────────────────────────────────────────────────────────────────────────

struct WebSocketConfig {
    /// nullopt: start the agent and synthesize the URL from the start port
    std::optional<std::string> url{kDefaultWebSocketUrl};
    std::size_t reconnect_attempts{3};
    std::chrono::milliseconds reconnect_interval{5'000};
    std::chrono::milliseconds connect_timeout{10'000};

    WebSocketConfig& with_url(std::string value);
    WebSocketConfig& with_auto_url();
    WebSocketConfig& with_reconnect(std::size_t attempts, std::chrono::milliseconds interval);
    WebSocketConfig& with_connect_timeout(std::chrono::milliseconds value);
};

struct ProcessConfig {
    bool auto_start{true};
    std::optional<std::uint16_t> start_port;
    bool debug{false};  ///< Pass the agent's stderr through instead of discarding it
    std::string executable{"iflow"};
    std::chrono::milliseconds startup_delay{2'000};
    std::size_t port_poll_attempts{30};
    std::chrono::milliseconds port_poll_interval{1'000};

    ProcessConfig& with_auto_start(bool value);
    ProcessConfig& with_start_port(std::uint16_t value);
    ProcessConfig& with_debug(bool value);
    ProcessConfig& with_executable(std::string value);

    [[nodiscard]] std::uint16_t effective_port() const noexcept {
        return start_port.value_or(kDefaultAgentPort);
    }
};

/// Message log: every event the caller consumes, appended to a rotated file
struct LoggingConfig {
    bool enabled{false};
    LogLevel level{LogLevel::Info};
    std::string log_file{"iflow_messages.log"};
    std::size_t max_file_size{kDefaultMaxFileSize};
    std::size_t max_files{5};

    LoggingConfig& with_enabled(bool value);
    LoggingConfig& with_level(LogLevel value);
    LoggingConfig& with_log_file(std::string value);
    LoggingConfig& with_rotation(std::size_t max_size, std::size_t max_count);
};

struct FileAccessConfig {
    bool enabled{false};
    std::vector<std::string> allowed_dirs;  ///< Empty: any path
    bool read_only{false};
    std::size_t max_size{kDefaultMaxFileSize};

    FileAccessConfig& with_enabled(bool value);
    FileAccessConfig& add_allowed_dir(std::string dir);
    FileAccessConfig& with_read_only(bool value);
    FileAccessConfig& with_max_size(std::size_t value);
};

// ─────────────────────────────────────────────────────────────────────────────
// IFlowOptions
// ─────────────────────────────────────────────────────────────────────────────

struct IFlowOptions {
    std::string cwd{current_directory()};
    std::vector<McpServerConfig> mcp_servers;
    std::chrono::milliseconds timeout{120'000};
    std::map<std::string, std::string> metadata;
    FileAccessConfig file_access;
    ProcessConfig process;
    std::optional<std::string> auth_method_id;
    LoggingConfig logging;
    std::optional<WebSocketConfig> websocket;  ///< nullopt: stdio mode
    PermissionMode permission_mode{PermissionMode::Auto};

    IFlowOptions& with_cwd(std::string value);
    IFlowOptions& add_mcp_server(McpServerConfig server);
    IFlowOptions& with_timeout(std::chrono::milliseconds value);
    IFlowOptions& with_metadata(std::string key, std::string value);
    IFlowOptions& with_file_access(FileAccessConfig value);
    IFlowOptions& with_process(ProcessConfig value);
    IFlowOptions& with_auth_method_id(std::string value);
    IFlowOptions& with_logging(LoggingConfig value);
    IFlowOptions& with_websocket(WebSocketConfig value);
    IFlowOptions& with_stdio();
    IFlowOptions& with_permission_mode(PermissionMode value);

    [[nodiscard]] bool uses_websocket() const noexcept {
        return websocket.has_value();
    }

    [[nodiscard]] std::string effective_auth_method_id() const {
        return auth_method_id.value_or(kDefaultAuthMethodId);
    }

    /// Process working directory, or "." when it cannot be determined
    [[nodiscard]] static std::string current_directory();
};

}  // namespace iflow
