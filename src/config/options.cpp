#include "iflow/config/options.hpp"

#include <filesystem>
#include <system_error>

namespace iflow {

namespace {

Json name_values_to_json(const std::vector<NameValue>& pairs) {
    Json list = Json::array();
    for (const auto& pair : pairs) {
        list.push_back({{"name", pair.name}, {"value", pair.value}});
    }
    return list;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// McpServerConfig
// ─────────────────────────────────────────────────────────────────────────────

McpServerConfig McpServerConfig::stdio(
    std::string name,
    std::string command,
    std::vector<std::string> args,
    std::vector<NameValue> env
) {
    McpServerConfig server;
    server.kind = Kind::Stdio;
    server.name = std::move(name);
    server.command = std::move(command);
    server.args = std::move(args);
    server.env = std::move(env);
    return server;
}

McpServerConfig McpServerConfig::http(std::string name, std::string url, std::vector<NameValue> headers) {
    McpServerConfig server;
    server.kind = Kind::Http;
    server.name = std::move(name);
    server.url = std::move(url);
    server.headers = std::move(headers);
    return server;
}

McpServerConfig McpServerConfig::sse(std::string name, std::string url, std::vector<NameValue> headers) {
    McpServerConfig server = http(std::move(name), std::move(url), std::move(headers));
    server.kind = Kind::Sse;
    return server;
}

Json McpServerConfig::to_json() const {
    switch (kind) {
        case Kind::Stdio:
            return Json{
                {"name", name},
                {"command", command},
                {"args", args},
                {"env", name_values_to_json(env)}
            };
        case Kind::Http:
        case Kind::Sse:
            return Json{
                {"type", (kind == Kind::Http) ? "http" : "sse"},
                {"name", name},
                {"url", url},
                {"headers", name_values_to_json(headers)}
            };
    }
    return Json::object();
}

Json mcp_servers_to_json(const std::vector<McpServerConfig>& servers) {
    Json list = Json::array();
    for (const auto& server : servers) {
        list.push_back(server.to_json());
    }
    return list;
}

// ─────────────────────────────────────────────────────────────────────────────
// WebSocketConfig
// ─────────────────────────────────────────────────────────────────────────────

WebSocketConfig& WebSocketConfig::with_url(std::string value) {
    url = std::move(value);
    return *this;
}

WebSocketConfig& WebSocketConfig::with_auto_url() {
    url.reset();
    return *this;
}

WebSocketConfig& WebSocketConfig::with_reconnect(std::size_t attempts, std::chrono::milliseconds interval) {
    reconnect_attempts = attempts;
    reconnect_interval = interval;
    return *this;
}

WebSocketConfig& WebSocketConfig::with_connect_timeout(std::chrono::milliseconds value) {
    connect_timeout = value;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// ProcessConfig
// ─────────────────────────────────────────────────────────────────────────────

ProcessConfig& ProcessConfig::with_auto_start(bool value) {
    auto_start = value;
    return *this;
}

ProcessConfig& ProcessConfig::with_start_port(std::uint16_t value) {
    start_port = value;
    return *this;
}

ProcessConfig& ProcessConfig::with_debug(bool value) {
    debug = value;
    return *this;
}

ProcessConfig& ProcessConfig::with_executable(std::string value) {
    executable = std::move(value);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// LoggingConfig / FileAccessConfig
// ─────────────────────────────────────────────────────────────────────────────

LoggingConfig& LoggingConfig::with_enabled(bool value) {
    enabled = value;
    return *this;
}

LoggingConfig& LoggingConfig::with_level(LogLevel value) {
    level = value;
    return *this;
}

LoggingConfig& LoggingConfig::with_log_file(std::string value) {
    log_file = std::move(value);
    return *this;
}

LoggingConfig& LoggingConfig::with_rotation(std::size_t max_size, std::size_t max_count) {
    max_file_size = max_size;
    max_files = max_count;
    return *this;
}

FileAccessConfig& FileAccessConfig::with_enabled(bool value) {
    enabled = value;
    return *this;
}

FileAccessConfig& FileAccessConfig::add_allowed_dir(std::string dir) {
    allowed_dirs.push_back(std::move(dir));
    return *this;
}

FileAccessConfig& FileAccessConfig::with_read_only(bool value) {
    read_only = value;
    return *this;
}

FileAccessConfig& FileAccessConfig::with_max_size(std::size_t value) {
    max_size = value;
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// IFlowOptions
// ─────────────────────────────────────────────────────────────────────────────

IFlowOptions& IFlowOptions::with_cwd(std::string value) {
    cwd = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::add_mcp_server(McpServerConfig server) {
    mcp_servers.push_back(std::move(server));
    return *this;
}

IFlowOptions& IFlowOptions::with_timeout(std::chrono::milliseconds value) {
    timeout = value;
    return *this;
}

IFlowOptions& IFlowOptions::with_metadata(std::string key, std::string value) {
    metadata.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

IFlowOptions& IFlowOptions::with_file_access(FileAccessConfig value) {
    file_access = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::with_process(ProcessConfig value) {
    process = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::with_auth_method_id(std::string value) {
    auth_method_id = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::with_logging(LoggingConfig value) {
    logging = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::with_websocket(WebSocketConfig value) {
    websocket = std::move(value);
    return *this;
}

IFlowOptions& IFlowOptions::with_stdio() {
    websocket.reset();
    return *this;
}

IFlowOptions& IFlowOptions::with_permission_mode(PermissionMode value) {
    permission_mode = value;
    return *this;
}

std::string IFlowOptions::current_directory() {
    std::error_code ec;
    const auto path = std::filesystem::current_path(ec);
    if (ec) {
        return ".";
    }
    return path.string();
}

}  // namespace iflow
