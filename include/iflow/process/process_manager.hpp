#pragma once

// Platform check - ProcessManager requires POSIX APIs (fork, pipe, waitpid)
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessManager is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "iflow/config/options.hpp"
#include "iflow/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// Process Manager Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ProcessManagerConfig {
    std::string executable{"iflow"};
    std::vector<std::string> launch_args{"--experimental-acp"};
    bool debug{false};  ///< Agent stderr passed through instead of discarded
    std::chrono::milliseconds startup_delay{2'000};
    std::size_t port_poll_attempts{30};
    std::chrono::milliseconds port_poll_interval{1'000};
    std::chrono::milliseconds termination_grace{100};

    /// Skip the shell-metacharacter check (tests run plain POSIX utilities)
    bool skip_command_validation{false};

    [[nodiscard]] static ProcessManagerConfig from(const ProcessConfig& process);
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Manager
// ═══════════════════════════════════════════════════════════════════════════
// Spawns and supervises the local agent process. The child is stopped when the
// manager is stopped or destroyed.
//
// Stdio mode:      <executable> <launch_args...>              (stdin/stdout piped)
// WebSocket mode:  <executable> <launch_args...> --port <N>   (agent listens on N)

class ProcessManager {
public:
    explicit ProcessManager(ProcessManagerConfig config);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;
    ProcessManager(ProcessManager&&) = delete;
    ProcessManager& operator=(ProcessManager&&) = delete;

    /// Spawn with piped stdin/stdout, wait startup_delay and verify the child is alive.
    [[nodiscard]] Result<void> start_stdio();

    /// Spawn listening on `port` and poll until it accepts connections.
    /// Returns the agent's WebSocket URL.
    [[nodiscard]] Result<std::string> start_websocket(std::uint16_t port);

    /// SIGTERM, grace period, SIGKILL, reap. Safe to call repeatedly.
    void stop() noexcept;

    /// Reaps the child if it has exited (records exit_code()).
    [[nodiscard]] bool is_running();

    [[nodiscard]] std::optional<pid_t> pid() const;
    [[nodiscard]] std::optional<std::uint16_t> port() const;

    /// Exit status once reaped; negative values are terminating signals.
    [[nodiscard]] std::optional<int> exit_code() const;

    /// Write end of the agent's stdin. Handed out once; the caller owns it.
    [[nodiscard]] std::optional<int> take_stdin();

    /// Read end of the agent's stdout. Handed out once; the caller owns it.
    [[nodiscard]] std::optional<int> take_stdout();

    [[nodiscard]] static bool is_port_listening(std::uint16_t port, const std::string& host = "127.0.0.1");

    /// ws://localhost:<port>/acp?peer=iflow
    [[nodiscard]] static std::string websocket_url(std::uint16_t port);

    /// False for empty commands and for shell metacharacters in the command or arguments.
    [[nodiscard]] static bool is_safe_command(const std::string& command, const std::vector<std::string>& args);

private:
    [[nodiscard]] Result<void> spawn(const std::vector<std::string>& extra_args, bool pipe_stdio);

    /// Must be called with mutex_ held
    void reap_if_exited();

    ProcessManagerConfig config_;

    mutable std::mutex mutex_;
    pid_t child_pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    std::optional<std::uint16_t> port_;
    std::optional<int> exit_code_;
};

}  // namespace iflow
