#include "iflow/process/process_manager.hpp"
#include "iflow/log/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>
#include <format>
#include <thread>
#include <utility>

namespace iflow {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::milliseconds kPortProbeTimeout{1'000};
constexpr std::chrono::milliseconds kExitPollInterval{10};

std::string errno_message() {
    return std::string(std::strerror(errno));
}

void close_fd(int& fd) noexcept {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

// Runs on the destructor path, so a failing logger must not escape
void log_agent_stopped(pid_t pid) noexcept {
    try {
        IFLOW_LOG_INFO(std::format("Stopped agent process (pid {})", pid));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "iflow: failed to log agent shutdown: %s\n", e.what());
    }
}

void redirect_to_devnull(int target_fd, int flags) {
    const int devnull = ::open("/dev/null", flags);
    if (devnull != -1) {
        ::dup2(devnull, target_fd);
        ::close(devnull);
    }
}

std::optional<int> decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return std::nullopt;
}

}  // namespace

ProcessManagerConfig ProcessManagerConfig::from(const ProcessConfig& process) {
    ProcessManagerConfig config;
    config.executable = process.executable;
    config.debug = process.debug;
    config.startup_delay = process.startup_delay;
    config.port_poll_attempts = process.port_poll_attempts;
    config.port_poll_interval = process.port_poll_interval;
    return config;
}

ProcessManager::ProcessManager(ProcessManagerConfig config)
    : config_(std::move(config))
{}

ProcessManager::~ProcessManager() {
    stop();
}

bool ProcessManager::is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }

    constexpr std::string_view kDangerousChars = ";|&$`\\\"'<>(){}[]!#~";
    const auto has_dangerous = [&](const std::string& value) {
        return value.find_first_of(kDangerousChars) != std::string::npos;
    };

    if (has_dangerous(command)) {
        return false;
    }
    for (const auto& arg : args) {
        if (has_dangerous(arg)) {
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Spawning
// ─────────────────────────────────────────────────────────────────────────────

Result<void> ProcessManager::spawn(const std::vector<std::string>& extra_args, bool pipe_stdio) {
    std::vector<std::string> args = config_.launch_args;
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    if ((config_.skip_command_validation == false) && (is_safe_command(config_.executable, args) == false)) {
        return tl::unexpected(Error::process_manager(
            "Command validation failed: potentially unsafe command or arguments"));
    }

    {
        std::lock_guard lock(mutex_);
        if (child_pid_ > 0) {
            return tl::unexpected(Error::process_manager("Agent process already running"));
        }
    }

    // argv is built before fork(): the child must not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(config_.executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};   // we write to stdin_pipe[1]
    int stdout_pipe[2] = {-1, -1};  // we read from stdout_pipe[0]

    if (pipe_stdio) {
        if (::pipe(stdin_pipe) == -1) {
            return tl::unexpected(Error::process_manager("Failed to create pipes: " + errno_message()));
        }
        if (::pipe(stdout_pipe) == -1) {
            const std::string reason = errno_message();
            close_fd(stdin_pipe[0]);
            close_fd(stdin_pipe[1]);
            return tl::unexpected(Error::process_manager("Failed to create pipes: " + reason));
        }
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const std::string reason = errno_message();
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return tl::unexpected(Error::process_manager("Failed to fork: " + reason));
    }

    if (pid == 0) {
        // Child process - no allocations past this point
        if (pipe_stdio) {
            ::dup2(stdin_pipe[0], STDIN_FILENO);
            ::close(stdin_pipe[0]);
            ::close(stdin_pipe[1]);

            ::dup2(stdout_pipe[1], STDOUT_FILENO);
            ::close(stdout_pipe[0]);
            ::close(stdout_pipe[1]);
        } else {
            redirect_to_devnull(STDIN_FILENO, O_RDONLY);
            if (config_.debug == false) {
                redirect_to_devnull(STDOUT_FILENO, O_WRONLY);
            }
        }

        if (config_.debug == false) {
            redirect_to_devnull(STDERR_FILENO, O_WRONLY);
        }

        ::execvp(config_.executable.c_str(), argv.data());
        ::_exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);

    {
        std::lock_guard lock(mutex_);
        child_pid_ = pid;
        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];
        exit_code_.reset();
    }

    IFLOW_LOG_INFO(std::format("Started agent process {} (pid {})", config_.executable, pid));
    return {};
}

Result<void> ProcessManager::start_stdio() {
    auto spawned = spawn({}, true);
    if (spawned.has_value() == false) {
        return spawned;
    }

    // Poll in small steps so an early exit is reported without waiting the full delay
    const auto deadline = std::chrono::steady_clock::now() + config_.startup_delay;
    while (true) {
        if (is_running() == false) {
            const auto code = exit_code();
            stop();
            return tl::unexpected(Error::process_manager(std::format(
                "Agent process exited during startup (exit code {})", code.value_or(-1))));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kExitPollInterval, deadline - now));
    }

    return {};
}

Result<std::string> ProcessManager::start_websocket(std::uint16_t port) {
    auto spawned = spawn({"--port", std::to_string(port)}, false);
    if (spawned.has_value() == false) {
        return tl::unexpected(spawned.error());
    }

    {
        std::lock_guard lock(mutex_);
        port_ = port;
    }

    for (std::size_t attempt = 1; attempt <= config_.port_poll_attempts; ++attempt) {
        if (is_running() == false) {
            const auto code = exit_code();
            stop();
            return tl::unexpected(Error::process_manager(std::format(
                "Agent process exited before listening on port {} (exit code {})", port, code.value_or(-1))));
        }
        if (is_port_listening(port)) {
            IFLOW_LOG_INFO(std::format("Agent is listening on port {}", port));
            return websocket_url(port);
        }
        IFLOW_LOG_DEBUG(std::format("Waiting for agent port {} (attempt {}/{})",
            port, attempt, config_.port_poll_attempts));
        std::this_thread::sleep_for(config_.port_poll_interval);
    }

    stop();
    return tl::unexpected(Error::process_manager(std::format(
        "Agent did not start listening on port {} after {} attempts", port, config_.port_poll_attempts)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────────────────────────────────────

void ProcessManager::stop() noexcept {
    pid_t pid_to_terminate = -1;
    int stdin_to_close = -1;
    int stdout_to_close = -1;

    // Extract state under lock, then release before blocking operations
    {
        std::lock_guard lock(mutex_);
        pid_to_terminate = child_pid_;
        stdin_to_close = stdin_fd_;
        stdout_to_close = stdout_fd_;
        child_pid_ = -1;
        stdin_fd_ = -1;
        stdout_fd_ = -1;
        port_.reset();
    }

    close_fd(stdin_to_close);
    close_fd(stdout_to_close);

    if (pid_to_terminate <= 0) {
        return;
    }

    ::kill(pid_to_terminate, SIGTERM);

    int status = 0;
    pid_t wait_result = ::waitpid(pid_to_terminate, &status, WNOHANG);
    if (wait_result == 0) {
        std::this_thread::sleep_for(config_.termination_grace);
        wait_result = ::waitpid(pid_to_terminate, &status, WNOHANG);
        if (wait_result == 0) {
            ::kill(pid_to_terminate, SIGKILL);
            wait_result = ::waitpid(pid_to_terminate, &status, 0);
        }
    }

    if (wait_result == pid_to_terminate) {
        std::lock_guard lock(mutex_);
        exit_code_ = decode_status(status);
    }

    log_agent_stopped(pid_to_terminate);
}

void ProcessManager::reap_if_exited() {
    if (child_pid_ <= 0) {
        return;
    }

    int status = 0;
    const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        exit_code_ = decode_status(status);
        child_pid_ = -1;
        port_.reset();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Accessors
// ─────────────────────────────────────────────────────────────────────────────

bool ProcessManager::is_running() {
    std::lock_guard lock(mutex_);
    reap_if_exited();
    return child_pid_ > 0;
}

std::optional<pid_t> ProcessManager::pid() const {
    std::lock_guard lock(mutex_);
    if (child_pid_ <= 0) {
        return std::nullopt;
    }
    return child_pid_;
}

std::optional<std::uint16_t> ProcessManager::port() const {
    std::lock_guard lock(mutex_);
    return port_;
}

std::optional<int> ProcessManager::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

std::optional<int> ProcessManager::take_stdin() {
    std::lock_guard lock(mutex_);
    if (stdin_fd_ == -1) {
        return std::nullopt;
    }
    return std::exchange(stdin_fd_, -1);
}

std::optional<int> ProcessManager::take_stdout() {
    std::lock_guard lock(mutex_);
    if (stdout_fd_ == -1) {
        return std::nullopt;
    }
    return std::exchange(stdout_fd_, -1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Port probing
// ─────────────────────────────────────────────────────────────────────────────

bool ProcessManager::is_port_listening(std::uint16_t port, const std::string& host) {
    asio::io_context ioc;
    boost::system::error_code ec;

    tcp::resolver resolver(ioc);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return false;
    }

    tcp::socket socket(ioc);
    bool completed = false;
    asio::async_connect(socket, endpoints,
        [&](const boost::system::error_code& connect_ec, const tcp::endpoint& /*endpoint*/) {
            ec = connect_ec;
            completed = true;
        });
    ioc.run_for(kPortProbeTimeout);

    boost::system::error_code ignored;
    socket.close(ignored);
    return completed && (ec.failed() == false);
}

std::string ProcessManager::websocket_url(std::uint16_t port) {
    return std::format("ws://localhost:{}/acp?peer=iflow", port);
}

}  // namespace iflow
