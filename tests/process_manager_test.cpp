#include <catch2/catch_test_macros.hpp>

#include "iflow/process/process_manager.hpp"
#include "iflow/log/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <unistd.h>

#include <array>
#include <stdexcept>
#include <string>

using namespace iflow;
using namespace std::chrono_literals;

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/// Plain POSIX utilities stand in for the agent binary
ProcessManagerConfig utility_config(std::string executable, std::vector<std::string> args = {}) {
    ProcessManagerConfig config;
    config.executable = std::move(executable);
    config.launch_args = std::move(args);
    config.startup_delay = 300ms;
    config.port_poll_attempts = 3;
    config.port_poll_interval = 20ms;
    config.termination_grace = 20ms;
    config.skip_command_validation = true;
    return config;
}

/// A shell that ignores the trailing "--port N" arguments and idles
ProcessManagerConfig idle_shell_config() {
    return utility_config("sh", {"-c", "exec sleep 30"});
}

std::uint16_t unused_port() {
    asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

/// A logging backend that fails on every record
class ThrowingLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        throw std::runtime_error("log sink unavailable");
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Command validation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("is_safe_command rejects shell metacharacters", "[process]") {
    REQUIRE(ProcessManager::is_safe_command("iflow", {"--experimental-acp", "--port", "8090"}));
    REQUIRE(ProcessManager::is_safe_command("/usr/local/bin/iflow", {}));

    REQUIRE_FALSE(ProcessManager::is_safe_command("", {}));
    REQUIRE_FALSE(ProcessManager::is_safe_command("iflow; rm -rf /", {}));
    REQUIRE_FALSE(ProcessManager::is_safe_command("iflow", {"$(whoami)"}));
    REQUIRE_FALSE(ProcessManager::is_safe_command("iflow", {"a|b"}));
    REQUIRE_FALSE(ProcessManager::is_safe_command("iflow", {"`id`"}));
}

TEST_CASE("Unsafe executables are refused before spawning", "[process]") {
    ProcessManagerConfig config;
    config.executable = "iflow && reboot";

    ProcessManager manager(config);
    auto started = manager.start_stdio();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == ErrorCode::ProcessManager);
    REQUIRE(manager.pid().has_value() == false);
}

TEST_CASE("ProcessManagerConfig derives from ProcessConfig", "[process]") {
    auto process = ProcessConfig{}.with_executable("/opt/iflow").with_debug(true);
    process.port_poll_attempts = 7;

    const auto config = ProcessManagerConfig::from(process);
    REQUIRE(config.executable == "/opt/iflow");
    REQUIRE(config.debug);
    REQUIRE(config.port_poll_attempts == 7);
    REQUIRE(config.launch_args == std::vector<std::string>{"--experimental-acp"});
    REQUIRE(config.skip_command_validation == false);
}

TEST_CASE("websocket_url targets the acp endpoint", "[process]") {
    REQUIRE(ProcessManager::websocket_url(8090) == "ws://localhost:8090/acp?peer=iflow");
}

// ─────────────────────────────────────────────────────────────────────────────
// Stdio mode
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("start_stdio hands out the agent pipes once", "[process]") {
    ProcessManager manager(utility_config("cat"));
    REQUIRE(manager.start_stdio().has_value());
    REQUIRE(manager.is_running());
    REQUIRE(manager.pid().has_value());

    const auto in = manager.take_stdin();
    const auto out = manager.take_stdout();
    REQUIRE(in.has_value());
    REQUIRE(out.has_value());
    REQUIRE(manager.take_stdin().has_value() == false);
    REQUIRE(manager.take_stdout().has_value() == false);

    // cat echoes what the client writes
    const std::string line = "ping\n";
    REQUIRE(::write(*in, line.data(), line.size()) == static_cast<ssize_t>(line.size()));
    std::array<char, 16> buffer{};
    const auto n = ::read(*out, buffer.data(), buffer.size());
    REQUIRE(std::string(buffer.data(), static_cast<std::size_t>(n)) == line);

    ::close(*in);
    ::close(*out);
    manager.stop();
    REQUIRE(manager.is_running() == false);
}

TEST_CASE("start_stdio reports an agent that exits during startup", "[process]") {
    ProcessManager manager(utility_config("false"));

    auto started = manager.start_stdio();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code == ErrorCode::ProcessManager);
    REQUIRE(started.error().message.find("exit code 1") != std::string::npos);
    REQUIRE(manager.exit_code() == 1);
}

TEST_CASE("start_stdio reports a missing executable", "[process]") {
    ProcessManager manager(utility_config("/nonexistent/iflow-agent"));

    auto started = manager.start_stdio();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(manager.exit_code() == 127);
}

TEST_CASE("A running agent cannot be started twice", "[process]") {
    ProcessManager manager(utility_config("cat"));
    REQUIRE(manager.start_stdio().has_value());

    auto second = manager.start_stdio();
    REQUIRE_FALSE(second.has_value());
    REQUIRE(second.error().message.find("already running") != std::string::npos);
}

TEST_CASE("stop terminates the agent and is idempotent", "[process]") {
    ProcessManager manager(utility_config("cat"));
    REQUIRE(manager.start_stdio().has_value());

    manager.stop();
    REQUIRE(manager.is_running() == false);
    REQUIRE(manager.pid().has_value() == false);
    REQUIRE(manager.exit_code().has_value());
    REQUIRE(manager.take_stdin().has_value() == false);

    manager.stop();
    REQUIRE(manager.is_running() == false);
}

TEST_CASE("Destroying the manager stops the agent", "[process]") {
    pid_t pid = -1;
    {
        ProcessManager manager(utility_config("cat"));
        REQUIRE(manager.start_stdio().has_value());
        pid = *manager.pid();
    }
    // Reaped by the destructor: the pid no longer names our child
    REQUIRE(::kill(pid, 0) == -1);
}

TEST_CASE("Shutdown completes when the logger throws", "[process]") {
    pid_t pid = -1;
    {
        ProcessManager manager(utility_config("cat"));
        REQUIRE(manager.start_stdio().has_value());
        pid = *manager.pid();

        set_logger(std::make_unique<ThrowingLogger>());
    }
    set_logger(nullptr);

    REQUIRE(::kill(pid, 0) == -1);
}

// ─────────────────────────────────────────────────────────────────────────────
// WebSocket mode
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("is_port_listening probes TCP ports", "[process][port]") {
    asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    REQUIRE(ProcessManager::is_port_listening(port));

    acceptor.close();
    REQUIRE(ProcessManager::is_port_listening(port) == false);
}

TEST_CASE("start_websocket returns the URL once the port accepts connections", "[process][port]") {
    asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    ProcessManager manager(idle_shell_config());
    auto url = manager.start_websocket(port);
    REQUIRE(url.has_value());
    REQUIRE(*url == ProcessManager::websocket_url(port));
    REQUIRE(manager.port() == port);

    manager.stop();
    REQUIRE(manager.port().has_value() == false);
}

TEST_CASE("start_websocket gives up after the poll budget", "[process][port]") {
    const auto port = unused_port();

    ProcessManager manager(idle_shell_config());
    auto url = manager.start_websocket(port);
    REQUIRE_FALSE(url.has_value());
    REQUIRE(url.error().code == ErrorCode::ProcessManager);
    REQUIRE(url.error().message.find("after 3 attempts") != std::string::npos);
    REQUIRE(manager.is_running() == false);
}
