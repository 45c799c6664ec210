// ─────────────────────────────────────────────────────────────────────────────
// iflow-cli - Talk to an iFlow agent from the terminal
// ─────────────────────────────────────────────────────────────────────────────
//
// Usage:
//   # One prompt over WebSocket (starts the agent on port 8090 if needed)
//   iflow-cli "Summarize the README"
//
//   # Agent as a child process over stdio
//   iflow-cli --stdio "List the source files"
//
//   # Existing agent, no auto-start, interactive session
//   iflow-cli --url ws://localhost:8093/acp?peer=iflow --no-auto-start
//
//   # Ask before every tool call, keep a message log
//   iflow-cli --permission manual --message-log session.log "Fix the build"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "iflow/client/iflow_client.hpp"
#include "iflow/log/spdlog_logger.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace iflow;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Rendering
// ═══════════════════════════════════════════════════════════════════════════

void render_event(const Event& event, bool json_output) {
    if (json_output) {
        std::cout << to_json(event).dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
        return;
    }

    if (const auto* text = std::get_if<AssistantText>(&event)) {
        std::cout << text->text << std::flush;
    } else if (const auto* tool = std::get_if<ToolCall>(&event)) {
        std::cout << "\n" << color::c(color::dim) << "[tool] " << tool->name
                  << " (" << tool->status << ")" << color::c(color::reset) << "\n";
    } else if (const auto* plan = std::get_if<Plan>(&event)) {
        std::cout << "\n" << color::c(color::bold) << "Plan:" << color::c(color::reset) << "\n";
        for (const auto& entry : plan->entries) {
            std::cout << "  [" << to_string(entry.status) << "] " << entry.content
                      << color::c(color::dim) << " (" << to_string(entry.priority) << ")"
                      << color::c(color::reset) << "\n";
        }
    } else if (const auto* failure = std::get_if<ErrorEvent>(&event)) {
        std::cout << "\n";
        print_error(failure->message);
    } else if (const auto* finished = std::get_if<TaskFinished>(&event)) {
        std::cout << "\n" << color::c(color::dim) << "-- " << finished->reason.value_or("completed")
                  << color::c(color::reset) << "\n";
    }
}

/// Print events until the task finishes. Returns false on an error event.
bool drain_until_finished(IFlowClient& client, bool json_output) {
    bool ok = true;
    while (auto event = client.receive_message()) {
        render_event(*event, json_output);
        if (is_error(*event)) {
            ok = false;
        }
        if (is_task_finished(*event) || is_error(*event)) {
            break;
        }
    }
    return ok;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive REPL
// ═══════════════════════════════════════════════════════════════════════════

void print_repl_help() {
    std::cout << "\n" << color::c(color::bold) << "Available commands:" << color::c(color::reset) << "\n";
    std::cout << "  " << color::c(color::yellow) << "<text>" << color::c(color::reset) << "   - Send a prompt\n";
    std::cout << "  " << color::c(color::yellow) << "session" << color::c(color::reset) << "  - Show the session id\n";
    std::cout << "  " << color::c(color::yellow) << "help" << color::c(color::reset) << "     - Show this help\n";
    std::cout << "  " << color::c(color::yellow) << "quit" << color::c(color::reset) << "     - Exit\n\n";
}

int run_repl(IFlowClient& client, bool json_output) {
    std::cout << color::c(color::bold) << color::c(color::green) << "Connected to iFlow"
              << color::c(color::reset) << "\n";
    std::cout << "Type 'help' for available commands, 'quit' to exit.\n";

    std::string line;
    while (true) {
        std::cout << color::c(color::cyan) << "iflow> " << color::c(color::reset);
        if (!std::getline(std::cin, line)) {
            break;
        }

        const size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        const size_t end = line.find_last_not_of(" \t");
        line = line.substr(start, end - start + 1);

        if (line == "quit" || line == "exit" || line == "q") {
            break;
        } else if (line == "help" || line == "?") {
            print_repl_help();
        } else if (line == "session") {
            std::cout << client.session_id().value_or("(no session yet)") << "\n";
        } else {
            auto sent = client.send_message(line);
            if (sent.has_value() == false) {
                print_error(sent.error().describe());
                continue;
            }
            drain_until_finished(client, json_output);
        }
    }

    std::cout << "\nGoodbye!\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("iflow-cli", "iFlow agent client");

    options.add_options()
        // Connection
        ("u,url", "Agent WebSocket URL", cxxopts::value<std::string>())
        ("p,port", "Port for an auto-started agent", cxxopts::value<std::uint16_t>())
        ("stdio", "Run the agent as a child process over stdio")
        ("no-auto-start", "Never start an agent process")
        ("executable", "Agent executable", cxxopts::value<std::string>()->default_value("iflow"))
        ("debug", "Show the agent's stderr")

        // Session
        ("permission", "Tool permission mode: auto, manual or selective", cxxopts::value<std::string>()->default_value("auto"))
        ("t,timeout", "Timeout in seconds", cxxopts::value<int>()->default_value("120"))
        ("cwd", "Working directory for the session", cxxopts::value<std::string>())
        ("auth-method", "Authentication method id", cxxopts::value<std::string>())
        ("allow-dir", "Serve agent file access under this directory (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("read-only", "Serve agent file reads only")

        // Output
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("message-log", "Append every event to this file", cxxopts::value<std::string>())
        ("j,json", "Print events as JSON lines")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage")

        ("prompt", "Prompt to send", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"prompt"});
    options.positional_help("[prompt]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Without a prompt an interactive session starts.\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        const auto level = log_level_from_string(result["log-level"].as<std::string>());
        if (level.has_value() == false) {
            print_error("Unknown log level: " + result["log-level"].as<std::string>());
            return 1;
        }
        set_logger(make_spdlog_console_logger(*level));

        const auto mode = permission_mode_from_string(result["permission"].as<std::string>());
        if (mode.has_value() == false) {
            print_error("Unknown permission mode: " + result["permission"].as<std::string>());
            return 1;
        }

        if (result.count("stdio") && result.count("url")) {
            print_error("Cannot use --stdio together with --url");
            return 1;
        }

        IFlowOptions client_options;
        client_options.with_timeout(std::chrono::seconds(result["timeout"].as<int>()))
                      .with_permission_mode(*mode);

        ProcessConfig process;
        process.with_auto_start(result.count("no-auto-start") == 0)
               .with_executable(result["executable"].as<std::string>())
               .with_debug(result.count("debug") > 0);
        if (result.count("port")) {
            process.with_start_port(result["port"].as<std::uint16_t>());
        }
        client_options.with_process(process);

        if (result.count("stdio")) {
            client_options.with_stdio();
        } else {
            WebSocketConfig websocket;
            if (result.count("url")) {
                websocket.with_url(result["url"].as<std::string>());
            } else if (result.count("port")) {
                websocket.with_auto_url();
            }
            client_options.with_websocket(websocket);
        }

        if (result.count("cwd")) {
            client_options.with_cwd(result["cwd"].as<std::string>());
        }
        if (result.count("auth-method")) {
            client_options.with_auth_method_id(result["auth-method"].as<std::string>());
        }
        if (result.count("allow-dir")) {
            FileAccessConfig file_access;
            file_access.with_enabled(true).with_read_only(result.count("read-only") > 0);
            for (const auto& dir : result["allow-dir"].as<std::vector<std::string>>()) {
                file_access.add_allowed_dir(dir);
            }
            client_options.with_file_access(file_access);
        }
        if (result.count("message-log")) {
            client_options.with_logging(LoggingConfig{}
                .with_enabled(true)
                .with_log_file(result["message-log"].as<std::string>()));
        }

        IFlowClient client(client_options);
        auto connected = client.connect();
        if (connected.has_value() == false) {
            print_error("Failed to connect: " + connected.error().describe());
            return 1;
        }

        int exit_code = 0;
        if (result.count("prompt")) {
            std::string prompt;
            for (const auto& word : result["prompt"].as<std::vector<std::string>>()) {
                if (prompt.empty() == false) {
                    prompt += ' ';
                }
                prompt += word;
            }

            auto sent = client.send_message(prompt);
            if (sent.has_value() == false) {
                print_error(sent.error().describe());
                exit_code = 1;
            } else if (drain_until_finished(client, json_output) == false) {
                exit_code = 1;
            }
        } else {
            exit_code = run_repl(client, json_output);
        }

        client.disconnect();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
