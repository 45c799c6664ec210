// Example 02: WebSocket Session
//
// A multi-turn session over WebSocket with an explicit event loop. The agent
// is started on the given port when nothing is listening there yet.

#include <iflow/client/iflow_client.hpp>
#include <iflow/log/spdlog_logger.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace iflow;

namespace {

void print_event(const Event& event) {
    std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AssistantText>) {
            std::cout << e.text << std::flush;
        } else if constexpr (std::is_same_v<T, ToolCall>) {
            std::cout << "\n  [tool " << e.id << "] " << e.name << " - " << e.status << "\n";
        } else if constexpr (std::is_same_v<T, Plan>) {
            std::cout << "\n  [plan] " << e.entries.size() << " entries\n";
            for (const auto& entry : e.entries) {
                std::cout << "    - " << entry.content << " (" << to_string(entry.status) << ")\n";
            }
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
            std::cout << "\n  [error " << e.code << "] " << e.message << "\n";
        } else if constexpr (std::is_same_v<T, TaskFinished>) {
            std::cout << "\n  [finished: " << e.reason.value_or("completed") << "]\n";
        }
    }, event);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::uint16_t port = kDefaultAgentPort;
    if (argc > 1) {
        port = static_cast<std::uint16_t>(std::stoi(argv[1]));
    }

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    std::cout << "=== WebSocket Session Example ===\n\n";

    IFlowOptions options;
    options.with_websocket(WebSocketConfig{}.with_url("ws://localhost:" + std::to_string(port) + "/acp?peer=iflow"))
           .with_process(ProcessConfig{}.with_start_port(port))
           .with_logging(LoggingConfig{}.with_enabled(true).with_log_file("websocket_session.log"));

    IFlowClient client(options);
    auto connected = client.connect();
    if (!connected) {
        std::cerr << "ERROR: Failed to connect: " << connected.error().describe() << "\n";
        return 1;
    }
    std::cout << "Connected!\n";

    const std::vector<std::string> prompts = {
        "Create a short plan for writing a hello world program in C++.",
        "Now show only the final program.",
    };

    for (const auto& prompt : prompts) {
        std::cout << "\n> " << prompt << "\n";
        auto sent = client.send_message(prompt);
        if (!sent) {
            std::cerr << "ERROR: " << sent.error().describe() << "\n";
            break;
        }

        while (auto event = client.receive_message_for(std::chrono::seconds(120))) {
            print_event(*event);
            if (is_task_finished(*event) || is_error(*event)) {
                break;
            }
        }
    }

    std::cout << "\nSession: " << client.session_id().value_or("-") << "\n";
    client.disconnect();
    return 0;
}
