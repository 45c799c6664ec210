// Example 03: Permission Modes
//
// The agent asks before running tools. Auto approves everything, Manual
// refuses everything, Selective approves read/fetch/list tools only. Run the
// same tool-using prompt under each mode and compare what happens.

#include <iflow/client/iflow_client.hpp>
#include <iflow/log/logger.hpp>

#include <iostream>
#include <string>

using namespace iflow;

namespace {

int run_with_mode(PermissionMode mode, const std::string& prompt) {
    std::cout << "\n--- mode: " << to_string(mode) << " ---\n";

    IFlowOptions options;
    options.with_stdio()
           .with_permission_mode(mode)
           .with_file_access(FileAccessConfig{}.with_enabled(true).add_allowed_dir(options.cwd).with_read_only(true));

    IFlowClient client(options);
    auto connected = client.connect();
    if (!connected) {
        std::cerr << "ERROR: " << connected.error().describe() << "\n";
        return 1;
    }

    auto sent = client.send_message(prompt);
    if (!sent) {
        std::cerr << "ERROR: " << sent.error().describe() << "\n";
        return 1;
    }

    std::size_t tool_calls = 0;
    while (auto event = client.receive_message()) {
        if (const auto* tool = std::get_if<ToolCall>(&*event)) {
            ++tool_calls;
            std::cout << "  tool: " << tool->name << " (" << tool->status << ")\n";
        } else if (auto text = event_text(*event)) {
            std::cout << *text << std::flush;
        }
        if (is_task_finished(*event) || is_error(*event)) {
            break;
        }
    }

    std::cout << "\n  tool calls seen: " << tool_calls << "\n";
    client.disconnect();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string prompt = (argc > 1) ? argv[1] : "List the files in the current directory, then read README.md.";

    set_logger(std::make_unique<ConsoleLogger>(LogLevel::Info));

    std::cout << "=== Permission Modes Example ===\n";

    int status = 0;
    for (auto mode : {PermissionMode::Auto, PermissionMode::Selective, PermissionMode::Manual}) {
        status |= run_with_mode(mode, prompt);
    }
    return status;
}
