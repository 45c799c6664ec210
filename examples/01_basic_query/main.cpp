// Example 01: Basic Query
//
// One prompt, one answer: query() connects, collects the assistant's text
// until the task finishes, and disconnects.

#include <iflow/client/query.hpp>
#include <iflow/log/logger.hpp>

#include <iostream>
#include <string>

using namespace iflow;

int main(int argc, char* argv[]) {
    std::string prompt = "What is 1 + 1? Answer with the number only.";
    bool use_stdio = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--stdio") {
            use_stdio = true;
        } else {
            prompt = arg;
        }
    }

    set_logger(std::make_unique<ConsoleLogger>(LogLevel::Warn));

    std::cout << "=== Basic Query Example ===\n\n";
    std::cout << "Prompt: " << prompt << "\n\n";

    IFlowOptions options;
    options.with_timeout(std::chrono::seconds(60));
    if (use_stdio) {
        options.with_stdio();
    } else {
        options.with_websocket(WebSocketConfig{});
    }

    auto answer = query(prompt, options);
    if (!answer) {
        std::cerr << "ERROR: " << answer.error().describe() << "\n";
        return 1;
    }

    std::cout << "Answer: " << *answer << "\n";

    // Streaming variant: chunks are printed as they arrive
    std::cout << "\nStreaming: ";
    auto streamed = query_stream("Count from 1 to 5.", options, [](std::string_view chunk) {
        std::cout << chunk << std::flush;
    });
    std::cout << "\n";
    if (!streamed) {
        std::cerr << "ERROR: " << streamed.error().describe() << "\n";
        return 1;
    }

    return 0;
}
