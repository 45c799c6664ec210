#include "iflow/client/query.hpp"
#include "iflow/client/iflow_client.hpp"
#include "iflow/log/logger.hpp"

#include <algorithm>
#include <format>

namespace iflow {

namespace {

constexpr std::chrono::milliseconds kMinReceiveWait{100};
constexpr std::chrono::milliseconds kMaxReceiveWait{1'000};

std::string trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

/// Collects assistant text up to the first TaskFinished.
Result<std::string> run_query(
    std::string_view prompt,
    const IFlowOptions& options,
    const ChunkCallback& on_chunk,
    ConnectionFactory connection_factory
) {
    IFlowClient client(options, std::move(connection_factory));

    auto connected = client.connect();
    if (connected.has_value() == false) {
        return tl::unexpected(connected.error());
    }

    auto sent = client.send_message(prompt);
    if (sent.has_value() == false) {
        return tl::unexpected(sent.error());
    }

    const auto wait = std::clamp(options.timeout / 10, kMinReceiveWait, kMaxReceiveWait);
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::string collected;

    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return tl::unexpected(Error::timeout(std::format(
                "Query timed out after {}ms", options.timeout.count())));
        }

        auto event = client.receive_message_for(wait);
        if (event.has_value() == false) {
            if (client.messages()->is_closed()) {
                return tl::unexpected(Error::connection("Event stream closed before the task finished"));
            }
            continue;
        }

        if (const auto* chunk = std::get_if<AssistantText>(&*event)) {
            collected += chunk->text;
            if (on_chunk) {
                on_chunk(chunk->text);
            }
        } else if (const auto* failure = std::get_if<ErrorEvent>(&*event)) {
            return tl::unexpected(Error::protocol(failure->message));
        } else if (is_task_finished(*event)) {
            break;
        }
    }

    client.disconnect();
    return trim(collected);
}

}  // namespace

Result<std::string> query(std::string_view prompt, const IFlowOptions& options) {
    return run_query(prompt, options, {}, make_connection);
}

Result<std::string> query(std::string_view prompt, const IFlowOptions& options, ConnectionFactory connection_factory) {
    return run_query(prompt, options, {}, std::move(connection_factory));
}

Result<void> query_stream(std::string_view prompt, const IFlowOptions& options, const ChunkCallback& on_chunk) {
    return query_stream(prompt, options, on_chunk, make_connection);
}

Result<void> query_stream(
    std::string_view prompt,
    const IFlowOptions& options,
    const ChunkCallback& on_chunk,
    ConnectionFactory connection_factory
) {
    auto result = run_query(prompt, options, on_chunk, std::move(connection_factory));
    if (result.has_value() == false) {
        return tl::unexpected(result.error());
    }
    return {};
}

}  // namespace iflow
