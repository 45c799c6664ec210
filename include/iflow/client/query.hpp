#pragma once

#include "iflow/config/options.hpp"
#include "iflow/connection/connection.hpp"
#include "iflow/error.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace iflow {

using ChunkCallback = std::function<void(std::string_view chunk)>;

/// One-shot prompt: connect, send, collect assistant text until the task
/// finishes, disconnect. Returns the trimmed concatenated text.
[[nodiscard]] Result<std::string> query(std::string_view prompt, const IFlowOptions& options = {});

[[nodiscard]] Result<std::string> query(
    std::string_view prompt,
    const IFlowOptions& options,
    ConnectionFactory connection_factory
);

/// Like query(), invoking `on_chunk` for each assistant chunk as it arrives.
[[nodiscard]] Result<void> query_stream(
    std::string_view prompt,
    const IFlowOptions& options,
    const ChunkCallback& on_chunk
);

[[nodiscard]] Result<void> query_stream(
    std::string_view prompt,
    const IFlowOptions& options,
    const ChunkCallback& on_chunk,
    ConnectionFactory connection_factory
);

}  // namespace iflow
