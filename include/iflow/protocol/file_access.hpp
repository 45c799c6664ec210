#pragma once

#include "iflow/config/options.hpp"
#include "iflow/protocol/json_rpc.hpp"

#include <tl/expected.hpp>

#include <filesystem>

namespace iflow {

inline constexpr std::string_view kMethodReadTextFile{"fs/read_text_file"};
inline constexpr std::string_view kMethodWriteTextFile{"fs/write_text_file"};

// ─────────────────────────────────────────────────────────────────────────────
// FileAccessHandler
// ─────────────────────────────────────────────────────────────────────────────
// Serves the agent's fs/* calls inside the configured sandbox. Failures are
// JSON-RPC errors for the reply, never exceptions.

class FileAccessHandler {
public:
    explicit FileAccessHandler(FileAccessConfig config = {});

    [[nodiscard]] bool enabled() const noexcept { return config_.enabled; }

    /// `{"readTextFile": bool, "writeTextFile": bool}` as advertised at initialize
    [[nodiscard]] Json capabilities() const;

    /// params `{path, line?, limit?}` -> `{content}`; `line` is 1-based
    [[nodiscard]] tl::expected<Json, JsonRpcError> read_text_file(const Json& params) const;

    /// params `{path, content}` -> null
    [[nodiscard]] tl::expected<Json, JsonRpcError> write_text_file(const Json& params) const;

    [[nodiscard]] bool is_path_allowed(const std::filesystem::path& path) const;

private:
    [[nodiscard]] tl::expected<std::filesystem::path, JsonRpcError> resolve_path(const Json& params) const;

    FileAccessConfig config_;
};

}  // namespace iflow
