#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iflow {

using Json = nlohmann::json;

inline constexpr std::string_view kOptionProceedOnce{"proceed_once"};
inline constexpr std::string_view kOptionProceedAlways{"proceed_always"};

/// How `session/request_permission` calls are answered
enum class PermissionMode {
    Auto,       ///< Approve everything
    Manual,     ///< Decline everything
    Selective   ///< Approve read-only tool types (read, fetch, list)
};

[[nodiscard]] constexpr std::string_view to_string(PermissionMode mode) noexcept {
    switch (mode) {
        case PermissionMode::Auto:      return "auto";
        case PermissionMode::Manual:    return "manual";
        case PermissionMode::Selective: return "selective";
    }
    return "auto";
}

[[nodiscard]] std::optional<PermissionMode> permission_mode_from_string(std::string_view name) noexcept;

/// Transient: lives between receipt of the call and the reply.
struct PermissionRequest {
    Json request_id;
    std::string tool_title;
    std::string tool_type;
    std::vector<std::string> option_ids;

    /// Missing fields default to "unknown" / no options.
    [[nodiscard]] static PermissionRequest from_call(const Json& request_id, const Json& params);
};

struct PermissionDecision {
    bool approved{false};
    std::optional<std::string> option_id;  ///< Set when approved
};

[[nodiscard]] bool should_approve(PermissionMode mode, std::string_view tool_type) noexcept;

/// proceed_once, then proceed_always, then the first offered, then "proceed_once".
[[nodiscard]] std::string select_option(const std::vector<std::string>& option_ids);

[[nodiscard]] PermissionDecision decide(PermissionMode mode, const PermissionRequest& request);

/// The `result` member of the reply: `{"outcome":{"outcome":"selected","optionId":...}}`
/// or `{"outcome":{"outcome":"cancelled"}}`.
[[nodiscard]] Json make_permission_result(const PermissionDecision& decision);

}  // namespace iflow
