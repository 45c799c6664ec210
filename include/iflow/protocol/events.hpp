#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Domain Events
// ═══════════════════════════════════════════════════════════════════════════
// The only protocol-derived type exposed to callers. Produced by the
// notification dispatcher, plus the synthetic TaskFinished the engine emits
// when a prompt completes.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace iflow {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Plan
// ─────────────────────────────────────────────────────────────────────────────

enum class PlanPriority { High, Medium, Low };

enum class PlanStatus { Pending, InProgress, Completed };

/// Unrecognized names map to Medium
[[nodiscard]] PlanPriority plan_priority_from_string(std::string_view name) noexcept;

/// Unrecognized names map to Pending
[[nodiscard]] PlanStatus plan_status_from_string(std::string_view name) noexcept;

[[nodiscard]] constexpr std::string_view to_string(PlanPriority priority) noexcept {
    switch (priority) {
        case PlanPriority::High:   return "high";
        case PlanPriority::Medium: return "medium";
        case PlanPriority::Low:    return "low";
    }
    return "medium";
}

[[nodiscard]] constexpr std::string_view to_string(PlanStatus status) noexcept {
    switch (status) {
        case PlanStatus::Pending:    return "pending";
        case PlanStatus::InProgress: return "in_progress";
        case PlanStatus::Completed:  return "completed";
    }
    return "pending";
}

struct PlanEntry {
    std::string content;
    PlanPriority priority{PlanPriority::Medium};
    PlanStatus status{PlanStatus::Pending};

    bool operator==(const PlanEntry&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Event Alternatives
// ─────────────────────────────────────────────────────────────────────────────

struct UserText {
    std::string text;
};

struct AssistantText {
    std::string text;
};

struct ToolCall {
    std::string id;
    std::string name;
    std::string status;
};

struct Plan {
    std::vector<PlanEntry> entries;
};

struct TaskFinished {
    std::optional<std::string> reason;
};

struct ErrorEvent {
    std::int32_t code{};
    std::string message;
    std::optional<Json> details;
};

using Event = std::variant<UserText, AssistantText, ToolCall, Plan, TaskFinished, ErrorEvent>;

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline bool is_task_finished(const Event& event) noexcept {
    return std::holds_alternative<TaskFinished>(event);
}

[[nodiscard]] inline bool is_error(const Event& event) noexcept {
    return std::holds_alternative<ErrorEvent>(event);
}

/// Text payload of UserText / AssistantText, nullopt otherwise
[[nodiscard]] std::optional<std::string_view> event_text(const Event& event) noexcept;

/// "user_text", "assistant_text", "tool_call", "plan", "task_finished", "error"
[[nodiscard]] std::string_view event_type_name(const Event& event) noexcept;

/// `{"type": event_type_name(event), ...fields}`
[[nodiscard]] Json to_json(const Event& event);

}  // namespace iflow
