#include "iflow/protocol/events.hpp"

namespace iflow {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

PlanPriority plan_priority_from_string(std::string_view name) noexcept {
    if (name == "high") return PlanPriority::High;
    if (name == "low") return PlanPriority::Low;
    return PlanPriority::Medium;
}

PlanStatus plan_status_from_string(std::string_view name) noexcept {
    if (name == "in_progress") return PlanStatus::InProgress;
    if (name == "completed") return PlanStatus::Completed;
    return PlanStatus::Pending;
}

std::optional<std::string_view> event_text(const Event& event) noexcept {
    if (const auto* user = std::get_if<UserText>(&event)) {
        return std::string_view(user->text);
    }
    if (const auto* assistant = std::get_if<AssistantText>(&event)) {
        return std::string_view(assistant->text);
    }
    return std::nullopt;
}

std::string_view event_type_name(const Event& event) noexcept {
    return std::visit(overloaded{
        [](const UserText&) { return std::string_view("user_text"); },
        [](const AssistantText&) { return std::string_view("assistant_text"); },
        [](const ToolCall&) { return std::string_view("tool_call"); },
        [](const Plan&) { return std::string_view("plan"); },
        [](const TaskFinished&) { return std::string_view("task_finished"); },
        [](const ErrorEvent&) { return std::string_view("error"); },
    }, event);
}

Json to_json(const Event& event) {
    Json payload = std::visit(overloaded{
        [](const UserText& e) { return Json{{"text", e.text}}; },
        [](const AssistantText& e) { return Json{{"text", e.text}}; },
        [](const ToolCall& e) {
            return Json{{"id", e.id}, {"name", e.name}, {"status", e.status}};
        },
        [](const Plan& e) {
            Json entries = Json::array();
            for (const auto& entry : e.entries) {
                entries.push_back({
                    {"content", entry.content},
                    {"priority", to_string(entry.priority)},
                    {"status", to_string(entry.status)}
                });
            }
            return Json{{"entries", std::move(entries)}};
        },
        [](const TaskFinished& e) {
            Json node = Json::object();
            if (e.reason.has_value()) {
                node["reason"] = *e.reason;
            }
            return node;
        },
        [](const ErrorEvent& e) {
            Json node{{"code", e.code}, {"message", e.message}};
            if (e.details.has_value()) {
                node["details"] = *e.details;
            }
            return node;
        },
    }, event);

    payload["type"] = event_type_name(event);
    return payload;
}

}  // namespace iflow
