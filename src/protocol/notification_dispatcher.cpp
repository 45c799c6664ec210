#include "iflow/protocol/notification_dispatcher.hpp"
#include "iflow/log/logger.hpp"

#include <format>
#include <functional>
#include <unordered_map>

namespace iflow {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Payload helpers: every accessor tolerates missing or mistyped fields
// ─────────────────────────────────────────────────────────────────────────────

const Json& empty_object() {
    static const Json empty = Json::object();
    return empty;
}

const Json& object_field(const Json& node, const char* key) {
    if (node.is_object() == false) {
        return empty_object();
    }
    const auto it = node.find(key);
    if ((it == node.end()) || (it->is_object() == false)) {
        return empty_object();
    }
    return *it;
}

std::optional<std::string> string_field(const Json& node, const char* key) {
    if (node.is_object() == false) {
        return std::nullopt;
    }
    const auto it = node.find(key);
    if ((it == node.end()) || (it->is_string() == false)) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string chunk_text(const Json& update) {
    return string_field(object_field(update, "content"), "text").value_or(std::string(kUnknownText));
}

std::optional<std::string> first_string(const Json& primary, const char* primary_key,
                                        const Json& fallback, const char* fallback_key) {
    auto value = string_field(primary, primary_key);
    if (value.has_value()) {
        return value;
    }
    return string_field(fallback, fallback_key);
}

ToolCall parse_tool_call(const Json& update) {
    // Fields may be nested under "toolCall" or flattened into the update
    const Json& nested = object_field(update, "toolCall");
    ToolCall call;
    call.id = first_string(nested, "id", update, "toolCallId").value_or("");
    call.name = first_string(nested, "title", update, "title").value_or("Unknown");
    call.status = first_string(nested, "status", update, "status").value_or("unknown");
    return call;
}

Plan parse_plan(const Json& update) {
    Plan plan;
    const auto entries_it = update.find("entries");
    if ((entries_it == update.end()) || (entries_it->is_array() == false)) {
        return plan;
    }
    for (const auto& node : *entries_it) {
        auto content = string_field(node, "content");
        if (content.has_value() == false) {
            IFLOW_LOG_DEBUG("Dropping plan entry without content");
            continue;
        }
        PlanEntry entry;
        entry.content = std::move(*content);
        entry.priority = plan_priority_from_string(string_field(node, "priority").value_or(""));
        entry.status = plan_status_from_string(string_field(node, "status").value_or(""));
        plan.entries.push_back(std::move(entry));
    }
    return plan;
}

}  // namespace

NotificationDispatcher::NotificationDispatcher(
    std::shared_ptr<EventChannel> events,
    PermissionMode permission_mode,
    FileAccessConfig file_access
)
    : events_(std::move(events))
    , permission_mode_(permission_mode)
    , file_access_(std::move(file_access))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Entry Points
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> NotificationDispatcher::dispatch(const ServerCallFrame& call, ITransport& transport) {
    static const std::unordered_map<std::string_view, CallHandler> dispatch_table = {
        {kMethodSessionUpdate,     &NotificationDispatcher::handle_session_update},
        {kMethodRequestPermission, &NotificationDispatcher::handle_permission_request},
        {kMethodReadTextFile,      &NotificationDispatcher::handle_read_text_file},
        {kMethodWriteTextFile,     &NotificationDispatcher::handle_write_text_file},
    };

    const auto it = dispatch_table.find(call.method);
    if (it == dispatch_table.end()) {
        if (call.id.has_value() == false) {
            IFLOW_LOG_DEBUG("Dropping notification with unknown method: " + call.method);
            return {};
        }
        IFLOW_LOG_DEBUG("Answering unknown method with 'Method not found': " + call.method);
        return reply(transport, *call.id, tl::unexpected(JsonRpcError::method_not_found(call.method)));
    }

    try {
        return (this->*(it->second))(call, transport);
    } catch (const std::exception& e) {
        // A malformed payload must never abort the caller's wait loop
        IFLOW_LOG_WARN(std::format("Failed to handle '{}': {}", call.method, e.what()));
        return {};
    }
}

void NotificationDispatcher::route_unmatched_response(const ResponseFrame& response) {
    ++unmatched_responses_;
    IFLOW_LOG_DEBUG("Ignoring response with unmatched id " + response.id.dump());
}

// ─────────────────────────────────────────────────────────────────────────────
// session/update
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> NotificationDispatcher::handle_session_update(const ServerCallFrame& call, ITransport& transport) {
    using UpdateHandler = std::function<void(NotificationDispatcher*, const Json&)>;
    static const std::unordered_map<std::string_view, UpdateHandler> update_table = {
        {"agent_message_chunk", [](NotificationDispatcher* self, const Json& update) {
            self->emit(AssistantText{chunk_text(update)});
        }},
        {"user_message_chunk", [](NotificationDispatcher* self, const Json& update) {
            self->emit(UserText{chunk_text(update)});
        }},
        {"tool_call", [](NotificationDispatcher* self, const Json& update) {
            self->emit(parse_tool_call(update));
        }},
        {"plan", [](NotificationDispatcher* self, const Json& update) {
            self->emit(parse_plan(update));
        }},
        // Acknowledged, no event
        {"tool_call_update", [](NotificationDispatcher*, const Json&) {}},
        {"notifyTaskFinish", [](NotificationDispatcher*, const Json&) {}},
        {"agent_thought_chunk", [](NotificationDispatcher*, const Json&) {}},
        {"current_mode_update", [](NotificationDispatcher*, const Json&) {}},
        {"available_commands_update", [](NotificationDispatcher*, const Json&) {}},
    };

    const Json& update = object_field(call.params, "update");
    const auto kind = string_field(update, "sessionUpdate").value_or("");

    if (const auto it = update_table.find(kind); it != update_table.end()) {
        it->second(this, update);
    } else {
        IFLOW_LOG_DEBUG("Ignoring session update of unknown kind '" + kind + "'");
    }

    if (call.id.has_value()) {
        return reply(transport, *call.id, Json(nullptr));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// session/request_permission
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> NotificationDispatcher::handle_permission_request(const ServerCallFrame& call, ITransport& transport) {
    if (call.id.has_value() == false) {
        IFLOW_LOG_WARN("Permission request without id cannot be answered");
        return {};
    }

    const auto request = PermissionRequest::from_call(*call.id, call.params);
    const auto decision = decide(permission_mode_, request);

    IFLOW_LOG_INFO(std::format(
        "Permission for '{}' ({}) in {} mode: {}",
        request.tool_title,
        request.tool_type,
        to_string(permission_mode_),
        decision.approved ? ("approved with " + decision.option_id.value_or("")) : std::string("cancelled")));

    return reply(transport, request.request_id, make_permission_result(decision));
}

// ─────────────────────────────────────────────────────────────────────────────
// fs/*
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> NotificationDispatcher::handle_read_text_file(const ServerCallFrame& call, ITransport& transport) {
    if (call.id.has_value() == false) {
        return {};
    }
    return reply(transport, *call.id, file_access_.read_text_file(call.params));
}

TransportResult<void> NotificationDispatcher::handle_write_text_file(const ServerCallFrame& call, ITransport& transport) {
    if (call.id.has_value() == false) {
        return {};
    }
    return reply(transport, *call.id, file_access_.write_text_file(call.params));
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> NotificationDispatcher::reply(
    ITransport& transport,
    const Json& id,
    const tl::expected<Json, JsonRpcError>& outcome
) {
    const Json message = outcome.has_value()
        ? make_result_response(id, *outcome)
        : make_error_response(id, outcome.error());

    auto result = transport.send(message);
    if (result.has_value() == false) {
        IFLOW_LOG_ERROR("Failed to send reply: " + result.error().message);
    }
    return result;
}

void NotificationDispatcher::emit(Event event) {
    if (events_ == nullptr) {
        return;
    }
    if (events_->push(std::move(event)) == false) {
        IFLOW_LOG_DEBUG("Event channel closed, dropping event");
    }
}

}  // namespace iflow
