// ─────────────────────────────────────────────────────────────────────────────
// Notification Dispatcher Tests
// ─────────────────────────────────────────────────────────────────────────────
// Server calls are fed straight into the dispatcher; replies are captured by
// a MockTransport and events by the channel.

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "iflow/protocol/notification_dispatcher.hpp"
#include "mocks/mock_transport.hpp"

#include <filesystem>
#include <fstream>

using namespace iflow;
using namespace iflow::testing;
using Json = nlohmann::json;

namespace {

ServerCallFrame as_call(const Json& message) {
    auto classified = classify_frame(message.dump());
    REQUIRE(std::holds_alternative<ServerCallFrame>(classified));
    return std::get<ServerCallFrame>(std::move(classified));
}

struct DispatchFixture {
    std::shared_ptr<EventChannel> events = std::make_shared<EventChannel>();
    std::shared_ptr<MockScript> script = std::make_shared<MockScript>();
    MockTransport transport{script};

    void dispatch(NotificationDispatcher& dispatcher, const Json& message) {
        auto result = dispatcher.dispatch(as_call(message), transport);
        REQUIRE(result.has_value());
    }
};

Json permission_call(const Json& id, const std::string& type, Json options) {
    return Json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "session/request_permission"},
        {"params", {
            {"sessionId", "s"},
            {"toolCall", {{"toolCallId", "t"}, {"title", "Run tool"}, {"type", type}}},
            {"options", std::move(options)}
        }}
    };
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// session/update
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Message chunks become text events", "[dispatcher][update]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, agent_chunk("s", "Hello"));
    f.dispatch(dispatcher, session_update("s", {{"sessionUpdate", "user_message_chunk"}, {"content", {{"text", "Hi"}}}}));
    f.dispatch(dispatcher, session_update("s", {{"sessionUpdate", "agent_message_chunk"}, {"content", Json::object()}}));

    REQUIRE(std::get<AssistantText>(*f.events->try_receive()).text == "Hello");
    REQUIRE(std::get<UserText>(*f.events->try_receive()).text == "Hi");
    REQUIRE(std::get<AssistantText>(*f.events->try_receive()).text == kUnknownText);

    // Notifications are never answered
    REQUIRE(f.script->sent().empty());
}

TEST_CASE("Tool calls read nested or flattened fields", "[dispatcher][update]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, session_update("s", {
        {"sessionUpdate", "tool_call"},
        {"toolCall", {{"id", "tc-1"}, {"title", "read_file"}, {"status", "running"}}}
    }));
    f.dispatch(dispatcher, session_update("s", {
        {"sessionUpdate", "tool_call"},
        {"toolCallId", "tc-2"}, {"title", "list_dir"}, {"status", "pending"}
    }));
    f.dispatch(dispatcher, session_update("s", {{"sessionUpdate", "tool_call"}}));

    const auto nested = std::get<ToolCall>(*f.events->try_receive());
    REQUIRE(nested.id == "tc-1");
    REQUIRE(nested.name == "read_file");
    REQUIRE(nested.status == "running");

    const auto flat = std::get<ToolCall>(*f.events->try_receive());
    REQUIRE(flat.id == "tc-2");
    REQUIRE(flat.name == "list_dir");

    const auto bare = std::get<ToolCall>(*f.events->try_receive());
    REQUIRE(bare.id.empty());
    REQUIRE(bare.name == "Unknown");
    REQUIRE(bare.status == "unknown");
}

TEST_CASE("Plans keep entries that have content", "[dispatcher][update]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, session_update("s", {
        {"sessionUpdate", "plan"},
        {"entries", Json::array({
            {{"content", "Read code"}, {"priority", "high"}, {"status", "completed"}},
            {{"priority", "low"}},
            {{"content", "Write fix"}}
        })}
    }));

    const auto plan = std::get<Plan>(*f.events->try_receive());
    REQUIRE(plan.entries.size() == 2);
    REQUIRE(plan.entries[0] == PlanEntry{"Read code", PlanPriority::High, PlanStatus::Completed});
    REQUIRE(plan.entries[1] == PlanEntry{"Write fix", PlanPriority::Medium, PlanStatus::Pending});
}

TEST_CASE("Ignored update kinds emit nothing", "[dispatcher][update]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    for (const char* kind : {"tool_call_update", "agent_thought_chunk", "current_mode_update",
                             "available_commands_update", "notifyTaskFinish", "something_new"}) {
        f.dispatch(dispatcher, session_update("s", {{"sessionUpdate", kind}}));
    }
    f.dispatch(dispatcher, Json{{"jsonrpc", "2.0"}, {"method", "session/update"}});

    REQUIRE(f.events->size() == 0);
}

TEST_CASE("Updates that carry an id are acknowledged with null", "[dispatcher][update]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    Json update = session_update("s", {{"sessionUpdate", "tool_call_update"}, {"toolCallId", "t"}});
    update["id"] = 77;
    f.dispatch(dispatcher, update);

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0]["id"] == 77);
    REQUIRE(replies[0].contains("result"));
    REQUIRE(replies[0]["result"].is_null());
}

// ═══════════════════════════════════════════════════════════════════════════
// session/request_permission
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Auto mode approves with the preferred option", "[dispatcher][permission]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, permission_call(5, "edit", Json::array({
        {{"optionId", "proceed_always"}}, {{"optionId", "proceed_once"}}
    })));

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0]["id"] == 5);
    REQUIRE(replies[0]["result"]["outcome"]["outcome"] == "selected");
    REQUIRE(replies[0]["result"]["outcome"]["optionId"] == "proceed_once");
    REQUIRE(f.events->size() == 0);
}

TEST_CASE("Selective mode answers by tool type", "[dispatcher][permission]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Selective);

    f.dispatch(dispatcher, permission_call(1, "read", Json::array({{{"optionId", "allow"}}})));
    f.dispatch(dispatcher, permission_call(2, "edit", Json::array({{{"optionId", "proceed_once"}}})));
    f.dispatch(dispatcher, permission_call(3, "write", Json::array({{{"optionId", "proceed_once"}}})));

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 3);
    REQUIRE(replies[0]["result"]["outcome"]["optionId"] == "allow");
    REQUIRE(replies[1]["result"]["outcome"]["outcome"] == "cancelled");
    REQUIRE(replies[2]["id"] == 3);
    REQUIRE(replies[2]["result"]["outcome"]["outcome"] == "cancelled");
    REQUIRE(f.events->size() == 0);
}

TEST_CASE("Manual mode cancels and the mode can change", "[dispatcher][permission]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Manual);

    f.dispatch(dispatcher, permission_call("p1", "read", Json::array()));
    dispatcher.set_permission_mode(PermissionMode::Auto);
    f.dispatch(dispatcher, permission_call("p2", "read", Json::array()));

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 2);
    REQUIRE(replies[0]["id"] == "p1");
    REQUIRE(replies[0]["result"]["outcome"]["outcome"] == "cancelled");
    REQUIRE(replies[1]["id"] == "p2");
    REQUIRE(replies[1]["result"]["outcome"]["optionId"] == "proceed_once");
}

// ═══════════════════════════════════════════════════════════════════════════
// Unknown methods and failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Unknown calls with an id get Method not found", "[dispatcher][unknown]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, Json{{"jsonrpc", "2.0"}, {"id", 12}, {"method", "terminal/create"}});
    f.dispatch(dispatcher, Json{{"jsonrpc", "2.0"}, {"method", "terminal/output"}});

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0]["id"] == 12);
    REQUIRE(replies[0]["error"]["code"] == rpc_error_code::kMethodNotFound);
}

TEST_CASE("Disabled file access answers Method not found", "[dispatcher][fs]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    f.dispatch(dispatcher, Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "fs/read_text_file"}, {"params", {{"path", "/etc/hostname"}}}});

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0]["error"]["code"] == rpc_error_code::kMethodNotFound);
}

TEST_CASE("Enabled file access serves reads", "[dispatcher][fs]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "iflow_dispatcher_fs_test";
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "note.txt");
        out << "alpha\nbeta\n";
    }

    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto,
        FileAccessConfig{}.with_enabled(true).add_allowed_dir(dir.string()));

    f.dispatch(dispatcher, Json{{"jsonrpc", "2.0"}, {"id", 4}, {"method", "fs/read_text_file"},
        {"params", {{"path", (dir / "note.txt").string()}}}});

    const auto replies = f.script->sent_replies();
    REQUIRE(replies.size() == 1);
    REQUIRE(replies[0]["result"]["content"] == "alpha\nbeta\n");

    fs::remove_all(dir);
}

TEST_CASE("Reply send failures are reported", "[dispatcher][failure]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);
    f.script->fail_next_sends(1);

    auto result = dispatcher.dispatch(as_call(permission_call(1, "read", Json::array())), f.transport);
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().category == TransportError::Category::Network);
}

TEST_CASE("Unmatched responses are counted", "[dispatcher][unmatched]") {
    DispatchFixture f;
    NotificationDispatcher dispatcher(f.events, PermissionMode::Auto);

    dispatcher.route_unmatched_response(ResponseFrame{99, Json{{"id", 99}, {"result", nullptr}}});
    dispatcher.route_unmatched_response(ResponseFrame{"x", Json::object()});

    REQUIRE(dispatcher.unmatched_responses() == 2);
    REQUIRE(f.events->size() == 0);
}
