#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "iflow/client/query.hpp"
#include "mocks/mock_connection.hpp"

#include <vector>

using namespace iflow;
using namespace iflow::testing;
using namespace std::chrono_literals;

namespace {

IFlowOptions quick_options() {
    return IFlowOptions{}.with_timeout(2s);
}

}  // namespace

TEST_CASE("query returns the trimmed assistant text", "[query]") {
    auto script = std::make_shared<MockScript>();
    install_happy_agent(*script, "session-q", {"\n  The answer", " is 42.\n"});

    auto answer = query("What is the answer?", quick_options(), mock_connection_factory(script));
    REQUIRE(answer.has_value());
    REQUIRE(*answer == "The answer is 42.");

    REQUIRE(script->sent_with_method("session/prompt")[0]["params"]["prompt"][0]["text"] == "What is the answer?");
    REQUIRE(script->close_count() == 1);
}

TEST_CASE("query_stream delivers each chunk", "[query]") {
    auto script = std::make_shared<MockScript>();
    install_happy_agent(*script, "session-q", {"a", "b", "c"});

    std::vector<std::string> chunks;
    auto streamed = query_stream("spell", quick_options(),
        [&chunks](std::string_view chunk) { chunks.emplace_back(chunk); },
        mock_connection_factory(script));

    REQUIRE(streamed.has_value());
    REQUIRE(chunks == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("query reports agent errors", "[query]") {
    auto script = std::make_shared<MockScript>();
    install_happy_agent(*script);
    script->on_request("session/prompt", [](const Json& request) {
        return std::vector<Json>{error_for(request, -32603, "model crashed")};
    });

    auto answer = query("hello", quick_options(), mock_connection_factory(script));
    REQUIRE_FALSE(answer.has_value());
    REQUIRE(answer.error().code == ErrorCode::Protocol);
    REQUIRE(answer.error().message.find("model crashed") != std::string::npos);
}

TEST_CASE("query propagates connect failures", "[query]") {
    auto script = std::make_shared<MockScript>();
    script->fail_connect(TransportError{TransportError::Category::Network, "no agent"});

    auto answer = query("hello", quick_options(), mock_connection_factory(script));
    REQUIRE_FALSE(answer.has_value());
    REQUIRE(answer.error().code == ErrorCode::Connection);
}

TEST_CASE("query gives up when the agent never finishes", "[query]") {
    auto script = std::make_shared<MockScript>();
    install_happy_agent(*script);
    script->on_request("session/prompt", [](const Json&) { return std::vector<Json>{}; });

    auto answer = query("hello", IFlowOptions{}.with_timeout(300ms), mock_connection_factory(script));
    REQUIRE_FALSE(answer.has_value());
    // Either the query deadline or the engine's own timeout fires first
    const bool timed_out = (answer.error().code == ErrorCode::Timeout)
        || (answer.error().message.find("Timed out") != std::string::npos);
    REQUIRE(timed_out);
}
