#ifndef IFLOW_TESTS_MOCKS_MOCK_TRANSPORT_HPP
#define IFLOW_TESTS_MOCKS_MOCK_TRANSPORT_HPP

#include "iflow/protocol/json_rpc.hpp"
#include "iflow/transport.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace iflow::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockScript - State shared between a test and its MockTransport
// ─────────────────────────────────────────────────────────────────────────────
// The transport is usually moved into the engine, so tests keep the script to:
// - Queue inbound frames, closes and receive errors
// - Answer outbound requests by method with canned frames
// - Fail sends or connect
// - Inspect everything that was sent

struct SentFrame {
    std::string text;
    Json json;                      ///< Parsed text, null if unparseable
    std::size_t consumed_before{};  ///< Inbound items consumed before this send
};

class MockScript {
public:
    using RequestHandler = std::function<std::vector<Json>(const Json& request)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Inbound
    // ─────────────────────────────────────────────────────────────────────────

    void push_text(std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.emplace_back(Frame::text(std::move(text)));
    }

    void push_json(const Json& message) {
        push_text(message.dump());
    }

    void push_close(std::string reason = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.emplace_back(Frame::closed(std::move(reason)));
    }

    void push_error(TransportError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.emplace_back(std::move(error));
    }

    /// Every later outbound request with `method` gets these frames queued.
    void on_request(std::string method, RequestHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[std::move(method)] = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Failure injection
    // ─────────────────────────────────────────────────────────────────────────

    void fail_next_sends(std::size_t count, TransportError::Category category = TransportError::Category::Network) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_sends_ = count;
        send_failure_category_ = category;
    }

    void fail_connect(TransportError error) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_error_ = std::move(error);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<SentFrame> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::vector<Json> sent_with_method(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Json> matches;
        for (const auto& frame : sent_) {
            if (frame.json.is_object() && (frame.json.value("method", "") == method)) {
                matches.push_back(frame.json);
            }
        }
        return matches;
    }

    /// Outbound messages that answer server calls (no "method")
    [[nodiscard]] std::vector<Json> sent_replies() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Json> replies;
        for (const auto& frame : sent_) {
            if (frame.json.is_object() && (frame.json.contains("method") == false)) {
                replies.push_back(frame.json);
            }
        }
        return replies;
    }

    [[nodiscard]] std::size_t consumed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consumed_;
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inbound_.size();
    }

    [[nodiscard]] std::size_t send_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return send_attempts_;
    }

    [[nodiscard]] std::size_t close_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

private:
    friend class MockTransport;

    using Item = std::variant<Frame, TransportError>;

    mutable std::mutex mutex_;
    std::deque<Item> inbound_;
    std::map<std::string, RequestHandler> handlers_;
    std::vector<SentFrame> sent_;
    std::size_t consumed_{0};
    std::size_t send_attempts_{0};
    std::size_t failing_sends_{0};
    TransportError::Category send_failure_category_{TransportError::Category::Network};
    std::optional<TransportError> connect_error_;
    std::size_t close_count_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// MockTransport - Test double for ITransport
// ─────────────────────────────────────────────────────────────────────────────

class MockTransport final : public ITransport {
public:
    explicit MockTransport(std::shared_ptr<MockScript> script)
        : script_(std::move(script))
    {}

    TransportResult<void> connect() override {
        std::lock_guard<std::mutex> lock(script_->mutex_);
        if (script_->connect_error_.has_value()) {
            return tl::unexpected(*script_->connect_error_);
        }
        connected_ = true;
        return {};
    }

    TransportResult<void> send_text(std::string_view text) override {
        RequestHandler handler;
        Json parsed = Json::parse(text.begin(), text.end(), nullptr, false);
        if (parsed.is_discarded()) {
            parsed = nullptr;
        }

        {
            std::lock_guard<std::mutex> lock(script_->mutex_);
            ++script_->send_attempts_;
            if (script_->failing_sends_ > 0) {
                --script_->failing_sends_;
                return tl::unexpected(TransportError{script_->send_failure_category_, "injected send failure"});
            }
            script_->sent_.push_back(SentFrame{std::string(text), parsed, script_->consumed_});

            if (parsed.is_object() && parsed.contains("method") && parsed["method"].is_string()) {
                const auto it = script_->handlers_.find(parsed["method"].get<std::string>());
                if (it != script_->handlers_.end()) {
                    handler = it->second;
                }
            }
        }

        // Outside the lock: handlers may inspect the script
        if (handler) {
            for (const auto& reply : handler(parsed)) {
                script_->push_json(reply);
            }
        }
        return {};
    }

    TransportResult<Frame> receive() override {
        while (true) {
            auto frame = receive_with_timeout(std::chrono::milliseconds{50});
            if (frame.has_value() == false) {
                return tl::unexpected(frame.error());
            }
            if (frame->has_value()) {
                return std::move(**frame);
            }
        }
    }

    TransportResult<std::optional<Frame>> receive_with_timeout(std::chrono::milliseconds timeout) override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex_);
            if (script_->inbound_.empty() == false) {
                auto item = std::move(script_->inbound_.front());
                script_->inbound_.pop_front();
                ++script_->consumed_;
                if (auto* error = std::get_if<TransportError>(&item)) {
                    return tl::unexpected(std::move(*error));
                }
                return std::optional<Frame>(std::get<Frame>(std::move(item)));
            }
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds{5}));
        return std::optional<Frame>{};
    }

    TransportResult<void> close() override {
        std::lock_guard<std::mutex> lock(script_->mutex_);
        if (connected_) {
            ++script_->close_count_;
        }
        connected_ = false;
        return {};
    }

    [[nodiscard]] bool is_connected() const noexcept override {
        return connected_;
    }

private:
    using RequestHandler = MockScript::RequestHandler;

    std::shared_ptr<MockScript> script_;
    bool connected_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Message builders
// ─────────────────────────────────────────────────────────────────────────────

inline Json result_for(const Json& request, Json result) {
    return Json{{"jsonrpc", "2.0"}, {"id", request.at("id")}, {"result", std::move(result)}};
}

inline Json error_for(const Json& request, int code, const std::string& message) {
    return Json{{"jsonrpc", "2.0"}, {"id", request.at("id")}, {"error", {{"code", code}, {"message", message}}}};
}

inline Json session_update(const std::string& session_id, Json update) {
    return Json{
        {"jsonrpc", "2.0"},
        {"method", "session/update"},
        {"params", {{"sessionId", session_id}, {"update", std::move(update)}}}
    };
}

inline Json agent_chunk(const std::string& session_id, const std::string& text) {
    return session_update(session_id, {
        {"sessionUpdate", "agent_message_chunk"},
        {"content", {{"type", "text"}, {"text", text}}}
    });
}

/// A well-behaved agent: unauthenticated initialize, successful authenticate,
/// session `session_id`, and each prompt answered by `chunks` then end_turn.
inline void install_happy_agent(
    MockScript& script,
    const std::string& session_id = "session-1",
    std::vector<std::string> chunks = {"Hello", " world"}
) {
    script.on_request("initialize", [](const Json& request) {
        return std::vector<Json>{result_for(request, {{"protocolVersion", 1}, {"isAuthenticated", false}})};
    });
    script.on_request("authenticate", [](const Json& request) {
        return std::vector<Json>{result_for(request, {{"methodId", request["params"]["methodId"]}})};
    });
    script.on_request("session/new", [session_id](const Json& request) {
        return std::vector<Json>{result_for(request, {{"sessionId", session_id}})};
    });
    script.on_request("session/prompt", [session_id, chunks](const Json& request) {
        std::vector<Json> frames;
        for (const auto& chunk : chunks) {
            frames.push_back(agent_chunk(session_id, chunk));
        }
        frames.push_back(result_for(request, {{"stopReason", "end_turn"}}));
        return frames;
    });
}

}  // namespace iflow::testing

#endif  // IFLOW_TESTS_MOCKS_MOCK_TRANSPORT_HPP
