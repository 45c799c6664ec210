#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace iflow {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

/// Literal token the agent emits once it accepts JSON-RPC traffic.
inline constexpr std::string_view kReadyToken{"//ready"};

/// Prefix shared by all bare-text control frames.
inline constexpr std::string_view kControlPrefix{"//"};

namespace rpc_error_code {
inline constexpr std::int64_t kParseError     = -32700;
inline constexpr std::int64_t kInvalidRequest = -32600;
inline constexpr std::int64_t kMethodNotFound = -32601;
inline constexpr std::int64_t kInvalidParams  = -32602;
inline constexpr std::int64_t kInternalError  = -32603;
}  // namespace rpc_error_code

/// Client-issued request ids. Monotonic per engine instance, never reused.
using RequestId = std::uint32_t;

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, RequestId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] RequestId id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    RequestId id_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;

    /// Lenient parse; missing fields fall back to an internal error.
    [[nodiscard]] static JsonRpcError from_json(const Json& node);

    [[nodiscard]] static JsonRpcError method_not_found(std::string_view method);
    [[nodiscard]] static JsonRpcError invalid_params(std::string message);
    [[nodiscard]] static JsonRpcError internal_error(std::string message);
};

/// `{"jsonrpc":"2.0","id":id,"result":result}`
[[nodiscard]] Json make_result_response(const Json& id, Json result);

/// `{"jsonrpc":"2.0","id":id,"error":{...}}`
[[nodiscard]] Json make_error_response(const Json& id, const JsonRpcError& error);

// ─────────────────────────────────────────────────────────────────────────────
// Frame Classification
// ─────────────────────────────────────────────────────────────────────────────
// Every inbound text frame is classified exactly once into one of four shapes.

/// Bare text beginning with "//" (the ready token or agent chatter)
struct ControlFrame {
    std::string token;

    [[nodiscard]] bool is_ready() const noexcept { return token == kReadyToken; }
};

/// A reply to a client request: carries an id and no server method
struct ResponseFrame {
    Json id;
    Json message;
};

/// A server-initiated call: carries a method and neither result nor error
struct ServerCallFrame {
    std::string method;
    std::optional<Json> id;  ///< Absent for pure notifications
    Json params;
    Json message;
};

/// Anything that is not one of the above (non-JSON text, id-less objects, ...)
struct MalformedFrame {
    std::string raw;
    std::string reason;
};

using ClassifiedFrame = std::variant<ControlFrame, ResponseFrame, ServerCallFrame, MalformedFrame>;

[[nodiscard]] ClassifiedFrame classify_frame(std::string_view text);

/// True when `id` is the integer `expected`.
[[nodiscard]] bool id_matches(const Json& id, RequestId expected) noexcept;

}  // namespace iflow
