#include "iflow/protocol/json_rpc.hpp"

#include <cctype>

namespace iflow {
namespace {

std::string_view trim(std::string_view text) {
    while ((text.empty() == false) && (std::isspace(static_cast<unsigned char>(text.front())) != 0)) {
        text.remove_prefix(1);
    }
    while ((text.empty() == false) && (std::isspace(static_cast<unsigned char>(text.back())) != 0)) {
        text.remove_suffix(1);
    }
    return text;
}

bool has_non_null(const Json& payload, const char* field) {
    const auto it = payload.find(field);
    return (it != payload.end()) && (it->is_null() == false);
}

}  // namespace

JsonRpcRequest::JsonRpcRequest(std::string method,
                               RequestId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(id),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

RequestId JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError error{rpc_error_code::kInternalError, "Unknown error", std::nullopt};
    if (node.is_object() == false) {
        if (node.is_string() == true) {
            error.message = node.get<std::string>();
        }
        return error;
    }

    const auto code_it = node.find("code");
    if ((code_it != node.end()) && (code_it->is_number_integer() == true)) {
        error.code = code_it->get<std::int64_t>();
    }
    const auto message_it = node.find("message");
    if ((message_it != node.end()) && (message_it->is_string() == true)) {
        error.message = message_it->get<std::string>();
    }
    const auto data_it = node.find("data");
    if (data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

JsonRpcError JsonRpcError::method_not_found(std::string_view /*method*/) {
    return JsonRpcError{rpc_error_code::kMethodNotFound, "Method not found", std::nullopt};
}

JsonRpcError JsonRpcError::invalid_params(std::string message) {
    return JsonRpcError{rpc_error_code::kInvalidParams, std::move(message), std::nullopt};
}

JsonRpcError JsonRpcError::internal_error(std::string message) {
    return JsonRpcError{rpc_error_code::kInternalError, std::move(message), std::nullopt};
}

Json make_result_response(const Json& id, Json result) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", std::move(result)}
    };
}

Json make_error_response(const Json& id, const JsonRpcError& error) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error.to_json()}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Frame Classification
// ─────────────────────────────────────────────────────────────────────────────

ClassifiedFrame classify_frame(std::string_view text) {
    const std::string_view trimmed = trim(text);

    if (trimmed.starts_with(kControlPrefix)) {
        return ControlFrame{std::string(trimmed)};
    }

    // Non-throwing parse: a discarded value signals invalid JSON
    Json message = Json::parse(trimmed.begin(), trimmed.end(), nullptr, false);
    if (message.is_discarded() == true) {
        return MalformedFrame{std::string(trimmed), "not valid JSON"};
    }
    if (message.is_object() == false) {
        return MalformedFrame{std::string(trimmed), "not a JSON object"};
    }

    const auto method_it = message.find("method");
    const bool has_method = (method_it != message.end()) && (method_it->is_string() == true);
    const bool has_result = message.contains("result");
    const bool has_error = message.contains("error");

    if (has_method && (has_result == false) && (has_error == false)) {
        ServerCallFrame call;
        call.method = method_it->get<std::string>();
        if (has_non_null(message, "id")) {
            call.id = message.at("id");
        }
        const auto params_it = message.find("params");
        call.params = (params_it != message.end()) ? *params_it : Json::object();
        call.message = std::move(message);
        return call;
    }

    if (has_non_null(message, "id")) {
        Json id = message.at("id");
        return ResponseFrame{std::move(id), std::move(message)};
    }

    return MalformedFrame{std::string(trimmed), "neither a call nor a response"};
}

bool id_matches(const Json& id, RequestId expected) noexcept {
    if (id.is_number_unsigned() == true) {
        return id.get<std::uint64_t>() == expected;
    }
    if (id.is_number_integer() == true) {
        return id.get<std::int64_t>() == static_cast<std::int64_t>(expected);
    }
    return false;
}

}  // namespace iflow
