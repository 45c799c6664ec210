#include "iflow/protocol/permission.hpp"

#include <algorithm>
#include <array>

namespace iflow {

namespace {

constexpr std::array<std::string_view, 3> kReadOnlyToolTypes{"read", "fetch", "list"};

std::string string_field(const Json& node, const char* key, std::string_view fallback) {
    if (node.is_object() == false) {
        return std::string(fallback);
    }
    const auto it = node.find(key);
    if ((it == node.end()) || (it->is_string() == false)) {
        return std::string(fallback);
    }
    return it->get<std::string>();
}

}  // namespace

std::optional<PermissionMode> permission_mode_from_string(std::string_view name) noexcept {
    if (name == "auto") return PermissionMode::Auto;
    if (name == "manual") return PermissionMode::Manual;
    if (name == "selective") return PermissionMode::Selective;
    return std::nullopt;
}

PermissionRequest PermissionRequest::from_call(const Json& request_id, const Json& params) {
    PermissionRequest request;
    request.request_id = request_id;

    const Json tool_call = (params.is_object() == true) ? params.value("toolCall", Json::object()) : Json::object();
    request.tool_title = string_field(tool_call, "title", "unknown");
    request.tool_type = string_field(tool_call, "type", "unknown");

    if ((params.is_object() == true) && params.contains("options") && params.at("options").is_array()) {
        for (const auto& option : params.at("options")) {
            if (option.is_object() && option.contains("optionId") && option.at("optionId").is_string()) {
                request.option_ids.push_back(option.at("optionId").get<std::string>());
            }
        }
    }
    return request;
}

bool should_approve(PermissionMode mode, std::string_view tool_type) noexcept {
    switch (mode) {
        case PermissionMode::Auto:
            return true;
        case PermissionMode::Manual:
            return false;
        case PermissionMode::Selective:
            return std::find(kReadOnlyToolTypes.begin(), kReadOnlyToolTypes.end(), tool_type)
                != kReadOnlyToolTypes.end();
    }
    return false;
}

std::string select_option(const std::vector<std::string>& option_ids) {
    for (const auto preferred : {kOptionProceedOnce, kOptionProceedAlways}) {
        const auto it = std::find(option_ids.begin(), option_ids.end(), preferred);
        if (it != option_ids.end()) {
            return *it;
        }
    }
    if (option_ids.empty() == false) {
        return option_ids.front();
    }
    return std::string(kOptionProceedOnce);
}

PermissionDecision decide(PermissionMode mode, const PermissionRequest& request) {
    if (should_approve(mode, request.tool_type) == false) {
        return PermissionDecision{false, std::nullopt};
    }
    return PermissionDecision{true, select_option(request.option_ids)};
}

Json make_permission_result(const PermissionDecision& decision) {
    if (decision.approved && decision.option_id.has_value()) {
        return Json{{"outcome", {{"outcome", "selected"}, {"optionId", *decision.option_id}}}};
    }
    return Json{{"outcome", {{"outcome", "cancelled"}}}};
}

}  // namespace iflow
