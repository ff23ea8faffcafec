#include "providers/provider_types.hpp"

namespace clubhouse::providers {

const char* ToString(HookEventKind kind) {
    switch (kind) {
        case HookEventKind::kPreTool: return "pre_tool";
        case HookEventKind::kPostTool: return "post_tool";
        case HookEventKind::kToolError: return "tool_error";
        case HookEventKind::kStop: return "stop";
        case HookEventKind::kNotification: return "notification";
        case HookEventKind::kPermissionRequest: return "permission_request";
    }
    return "stop";
}

std::optional<HookEventKind> ParseHookEventKind(const std::string& value) {
    for (const auto kind : AllHookEventKinds()) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const std::vector<HookEventKind>& AllHookEventKinds() {
    static const std::vector<HookEventKind> kinds = {
        HookEventKind::kPreTool,
        HookEventKind::kPostTool,
        HookEventKind::kToolError,
        HookEventKind::kStop,
        HookEventKind::kNotification,
        HookEventKind::kPermissionRequest
    };
    return kinds;
}

const char* ToString(HeadlessOutputKind kind) {
    switch (kind) {
        case HeadlessOutputKind::kStreamJson: return "stream-json";
        case HeadlessOutputKind::kText: return "text";
    }
    return "text";
}

nlohmann::json ToJson(const NormalizedHookEvent& event) {
    nlohmann::json json = nlohmann::json::object();
    json["kind"] = ToString(event.kind);
    json["toolName"] = event.tool_name ? nlohmann::json(*event.tool_name) : nlohmann::json(nullptr);
    json["toolInput"] = event.tool_input ? *event.tool_input : nlohmann::json(nullptr);
    json["message"] = event.message ? nlohmann::json(*event.message) : nlohmann::json(nullptr);
    json["toolVerb"] = event.tool_verb ? nlohmann::json(*event.tool_verb) : nlohmann::json(nullptr);
    json["timestamp"] = event.timestamp;
    return json;
}

}  // namespace clubhouse::providers
