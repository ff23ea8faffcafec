#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace clubhouse::providers {

enum class HookEventKind {
    kPreTool,
    kPostTool,
    kToolError,
    kStop,
    kNotification,
    kPermissionRequest
};

const char* ToString(HookEventKind kind);
std::optional<HookEventKind> ParseHookEventKind(const std::string& value);
const std::vector<HookEventKind>& AllHookEventKinds();

enum class HeadlessOutputKind {
    kStreamJson,
    kText
};

const char* ToString(HeadlessOutputKind kind);

enum class AgentKind {
    kQuick,
    kDurable
};

struct SpawnOptions {
    std::string cwd;
    std::string model;
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    std::string system_prompt;
    std::string mission;
    bool free_agent_mode = false;
    std::string agent_id;
};

struct HeadlessOptions : SpawnOptions {
    // Empty means the provider's richest supported format.
    std::string output_format;
    bool no_session_persistence = false;
};

struct SpawnCommand {
    std::string binary;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
};

struct HeadlessCommandResult {
    std::string binary;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;
    HeadlessOutputKind output_kind = HeadlessOutputKind::kStreamJson;
};

struct NormalizedHookEvent {
    HookEventKind kind = HookEventKind::kStop;
    std::optional<std::string> tool_name;
    std::optional<nlohmann::json> tool_input;
    std::optional<std::string> message;
    std::optional<std::string> tool_verb;
    std::int64_t timestamp = 0;
};

nlohmann::json ToJson(const NormalizedHookEvent& event);

struct Conventions {
    std::string config_dir;
    std::string local_instructions_file;
    std::string legacy_instructions_file;
    std::string mcp_config_file;
    std::string skills_dir;
    std::string agent_templates_dir;
    std::string local_settings_file;
};

struct ProviderCapabilities {
    bool headless = false;
    bool structured_output = false;
    bool hooks = false;
    bool session_resume = false;
    bool permissions = false;

    bool operator==(const ProviderCapabilities& other) const {
        return headless == other.headless
            && structured_output == other.structured_output
            && hooks == other.hooks
            && session_resume == other.session_resume
            && permissions == other.permissions;
    }
};

struct ModelOption {
    std::string id;
    std::string label;

    bool operator==(const ModelOption& other) const {
        return id == other.id && label == other.label;
    }
};

struct Availability {
    bool available = false;
    std::string error;
};

struct HooksConfigOptions {
    // Base callback URL, e.g. "http://127.0.0.1:4567/hook".
    std::string hook_url;
    // Empty means the child's $CLUBHOUSE_HOOK_NONCE is referenced instead.
    std::string nonce;
};

struct QuickSummary {
    std::optional<std::string> summary;
    std::vector<std::string> files_modified;
};

}  // namespace clubhouse::providers
