#include "providers/claude_code_provider.hpp"

#include <unordered_map>
#include <utility>

#include "providers/hook_config.hpp"
#include "providers/provider_support.hpp"
#include "utils/logging.hpp"

namespace clubhouse::providers {
namespace {

const std::unordered_map<std::string, std::string>& ToolVerbs() {
    static const std::unordered_map<std::string, std::string> verbs = {
        {"Bash", "Running command"},
        {"Edit", "Editing file"},
        {"Write", "Writing file"},
        {"Read", "Reading file"},
        {"Glob", "Searching files"},
        {"Grep", "Searching code"},
        {"Task", "Running task"},
        {"WebSearch", "Searching web"},
        {"WebFetch", "Fetching page"},
        {"EnterPlanMode", "Planning"},
        {"ExitPlanMode", "Finishing plan"},
        {"NotebookEdit", "Editing notebook"}
    };
    return verbs;
}

const std::unordered_map<std::string, HookEventKind>& EventNames() {
    static const std::unordered_map<std::string, HookEventKind> names = {
        {"PreToolUse", HookEventKind::kPreTool},
        {"PostToolUse", HookEventKind::kPostTool},
        {"PostToolUseFailure", HookEventKind::kToolError},
        {"Stop", HookEventKind::kStop},
        {"Notification", HookEventKind::kNotification},
        {"PermissionRequest", HookEventKind::kPermissionRequest}
    };
    return names;
}

// Registration order of the settings categories.
const std::vector<std::string>& HookCategories() {
    static const std::vector<std::string> categories = {
        "PreToolUse", "PostToolUse", "PostToolUseFailure", "Stop", "Notification", "PermissionRequest"
    };
    return categories;
}

const std::vector<std::string> kDurablePermissions = {"Bash(git:*)", "Bash(npm:*)", "Bash(npx:*)"};
const std::vector<std::string> kQuickExtras = {"Read", "Write", "Edit", "Glob", "Grep"};

constexpr const char* kSkipPermissionsFlag = "--dangerously-skip-permissions";

void AppendToolFlags(std::vector<std::string>& args, const SpawnOptions& options) {
    if (HasExplicitModel(options.model)) {
        args.push_back("--model");
        args.push_back(options.model);
    }
    for (const auto& tool : options.allowed_tools) {
        args.push_back("--allowedTools");
        args.push_back(tool);
    }
    for (const auto& tool : options.disallowed_tools) {
        args.push_back("--disallowedTools");
        args.push_back(tool);
    }
    if (!options.system_prompt.empty()) {
        args.push_back("--append-system-prompt");
        args.push_back(options.system_prompt);
    }
}

}  // namespace

ClaudeCodeProvider::ClaudeCodeProvider() {
    conventions_.config_dir = ".claude";
    conventions_.local_instructions_file = "CLAUDE.local.md";
    conventions_.legacy_instructions_file = "CLAUDE.md";
    conventions_.mcp_config_file = ".mcp.json";
    conventions_.skills_dir = "skills";
    conventions_.agent_templates_dir = "agents";
    conventions_.local_settings_file = "settings.local.json";
}

std::string ClaudeCodeProvider::FindBinary() const {
    return FindBinaryInPath({"claude"}, {
        HomePath(".local/bin/claude"),
        HomePath(".claude/local/claude"),
        HomePath(".npm-global/bin/claude"),
        "/usr/local/bin/claude",
        "/opt/homebrew/bin/claude"
    });
}

ProviderCapabilities ClaudeCodeProvider::GetCapabilities() const {
    ProviderCapabilities capabilities{};
    capabilities.headless = true;
    capabilities.structured_output = true;
    capabilities.hooks = true;
    capabilities.session_resume = true;
    capabilities.permissions = true;
    return capabilities;
}

Availability ClaudeCodeProvider::CheckAvailability() const {
    try {
        FindBinary();
        return {true, ""};
    } catch (const std::exception& ex) {
        return {false, ex.what()};
    }
}

SpawnCommand ClaudeCodeProvider::BuildSpawnCommand(const SpawnOptions& options) const {
    SpawnCommand command{};
    command.binary = FindBinary();
    if (options.free_agent_mode) {
        command.args.push_back(kSkipPermissionsFlag);
    }
    AppendToolFlags(command.args, options);
    if (!options.mission.empty()) {
        command.args.push_back(options.mission);
    }
    return command;
}

std::optional<HeadlessCommandResult> ClaudeCodeProvider::BuildHeadlessCommand(
    const HeadlessOptions& options) const {
    if (options.mission.empty()) {
        return std::nullopt;
    }
    const std::string format = options.output_format.empty() ? "stream-json" : options.output_format;

    HeadlessCommandResult result{};
    result.binary = FindBinary();
    result.args = {"-p", options.mission, "--output-format", format};
    // stream-json output is rejected by the tool without --verbose.
    if (format == "stream-json") {
        result.args.push_back("--verbose");
    }
    result.args.push_back(kSkipPermissionsFlag);
    AppendToolFlags(result.args, options);
    if (options.no_session_persistence) {
        result.args.push_back("--no-session-persistence");
    }
    result.output_kind = format == "stream-json" ? HeadlessOutputKind::kStreamJson : HeadlessOutputKind::kText;
    return result;
}

void ClaudeCodeProvider::WriteHooksConfig(const std::filesystem::path& workspace,
                                          const std::string& agent_id,
                                          const HooksConfigOptions& options) const {
    const auto settings_path = workspace / conventions_.config_dir / conventions_.local_settings_file;
    auto config = ReadJsonObject(settings_path);

    std::vector<std::pair<std::string, nlohmann::json>> entries;
    for (const auto& category : HookCategories()) {
        nlohmann::json hook = {
            {"type", "command"},
            {"command", BuildHookCommand(options.hook_url, agent_id, category, options.nonce)},
            {"async", true},
            {"timeout", 5}
        };
        nlohmann::json entry = nlohmann::json::object();
        if (category == "Notification") {
            entry["matcher"] = "";
        }
        entry["hooks"] = nlohmann::json::array({hook});
        entries.emplace_back(category, std::move(entry));
    }
    MergeHookCategories(config, entries, IsOwnHookEntry);
    WriteJsonFile(settings_path, config);
    utils::LogDebug("hooks-config", "wrote hooks",
                    {{"provider", Id()}, {"agent", agent_id}, {"path", settings_path.string()}});
}

std::optional<NormalizedHookEvent> ClaudeCodeProvider::ParseHookEvent(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    const auto name = raw.find("hook_event_name");
    if (name == raw.end() || !name->is_string()) {
        return std::nullopt;
    }
    const auto kind = EventNames().find(name->get<std::string>());
    if (kind == EventNames().end()) {
        return std::nullopt;
    }

    NormalizedHookEvent event{};
    event.kind = kind->second;
    if (raw.contains("tool_name") && raw["tool_name"].is_string()) {
        event.tool_name = raw["tool_name"].get<std::string>();
    }
    if (raw.contains("tool_input") && raw["tool_input"].is_object()) {
        event.tool_input = raw["tool_input"];
    }
    if (raw.contains("message") && raw["message"].is_string()) {
        event.message = raw["message"].get<std::string>();
    }
    return event;
}

std::string ClaudeCodeProvider::ReadInstructions(const std::filesystem::path& worktree) const {
    const auto local_path = worktree / conventions_.config_dir / conventions_.local_instructions_file;
    std::error_code ec;
    if (std::filesystem::exists(local_path, ec)) {
        return ReadTextFile(local_path);
    }
    return ReadTextFile(worktree / conventions_.legacy_instructions_file);
}

void ClaudeCodeProvider::WriteInstructions(const std::filesystem::path& worktree,
                                           const std::string& content) const {
    WriteTextFile(worktree / conventions_.config_dir / conventions_.local_instructions_file, content);
}

std::vector<ModelOption> ClaudeCodeProvider::GetModelOptions() const {
    try {
        const auto help = ProbeCommandOutput(FindBinary(), {"--help"});
        if (help) {
            if (auto parsed = ParseModelChoicesFromHelp(*help)) {
                return *parsed;
            }
            if (auto parsed = ParseModelAliasesFromHelp(*help)) {
                return *parsed;
            }
        }
    } catch (const std::exception& ex) {
        utils::LogDebug("provider", "model probe unavailable", {{"provider", Id()}, {"error", ex.what()}});
    }
    return {{"default", "Default"}, {"opus", "Opus"}, {"sonnet", "Sonnet"}, {"haiku", "Haiku"}};
}

std::vector<std::string> ClaudeCodeProvider::GetDefaultPermissions(AgentKind kind) const {
    auto permissions = kDurablePermissions;
    if (kind == AgentKind::kQuick) {
        permissions.insert(permissions.end(), kQuickExtras.begin(), kQuickExtras.end());
    }
    return permissions;
}

std::optional<std::string> ClaudeCodeProvider::ToolVerb(const std::string& tool_name) const {
    const auto it = ToolVerbs().find(tool_name);
    if (it == ToolVerbs().end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace clubhouse::providers
