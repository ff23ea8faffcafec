#include "providers/copilot_cli_provider.hpp"

#include <unordered_map>
#include <utility>

#include "providers/hook_config.hpp"
#include "providers/provider_support.hpp"
#include "utils/logging.hpp"

namespace clubhouse::providers {
namespace {

// Copilot reports lowercase tool names.
const std::unordered_map<std::string, std::string>& ToolVerbs() {
    static const std::unordered_map<std::string, std::string> verbs = {
        {"shell", "Running command"},
        {"edit", "Editing file"},
        {"read", "Reading file"},
        {"search", "Searching code"},
        {"agent", "Running agent"}
    };
    return verbs;
}

const std::unordered_map<std::string, HookEventKind>& EventNames() {
    static const std::unordered_map<std::string, HookEventKind> names = {
        {"preToolUse", HookEventKind::kPreTool},
        {"postToolUse", HookEventKind::kPostTool},
        {"errorOccurred", HookEventKind::kToolError},
        {"sessionEnd", HookEventKind::kStop}
    };
    return names;
}

const std::vector<std::string>& HookCategories() {
    static const std::vector<std::string> categories = {
        "preToolUse", "postToolUse", "errorOccurred", "sessionEnd"
    };
    return categories;
}

const std::vector<std::string> kDurablePermissions = {"Bash(git:*)", "Bash(npm:*)", "Bash(npx:*)"};
const std::vector<std::string> kQuickExtras = {"Read", "Write", "Edit", "Glob", "Grep"};

constexpr const char* kYoloFlag = "--yolo";

std::optional<std::string> FindString(const nlohmann::json& raw, const char* primary, const char* secondary) {
    for (const char* key : {primary, secondary}) {
        const auto it = raw.find(key);
        if (it != raw.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

// tool_input arrives as an object; toolArgs as an object or a JSON-encoded string.
std::optional<nlohmann::json> FindToolInput(const nlohmann::json& raw) {
    if (raw.contains("tool_input") && raw["tool_input"].is_object()) {
        return raw["tool_input"];
    }
    if (!raw.contains("toolArgs")) {
        return std::nullopt;
    }
    const auto& args = raw["toolArgs"];
    if (args.is_object()) {
        return args;
    }
    if (args.is_string()) {
        auto parsed = nlohmann::json::parse(args.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
        utils::LogDebug("provider", "dropping unparseable toolArgs", {{"provider", "copilot-cli"}});
    }
    return std::nullopt;
}

}  // namespace

CopilotCliProvider::CopilotCliProvider() {
    conventions_.config_dir = ".github";
    conventions_.local_instructions_file = "copilot-instructions.md";
    conventions_.legacy_instructions_file = "copilot-instructions.md";
    conventions_.mcp_config_file = ".github/mcp.json";
    conventions_.skills_dir = "skills";
    conventions_.agent_templates_dir = "agents";
    conventions_.local_settings_file = "hooks/hooks.json";
}

std::string CopilotCliProvider::FindBinary() const {
    return FindBinaryInPath({"copilot"}, {
        HomePath(".local/bin/copilot"),
        HomePath(".npm-global/bin/copilot"),
        "/usr/local/bin/copilot",
        "/opt/homebrew/bin/copilot"
    });
}

ProviderCapabilities CopilotCliProvider::GetCapabilities() const {
    ProviderCapabilities capabilities{};
    capabilities.headless = true;
    capabilities.structured_output = false;
    capabilities.hooks = true;
    capabilities.session_resume = true;
    capabilities.permissions = true;
    return capabilities;
}

Availability CopilotCliProvider::CheckAvailability() const {
    try {
        FindBinary();
        return {true, ""};
    } catch (const std::exception& ex) {
        return {false, ex.what()};
    }
}

SpawnCommand CopilotCliProvider::BuildSpawnCommand(const SpawnOptions& options) const {
    SpawnCommand command{};
    command.binary = FindBinary();
    if (options.free_agent_mode) {
        command.args.push_back(kYoloFlag);
    }
    if (HasExplicitModel(options.model)) {
        command.args.push_back("--model");
        command.args.push_back(options.model);
    }
    for (const auto& tool : options.allowed_tools) {
        command.args.push_back("--allow-tool");
        command.args.push_back(tool);
    }
    for (const auto& tool : options.disallowed_tools) {
        command.args.push_back("--deny-tool");
        command.args.push_back(tool);
    }
    const auto prompt = JoinPrompt(options.system_prompt, options.mission);
    if (!prompt.empty()) {
        command.args.push_back("-p");
        command.args.push_back(prompt);
    }
    return command;
}

std::optional<HeadlessCommandResult> CopilotCliProvider::BuildHeadlessCommand(
    const HeadlessOptions& options) const {
    if (options.mission.empty()) {
        return std::nullopt;
    }
    HeadlessCommandResult result{};
    result.binary = FindBinary();
    result.args = {"-p", JoinPrompt(options.system_prompt, options.mission), "--allow-all", "--silent"};
    if (HasExplicitModel(options.model)) {
        result.args.push_back("--model");
        result.args.push_back(options.model);
    }
    result.output_kind = HeadlessOutputKind::kText;
    return result;
}

void CopilotCliProvider::WriteHooksConfig(const std::filesystem::path& workspace,
                                          const std::string& agent_id,
                                          const HooksConfigOptions& options) const {
    const auto hooks_path = workspace / conventions_.config_dir / conventions_.local_settings_file;
    auto config = ReadJsonObject(hooks_path);
    config["version"] = 1;

    std::vector<std::pair<std::string, nlohmann::json>> entries;
    for (const auto& category : HookCategories()) {
        entries.emplace_back(category, nlohmann::json{
            {"type", "command"},
            {"bash", BuildHookCommand(options.hook_url, agent_id, category, options.nonce)},
            {"timeoutSec", 5}
        });
    }
    MergeHookCategories(config, entries, IsOwnHookEntry);
    WriteJsonFile(hooks_path, config);
    utils::LogDebug("hooks-config", "wrote hooks",
                    {{"provider", Id()}, {"agent", agent_id}, {"path", hooks_path.string()}});
}

std::optional<NormalizedHookEvent> CopilotCliProvider::ParseHookEvent(const nlohmann::json& raw) const {
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
    event.tool_name = FindString(raw, "tool_name", "toolName");
    event.tool_input = FindToolInput(raw);
    if (raw.contains("message") && raw["message"].is_string()) {
        event.message = raw["message"].get<std::string>();
    } else if (raw.contains("error") && raw["error"].is_object()) {
        const auto& error = raw["error"];
        if (error.contains("message") && error["message"].is_string()) {
            event.message = error["message"].get<std::string>();
        }
    }
    return event;
}

std::string CopilotCliProvider::ReadInstructions(const std::filesystem::path& worktree) const {
    return ReadTextFile(worktree / conventions_.config_dir / conventions_.local_instructions_file);
}

void CopilotCliProvider::WriteInstructions(const std::filesystem::path& worktree,
                                           const std::string& content) const {
    WriteTextFile(worktree / conventions_.config_dir / conventions_.local_instructions_file, content);
}

std::vector<ModelOption> CopilotCliProvider::GetModelOptions() const {
    try {
        const auto help = ProbeCommandOutput(FindBinary(), {"--help"});
        if (help) {
            if (auto parsed = ParseModelChoicesFromHelp(*help)) {
                return *parsed;
            }
        }
    } catch (const std::exception& ex) {
        utils::LogDebug("provider", "model probe unavailable", {{"provider", Id()}, {"error", ex.what()}});
    }
    return {
        {"default", "Default"},
        {"claude-sonnet-4.5", "Claude Sonnet 4.5"},
        {"claude-sonnet-4", "Claude Sonnet 4"},
        {"claude-haiku-4.5", "Claude Haiku 4.5"},
        {"gpt-5", "GPT 5"}
    };
}

std::vector<std::string> CopilotCliProvider::GetDefaultPermissions(AgentKind kind) const {
    auto permissions = kDurablePermissions;
    if (kind == AgentKind::kQuick) {
        permissions.insert(permissions.end(), kQuickExtras.begin(), kQuickExtras.end());
    }
    return permissions;
}

std::optional<std::string> CopilotCliProvider::ToolVerb(const std::string& tool_name) const {
    const auto it = ToolVerbs().find(tool_name);
    if (it == ToolVerbs().end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace clubhouse::providers
