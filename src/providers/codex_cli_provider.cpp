#include "providers/codex_cli_provider.hpp"

#include <unordered_map>

#include "providers/provider_support.hpp"
#include "utils/logging.hpp"

namespace clubhouse::providers {
namespace {

const std::unordered_map<std::string, std::string>& ToolVerbs() {
    static const std::unordered_map<std::string, std::string> verbs = {
        {"shell", "Running command"},
        {"shell_command", "Running command"},
        {"apply_patch", "Editing file"}
    };
    return verbs;
}

// Codex permissions are sandbox based; these map onto the same permission UI.
const std::vector<std::string> kDurablePermissions = {"shell(git:*)", "shell(npm:*)", "shell(npx:*)"};
const std::vector<std::string> kQuickExtras = {"shell(*)", "apply_patch"};

constexpr const char* kFullAutoFlag = "--full-auto";

std::optional<std::string> StringField(const nlohmann::json& raw, const char* key) {
    const auto it = raw.find(key);
    if (it != raw.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

}  // namespace

CodexCliProvider::CodexCliProvider() {
    conventions_.config_dir = ".codex";
    conventions_.local_instructions_file = "AGENTS.md";
    conventions_.legacy_instructions_file = "AGENTS.md";
    conventions_.mcp_config_file = ".codex/config.toml";
    conventions_.skills_dir = "skills";
    conventions_.agent_templates_dir = "agents";
    conventions_.local_settings_file = "config.toml";
}

std::string CodexCliProvider::FindBinary() const {
    return FindBinaryInPath({"codex"}, {
        HomePath(".local/bin/codex"),
        HomePath(".npm-global/bin/codex"),
        "/usr/local/bin/codex",
        "/opt/homebrew/bin/codex",
        HomePath(".volta/bin/codex"),
        HomePath(".local/share/pnpm/codex"),
        HomePath(".local/share/fnm/aliases/default/bin/codex")
    });
}

ProviderCapabilities CodexCliProvider::GetCapabilities() const {
    ProviderCapabilities capabilities{};
    capabilities.headless = true;
    capabilities.structured_output = false;
    capabilities.hooks = false;
    capabilities.session_resume = true;
    capabilities.permissions = true;
    return capabilities;
}

Availability CodexCliProvider::CheckAvailability() const {
    try {
        FindBinary();
        return {true, ""};
    } catch (const std::exception& ex) {
        return {false, ex.what()};
    }
}

SpawnCommand CodexCliProvider::BuildSpawnCommand(const SpawnOptions& options) const {
    SpawnCommand command{};
    command.binary = FindBinary();
    if (options.free_agent_mode) {
        command.args.push_back(kFullAutoFlag);
    }
    if (HasExplicitModel(options.model)) {
        command.args.push_back("--model");
        command.args.push_back(options.model);
    }
    const auto prompt = JoinPrompt(options.system_prompt, options.mission);
    if (!prompt.empty()) {
        command.args.push_back(prompt);
    }
    return command;
}

std::optional<HeadlessCommandResult> CodexCliProvider::BuildHeadlessCommand(
    const HeadlessOptions& options) const {
    if (options.mission.empty()) {
        return std::nullopt;
    }
    HeadlessCommandResult result{};
    result.binary = FindBinary();
    result.args = {"exec", JoinPrompt(options.system_prompt, options.mission), "--json", kFullAutoFlag};
    if (HasExplicitModel(options.model)) {
        result.args.push_back("--model");
        result.args.push_back(options.model);
    }
    result.output_kind = HeadlessOutputKind::kText;
    return result;
}

// Codex only offers a notify program for turn completion, which cannot carry
// per-tool events, so nothing is registered.
void CodexCliProvider::WriteHooksConfig(const std::filesystem::path& workspace,
                                        const std::string& agent_id,
                                        const HooksConfigOptions& options) const {
    (void)options;
    utils::LogDebug("hooks-config", "provider has no hooks",
                    {{"provider", Id()}, {"agent", agent_id}, {"workspace", workspace.string()}});
}

std::optional<NormalizedHookEvent> CodexCliProvider::ParseHookEvent(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    const auto type = StringField(raw, "type");
    if (!type) {
        return std::nullopt;
    }
    NormalizedHookEvent event{};
    if (*type == "agent-turn-complete") {
        event.kind = HookEventKind::kStop;
        event.message = StringField(raw, "last-assistant-message");
        return event;
    }
    if (*type == "approval-requested") {
        event.kind = HookEventKind::kPermissionRequest;
        event.message = StringField(raw, "message");
        return event;
    }
    return std::nullopt;
}

std::string CodexCliProvider::ReadInstructions(const std::filesystem::path& worktree) const {
    return ReadTextFile(worktree / conventions_.local_instructions_file);
}

void CodexCliProvider::WriteInstructions(const std::filesystem::path& worktree,
                                         const std::string& content) const {
    WriteTextFile(worktree / conventions_.local_instructions_file, content);
}

std::vector<ModelOption> CodexCliProvider::GetModelOptions() const {
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
        {"gpt-5.3-codex", "GPT 5.3 Codex"},
        {"gpt-5.2-codex", "GPT 5.2 Codex"},
        {"codex-mini-latest", "Codex Mini"},
        {"gpt-5", "GPT 5"}
    };
}

std::vector<std::string> CodexCliProvider::GetDefaultPermissions(AgentKind kind) const {
    auto permissions = kDurablePermissions;
    if (kind == AgentKind::kQuick) {
        permissions.insert(permissions.end(), kQuickExtras.begin(), kQuickExtras.end());
    }
    return permissions;
}

std::optional<std::string> CodexCliProvider::ToolVerb(const std::string& tool_name) const {
    const auto it = ToolVerbs().find(tool_name);
    if (it == ToolVerbs().end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace clubhouse::providers
