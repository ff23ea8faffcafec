#include "providers/opencode_provider.hpp"

#include <initializer_list>
#include <sstream>
#include <unordered_map>

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
        {"Task", "Running task"}
    };
    return verbs;
}

const std::vector<std::string> kDurablePermissions = {"bash(git:*)", "bash(npm:*)", "bash(npx:*)"};
const std::vector<std::string> kQuickExtras = {"read", "edit", "glob", "grep"};

std::optional<std::string> FindString(const nlohmann::json& raw, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto it = raw.find(key);
        if (it != raw.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::vector<std::string> ParseModelList(const std::string& output) {
    std::vector<std::string> ids;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = line.find_last_not_of(" \t\r");
        auto id = line.substr(begin, end - begin + 1);
        if (id.find(' ') != std::string::npos) {
            continue;
        }
        ids.push_back(id);
    }
    return ids;
}

}  // namespace

OpenCodeProvider::OpenCodeProvider() {
    conventions_.config_dir = ".opencode";
    conventions_.local_instructions_file = "instructions.md";
    conventions_.legacy_instructions_file = "instructions.md";
    conventions_.mcp_config_file = "opencode.json";
    conventions_.skills_dir = "skills";
    conventions_.agent_templates_dir = "agents";
    conventions_.local_settings_file = "opencode.json";
}

std::string OpenCodeProvider::FindBinary() const {
    return FindBinaryInPath({"opencode"}, {
        HomePath(".local/bin/opencode"),
        HomePath("go/bin/opencode"),
        "/usr/local/bin/opencode",
        "/opt/homebrew/bin/opencode"
    });
}

ProviderCapabilities OpenCodeProvider::GetCapabilities() const {
    ProviderCapabilities capabilities{};
    capabilities.headless = true;
    capabilities.structured_output = false;
    capabilities.hooks = false;
    capabilities.session_resume = true;
    capabilities.permissions = false;
    return capabilities;
}

Availability OpenCodeProvider::CheckAvailability() const {
    try {
        FindBinary();
        return {true, ""};
    } catch (const std::exception& ex) {
        return {false, ex.what()};
    }
}

// OpenCode has no permission prompts, so free agent mode adds nothing.
SpawnCommand OpenCodeProvider::BuildSpawnCommand(const SpawnOptions& options) const {
    SpawnCommand command{};
    command.binary = FindBinary();
    if (HasExplicitModel(options.model)) {
        command.args.push_back("--model");
        command.args.push_back(options.model);
    }
    const auto prompt = JoinPrompt(options.system_prompt, options.mission);
    if (!prompt.empty()) {
        command.args.push_back("--prompt");
        command.args.push_back(prompt);
    }
    return command;
}

std::optional<HeadlessCommandResult> OpenCodeProvider::BuildHeadlessCommand(
    const HeadlessOptions& options) const {
    if (options.mission.empty()) {
        return std::nullopt;
    }
    HeadlessCommandResult result{};
    result.binary = FindBinary();
    result.args = {"run", JoinPrompt(options.system_prompt, options.mission), "--format", "json"};
    if (HasExplicitModel(options.model)) {
        result.args.push_back("--model");
        result.args.push_back(options.model);
    }
    result.output_kind = HeadlessOutputKind::kText;
    return result;
}

void OpenCodeProvider::WriteHooksConfig(const std::filesystem::path& workspace,
                                        const std::string& agent_id,
                                        const HooksConfigOptions& options) const {
    (void)options;
    utils::LogDebug("hooks-config", "provider has no hooks",
                    {{"provider", Id()}, {"agent", agent_id}, {"workspace", workspace.string()}});
}

std::optional<NormalizedHookEvent> OpenCodeProvider::ParseHookEvent(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    const auto kind_name = FindString(raw, {"kind"});
    if (!kind_name) {
        return std::nullopt;
    }
    const auto kind = ParseHookEventKind(*kind_name);
    if (!kind) {
        return std::nullopt;
    }

    NormalizedHookEvent event{};
    event.kind = *kind;
    event.tool_name = FindString(raw, {"toolName", "tool_name"});
    for (const char* key : {"toolInput", "tool_input"}) {
        if (raw.contains(key) && raw[key].is_object()) {
            event.tool_input = raw[key];
            break;
        }
    }
    event.message = FindString(raw, {"message"});
    return event;
}

std::string OpenCodeProvider::ReadInstructions(const std::filesystem::path& worktree) const {
    return ReadTextFile(worktree / conventions_.config_dir / conventions_.local_instructions_file);
}

void OpenCodeProvider::WriteInstructions(const std::filesystem::path& worktree,
                                         const std::string& content) const {
    WriteTextFile(worktree / conventions_.config_dir / conventions_.local_instructions_file, content);
}

std::vector<ModelOption> OpenCodeProvider::GetModelOptions() const {
    try {
        const auto output = ProbeCommandOutput(FindBinary(), {"models"});
        if (output) {
            const auto ids = ParseModelList(*output);
            if (!ids.empty()) {
                // Listed as provider/model; labels keep the id.
                return WithDefaultModel(ids, false);
            }
        }
    } catch (const std::exception& ex) {
        utils::LogDebug("provider", "model probe unavailable", {{"provider", Id()}, {"error", ex.what()}});
    }
    return {{"default", "Default"}};
}

std::vector<std::string> OpenCodeProvider::GetDefaultPermissions(AgentKind kind) const {
    auto permissions = kDurablePermissions;
    if (kind == AgentKind::kQuick) {
        permissions.insert(permissions.end(), kQuickExtras.begin(), kQuickExtras.end());
    }
    return permissions;
}

std::optional<std::string> OpenCodeProvider::ToolVerb(const std::string& tool_name) const {
    const auto it = ToolVerbs().find(tool_name);
    if (it == ToolVerbs().end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace clubhouse::providers
