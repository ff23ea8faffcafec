#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/provider_types.hpp"

namespace clubhouse::providers {

// Adapter for one external CLI coding agent. Implementations are stateless
// and shared between every agent that uses the tool.
class OrchestratorProvider {
public:
    virtual ~OrchestratorProvider() = default;

    virtual std::string Id() const = 0;
    virtual std::string DisplayName() const = 0;
    virtual std::string ShortName() const = 0;
    virtual std::optional<std::string> Badge() const { return std::nullopt; }

    virtual const Conventions& GetConventions() const = 0;
    virtual ProviderCapabilities GetCapabilities() const = 0;

    virtual Availability CheckAvailability() const = 0;

    // Throws std::runtime_error when the tool binary cannot be located.
    virtual SpawnCommand BuildSpawnCommand(const SpawnOptions& options) const = 0;
    // Returns std::nullopt when options.mission is empty.
    virtual std::optional<HeadlessCommandResult> BuildHeadlessCommand(
        const HeadlessOptions& options) const = 0;
    virtual std::string GetExitCommand() const { return "/exit\r"; }

    // Merges this system's callbacks into the tool's settings file.
    // Throws std::runtime_error when the file cannot be written.
    virtual void WriteHooksConfig(const std::filesystem::path& workspace,
                                  const std::string& agent_id,
                                  const HooksConfigOptions& options) const = 0;
    virtual std::optional<NormalizedHookEvent> ParseHookEvent(const nlohmann::json& raw) const = 0;

    virtual std::string ReadInstructions(const std::filesystem::path& worktree) const = 0;
    virtual void WriteInstructions(const std::filesystem::path& worktree,
                                   const std::string& content) const = 0;

    virtual std::vector<ModelOption> GetModelOptions() const = 0;
    virtual std::vector<std::string> GetDefaultPermissions(AgentKind kind) const = 0;
    virtual std::optional<std::string> ToolVerb(const std::string& tool_name) const = 0;

    virtual std::string BuildSummaryInstruction(const std::string& agent_id) const;
    virtual std::optional<QuickSummary> ReadQuickSummary(const std::string& agent_id) const;
};

// "Using {tool}" when the provider has no verb of its own.
std::string ResolveToolVerb(const OrchestratorProvider& provider, const std::string& tool_name);

}  // namespace clubhouse::providers
