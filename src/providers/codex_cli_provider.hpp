#pragma once

#include <string>
#include <vector>

#include "providers/orchestrator_provider.hpp"

namespace clubhouse::providers {

class CodexCliProvider : public OrchestratorProvider {
public:
    CodexCliProvider();

    std::string Id() const override { return "codex-cli"; }
    std::string DisplayName() const override { return "Codex CLI"; }
    std::string ShortName() const override { return "CX"; }
    std::optional<std::string> Badge() const override { return "Beta"; }

    const Conventions& GetConventions() const override { return conventions_; }
    ProviderCapabilities GetCapabilities() const override;
    Availability CheckAvailability() const override;

    SpawnCommand BuildSpawnCommand(const SpawnOptions& options) const override;
    std::optional<HeadlessCommandResult> BuildHeadlessCommand(
        const HeadlessOptions& options) const override;

    void WriteHooksConfig(const std::filesystem::path& workspace,
                          const std::string& agent_id,
                          const HooksConfigOptions& options) const override;
    std::optional<NormalizedHookEvent> ParseHookEvent(const nlohmann::json& raw) const override;

    std::string ReadInstructions(const std::filesystem::path& worktree) const override;
    void WriteInstructions(const std::filesystem::path& worktree,
                           const std::string& content) const override;

    std::vector<ModelOption> GetModelOptions() const override;
    std::vector<std::string> GetDefaultPermissions(AgentKind kind) const override;
    std::optional<std::string> ToolVerb(const std::string& tool_name) const override;

private:
    std::string FindBinary() const;

    Conventions conventions_;
};

}  // namespace clubhouse::providers
