#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "providers/provider_registry.hpp"

namespace clubhouse::agents {

// Picks the provider for a workspace: explicit id, then the workspace's
// stored preference, then the first available provider in the configured
// order, then the configured default.
class ProviderResolver {
public:
    ProviderResolver(const providers::ProviderRegistry& registry,
                     config::OrchestratorsConfig config);

    // Throws std::invalid_argument for an unknown explicit id.
    const providers::OrchestratorProvider& Resolve(
        const std::filesystem::path& workspace,
        const std::optional<std::string>& explicit_id = std::nullopt) const;

    // <workspace>/.clubhouse/settings.json, key "orchestrator".
    std::optional<std::string> ReadWorkspacePreference(const std::filesystem::path& workspace) const;
    // Keeps every other settings key. Throws std::runtime_error on write failure.
    void SaveWorkspacePreference(const std::filesystem::path& workspace, const std::string& provider_id) const;

    const providers::ProviderRegistry& Registry() const { return registry_; }

private:
    std::vector<std::string> ProbeOrder() const;

    const providers::ProviderRegistry& registry_;
    config::OrchestratorsConfig config_;
};

std::filesystem::path WorkspaceSettingsPath(const std::filesystem::path& workspace);

}  // namespace clubhouse::agents
