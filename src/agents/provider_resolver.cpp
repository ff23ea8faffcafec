#include "agents/provider_resolver.hpp"

#include <stdexcept>
#include <utility>

#include "providers/hook_config.hpp"
#include "utils/logging.hpp"

namespace clubhouse::agents {

namespace {

constexpr const char* kFallbackProvider = "claude-code";

}  // namespace

std::filesystem::path WorkspaceSettingsPath(const std::filesystem::path& workspace) {
    return workspace / ".clubhouse" / "settings.json";
}

ProviderResolver::ProviderResolver(const providers::ProviderRegistry& registry,
                                   config::OrchestratorsConfig config)
    : registry_(registry)
    , config_(std::move(config)) {}

const providers::OrchestratorProvider& ProviderResolver::Resolve(
    const std::filesystem::path& workspace,
    const std::optional<std::string>& explicit_id) const {
    if (explicit_id && !explicit_id->empty()) {
        const auto* provider = registry_.Find(*explicit_id);
        if (!provider) {
            throw std::invalid_argument("Unknown orchestrator: " + *explicit_id);
        }
        return *provider;
    }

    if (const auto preferred = ReadWorkspacePreference(workspace)) {
        if (const auto* provider = registry_.Find(*preferred)) {
            return *provider;
        }
        utils::LogWarn("supervisor", "ignoring unknown workspace orchestrator",
                       {{"workspace", workspace.string()}, {"orchestrator", *preferred}});
    }

    for (const auto& id : ProbeOrder()) {
        const auto* provider = registry_.Find(id);
        if (provider && provider->CheckAvailability().available) {
            return *provider;
        }
    }

    for (const auto& id : {config_.default_id, std::string(kFallbackProvider)}) {
        if (const auto* provider = registry_.Find(id)) {
            return *provider;
        }
    }
    throw std::runtime_error("No orchestrator providers registered");
}

std::vector<std::string> ProviderResolver::ProbeOrder() const {
    return config_.order.empty() ? registry_.Ids() : config_.order;
}

std::optional<std::string> ProviderResolver::ReadWorkspacePreference(
    const std::filesystem::path& workspace) const {
    const auto settings = providers::ReadJsonObject(WorkspaceSettingsPath(workspace));
    if (settings.contains("orchestrator") && settings["orchestrator"].is_string()) {
        const auto id = settings["orchestrator"].get<std::string>();
        if (!id.empty()) {
            return id;
        }
    }
    return std::nullopt;
}

void ProviderResolver::SaveWorkspacePreference(const std::filesystem::path& workspace,
                                               const std::string& provider_id) const {
    const auto path = WorkspaceSettingsPath(workspace);
    auto settings = providers::ReadJsonObject(path);
    settings["orchestrator"] = provider_id;
    providers::WriteJsonFile(path, settings);
}

}  // namespace clubhouse::agents
