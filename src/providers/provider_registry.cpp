#include "providers/provider_registry.hpp"

#include "providers/claude_code_provider.hpp"
#include "providers/codex_cli_provider.hpp"
#include "providers/copilot_cli_provider.hpp"
#include "providers/opencode_provider.hpp"

namespace clubhouse::providers {

ProviderRegistry::ProviderRegistry() {
    Register(std::make_unique<ClaudeCodeProvider>());
    Register(std::make_unique<CopilotCliProvider>());
    Register(std::make_unique<CodexCliProvider>());
    Register(std::make_unique<OpenCodeProvider>());
}

void ProviderRegistry::Register(std::unique_ptr<OrchestratorProvider> provider) {
    if (!provider) {
        return;
    }
    const auto id = provider->Id();
    for (auto& existing : providers_) {
        if (existing->Id() == id) {
            existing = std::move(provider);
            return;
        }
    }
    providers_.push_back(std::move(provider));
}

const OrchestratorProvider* ProviderRegistry::Find(const std::string& id) const {
    for (const auto& provider : providers_) {
        if (provider->Id() == id) {
            return provider.get();
        }
    }
    return nullptr;
}

std::vector<const OrchestratorProvider*> ProviderRegistry::All() const {
    std::vector<const OrchestratorProvider*> all;
    all.reserve(providers_.size());
    for (const auto& provider : providers_) {
        all.push_back(provider.get());
    }
    return all;
}

std::vector<std::string> ProviderRegistry::Ids() const {
    std::vector<std::string> ids;
    for (const auto& provider : providers_) {
        ids.push_back(provider->Id());
    }
    return ids;
}

}  // namespace clubhouse::providers
