#pragma once

#include <memory>
#include <string>
#include <vector>

#include "providers/orchestrator_provider.hpp"

namespace clubhouse::providers {

class ProviderRegistry {
public:
    // Registers the four built-in providers in display order.
    ProviderRegistry();

    // Replaces any provider already registered under the same id.
    void Register(std::unique_ptr<OrchestratorProvider> provider);
    const OrchestratorProvider* Find(const std::string& id) const;
    std::vector<const OrchestratorProvider*> All() const;
    std::vector<std::string> Ids() const;

private:
    std::vector<std::unique_ptr<OrchestratorProvider>> providers_;
};

}  // namespace clubhouse::providers
