#include "agents/agent_registry.hpp"

namespace clubhouse::agents {

bool AgentRegistry::Insert(const AgentRegistration& registration) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.emplace(registration.agent_id, registration).second;
}

bool AgentRegistry::Remove(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.erase(agent_id) > 0;
}

bool AgentRegistry::SetPid(const std::string& agent_id, int pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(agent_id);
    if (it == registrations_.end()) {
        return false;
    }
    it->second.pid = pid;
    return true;
}

std::optional<AgentRegistration> AgentRegistry::Find(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(agent_id);
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentRegistration> AgentRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentRegistration> all;
    all.reserve(registrations_.size());
    for (const auto& [_, registration] : registrations_) {
        all.push_back(registration);
    }
    return all;
}

std::size_t AgentRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

}  // namespace clubhouse::agents
