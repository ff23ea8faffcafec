#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clubhouse::agents {

enum class LaunchMode {
    kInteractive,
    kHeadless
};

struct AgentRegistration {
    std::string agent_id;
    std::string workspace_path;
    std::string provider_id;
    std::string nonce;
    LaunchMode mode = LaunchMode::kInteractive;
    std::optional<int> pid;
};

// agentId -> registration. Shared by the hook server (reads) and the
// supervisor (insert, remove). Reads hand out copies.
class AgentRegistry {
public:
    // Returns false when the id is already registered.
    bool Insert(const AgentRegistration& registration);
    bool Remove(const std::string& agent_id);
    bool SetPid(const std::string& agent_id, int pid);

    std::optional<AgentRegistration> Find(const std::string& agent_id) const;
    std::vector<AgentRegistration> List() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AgentRegistration> registrations_;
};

}  // namespace clubhouse::agents
