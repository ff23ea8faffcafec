#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "agents/agent_registry.hpp"
#include "agents/provider_resolver.hpp"
#include "bus/event_bus.hpp"
#include "config/config_schema.hpp"
#include "hooks/hook_server.hpp"
#include "process/process_launcher.hpp"
#include "providers/provider_types.hpp"

namespace clubhouse::agents {

struct SpawnParams {
    // Generated when empty.
    std::string agent_id;
    // Project root used for provider resolution.
    std::string workspace_path;
    // Where the tool runs and where hook config is written; defaults to
    // workspace_path.
    std::string cwd;
    std::optional<std::string> provider_id;
    providers::AgentKind kind = providers::AgentKind::kDurable;
    LaunchMode mode = LaunchMode::kInteractive;
    std::string model;
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    std::string system_prompt;
    std::string mission;
    bool free_agent_mode = false;
    // Headless only.
    std::string output_format;
    bool no_session_persistence = false;
};

struct SpawnResult {
    std::string agent_id;
    std::string provider_id;
    int pid = 0;
    // Headless output file, empty for interactive agents.
    std::string output_path;
};

// Spawns and kills agent processes and owns their registrations. Exits are
// reaped on a background thread and published on the bus.
class ProcessSupervisor {
public:
    ProcessSupervisor(config::AgentsConfig config,
                      AgentRegistry& registry,
                      const ProviderResolver& resolver,
                      hooks::HookServer& hook_server,
                      bus::EventBus& bus,
                      std::unique_ptr<process::ProcessLauncher> launcher);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Throws std::runtime_error, or std::invalid_argument for an unknown
    // provider id or an agent id rejected by providers::IsValidAgentId.
    // Nothing stays registered when it throws.
    SpawnResult Spawn(const SpawnParams& params);
    // SIGTERM, then SIGKILL after kill_grace_ms. Returns false for an
    // unknown agent.
    bool Kill(const std::string& agent_id);
    void KillAll();

    bool IsTracked(const std::string& agent_id) const;
    std::vector<std::string> TrackedAgents() const;

private:
    struct TrackedProcess {
        int pid = 0;
        std::string provider_id;
        providers::AgentKind kind = providers::AgentKind::kDurable;
    };

    std::string BuildOutputPath(const std::string& agent_id, providers::HeadlessOutputKind kind) const;
    void ReapLoop();
    void OnExit(const std::string& agent_id, const TrackedProcess& process, int exit_code);

    config::AgentsConfig config_;
    AgentRegistry& registry_;
    const ProviderResolver& resolver_;
    hooks::HookServer& hook_server_;
    bus::EventBus& bus_;
    std::unique_ptr<process::ProcessLauncher> launcher_;

    mutable std::mutex mutex_;
    std::condition_variable exited_cv_;
    std::unordered_map<std::string, TrackedProcess> tracked_;
    std::atomic<bool> running_{true};
    std::thread reaper_;
};

}  // namespace clubhouse::agents
