#include "agents/process_supervisor.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <signal.h>
#include <stdexcept>

#include "agents/nonce.hpp"
#include "config/config_loader.hpp"
#include "providers/hook_config.hpp"
#include "providers/provider_support.hpp"
#include "utils/logging.hpp"

namespace clubhouse::agents {

namespace {

constexpr const char* kTag = "supervisor";
constexpr std::chrono::milliseconds kReapInterval{50};
constexpr std::chrono::seconds kKillWait{5};

template <typename Options>
void FillCommonOptions(Options& options,
                       const SpawnParams& params,
                       const std::string& agent_id,
                       const std::string& cwd,
                       std::vector<std::string> allowed_tools,
                       std::string system_prompt) {
    options.cwd = cwd;
    options.model = params.model;
    options.allowed_tools = std::move(allowed_tools);
    options.disallowed_tools = params.disallowed_tools;
    options.system_prompt = std::move(system_prompt);
    options.mission = params.mission;
    options.free_agent_mode = params.free_agent_mode;
    options.agent_id = agent_id;
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(config::AgentsConfig config,
                                     AgentRegistry& registry,
                                     const ProviderResolver& resolver,
                                     hooks::HookServer& hook_server,
                                     bus::EventBus& bus,
                                     std::unique_ptr<process::ProcessLauncher> launcher)
    : config_(std::move(config))
    , registry_(registry)
    , resolver_(resolver)
    , hook_server_(hook_server)
    , bus_(bus)
    , launcher_(std::move(launcher)) {
    if (!launcher_) {
        launcher_ = std::make_unique<process::BoostProcessLauncher>();
    }
    reaper_ = std::thread([this] { ReapLoop(); });
}

ProcessSupervisor::~ProcessSupervisor() {
    running_ = false;
    if (reaper_.joinable()) {
        reaper_.join();
    }
}

SpawnResult ProcessSupervisor::Spawn(const SpawnParams& params) {
    if (params.workspace_path.empty()) {
        throw std::invalid_argument("Spawn requires a workspace path");
    }
    if (!params.agent_id.empty() && !providers::IsValidAgentId(params.agent_id)) {
        throw std::invalid_argument("Invalid agent id: " + params.agent_id);
    }
    const auto& provider = resolver_.Resolve(params.workspace_path, params.provider_id);

    AgentRegistration registration{};
    registration.agent_id = params.agent_id.empty()
        ? "agent-" + GenerateNonce().substr(0, 8)
        : params.agent_id;
    registration.workspace_path = params.workspace_path;
    registration.provider_id = provider.Id();
    registration.nonce = GenerateNonce();
    registration.mode = params.mode;
    const auto agent_id = registration.agent_id;
    if (!registry_.Insert(registration)) {
        throw std::runtime_error("Agent already registered: " + agent_id);
    }

    try {
        const std::string cwd = params.cwd.empty() ? params.workspace_path : params.cwd;

        // Hook files reference ${CLUBHOUSE_HOOK_NONCE} so the secret stays off disk.
        providers::HooksConfigOptions hook_options{};
        hook_options.hook_url = hook_server_.HookBaseUrl();
        provider.WriteHooksConfig(cwd, agent_id, hook_options);

        auto allowed_tools = params.allowed_tools;
        if (allowed_tools.empty() && params.kind == providers::AgentKind::kQuick) {
            allowed_tools = provider.GetDefaultPermissions(providers::AgentKind::kQuick);
        }
        auto system_prompt = params.system_prompt;
        if (params.kind == providers::AgentKind::kQuick) {
            system_prompt = providers::JoinPrompt(system_prompt, provider.BuildSummaryInstruction(agent_id));
        }

        process::LaunchSpec spec{};
        spec.working_dir = cwd;
        if (params.mode == LaunchMode::kHeadless) {
            providers::HeadlessOptions options{};
            FillCommonOptions(options, params, agent_id, cwd, std::move(allowed_tools), std::move(system_prompt));
            options.output_format = params.output_format;
            options.no_session_persistence = params.no_session_persistence;
            auto command = provider.BuildHeadlessCommand(options);
            if (!command) {
                throw std::runtime_error("Headless launch requires a mission");
            }
            spec.binary = command->binary;
            spec.args = command->args;
            spec.env = command->env;
            spec.output_path = BuildOutputPath(agent_id, command->output_kind);
        } else {
            providers::SpawnOptions options{};
            FillCommonOptions(options, params, agent_id, cwd, std::move(allowed_tools), std::move(system_prompt));
            auto command = provider.BuildSpawnCommand(options);
            spec.binary = command.binary;
            spec.args = command.args;
            spec.env = command.env;
        }
        spec.env["CLUBHOUSE_AGENT_ID"] = agent_id;
        spec.env["CLUBHOUSE_HOOK_NONCE"] = registration.nonce;

        const int pid = launcher_->Launch(spec);
        registry_.SetPid(agent_id, pid);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tracked_[agent_id] = TrackedProcess{pid, provider.Id(), params.kind};
        }
        utils::LogInfo(kTag, "spawned agent",
                       {{"agent", agent_id}, {"provider", provider.Id()}, {"pid", std::to_string(pid)},
                        {"mode", params.mode == LaunchMode::kHeadless ? "headless" : "interactive"}});

        SpawnResult result{};
        result.agent_id = agent_id;
        result.provider_id = provider.Id();
        result.pid = pid;
        result.output_path = spec.output_path;
        return result;
    } catch (const std::exception& ex) {
        registry_.Remove(agent_id);
        utils::LogError(kTag, "spawn failed", {{"agent", agent_id}, {"error", ex.what()}});
        throw;
    }
}

bool ProcessSupervisor::Kill(const std::string& agent_id) {
    const bool registered = registry_.Remove(agent_id);
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = tracked_.find(agent_id);
    if (it == tracked_.end()) {
        return registered;
    }
    const int pid = it->second.pid;

    const auto exited = [this, &agent_id, pid] {
        auto current = tracked_.find(agent_id);
        return current == tracked_.end() || current->second.pid != pid;
    };
    // Signals are only sent with mutex_ held and the pid still tracked. The
    // reaper polls and erases under the same lock, so a reaped pid is never
    // signalled.
    launcher_->Signal(pid, SIGTERM);
    const auto grace = std::chrono::milliseconds(std::max(0, config_.kill_grace_ms));
    if (!exited_cv_.wait_for(lock, grace, exited)) {
        utils::LogWarn(kTag, "agent ignored SIGTERM, killing",
                       {{"agent", agent_id}, {"pid", std::to_string(pid)}});
        launcher_->Signal(pid, SIGKILL);
        exited_cv_.wait_for(lock, kKillWait, exited);
    }
    return true;
}

void ProcessSupervisor::KillAll() {
    for (const auto& agent_id : TrackedAgents()) {
        Kill(agent_id);
    }
}

bool ProcessSupervisor::IsTracked(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.count(agent_id) > 0;
}

std::vector<std::string> ProcessSupervisor::TrackedAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [agent_id, _] : tracked_) {
        ids.push_back(agent_id);
    }
    return ids;
}

std::string ProcessSupervisor::BuildOutputPath(const std::string& agent_id,
                                               providers::HeadlessOutputKind kind) const {
    const auto dir = config::ExpandPath(config_.logs_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create logs directory " + dir.string() + ": " + ec.message());
    }
    const char* extension = kind == providers::HeadlessOutputKind::kStreamJson ? ".jsonl" : ".log";
    return (dir / (agent_id + extension)).string();
}

void ProcessSupervisor::ReapLoop() {
    while (running_) {
        std::vector<std::pair<std::string, TrackedProcess>> exited;
        std::vector<int> codes;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = tracked_.begin(); it != tracked_.end();) {
                const auto exit_code = launcher_->PollExit(it->second.pid);
                if (!exit_code) {
                    ++it;
                    continue;
                }
                exited.emplace_back(it->first, it->second);
                codes.push_back(*exit_code);
                it = tracked_.erase(it);
            }
        }
        for (std::size_t i = 0; i < exited.size(); ++i) {
            OnExit(exited[i].first, exited[i].second, codes[i]);
        }
        if (!exited.empty()) {
            exited_cv_.notify_all();
        }
        std::this_thread::sleep_for(kReapInterval);
    }
}

void ProcessSupervisor::OnExit(const std::string& agent_id, const TrackedProcess& process, int exit_code) {
    registry_.Remove(agent_id);
    auto event = bus::MakeExitEvent(agent_id, exit_code);
    if (process.kind == providers::AgentKind::kQuick) {
        if (const auto* provider = resolver_.Registry().Find(process.provider_id)) {
            event.summary = provider->ReadQuickSummary(agent_id);
        }
    }
    utils::LogInfo(kTag, "agent exited", {{"agent", agent_id}, {"code", std::to_string(exit_code)}});
    bus_.Publish(event);
}

}  // namespace clubhouse::agents
