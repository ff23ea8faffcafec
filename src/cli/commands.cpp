#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "agents/agent_registry.hpp"
#include "agents/nonce.hpp"
#include "agents/process_supervisor.hpp"
#include "agents/provider_resolver.hpp"
#include "bus/event_bus.hpp"
#include "config/config_loader.hpp"
#include "hooks/hook_server.hpp"
#include "nlohmann/json.hpp"
#include "providers/hook_config.hpp"
#include "providers/provider_registry.hpp"
#include "utils/logging.hpp"

namespace {

constexpr const char* kTag = "cli";

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  clubhouse serve [--agent <id> --workspace <path> [--provider <id>]]\n"
              << "  clubhouse providers\n"
              << "  clubhouse models <provider>\n"
              << "  clubhouse write-hooks <provider> <workspace> <agentId> <port> [--nonce <nonce>]\n"
              << "  clubhouse spawn <workspace> [--provider <id>] [--mission <text>] [--model <m>]\n"
              << "                  [--system-prompt <text>] [--headless] [--free] [--quick]"
              << std::endl;
}

// Prints every hook event it receives as one JSON line.
class ConsoleSurface : public clubhouse::hooks::EventSurface {
public:
    bool IsAlive() const override { return true; }

    void OnHookEvent(const std::string& agent_id,
                     const clubhouse::providers::NormalizedHookEvent& event) override {
        nlohmann::json line = clubhouse::providers::ToJson(event);
        line["agentId"] = agent_id;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line.dump() << std::endl;
    }

private:
    std::mutex mutex_;
};

struct Runtime {
    explicit Runtime(const clubhouse::config::Config& config)
        : resolver(providers, config.orchestrators)
        , hook_server(config.hook_server, registry, resolver, &bus) {}

    clubhouse::providers::ProviderRegistry providers;
    clubhouse::agents::AgentRegistry registry;
    clubhouse::agents::ProviderResolver resolver;
    clubhouse::bus::EventBus bus;
    clubhouse::hooks::HookServer hook_server;
};

clubhouse::config::Config LoadRuntimeConfig() {
    auto config = clubhouse::config::LoadConfig();
    clubhouse::utils::LogConfig log_config{};
    log_config.min_level = clubhouse::utils::ParseLogLevel(config.logging.level);
    clubhouse::utils::SetLogConfig(log_config);
    return config;
}

std::optional<std::string> TakeOption(std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name && i + 1 < args.size()) {
            auto value = args[i + 1];
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                       args.begin() + static_cast<std::ptrdiff_t>(i + 2));
            return value;
        }
    }
    return std::nullopt;
}

bool TakeFlag(std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

void WaitForSignal(const std::function<bool()>& keep_running) {
    while (g_running.load()) {
        if (g_signal != 0 || !keep_running()) {
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int RunServe(std::vector<std::string> args) {
    const auto config = LoadRuntimeConfig();
    Runtime runtime(config);

    const auto agent_id = TakeOption(args, "--agent");
    const auto workspace = TakeOption(args, "--workspace");
    const auto provider_id = TakeOption(args, "--provider");

    if (agent_id && !clubhouse::providers::IsValidAgentId(*agent_id)) {
        std::cerr << "Invalid agent id: " << *agent_id << std::endl;
        return 1;
    }

    auto surface = std::make_shared<ConsoleSurface>();
    runtime.hook_server.AddSurface(surface);
    // Nothing subscribes in serve; the dispatcher keeps the queue drained.
    clubhouse::bus::EventDispatcher dispatcher(runtime.bus);
    const auto port = runtime.hook_server.Start().get();
    std::cout << "clubhouse hook server listening on " << runtime.hook_server.HookBaseUrl() << std::endl;

    if (agent_id && workspace) {
        const auto& provider = runtime.resolver.Resolve(*workspace, provider_id);
        clubhouse::agents::AgentRegistration registration{};
        registration.agent_id = *agent_id;
        registration.workspace_path = *workspace;
        registration.provider_id = provider.Id();
        registration.nonce = clubhouse::agents::GenerateNonce();
        runtime.registry.Insert(registration);

        clubhouse::providers::HooksConfigOptions options{};
        options.hook_url = runtime.hook_server.HookBaseUrl();
        options.nonce = registration.nonce;
        provider.WriteHooksConfig(*workspace, *agent_id, options);
        std::cout << "registered " << *agent_id << " (" << provider.Id() << ") nonce="
                  << registration.nonce << std::endl;
    }

    InstallSignalHandlers();
    clubhouse::utils::LogInfo(kTag, "serving", {{"port", std::to_string(port)}});
    WaitForSignal([] { return true; });
    runtime.hook_server.Stop();
    return 0;
}

int RunProviders() {
    const auto config = LoadRuntimeConfig();
    clubhouse::providers::ProviderRegistry providers;
    for (const auto* provider : providers.All()) {
        const auto capabilities = provider->GetCapabilities();
        const auto availability = provider->CheckAvailability();
        nlohmann::json line = {
            {"id", provider->Id()},
            {"displayName", provider->DisplayName()},
            {"shortName", provider->ShortName()},
            {"badge", provider->Badge() ? nlohmann::json(*provider->Badge()) : nlohmann::json(nullptr)},
            {"capabilities", {
                {"headless", capabilities.headless},
                {"structuredOutput", capabilities.structured_output},
                {"hooks", capabilities.hooks},
                {"sessionResume", capabilities.session_resume},
                {"permissions", capabilities.permissions}
            }},
            {"available", availability.available}
        };
        if (!availability.available) {
            line["error"] = availability.error;
        }
        std::cout << line.dump() << std::endl;
    }
    return 0;
}

int RunModels(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    LoadRuntimeConfig();
    clubhouse::providers::ProviderRegistry providers;
    const auto* provider = providers.Find(args[0]);
    if (!provider) {
        std::cerr << "Unknown orchestrator: " << args[0] << std::endl;
        return 1;
    }
    for (const auto& option : provider->GetModelOptions()) {
        std::cout << option.id << "\t" << option.label << std::endl;
    }
    return 0;
}

int RunWriteHooks(std::vector<std::string> args) {
    const auto nonce = TakeOption(args, "--nonce");
    if (args.size() < 4) {
        PrintUsage();
        return 1;
    }
    LoadRuntimeConfig();
    clubhouse::providers::ProviderRegistry providers;
    const auto* provider = providers.Find(args[0]);
    if (!provider) {
        std::cerr << "Unknown orchestrator: " << args[0] << std::endl;
        return 1;
    }
    int port = 0;
    try {
        port = std::stoi(args[3]);
    } catch (const std::exception&) {
        std::cerr << "Invalid hook server port: " << args[3] << std::endl;
        return 1;
    }

    clubhouse::providers::HooksConfigOptions options{};
    options.hook_url = clubhouse::providers::BuildHookBaseUrl(port);
    options.nonce = nonce.value_or("");
    provider->WriteHooksConfig(args[1], args[2], options);
    if (!provider->GetCapabilities().hooks) {
        std::cout << provider->Id() << " has no hook support; nothing written" << std::endl;
        return 0;
    }
    const auto path = std::filesystem::path(args[1]) / provider->GetConventions().config_dir
        / provider->GetConventions().local_settings_file;
    std::cout << "wrote " << path.string() << std::endl;
    return 0;
}

int RunSpawn(std::vector<std::string> args) {
    clubhouse::agents::SpawnParams params{};
    params.provider_id = TakeOption(args, "--provider");
    params.mission = TakeOption(args, "--mission").value_or("");
    params.model = TakeOption(args, "--model").value_or("");
    params.system_prompt = TakeOption(args, "--system-prompt").value_or("");
    params.mode = TakeFlag(args, "--headless")
        ? clubhouse::agents::LaunchMode::kHeadless
        : clubhouse::agents::LaunchMode::kInteractive;
    params.free_agent_mode = TakeFlag(args, "--free");
    params.kind = TakeFlag(args, "--quick")
        ? clubhouse::providers::AgentKind::kQuick
        : clubhouse::providers::AgentKind::kDurable;
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    params.workspace_path = std::filesystem::absolute(args[0]).string();

    const auto config = LoadRuntimeConfig();
    Runtime runtime(config);
    const bool headless = params.mode == clubhouse::agents::LaunchMode::kHeadless;
    // Interactive tools own the terminal; only headless runs echo events.
    auto surface = std::make_shared<ConsoleSurface>();
    if (headless) {
        runtime.hook_server.AddSurface(surface);
    }
    runtime.hook_server.Start().get();

    clubhouse::agents::ProcessSupervisor supervisor(
        config.agents, runtime.registry, runtime.resolver, runtime.hook_server, runtime.bus,
        std::make_unique<clubhouse::process::BoostProcessLauncher>());

    std::atomic<bool> exited{false};
    runtime.bus.Subscribe("", [&exited](const clubhouse::bus::AgentEvent& event) {
        if (event.type != clubhouse::bus::AgentEventType::kExit) {
            return;
        }
        nlohmann::json line = {{"agentId", event.agent_id}, {"exitCode", event.exit_code}};
        if (event.summary) {
            line["summary"] = event.summary->summary ? nlohmann::json(*event.summary->summary)
                                                     : nlohmann::json(nullptr);
            line["filesModified"] = event.summary->files_modified;
        }
        std::cerr << line.dump() << std::endl;
        exited = true;
    });
    clubhouse::bus::EventDispatcher dispatcher(runtime.bus);

    int status = 0;
    try {
        const auto result = supervisor.Spawn(params);
        clubhouse::utils::LogInfo(kTag, "agent running",
                                  {{"agent", result.agent_id}, {"provider", result.provider_id},
                                   {"output", result.output_path}});
        InstallSignalHandlers();
        WaitForSignal([&exited] { return !exited.load(); });
        if (!exited.load()) {
            supervisor.Kill(result.agent_id);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to spawn agent: " << ex.what() << std::endl;
        status = 1;
    }

    runtime.hook_server.Stop();
    return status;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "serve") {
            return RunServe(args);
        }
        if (command == "providers") {
            return RunProviders();
        }
        if (command == "models") {
            return RunModels(args);
        }
        if (command == "write-hooks") {
            return RunWriteHooks(args);
        }
        if (command == "spawn") {
            return RunSpawn(args);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[" << kTag << "] " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
