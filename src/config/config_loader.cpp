#include "config/config_loader.hpp"

#include <fstream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace clubhouse::config {
namespace {

constexpr const char* kLogTag = "config";

bool IsLoopbackHost(const std::string& host) {
    return host == "127.0.0.1" || host == "localhost";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void SetHost(Config& config, const std::string& host) {
    if (!IsLoopbackHost(host)) {
        clubhouse::utils::LogWarn(kLogTag, "ignoring non-loopback hook server host",
                                  {{"host", host}});
        return;
    }
    config.hook_server.host = host == "localhost" ? "127.0.0.1" : host;
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return clubhouse::utils::GetHomePath() / ".clubhouse" / "config.json";
}

std::filesystem::path ExpandPath(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        return clubhouse::utils::GetHomePath() / path.substr(2);
    }
    if (path == "~") {
        return clubhouse::utils::GetHomePath();
    }
    return std::filesystem::path(path);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("hookServer") && data["hookServer"].is_object()) {
        const auto& server = data["hookServer"];
        if (server.contains("host") && server["host"].is_string()) {
            SetHost(config, server["host"].get<std::string>());
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.hook_server.port = server["port"].get<int>();
        }
        if (server.contains("threads") && server["threads"].is_number_integer()) {
            config.hook_server.threads = server["threads"].get<int>();
        }
        if (server.contains("processingThreads") && server["processingThreads"].is_number_integer()) {
            config.hook_server.processing_threads = server["processingThreads"].get<int>();
        }
    }

    if (data.contains("orchestrators") && data["orchestrators"].is_object()) {
        const auto& orchestrators = data["orchestrators"];
        if (orchestrators.contains("default") && orchestrators["default"].is_string()) {
            config.orchestrators.default_id = orchestrators["default"].get<std::string>();
        }
        if (orchestrators.contains("order") && orchestrators["order"].is_array()) {
            config.orchestrators.order.clear();
            for (const auto& item : orchestrators["order"]) {
                if (item.is_string()) {
                    config.orchestrators.order.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("agents") && data["agents"].is_object()) {
        const auto& agents = data["agents"];
        if (agents.contains("logsDir") && agents["logsDir"].is_string()) {
            config.agents.logs_dir = agents["logsDir"].get<std::string>();
        }
        if (agents.contains("killGraceMs") && agents["killGraceMs"].is_number_integer()) {
            config.agents.kill_grace_ms = agents["killGraceMs"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    using clubhouse::utils::GetEnv;

    const auto host = GetEnv("CLUBHOUSE_HOOK_HOST");
    if (!host.empty()) {
        SetHost(config, host);
    }

    const auto port = GetEnv("CLUBHOUSE_HOOK_PORT");
    if (!port.empty()) {
        config.hook_server.port = ParseInt(port, config.hook_server.port);
    }

    const auto threads = GetEnv("CLUBHOUSE_HOOK_THREADS");
    if (!threads.empty()) {
        config.hook_server.threads = ParseInt(threads, config.hook_server.threads);
    }

    const auto processing_threads = GetEnv("CLUBHOUSE_HOOK_PROCESSING_THREADS");
    if (!processing_threads.empty()) {
        config.hook_server.processing_threads =
            ParseInt(processing_threads, config.hook_server.processing_threads);
    }

    const auto orchestrator = GetEnv("CLUBHOUSE_ORCHESTRATOR");
    if (!orchestrator.empty()) {
        config.orchestrators.default_id = orchestrator;
    }

    const auto order = GetEnv("CLUBHOUSE_ORCHESTRATOR_ORDER");
    if (!order.empty()) {
        config.orchestrators.order = SplitCsv(order);
    }

    const auto logs_dir = GetEnv("CLUBHOUSE_LOGS_DIR");
    if (!logs_dir.empty()) {
        config.agents.logs_dir = logs_dir;
    }

    const auto level = GetEnv("CLUBHOUSE_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }

    if (config.hook_server.port < 0 || config.hook_server.port > 65535) {
        clubhouse::utils::LogWarn(kLogTag, "hook server port out of range, using ephemeral port",
                                  {{"port", std::to_string(config.hook_server.port)}});
        config.hook_server.port = 0;
    }
    if (config.hook_server.threads < 1) {
        config.hook_server.threads = 1;
    }
    if (config.hook_server.processing_threads < 1) {
        config.hook_server.processing_threads = 1;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            clubhouse::utils::LogWarn(kLogTag, "config file is not valid JSON, keeping defaults",
                                      {{"path", path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace clubhouse::config
