#pragma once

#include <string>
#include <vector>

namespace clubhouse::config {

struct HookServerConfig {
    std::string host = "127.0.0.1";
    int port = 0;
    int threads = 2;
    // Runs authentication, normalization and fan-out after the response.
    int processing_threads = 4;
};

struct OrchestratorsConfig {
    std::string default_id = "claude-code";
    std::vector<std::string> order;
};

struct AgentsConfig {
    std::string logs_dir = "~/.clubhouse/agent-logs";
    int kill_grace_ms = 5000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    HookServerConfig hook_server;
    OrchestratorsConfig orchestrators;
    AgentsConfig agents;
    LoggingConfig logging;
};

}  // namespace clubhouse::config
