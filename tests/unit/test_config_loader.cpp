#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"

namespace {

using clubhouse::config::ApplyConfigFromJson;
using clubhouse::config::ApplyEnvOverrides;
using clubhouse::config::Config;
using clubhouse::config::ExpandPath;
using clubhouse::config::LoadConfig;
using clubhouse::testing::ScopedEnv;
using clubhouse::testing::TempDir;
using clubhouse::testing::WriteFile;

class ConfigLoaderTest : public ::testing::Test {
protected:
    // Keep the host environment from leaking into the expectations.
    ScopedEnv host_{"CLUBHOUSE_HOOK_HOST", std::nullopt};
    ScopedEnv port_{"CLUBHOUSE_HOOK_PORT", std::nullopt};
    ScopedEnv threads_{"CLUBHOUSE_HOOK_THREADS", std::nullopt};
    ScopedEnv processing_{"CLUBHOUSE_HOOK_PROCESSING_THREADS", std::nullopt};
    ScopedEnv orchestrator_{"CLUBHOUSE_ORCHESTRATOR", std::nullopt};
    ScopedEnv order_{"CLUBHOUSE_ORCHESTRATOR_ORDER", std::nullopt};
    ScopedEnv logs_{"CLUBHOUSE_LOGS_DIR", std::nullopt};
    ScopedEnv level_{"CLUBHOUSE_LOG_LEVEL", std::nullopt};
    TempDir dir_;
};

TEST_F(ConfigLoaderTest, MissingFileKeepsDefaults) {
    const auto config = LoadConfig(dir_.path() / "absent.json");
    EXPECT_EQ(config.hook_server.host, "127.0.0.1");
    EXPECT_EQ(config.hook_server.port, 0);
    EXPECT_EQ(config.hook_server.threads, 2);
    EXPECT_EQ(config.hook_server.processing_threads, 4);
    EXPECT_EQ(config.orchestrators.default_id, "claude-code");
    EXPECT_TRUE(config.orchestrators.order.empty());
    EXPECT_EQ(config.agents.kill_grace_ms, 5000);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoaderTest, ReadsAllSections) {
    const auto path = dir_.path() / "config.json";
    WriteFile(path, R"({
        "hookServer": {"host": "localhost", "port": 4567, "threads": 4, "processingThreads": 8},
        "orchestrators": {"default": "codex-cli", "order": ["opencode", "codex-cli"]},
        "agents": {"logsDir": "/tmp/clubhouse-logs", "killGraceMs": 250},
        "logging": {"level": "debug"}
    })");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.hook_server.host, "127.0.0.1");
    EXPECT_EQ(config.hook_server.port, 4567);
    EXPECT_EQ(config.hook_server.threads, 4);
    EXPECT_EQ(config.hook_server.processing_threads, 8);
    EXPECT_EQ(config.orchestrators.default_id, "codex-cli");
    ASSERT_EQ(config.orchestrators.order.size(), 2u);
    EXPECT_EQ(config.orchestrators.order[0], "opencode");
    EXPECT_EQ(config.agents.logs_dir, "/tmp/clubhouse-logs");
    EXPECT_EQ(config.agents.kill_grace_ms, 250);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, CorruptFileKeepsDefaults) {
    const auto path = dir_.path() / "config.json";
    WriteFile(path, "{not json");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.hook_server.port, 0);
    EXPECT_EQ(config.orchestrators.default_id, "claude-code");
}

TEST_F(ConfigLoaderTest, NonLoopbackHostIsIgnored) {
    Config config{};
    ApplyConfigFromJson(config, {{"hookServer", {{"host", "0.0.0.0"}}}});
    EXPECT_EQ(config.hook_server.host, "127.0.0.1");
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    Config config{};
    ApplyConfigFromJson(config, {{"hookServer", {{"port", "4567"}}}, {"agents", "nope"}});
    EXPECT_EQ(config.hook_server.port, 0);
    EXPECT_EQ(config.agents.kill_grace_ms, 5000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    ScopedEnv port("CLUBHOUSE_HOOK_PORT", std::string("9000"));
    ScopedEnv order("CLUBHOUSE_ORCHESTRATOR_ORDER", std::string("copilot-cli,,claude-code"));
    ScopedEnv level("CLUBHOUSE_LOG_LEVEL", std::string("warn"));

    const auto path = dir_.path() / "config.json";
    WriteFile(path, R"({"hookServer": {"port": 4567}, "logging": {"level": "debug"}})");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.hook_server.port, 9000);
    ASSERT_EQ(config.orchestrators.order.size(), 2u);
    EXPECT_EQ(config.orchestrators.order[0], "copilot-cli");
    EXPECT_EQ(config.orchestrators.order[1], "claude-code");
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesAreClamped) {
    Config config{};
    config.hook_server.port = 70000;
    config.hook_server.threads = 0;
    config.hook_server.processing_threads = -3;
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.hook_server.port, 0);
    EXPECT_EQ(config.hook_server.threads, 1);
    EXPECT_EQ(config.hook_server.processing_threads, 1);
}

TEST_F(ConfigLoaderTest, UnparseablePortOverrideKeepsValue) {
    ScopedEnv port("CLUBHOUSE_HOOK_PORT", std::string("abc"));
    Config config{};
    config.hook_server.port = 1234;
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.hook_server.port, 1234);
}

TEST_F(ConfigLoaderTest, ExpandsHomePrefix) {
    ScopedEnv home("HOME", dir_.path().string());
    EXPECT_EQ(ExpandPath("~/logs"), dir_.path() / "logs");
    EXPECT_EQ(ExpandPath("~"), dir_.path());
    EXPECT_EQ(ExpandPath("/var/log"), std::filesystem::path("/var/log"));
    EXPECT_EQ(ExpandPath("a~/b"), std::filesystem::path("a~/b"));
}

}  // namespace
