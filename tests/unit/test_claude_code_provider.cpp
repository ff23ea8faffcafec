#include <gtest/gtest.h>

#include <algorithm>
#include <nlohmann/json.hpp>

#include "providers/claude_code_provider.hpp"
#include "providers/hook_config.hpp"
#include "test_support.hpp"

namespace {

using clubhouse::providers::AgentKind;
using clubhouse::providers::ClaudeCodeProvider;
using clubhouse::providers::HeadlessOptions;
using clubhouse::providers::HeadlessOutputKind;
using clubhouse::providers::HookEventKind;
using clubhouse::providers::HooksConfigOptions;
using clubhouse::providers::ModelOption;
using clubhouse::providers::SpawnOptions;
using clubhouse::testing::StubToolchain;
using clubhouse::testing::TempDir;
using clubhouse::testing::WriteFile;
using nlohmann::json;

using Args = std::vector<std::string>;

class ClaudeCodeProviderTest : public ::testing::Test {
protected:
    StubToolchain tools_;
    ClaudeCodeProvider provider_;
};

TEST_F(ClaudeCodeProviderTest, Identity) {
    EXPECT_EQ(provider_.Id(), "claude-code");
    EXPECT_EQ(provider_.DisplayName(), "Claude Code");
    EXPECT_EQ(provider_.ShortName(), "CC");
    EXPECT_FALSE(provider_.Badge().has_value());
    EXPECT_EQ(provider_.GetConventions().config_dir, ".claude");
    EXPECT_EQ(provider_.GetConventions().local_settings_file, "settings.local.json");
    EXPECT_EQ(provider_.GetExitCommand(), "/exit\r");
}

TEST_F(ClaudeCodeProviderTest, CapabilitiesAreAllEnabled) {
    const auto capabilities = provider_.GetCapabilities();
    EXPECT_TRUE(capabilities.headless);
    EXPECT_TRUE(capabilities.structured_output);
    EXPECT_TRUE(capabilities.hooks);
    EXPECT_TRUE(capabilities.session_resume);
    EXPECT_TRUE(capabilities.permissions);
}

TEST_F(ClaudeCodeProviderTest, AvailabilityFollowsBinary) {
    const auto missing = provider_.CheckAvailability();
    EXPECT_FALSE(missing.available);
    EXPECT_NE(missing.error.find("claude"), std::string::npos);

    tools_.Add("claude");
    EXPECT_TRUE(provider_.CheckAvailability().available);
}

TEST_F(ClaudeCodeProviderTest, SpawnWithoutBinaryThrows) {
    EXPECT_THROW(provider_.BuildSpawnCommand(SpawnOptions{}), std::runtime_error);
}

TEST_F(ClaudeCodeProviderTest, SpawnCommandOrdersFlagsBeforeMission) {
    const auto binary = tools_.Add("claude");
    SpawnOptions options{};
    options.cwd = "/work";
    options.model = "opus";
    options.allowed_tools = {"Read", "Bash(git:*)"};
    options.disallowed_tools = {"WebFetch"};
    options.system_prompt = "Be terse.";
    options.mission = "Fix the build";
    options.free_agent_mode = true;

    const auto command = provider_.BuildSpawnCommand(options);
    EXPECT_EQ(command.binary, binary.string());
    const Args expected = {
        "--dangerously-skip-permissions",
        "--model", "opus",
        "--allowedTools", "Read",
        "--allowedTools", "Bash(git:*)",
        "--disallowedTools", "WebFetch",
        "--append-system-prompt", "Be terse.",
        "Fix the build"
    };
    EXPECT_EQ(command.args, expected);
}

TEST_F(ClaudeCodeProviderTest, SpawnCommandOmitsDefaultsAndEmptyParts) {
    tools_.Add("claude");
    SpawnOptions options{};
    options.model = "default";
    EXPECT_TRUE(provider_.BuildSpawnCommand(options).args.empty());
}

TEST_F(ClaudeCodeProviderTest, HeadlessRequiresMission) {
    tools_.Add("claude");
    EXPECT_FALSE(provider_.BuildHeadlessCommand(HeadlessOptions{}).has_value());
}

TEST_F(ClaudeCodeProviderTest, HeadlessDefaultsToStreamJson) {
    tools_.Add("claude");
    HeadlessOptions options{};
    options.mission = "Summarize";
    options.model = "sonnet";
    options.no_session_persistence = true;

    const auto command = provider_.BuildHeadlessCommand(options);
    ASSERT_TRUE(command.has_value());
    const Args expected = {
        "-p", "Summarize",
        "--output-format", "stream-json",
        "--verbose",
        "--dangerously-skip-permissions",
        "--model", "sonnet",
        "--no-session-persistence"
    };
    EXPECT_EQ(command->args, expected);
    EXPECT_EQ(command->output_kind, HeadlessOutputKind::kStreamJson);
}

TEST_F(ClaudeCodeProviderTest, HeadlessTextFormatDropsVerbose) {
    tools_.Add("claude");
    HeadlessOptions options{};
    options.mission = "Summarize";
    options.output_format = "json";

    const auto command = provider_.BuildHeadlessCommand(options);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(std::count(command->args.begin(), command->args.end(), "--verbose"), 0);
    EXPECT_EQ(command->output_kind, HeadlessOutputKind::kText);
}

TEST_F(ClaudeCodeProviderTest, WritesAllHookCategories) {
    TempDir workspace;
    HooksConfigOptions options{};
    options.hook_url = "http://127.0.0.1:4567/hook";
    provider_.WriteHooksConfig(workspace.path(), "agent-1", options);

    const auto settings = clubhouse::providers::ReadJsonObject(
        workspace.path() / ".claude" / "settings.local.json");
    const auto& hooks = settings["hooks"];
    for (const char* category : {"PreToolUse", "PostToolUse", "PostToolUseFailure", "Stop",
                                 "Notification", "PermissionRequest"}) {
        ASSERT_TRUE(hooks.contains(category)) << category;
        ASSERT_EQ(hooks[category].size(), 1u) << category;
        const auto& hook = hooks[category][0]["hooks"][0];
        EXPECT_EQ(hook["type"], "command");
        EXPECT_EQ(hook["async"], true);
        EXPECT_EQ(hook["timeout"], 5);
        EXPECT_NE(hook["command"].get<std::string>().find(
                      std::string("/hook/agent-1/") + category),
                  std::string::npos);
    }
    EXPECT_EQ(hooks["Notification"][0]["matcher"], "");
    EXPECT_FALSE(hooks["Stop"][0].contains("matcher"));
}

TEST_F(ClaudeCodeProviderTest, RewritingHooksKeepsUserEntries) {
    TempDir workspace;
    const auto path = workspace.path() / ".claude" / "settings.local.json";
    WriteFile(path, R"({
        "model": "opus",
        "hooks": {"Stop": [{"hooks": [{"type": "command", "command": "./notify.sh"}]}]}
    })");

    HooksConfigOptions first{};
    first.hook_url = "http://127.0.0.1:1111/hook";
    provider_.WriteHooksConfig(workspace.path(), "agent-1", first);
    HooksConfigOptions second{};
    second.hook_url = "http://127.0.0.1:2222/hook";
    provider_.WriteHooksConfig(workspace.path(), "agent-1", second);

    const auto settings = clubhouse::providers::ReadJsonObject(path);
    EXPECT_EQ(settings["model"], "opus");
    const auto& stop = settings["hooks"]["Stop"];
    ASSERT_EQ(stop.size(), 2u);
    EXPECT_EQ(stop[0]["hooks"][0]["command"], "./notify.sh");
    EXPECT_NE(stop[1]["hooks"][0]["command"].get<std::string>().find(":2222/hook/"), std::string::npos);
}

TEST_F(ClaudeCodeProviderTest, ParsesEveryEventName) {
    const std::vector<std::pair<std::string, HookEventKind>> cases = {
        {"PreToolUse", HookEventKind::kPreTool},
        {"PostToolUse", HookEventKind::kPostTool},
        {"PostToolUseFailure", HookEventKind::kToolError},
        {"Stop", HookEventKind::kStop},
        {"Notification", HookEventKind::kNotification},
        {"PermissionRequest", HookEventKind::kPermissionRequest}
    };
    for (const auto& [name, kind] : cases) {
        const auto event = provider_.ParseHookEvent({{"hook_event_name", name}});
        ASSERT_TRUE(event.has_value()) << name;
        EXPECT_EQ(event->kind, kind) << name;
    }
}

TEST_F(ClaudeCodeProviderTest, ParsesToolFields) {
    const json raw = {
        {"hook_event_name", "PreToolUse"},
        {"tool_name", "Bash"},
        {"tool_input", {{"command", "ls"}}},
        {"message", "running"}
    };
    const auto event = provider_.ParseHookEvent(raw);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->tool_name, std::optional<std::string>("Bash"));
    ASSERT_TRUE(event->tool_input.has_value());
    EXPECT_EQ((*event->tool_input)["command"], "ls");
    EXPECT_EQ(event->message, std::optional<std::string>("running"));
    EXPECT_FALSE(event->tool_verb.has_value());
}

TEST_F(ClaudeCodeProviderTest, RejectsUnknownOrMalformedEvents) {
    EXPECT_FALSE(provider_.ParseHookEvent({{"hook_event_name", "SessionStart"}}).has_value());
    EXPECT_FALSE(provider_.ParseHookEvent({{"tool_name", "Bash"}}).has_value());
    EXPECT_FALSE(provider_.ParseHookEvent(json::array()).has_value());
    EXPECT_FALSE(provider_.ParseHookEvent({{"hook_event_name", 3}}).has_value());
}

TEST_F(ClaudeCodeProviderTest, NonObjectToolInputIsDropped) {
    const auto event = provider_.ParseHookEvent({{"hook_event_name", "PreToolUse"}, {"tool_input", "ls"}});
    ASSERT_TRUE(event.has_value());
    EXPECT_FALSE(event->tool_input.has_value());
}

TEST_F(ClaudeCodeProviderTest, InstructionsPreferLocalFile) {
    TempDir worktree;
    EXPECT_EQ(provider_.ReadInstructions(worktree.path()), "");

    WriteFile(worktree.path() / "CLAUDE.md", "legacy");
    EXPECT_EQ(provider_.ReadInstructions(worktree.path()), "legacy");

    provider_.WriteInstructions(worktree.path(), "local");
    EXPECT_EQ(clubhouse::testing::ReadFile(worktree.path() / ".claude" / "CLAUDE.local.md"), "local");
    EXPECT_FALSE(std::filesystem::exists(worktree.path() / ".claude" / "CLAUDE.md"));
    EXPECT_EQ(clubhouse::testing::ReadFile(worktree.path() / "CLAUDE.md"), "legacy");
    EXPECT_EQ(provider_.ReadInstructions(worktree.path()), "local");
}

TEST_F(ClaudeCodeProviderTest, ModelsFallBackWithoutBinary) {
    const std::vector<ModelOption> expected = {
        {"default", "Default"}, {"opus", "Opus"}, {"sonnet", "Sonnet"}, {"haiku", "Haiku"}
    };
    EXPECT_EQ(provider_.GetModelOptions(), expected);
}

TEST_F(ClaudeCodeProviderTest, ModelsComeFromHelpChoices) {
    tools_.Add("claude",
               "echo '  --model <model>  Model to use (choices: \"opus-4\", \"sonnet-4\")'\n");
    const auto options = provider_.GetModelOptions();
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].id, "default");
    EXPECT_EQ(options[1], (ModelOption{"opus-4", "Opus 4"}));
    EXPECT_EQ(options[2], (ModelOption{"sonnet-4", "Sonnet 4"}));
}

TEST_F(ClaudeCodeProviderTest, ModelsFallBackToHelpAliases) {
    tools_.Add("claude",
               "echo \"  --model <model>  Provide an alias for the latest model (e.g. 'sonnet' or 'opus')\"\n");
    const std::vector<ModelOption> expected = {{"default", "Default"}, {"sonnet", "Sonnet"}, {"opus", "Opus"}};
    EXPECT_EQ(provider_.GetModelOptions(), expected);
}

TEST_F(ClaudeCodeProviderTest, QuickPermissionsExtendDurable) {
    const auto durable = provider_.GetDefaultPermissions(AgentKind::kDurable);
    const Args expected_durable = {"Bash(git:*)", "Bash(npm:*)", "Bash(npx:*)"};
    EXPECT_EQ(durable, expected_durable);

    const auto quick = provider_.GetDefaultPermissions(AgentKind::kQuick);
    ASSERT_GT(quick.size(), durable.size());
    EXPECT_TRUE(std::equal(durable.begin(), durable.end(), quick.begin()));
    EXPECT_NE(std::find(quick.begin(), quick.end(), "Edit"), quick.end());
}

TEST_F(ClaudeCodeProviderTest, ToolVerbs) {
    EXPECT_EQ(provider_.ToolVerb("Bash"), std::optional<std::string>("Running command"));
    EXPECT_EQ(provider_.ToolVerb("Edit"), std::optional<std::string>("Editing file"));
    EXPECT_FALSE(provider_.ToolVerb("mcp__custom").has_value());
    EXPECT_EQ(clubhouse::providers::ResolveToolVerb(provider_, "mcp__custom"), "Using mcp__custom");
}

}  // namespace
