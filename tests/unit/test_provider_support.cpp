#include <gtest/gtest.h>

#include <stdexcept>

#include "providers/provider_support.hpp"
#include "test_support.hpp"

namespace {

using clubhouse::providers::FindBinaryInPath;
using clubhouse::providers::HasExplicitModel;
using clubhouse::providers::HumanizeModelId;
using clubhouse::providers::JoinPrompt;
using clubhouse::providers::ModelOption;
using clubhouse::providers::ParseModelAliasesFromHelp;
using clubhouse::providers::ParseModelChoicesFromHelp;
using clubhouse::providers::ProbeCommandOutput;
using clubhouse::providers::ReadTextFile;
using clubhouse::providers::WithDefaultModel;
using clubhouse::providers::WriteTextFile;
using clubhouse::testing::StubToolchain;
using clubhouse::testing::TempDir;

TEST(ProviderSupportTest, FindsBinaryOnPath) {
    StubToolchain tools;
    const auto stub = tools.Add("mytool");
    EXPECT_EQ(FindBinaryInPath({"mytool"}, {}), stub.string());
}

TEST(ProviderSupportTest, ExtraPathsWinOverPath) {
    StubToolchain tools;
    tools.Add("mytool");
    const auto preferred = clubhouse::testing::WriteStubBinary(tools.home(), "mytool");
    EXPECT_EQ(FindBinaryInPath({"mytool"}, {tools.home() / "missing", preferred}), preferred.string());
}

TEST(ProviderSupportTest, MissingBinaryNamesEveryCandidate) {
    StubToolchain tools;
    try {
        FindBinaryInPath({"nope-a", "nope-b"}, {});
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& ex) {
        EXPECT_EQ(std::string(ex.what()),
                  "Could not find any of [nope-a, nope-b] on PATH. Make sure it is installed.");
    }
}

TEST(ProviderSupportTest, DefaultModelIsNotExplicit) {
    EXPECT_FALSE(HasExplicitModel(""));
    EXPECT_FALSE(HasExplicitModel("default"));
    EXPECT_TRUE(HasExplicitModel("opus"));
}

TEST(ProviderSupportTest, JoinPromptSkipsEmptyParts) {
    EXPECT_EQ(JoinPrompt("sys", "do it"), "sys\n\ndo it");
    EXPECT_EQ(JoinPrompt("", "do it"), "do it");
    EXPECT_EQ(JoinPrompt("sys", ""), "sys");
    EXPECT_EQ(JoinPrompt("", ""), "");
}

TEST(ProviderSupportTest, HumanizesModelIds) {
    EXPECT_EQ(HumanizeModelId("gpt-5-codex"), "Gpt 5 Codex");
    EXPECT_EQ(HumanizeModelId("claude-sonnet-4.5"), "Claude Sonnet 4.5");
    EXPECT_EQ(HumanizeModelId("opus"), "Opus");
}

TEST(ProviderSupportTest, ParsesChoicesFromHelp) {
    const std::string help =
        "Options:\n"
        "  --model <model>   Set the AI model to use (choices: \"claude-sonnet-4.5\", \"gpt-5\")\n"
        "  --yolo            Allow everything\n";
    const auto options = ParseModelChoicesFromHelp(help);
    ASSERT_TRUE(options.has_value());
    const std::vector<ModelOption> expected = {
        {"default", "Default"},
        {"claude-sonnet-4.5", "Claude Sonnet 4.5"},
        {"gpt-5", "Gpt 5"}
    };
    EXPECT_EQ(*options, expected);
}

TEST(ProviderSupportTest, HelpWithoutChoicesYieldsNothing) {
    EXPECT_FALSE(ParseModelChoicesFromHelp("  --model <model>  Model for the session\n").has_value());
    EXPECT_FALSE(ParseModelChoicesFromHelp("  --model <model>  (choices: )\n").has_value());
    EXPECT_FALSE(ParseModelChoicesFromHelp("").has_value());
}

TEST(ProviderSupportTest, ParsesAliasesFromHelp) {
    const std::string help =
        "  --model <model>  Model for the current session. Provide an alias for the latest "
        "model (e.g. 'sonnet' or 'opus') or a model's full name\n";
    const auto options = ParseModelAliasesFromHelp(help);
    ASSERT_TRUE(options.has_value());
    const std::vector<ModelOption> expected = {
        {"default", "Default"},
        {"sonnet", "Sonnet"},
        {"opus", "Opus"}
    };
    EXPECT_EQ(*options, expected);
}

TEST(ProviderSupportTest, WithDefaultModelCanKeepIdsAsLabels) {
    const auto options = WithDefaultModel({"anthropic/claude-sonnet-4"}, false);
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options[0].id, "default");
    EXPECT_EQ(options[1].label, "anthropic/claude-sonnet-4");
}

TEST(ProviderSupportTest, ProbeReturnsStdoutOnSuccess) {
    StubToolchain tools;
    const auto stub = tools.Add("prober", "echo \"hello $1\"\n");
    const auto output = ProbeCommandOutput(stub.string(), {"world"});
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, "hello world\n");
}

TEST(ProviderSupportTest, ProbeFailsOnNonZeroExit) {
    StubToolchain tools;
    const auto stub = tools.Add("prober", "echo partial\nexit 3\n");
    EXPECT_FALSE(ProbeCommandOutput(stub.string(), {}).has_value());
}

TEST(ProviderSupportTest, ProbeFailsForMissingBinary) {
    TempDir dir;
    EXPECT_FALSE(ProbeCommandOutput((dir.path() / "absent").string(), {}).has_value());
}

TEST(ProviderSupportTest, TextFilesRoundTripThroughNewDirectories) {
    TempDir dir;
    const auto path = dir.path() / "a" / "b" / "notes.md";
    EXPECT_EQ(ReadTextFile(path), "");
    WriteTextFile(path, "# Notes\n");
    EXPECT_EQ(ReadTextFile(path), "# Notes\n");
}

TEST(ProviderSupportTest, WriteTextFileThrowsWhenParentIsAFile) {
    TempDir dir;
    clubhouse::testing::WriteFile(dir.path() / "blocker", "x");
    EXPECT_THROW(WriteTextFile(dir.path() / "blocker" / "child.md", "y"), std::runtime_error);
}

}  // namespace
