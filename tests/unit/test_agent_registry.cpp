#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

#include "agents/agent_registry.hpp"
#include "agents/nonce.hpp"

namespace {

using clubhouse::agents::AgentRegistration;
using clubhouse::agents::AgentRegistry;
using clubhouse::agents::GenerateNonce;
using clubhouse::agents::LaunchMode;

AgentRegistration MakeRegistration(const std::string& id) {
    AgentRegistration registration{};
    registration.agent_id = id;
    registration.workspace_path = "/work/" + id;
    registration.provider_id = "claude-code";
    registration.nonce = "nonce-" + id;
    return registration;
}

TEST(AgentRegistryTest, InsertFindRemove) {
    AgentRegistry registry;
    EXPECT_TRUE(registry.Insert(MakeRegistration("a")));
    EXPECT_FALSE(registry.Insert(MakeRegistration("a")));
    EXPECT_EQ(registry.Size(), 1u);

    const auto found = registry.Find("a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->nonce, "nonce-a");
    EXPECT_EQ(found->mode, LaunchMode::kInteractive);
    EXPECT_FALSE(found->pid.has_value());

    EXPECT_TRUE(registry.Remove("a"));
    EXPECT_FALSE(registry.Remove("a"));
    EXPECT_FALSE(registry.Find("a").has_value());
}

TEST(AgentRegistryTest, SetPidOnlyForKnownAgents) {
    AgentRegistry registry;
    registry.Insert(MakeRegistration("a"));
    EXPECT_TRUE(registry.SetPid("a", 1234));
    EXPECT_FALSE(registry.SetPid("b", 1));
    EXPECT_EQ(registry.Find("a")->pid, std::optional<int>(1234));
}

TEST(AgentRegistryTest, FindReturnsCopy) {
    AgentRegistry registry;
    registry.Insert(MakeRegistration("a"));
    auto copy = registry.Find("a");
    copy->nonce = "tampered";
    EXPECT_EQ(registry.Find("a")->nonce, "nonce-a");
}

TEST(AgentRegistryTest, ListsAllRegistrations) {
    AgentRegistry registry;
    registry.Insert(MakeRegistration("a"));
    registry.Insert(MakeRegistration("b"));
    std::set<std::string> ids;
    for (const auto& registration : registry.List()) {
        ids.insert(registration.agent_id);
    }
    EXPECT_EQ(ids, (std::set<std::string>{"a", "b"}));
}

TEST(AgentRegistryTest, ConcurrentInsertsAreAllKept) {
    AgentRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 50; ++i) {
                registry.Insert(MakeRegistration(std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(registry.Size(), 200u);
}

TEST(NonceTest, GeneratesUuidV4) {
    const auto nonce = GenerateNonce();
    ASSERT_EQ(nonce.size(), 36u);
    EXPECT_EQ(nonce[8], '-');
    EXPECT_EQ(nonce[13], '-');
    EXPECT_EQ(nonce[14], '4');
    EXPECT_EQ(nonce[18], '-');
    EXPECT_NE(std::string("89ab").find(nonce[19]), std::string::npos);
    EXPECT_EQ(nonce[23], '-');
}

TEST(NonceTest, NoncesAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(GenerateNonce());
    }
    EXPECT_EQ(seen.size(), 100u);
}

}  // namespace
