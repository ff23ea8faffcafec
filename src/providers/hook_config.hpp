#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace clubhouse::providers {

using HookEntryPredicate = std::function<bool(const nlohmann::json&)>;

// Every callback this process writes targets the loopback hook route.
bool IsOwnHookCommand(const std::string& command);

// True when any "command" or "bash" string inside entry (at any depth)
// is one of ours.
bool IsOwnHookEntry(const nlohmann::json& entry);

// Letters, digits, '-', '_' and '.', at most 128 characters. Anything else
// could break out of the hook command or the /hook/{agentId} route.
bool IsValidAgentId(const std::string& agent_id);

// http://127.0.0.1:<port>/hook. Throws std::invalid_argument for a port
// outside 1..65535.
std::string BuildHookBaseUrl(int port);

// cat | curl -s -X POST <hook_url>/<agent_id>/<event> ... || true
// An empty nonce references ${CLUBHOUSE_HOOK_NONCE} from the child's env;
// a literal nonce is single-quoted. Throws std::invalid_argument for an
// agent id rejected by IsValidAgentId.
std::string BuildHookCommand(const std::string& hook_url,
                             const std::string& agent_id,
                             const std::string& event,
                             const std::string& nonce);

// Drops every entry matching is_own and appends fresh. A non-array
// existing value is treated as empty.
nlohmann::json MergeHookEntry(const nlohmann::json& existing,
                              const nlohmann::json& fresh,
                              const HookEntryPredicate& is_own);

// Applies MergeHookEntry per category under config["hooks"], replacing a
// non-object "hooks" value.
void MergeHookCategories(nlohmann::json& config,
                         const std::vector<std::pair<std::string, nlohmann::json>>& entries,
                         const HookEntryPredicate& is_own);

// Missing, unreadable, corrupt or non-object files all read as {}.
nlohmann::json ReadJsonObject(const std::filesystem::path& path);

// 2-space indented. Creates parent directories; throws std::runtime_error.
void WriteJsonFile(const std::filesystem::path& path, const nlohmann::json& data);

}  // namespace clubhouse::providers
