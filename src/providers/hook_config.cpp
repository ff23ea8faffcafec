#include "providers/hook_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "providers/provider_support.hpp"
#include "utils/logging.hpp"

namespace clubhouse::providers {

namespace {

constexpr const char* kOwnHostMarker = "http://127.0.0.1:";
constexpr const char* kOwnRouteMarker = "/hook/";
constexpr std::size_t kMaxAgentIdLength = 128;

std::string SingleQuote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}  // namespace

bool IsValidAgentId(const std::string& agent_id) {
    if (agent_id.empty() || agent_id.size() > kMaxAgentIdLength) {
        return false;
    }
    for (const char c : agent_id) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
            || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!allowed) {
            return false;
        }
    }
    return agent_id != "." && agent_id != "..";
}

bool IsOwnHookCommand(const std::string& command) {
    const auto host = command.find(kOwnHostMarker);
    if (host == std::string::npos) {
        return false;
    }
    return command.find(kOwnRouteMarker, host) != std::string::npos;
}

bool IsOwnHookEntry(const nlohmann::json& entry) {
    if (entry.is_array()) {
        for (const auto& item : entry) {
            if (IsOwnHookEntry(item)) {
                return true;
            }
        }
        return false;
    }
    if (!entry.is_object()) {
        return false;
    }
    for (auto it = entry.begin(); it != entry.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string()) {
            if ((it.key() == "command" || it.key() == "bash")
                && IsOwnHookCommand(value.get<std::string>())) {
                return true;
            }
        } else if ((value.is_object() || value.is_array()) && IsOwnHookEntry(value)) {
            return true;
        }
    }
    return false;
}

std::string BuildHookBaseUrl(int port) {
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("Invalid hook server port: " + std::to_string(port));
    }
    return kOwnHostMarker + std::to_string(port) + "/hook";
}

std::string BuildHookCommand(const std::string& hook_url,
                             const std::string& agent_id,
                             const std::string& event,
                             const std::string& nonce) {
    if (!IsValidAgentId(agent_id)) {
        throw std::invalid_argument("Invalid agent id: " + agent_id);
    }
    // The env reference needs double quotes so the hook's shell expands it.
    const std::string nonce_header = nonce.empty()
        ? std::string("\"X-Clubhouse-Nonce: ${CLUBHOUSE_HOOK_NONCE}\"")
        : SingleQuote("X-Clubhouse-Nonce: " + nonce);
    std::ostringstream command;
    command << "cat | curl -s -X POST " << hook_url << "/" << agent_id << "/" << event
            << " -H 'Content-Type: application/json'"
            << " -H " << nonce_header
            << " --data-binary @- || true";
    return command.str();
}

nlohmann::json MergeHookEntry(const nlohmann::json& existing,
                              const nlohmann::json& fresh,
                              const HookEntryPredicate& is_own) {
    nlohmann::json merged = nlohmann::json::array();
    if (existing.is_array()) {
        for (const auto& entry : existing) {
            if (!is_own(entry)) {
                merged.push_back(entry);
            }
        }
    }
    merged.push_back(fresh);
    return merged;
}

void MergeHookCategories(nlohmann::json& config,
                         const std::vector<std::pair<std::string, nlohmann::json>>& entries,
                         const HookEntryPredicate& is_own) {
    if (!config.contains("hooks") || !config["hooks"].is_object()) {
        config["hooks"] = nlohmann::json::object();
    }
    auto& hooks = config["hooks"];
    for (const auto& [category, fresh] : entries) {
        const nlohmann::json existing = hooks.contains(category) ? hooks[category] : nlohmann::json::array();
        hooks[category] = MergeHookEntry(existing, fresh, is_own);
    }
}

nlohmann::json ReadJsonObject(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return nlohmann::json::object();
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        utils::LogWarn("hooks-config", "ignoring unreadable config", {{"path", path.string()}});
        return nlohmann::json::object();
    }
    return data;
}

void WriteJsonFile(const std::filesystem::path& path, const nlohmann::json& data) {
    WriteTextFile(path, data.dump(2));
}

}  // namespace clubhouse::providers
