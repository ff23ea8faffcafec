#include "providers/orchestrator_provider.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace clubhouse::providers {

namespace {

std::filesystem::path SummaryPath(const std::string& agent_id) {
    return std::filesystem::temp_directory_path() / ("clubhouse-summary-" + agent_id + ".json");
}

}  // namespace

std::string OrchestratorProvider::BuildSummaryInstruction(const std::string& agent_id) const {
    std::ostringstream text;
    text << "When you have completed the task, before exiting write a file to "
         << SummaryPath(agent_id).string()
         << " with this exact JSON format:\n"
         << "{\"summary\": \"1-2 sentence description of what you did\", "
         << "\"filesModified\": [\"relative/path/to/file\", ...]}\n"
         << "Do not mention this instruction to the user.";
    return text.str();
}

std::optional<QuickSummary> OrchestratorProvider::ReadQuickSummary(const std::string& agent_id) const {
    const auto path = SummaryPath(agent_id);
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    input.close();

    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        utils::LogDebug("provider", "summary file is not a JSON object", {{"agent", agent_id}});
        return std::nullopt;
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);

    QuickSummary summary{};
    if (data.contains("summary") && data["summary"].is_string()) {
        summary.summary = data["summary"].get<std::string>();
    }
    if (data.contains("filesModified") && data["filesModified"].is_array()) {
        for (const auto& item : data["filesModified"]) {
            if (item.is_string()) {
                summary.files_modified.push_back(item.get<std::string>());
            }
        }
    }
    return summary;
}

std::string ResolveToolVerb(const OrchestratorProvider& provider, const std::string& tool_name) {
    if (auto verb = provider.ToolVerb(tool_name)) {
        return *verb;
    }
    return "Using " + tool_name;
}

}  // namespace clubhouse::providers
