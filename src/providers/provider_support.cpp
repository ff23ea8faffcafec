#include "providers/provider_support.hpp"

#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "process/command_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace clubhouse::providers {

namespace {

constexpr std::chrono::milliseconds kProbeTimeout{5000};

bool IsCandidate(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !std::filesystem::is_directory(path, ec);
}

std::vector<std::string> SplitPath(const std::string& value) {
    std::vector<std::string> dirs;
    std::stringstream stream(value);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (!dir.empty()) {
            dirs.push_back(dir);
        }
    }
    return dirs;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n'");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n'");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

std::string FindBinaryInPath(const std::vector<std::string>& names,
                             const std::vector<std::filesystem::path>& extra_paths) {
    for (const auto& path : extra_paths) {
        if (IsCandidate(path)) {
            return path.string();
        }
    }
    for (const auto& dir : SplitPath(utils::GetEnv("PATH"))) {
        for (const auto& name : names) {
            const auto candidate = std::filesystem::path(dir) / name;
            if (IsCandidate(candidate)) {
                return candidate.string();
            }
        }
    }
    throw std::runtime_error("Could not find any of [" + utils::Join(names, ", ")
                             + "] on PATH. Make sure it is installed.");
}

std::filesystem::path HomePath(const std::string& relative) {
    return utils::GetHomePath() / relative;
}

bool HasExplicitModel(const std::string& model) {
    return !model.empty() && model != "default";
}

std::string JoinPrompt(const std::string& system_prompt, const std::string& mission) {
    std::vector<std::string> parts;
    if (!system_prompt.empty()) {
        parts.push_back(system_prompt);
    }
    if (!mission.empty()) {
        parts.push_back(mission);
    }
    return utils::Join(parts, "\n\n");
}

std::string HumanizeModelId(const std::string& id) {
    std::string label;
    bool word_start = true;
    for (const char c : id) {
        if (c == '-') {
            label.push_back(' ');
            word_start = true;
            continue;
        }
        label.push_back(word_start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        word_start = false;
    }
    return label;
}

std::vector<ModelOption> WithDefaultModel(const std::vector<std::string>& ids, bool humanize) {
    std::vector<ModelOption> options;
    options.push_back({"default", "Default"});
    for (const auto& id : ids) {
        options.push_back({id, humanize ? HumanizeModelId(id) : id});
    }
    return options;
}

std::optional<std::vector<ModelOption>> ParseModelChoicesFromHelp(const std::string& help_text) {
    static const std::regex kChoices(R"(--model\s+(?:<\w+>)?\s*.*?\(choices:\s*([^)]*)\))");
    static const std::regex kQuoted("\"([^\"]+)\"");
    std::smatch match;
    if (!std::regex_search(help_text, match, kChoices)) {
        return std::nullopt;
    }
    const std::string choices = match[1].str();
    std::vector<std::string> ids;
    for (auto it = std::sregex_iterator(choices.begin(), choices.end(), kQuoted);
         it != std::sregex_iterator(); ++it) {
        ids.push_back((*it)[1].str());
    }
    if (ids.empty()) {
        return std::nullopt;
    }
    return WithDefaultModel(ids, true);
}

std::optional<std::vector<ModelOption>> ParseModelAliasesFromHelp(const std::string& help_text) {
    static const std::regex kAlias(R"(alias[^\n]*\(e\.g\.\s*'([^)]+)'\))", std::regex::icase);
    static const std::regex kSeparator(R"('\s*or\s*'|',\s*')");
    std::smatch match;
    if (!std::regex_search(help_text, match, kAlias)) {
        return std::nullopt;
    }
    const std::string aliases = match[1].str();
    std::vector<std::string> ids;
    for (auto it = std::sregex_token_iterator(aliases.begin(), aliases.end(), kSeparator, -1);
         it != std::sregex_token_iterator(); ++it) {
        auto alias = Trim(it->str());
        if (!alias.empty()) {
            ids.push_back(alias);
        }
    }
    if (ids.empty()) {
        return std::nullopt;
    }
    return WithDefaultModel(ids, true);
}

std::optional<std::string> ProbeCommandOutput(const std::string& binary,
                                              const std::vector<std::string>& args) {
    const auto result = process::CommandRunner::Run(binary, args, "", kProbeTimeout);
    if (!result.launched || result.timed_out || result.exit_code != 0) {
        utils::LogDebug("provider", "probe failed",
                        {{"binary", binary}, {"exit", std::to_string(result.exit_code)}});
        return std::nullopt;
    }
    return result.output;
}

std::string ReadTextFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void WriteTextFile(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + path.parent_path().string()
                                     + ": " + ec.message());
        }
    }
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    output << content;
    output.close();
    if (!output) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

}  // namespace clubhouse::providers
