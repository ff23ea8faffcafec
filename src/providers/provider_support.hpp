#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "providers/provider_types.hpp"

namespace clubhouse::providers {

// Returns the first existing path among extra_paths, then the first
// <dir>/<name> found on $PATH. Throws std::runtime_error listing the
// names searched when nothing matches.
std::string FindBinaryInPath(const std::vector<std::string>& names,
                             const std::vector<std::filesystem::path>& extra_paths);

std::filesystem::path HomePath(const std::string& relative);

// "default" and "" both mean "let the tool decide".
bool HasExplicitModel(const std::string& model);

// systemPrompt and mission joined by a blank line, skipping empty parts.
std::string JoinPrompt(const std::string& system_prompt, const std::string& mission);

// "gpt-5-codex" -> "Gpt 5 Codex"
std::string HumanizeModelId(const std::string& id);

// Parses `--model <model> ... (choices: "a", "b")` out of --help text.
std::optional<std::vector<ModelOption>> ParseModelChoicesFromHelp(const std::string& help_text);
// Parses "alias for the latest model (e.g. 'sonnet' or 'opus')" out of --help text.
std::optional<std::vector<ModelOption>> ParseModelAliasesFromHelp(const std::string& help_text);

// Prepends the synthetic {default, Default} option.
std::vector<ModelOption> WithDefaultModel(const std::vector<std::string>& ids, bool humanize);

// Runs binary with args under a short deadline and returns stdout when the
// process exits with status 0.
std::optional<std::string> ProbeCommandOutput(const std::string& binary,
                                              const std::vector<std::string>& args);

// Missing or unreadable files read as "".
std::string ReadTextFile(const std::filesystem::path& path);
// Creates parent directories. Throws std::runtime_error on failure.
void WriteTextFile(const std::filesystem::path& path, const std::string& content);

}  // namespace clubhouse::providers
