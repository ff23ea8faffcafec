#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace clubhouse::config {

std::filesystem::path GetConfigPath();

// Reads ~/.clubhouse/config.json and applies CLUBHOUSE_* environment
// overrides. Parse errors keep the defaults.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

// Expands a leading "~/" against $HOME.
std::filesystem::path ExpandPath(const std::string& path);

}  // namespace clubhouse::config
