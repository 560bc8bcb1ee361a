#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

#include "nlohmann/json.hpp"

namespace gradebox::config {

// Defaults, then the JSON config file, then environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);

// Raises the caller deadline to the executor timeout plus margin when needed.
// Returns true when the value was adjusted.
bool EnforceDeadlineFloor(Config& config);

std::filesystem::path DefaultConfigPath();

}  // namespace gradebox::config
