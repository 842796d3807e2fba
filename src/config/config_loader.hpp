#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"

namespace runbox::config {

// $RUNBOX_CONFIG, falling back to ~/.runbox/config.json.
std::filesystem::path DefaultConfigPath();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

// Defaults, then the JSON file at `path` (if present), then the environment.
Config LoadConfig(const std::filesystem::path& path);
Config LoadConfig();

}  // namespace runbox::config
