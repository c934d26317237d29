#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace autolab::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file at `path` (DefaultConfigPath() when empty), then
// AUTOLAB_* environment overrides. Out-of-range values are clamped.
Config LoadConfig(const std::filesystem::path& path = {});

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);
void ClampConfig(Config& config);

}  // namespace autolab::config
