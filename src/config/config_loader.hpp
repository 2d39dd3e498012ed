#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace librarian::config {

struct ConfigLoadResult {
    Config config;
    std::vector<std::string> warnings;
};

std::filesystem::path DefaultConfigPath();

// Reads ~/.librarian/config.json, then applies LIBRARIAN_* environment overrides.
ConfigLoadResult LoadConfig();
ConfigLoadResult LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

std::vector<std::string> ValidateConfig(const Config& config);

}  // namespace librarian::config
