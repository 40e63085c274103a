#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace judgelink::config {

std::filesystem::path GetConfigPath();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);
// Derives values that depend on other settings (default gateway host, fallback trust store).
void FinalizeConfig(Config& config);

Config LoadConfigFromFile(const std::filesystem::path& path);
Config LoadConfig();

}  // namespace judgelink::config
