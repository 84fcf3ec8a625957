#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace playrun::config {

Config LoadConfig();
Config LoadConfigFromFile(const std::filesystem::path& path);
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace playrun::config
