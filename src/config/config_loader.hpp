#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace pyexec::config {

// Defaults, then the JSON config file, then PYEXEC_* environment variables.
Config LoadConfig();

std::filesystem::path GetConfigPath();

// Overlays the keys present in data onto config. Invalid values keep the
// current setting and are logged.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

void ApplyConfigFromEnv(Config& config);

}  // namespace pyexec::config
