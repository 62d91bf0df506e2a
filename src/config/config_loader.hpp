#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace abstruse::config {

std::filesystem::path GetConfigPath();

// Defaults, then the JSON file at `path` if it exists, then ABSTRUSE_* env vars.
Config LoadConfig(const std::filesystem::path& path);
Config LoadConfig();

}  // namespace abstruse::config
