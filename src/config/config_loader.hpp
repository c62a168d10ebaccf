#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace gistools::config {

std::filesystem::path GetConfigPath();

// Reads ~/.gistools/config.json, then applies GISTOOLS_* environment overrides.
Config LoadConfig();

// Same as LoadConfig() with an explicit file. A missing or malformed file keeps the
// defaults.
Config LoadConfigFrom(const std::filesystem::path& path);

}  // namespace gistools::config
