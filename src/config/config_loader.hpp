#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace scriptbox::config {

// Reads ~/.scriptbox/config.json, then applies SCRIPTBOX_* environment overrides.
Config LoadConfig();

Config LoadConfigFromFile(const std::filesystem::path& config_path);

}  // namespace scriptbox::config
