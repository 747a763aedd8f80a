#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace clerk::config {

std::filesystem::path DefaultConfigPath();

// Reads the JSON config file (DefaultConfigPath() when config_path is empty),
// then applies CLERK_* / ANTHROPIC_API_KEY environment overrides. A missing or
// malformed file leaves the defaults in place.
Config LoadConfig(const std::string& config_path = "");

}  // namespace clerk::config
