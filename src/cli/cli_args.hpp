#pragma once

#include <optional>
#include <string>

#include "config/config_schema.hpp"

namespace clerk::cli {

struct CliOptions {
    std::optional<std::string> api_key;
    std::optional<std::string> api_base;
    std::optional<std::string> model;
    std::optional<std::string> log_file;
    std::optional<std::string> config_path;
    std::optional<int> max_tokens;
    std::optional<int> max_tool_iterations;
    bool show_help = false;
};

struct CliParseResult {
    bool ok = true;
    CliOptions options;
    std::string error;
};

CliParseResult ParseCliArgs(int argc, char* argv[]);
std::string Usage(const std::string& program);

// Flags win over the config file and the environment.
void ApplyCliOverrides(const CliOptions& options, clerk::config::Config& config);

}  // namespace clerk::cli
