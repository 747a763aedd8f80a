#include "config/config_loader.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>

#include "nlohmann/json.hpp"

namespace clerk::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("provider") && data["provider"].is_object()) {
        const auto& provider = data["provider"];
        ApplyString(config.provider.api_key, provider, "apiKey");
        ApplyString(config.provider.api_base, provider, "apiBase");
        if (provider.contains("timeoutS") && provider["timeoutS"].is_number_integer()) {
            const auto value = provider["timeoutS"].get<int>();
            if (value > 0) {
                config.provider.timeout_s = value;
            }
        }
    }

    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        ApplyString(config.agent.model, agent, "model");
        ApplyString(config.agent.system_prompt, agent, "systemPrompt");
        if (agent.contains("maxTokens") && agent["maxTokens"].is_number_integer()) {
            const auto value = agent["maxTokens"].get<int>();
            if (value > 0) {
                config.agent.max_tokens = value;
            }
        }
        if (agent.contains("temperature") && agent["temperature"].is_number()) {
            config.agent.temperature = agent["temperature"].get<double>();
        }
        if (agent.contains("maxToolIterations") && agent["maxToolIterations"].is_number_integer()) {
            const auto value = agent["maxToolIterations"].get<int>();
            if (value > 0) {
                config.agent.max_tool_iterations = value;
            }
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        ApplyString(config.logging.file, logging, "file");
        ApplyString(config.logging.level, logging, "level");
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        const auto parsed = std::stoi(value);
        return parsed > 0 ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".clerk" / "config.json";
}

Config LoadConfig(const std::string& config_path) {
    Config config{};

    const auto path = config_path.empty() ? DefaultConfigPath() : std::filesystem::path(config_path);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (!data.is_discarded()) {
            ApplyConfigFromJson(config, data);
        }
    }

    const auto api_key = GetEnvFallback("CLERK_API_KEY", "ANTHROPIC_API_KEY");
    if (!api_key.empty()) {
        config.provider.api_key = api_key;
    }

    const auto api_base = GetEnvFallback("CLERK_API_BASE", "ANTHROPIC_BASE_URL");
    if (!api_base.empty()) {
        config.provider.api_base = api_base;
    }

    const auto timeout = GetEnv("CLERK_TIMEOUT_S");
    if (!timeout.empty()) {
        config.provider.timeout_s = ParseInt(timeout, config.provider.timeout_s);
    }

    const auto model = GetEnv("CLERK_MODEL");
    if (!model.empty()) {
        config.agent.model = model;
    }

    const auto max_tokens = GetEnv("CLERK_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.agent.max_tokens = ParseInt(max_tokens, config.agent.max_tokens);
    }

    const auto temperature = GetEnv("CLERK_TEMPERATURE");
    if (!temperature.empty()) {
        config.agent.temperature = ParseDouble(temperature, config.agent.temperature);
    }

    const auto max_tool_iterations = GetEnv("CLERK_MAX_TOOL_ITERATIONS");
    if (!max_tool_iterations.empty()) {
        config.agent.max_tool_iterations = ParseInt(
            max_tool_iterations,
            config.agent.max_tool_iterations);
    }

    const auto log_file = GetEnv("CLERK_LOG_FILE");
    if (!log_file.empty()) {
        config.logging.file = log_file;
    }

    const auto log_level = GetEnv("CLERK_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    return config;
}

}  // namespace clerk::config
