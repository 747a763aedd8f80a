#pragma once

#include <string>

namespace clerk::config {

inline constexpr const char* kDefaultModel = "claude-sonnet-4-5-20250929";

inline constexpr const char* kDefaultSystemPrompt =
    "You are a helpful coding assistant running in a terminal. "
    "Output plain text only and do not use markdown formatting, because your replies "
    "are printed directly in the terminal. Be concise but thorough, and give clear, "
    "practical advice in a friendly tone. Never use asterisk characters in your replies.";

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    int timeout_s = 120;
};

struct AgentDefaults {
    std::string model = kDefaultModel;
    std::string system_prompt = kDefaultSystemPrompt;
    int max_tokens = 4096;
    double temperature = 1.0;
    int max_tool_iterations = 20;
};

struct LoggingConfig {
    std::string file = "agent.log";
    std::string level = "info";
};

struct Config {
    ProviderConfig provider;
    AgentDefaults agent;
    LoggingConfig logging;
};

}  // namespace clerk::config
