#pragma once

#include <string>
#include <vector>

#include "agent/tools/tool_registry.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"
#include "utils/logging.hpp"

namespace clerk::agent {

enum class TurnStatus {
    kCompleted,
    kModelError,
    kTurnLimitExceeded
};

const char* ToString(TurnStatus status);

struct TurnResult {
    TurnStatus status = TurnStatus::kCompleted;
    std::string text;
    int model_calls = 0;
    int tool_calls = 0;
};

// Drives one conversation: each ProcessTurn() appends the user's text, then
// alternates model calls and tool executions until the model answers without
// requesting a tool. The transcript lives as long as the loop.
class AgentLoop {
public:
    AgentLoop(
        clerk::providers::LLMProvider& provider,
        clerk::agent::tools::ToolRegistry& tools,
        clerk::config::AgentDefaults config,
        clerk::utils::Logger& logger);

    TurnResult ProcessTurn(const std::string& user_input);

    const std::vector<clerk::providers::Message>& Transcript() const { return messages_; }

private:
    clerk::providers::LLMProvider& provider_;
    clerk::agent::tools::ToolRegistry& tools_;
    clerk::config::AgentDefaults config_;
    clerk::utils::Logger& logger_;
    std::vector<clerk::providers::Message> messages_;

    clerk::providers::LLMResponse CallModel(
        const std::vector<clerk::providers::ToolDefinition>& definitions);
    std::string RunTool(const clerk::providers::ContentBlock& call);
};

}  // namespace clerk::agent
