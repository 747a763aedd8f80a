#include "agent/agent_loop.hpp"

#include <exception>
#include <utility>

#include "utils/common.hpp"

namespace clerk::agent {
namespace {

constexpr std::size_t kResultPreviewSize = 500;

std::string DumpInput(const nlohmann::json& input) {
    return input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

const char* ToString(TurnStatus status) {
    switch (status) {
        case TurnStatus::kCompleted: return "completed";
        case TurnStatus::kModelError: return "model_error";
        case TurnStatus::kTurnLimitExceeded: return "turn_limit_exceeded";
    }
    return "unknown";
}

AgentLoop::AgentLoop(
    clerk::providers::LLMProvider& provider,
    clerk::agent::tools::ToolRegistry& tools,
    clerk::config::AgentDefaults config,
    clerk::utils::Logger& logger)
    : provider_(provider)
    , tools_(tools)
    , config_(std::move(config))
    , logger_(logger) {}

TurnResult AgentLoop::ProcessTurn(const std::string& user_input) {
    using clerk::providers::ContentBlock;
    using clerk::providers::ContentType;
    using clerk::providers::Message;
    using clerk::providers::Role;

    logger_.Info("User input: " + user_input);
    messages_.push_back(Message{Role::kUser, {ContentBlock::Text(user_input)}});

    const auto definitions = tools_.GetDefinitions();
    TurnResult result{};
    int round_trips = 0;

    while (true) {
        auto response = CallModel(definitions);
        result.model_calls += 1;
        if (response.IsError()) {
            logger_.Log({clerk::utils::LogLevel::kError,
                         "Model call failed: " + response.error,
                         {{"model_calls", std::to_string(result.model_calls)}}});
            result.status = TurnStatus::kModelError;
            result.text = "Error: " + response.error;
            return result;
        }

        messages_.push_back(Message{Role::kAssistant, response.content});
        if (!response.HasToolCalls()) {
            result.status = TurnStatus::kCompleted;
            result.text = response.FirstText();
            return result;
        }

        const bool limit_reached =
            config_.max_tool_iterations > 0 && round_trips >= config_.max_tool_iterations;
        const std::string limit_text = "Error: turn limit exceeded after " +
            std::to_string(round_trips) + " tool round trips";

        // Every tool_use in the assistant message gets exactly one tool_result,
        // in the same order, even when the limit stops execution.
        Message tool_results{Role::kUser, {}};
        for (const auto& block : response.content) {
            if (block.type != ContentType::kToolUse) {
                continue;
            }
            if (limit_reached) {
                tool_results.content.push_back(ContentBlock::ToolResult(block.id, limit_text));
                continue;
            }
            tool_results.content.push_back(ContentBlock::ToolResult(block.id, RunTool(block)));
            result.tool_calls += 1;
        }
        messages_.push_back(std::move(tool_results));

        if (limit_reached) {
            logger_.Warn(limit_text);
            result.status = TurnStatus::kTurnLimitExceeded;
            result.text = limit_text;
            return result;
        }
        round_trips += 1;
    }
}

clerk::providers::LLMResponse AgentLoop::CallModel(
    const std::vector<clerk::providers::ToolDefinition>& definitions) {
    const auto model = config_.model.empty() ? provider_.GetDefaultModel() : config_.model;
    try {
        return provider_.Chat(
            config_.system_prompt,
            messages_,
            definitions,
            model,
            config_.max_tokens,
            config_.temperature);
    } catch (const std::exception& ex) {
        return clerk::providers::LLMResponse::Failure(ex.what());
    }
}

std::string AgentLoop::RunTool(const clerk::providers::ContentBlock& call) {
    logger_.Info("Executing tool: " + call.name + " input: " + DumpInput(call.input));
    const auto outcome = tools_.Execute(call.name, clerk::providers::ParseToolArguments(call.input));
    const auto& text = clerk::agent::tools::OutcomeText(outcome);
    if (const auto* error = std::get_if<clerk::agent::tools::ToolError>(&outcome)) {
        logger_.Log({clerk::utils::LogLevel::kWarn,
                     "Tool failed: " + call.name,
                     {{"kind", clerk::agent::tools::ToString(error->kind)}}});
    }
    logger_.Info("Tool result: " + clerk::utils::Truncate(text, kResultPreviewSize) + "...");
    return text;
}

}  // namespace clerk::agent
