#include "providers/llm_provider.hpp"

#include <utility>

#include "providers/anthropic_provider.hpp"

namespace clerk::providers {

const char* ToString(Role role) {
    switch (role) {
        case Role::kUser: return "user";
        case Role::kAssistant: return "assistant";
    }
    return "user";
}

ContentBlock ContentBlock::Text(std::string text) {
    ContentBlock block{};
    block.type = ContentType::kText;
    block.text = std::move(text);
    return block;
}

ContentBlock ContentBlock::ToolUse(std::string id, std::string name, nlohmann::json input) {
    ContentBlock block{};
    block.type = ContentType::kToolUse;
    block.id = std::move(id);
    block.name = std::move(name);
    block.input = input.is_object() ? std::move(input) : nlohmann::json::object();
    return block;
}

ContentBlock ContentBlock::ToolResult(std::string tool_use_id, std::string content) {
    ContentBlock block{};
    block.type = ContentType::kToolResult;
    block.tool_use_id = std::move(tool_use_id);
    block.content = std::move(content);
    return block;
}

bool LLMResponse::HasToolCalls() const {
    for (const auto& block : content) {
        if (block.type == ContentType::kToolUse) {
            return true;
        }
    }
    return false;
}

std::string LLMResponse::FirstText() const {
    for (const auto& block : content) {
        if (block.type == ContentType::kText) {
            return block.text;
        }
    }
    return {};
}

LLMResponse LLMResponse::Failure(std::string error) {
    LLMResponse response{};
    response.finish_reason = "error";
    response.error = std::move(error);
    return response;
}

std::unordered_map<std::string, std::string> ParseToolArguments(const nlohmann::json& input) {
    std::unordered_map<std::string, std::string> parsed;
    if (!input.is_object()) {
        return parsed;
    }
    for (const auto& item : input.items()) {
        if (item.value().is_string()) {
            parsed[item.key()] = item.value().get<std::string>();
        } else if (!item.value().is_null()) {
            parsed[item.key()] = item.value().dump();
        }
    }
    return parsed;
}

ProviderSettings ResolveProviderSettings(const clerk::config::Config& config) {
    ProviderSettings settings{};
    settings.api_key = config.provider.api_key;
    settings.api_base = config.provider.api_base;
    settings.model = config.agent.model.empty() ? clerk::config::kDefaultModel : config.agent.model;
    settings.timeout_s = config.provider.timeout_s;
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(
    const clerk::config::Config& config,
    clerk::utils::Logger* logger) {
    const auto settings = ResolveProviderSettings(config);
    return std::make_unique<AnthropicProvider>(
        settings.api_key,
        settings.api_base,
        settings.model,
        settings.timeout_s,
        logger);
}

}  // namespace clerk::providers
