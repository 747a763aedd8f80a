#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace clerk::providers {

class AnthropicProvider : public LLMProvider {
public:
    AnthropicProvider(std::string api_key,
                      std::string api_base,
                      std::string default_model,
                      int timeout_s,
                      clerk::utils::Logger* logger = nullptr);

    LLMResponse Chat(
        const std::string& system_prompt,
        const std::vector<Message>& messages,
        const std::vector<ToolDefinition>& tools,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return default_model_; }

private:
    std::string api_key_;
    std::string api_base_;
    std::string default_model_;
    int timeout_s_ = 120;
    clerk::utils::Logger* logger_ = nullptr;
};

// Request body for POST /v1/messages.
nlohmann::json BuildMessagesPayload(
    const std::string& system_prompt,
    const std::vector<Message>& messages,
    const std::vector<ToolDefinition>& tools,
    const std::string& model,
    int max_tokens,
    double temperature);

// Converts a /v1/messages response body into an LLMResponse. Bodies without a
// content array come back as an error response.
LLMResponse ParseMessagesResponse(const nlohmann::json& body);

// "HTTP <status>" plus the service's error type and message when the body
// carries them.
std::string DescribeHttpError(int status, const std::string& body);

}  // namespace clerk::providers
