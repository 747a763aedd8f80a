#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace clerk::utils {
class Logger;
}  // namespace clerk::utils

namespace clerk::providers {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

enum class Role {
    kUser,
    kAssistant
};

const char* ToString(Role role);

enum class ContentType {
    kText,
    kToolUse,
    kToolResult
};

// One block of message content. `type` selects which fields are meaningful:
// kText uses `text`; kToolUse uses `id`, `name` and `input`; kToolResult uses
// `tool_use_id` and `content`.
struct ContentBlock {
    ContentType type = ContentType::kText;
    std::string text;
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
    std::string tool_use_id;
    std::string content;

    static ContentBlock Text(std::string text);
    static ContentBlock ToolUse(std::string id, std::string name, nlohmann::json input);
    static ContentBlock ToolResult(std::string tool_use_id, std::string content);
};

struct Message {
    Role role = Role::kUser;
    std::vector<ContentBlock> content;
};

struct LLMResponse {
    std::vector<ContentBlock> content;
    std::string finish_reason = "stop";
    std::string error;
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
    bool HasToolCalls() const;
    std::string FirstText() const;

    static LLMResponse Failure(std::string error);
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    int timeout_s = 120;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::string& system_prompt,
        const std::vector<Message>& messages,
        const std::vector<ToolDefinition>& tools,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

// Flattens a tool_use input object into named string arguments. String
// values are taken as-is; anything else is carried as its JSON text.
std::unordered_map<std::string, std::string> ParseToolArguments(const nlohmann::json& input);

ProviderSettings ResolveProviderSettings(const clerk::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(
    const clerk::config::Config& config,
    clerk::utils::Logger* logger = nullptr);

}  // namespace clerk::providers
