#include "providers/anthropic_provider.hpp"

#include <memory>
#include <string>
#include <utility>

#include "httplib.h"
#include "utils/logging.hpp"

namespace clerk::providers {
namespace {

constexpr const char* kDefaultApiBase = "https://api.anthropic.com/v1";
constexpr const char* kAnthropicVersion = "2023-06-01";

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

nlohmann::json BuildContentBlock(const ContentBlock& block) {
    switch (block.type) {
        case ContentType::kText:
            return {{"type", "text"}, {"text", block.text}};
        case ContentType::kToolUse:
            return {
                {"type", "tool_use"},
                {"id", block.id},
                {"name", block.name},
                {"input", block.input.is_object() ? block.input : nlohmann::json::object()}
            };
        case ContentType::kToolResult:
            return {
                {"type", "tool_result"},
                {"tool_use_id", block.tool_use_id},
                {"content", block.content}
            };
    }
    return nlohmann::json::object();
}

}  // namespace

nlohmann::json BuildMessagesPayload(
    const std::string& system_prompt,
    const std::vector<Message>& messages,
    const std::vector<ToolDefinition>& tools,
    const std::string& model,
    int max_tokens,
    double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }

    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        nlohmann::json content = nlohmann::json::array();
        for (const auto& block : msg.content) {
            content.push_back(BuildContentBlock(block));
        }
        payload["messages"].push_back({
            {"role", ToString(msg.role)},
            {"content", content}
        });
    }

    if (!tools.empty()) {
        nlohmann::json tool_defs = nlohmann::json::array();
        for (const auto& tool : tools) {
            nlohmann::json params = nlohmann::json::object();
            if (!tool.parameters_json.empty()) {
                params = nlohmann::json::parse(tool.parameters_json, nullptr, false);
                if (params.is_discarded()) {
                    params = nlohmann::json::object();
                }
            }
            tool_defs.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"input_schema", params}
            });
        }
        payload["tools"] = tool_defs;
    }
    return payload;
}

LLMResponse ParseMessagesResponse(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("content") || !body["content"].is_array()) {
        return LLMResponse::Failure("invalid response from model service");
    }

    LLMResponse parsed_response{};
    for (const auto& block : body["content"]) {
        if (!block.is_object()) {
            continue;
        }
        const auto type = block.value("type", "");
        if (type == "text") {
            parsed_response.content.push_back(ContentBlock::Text(block.value("text", "")));
        } else if (type == "tool_use") {
            parsed_response.content.push_back(ContentBlock::ToolUse(
                block.value("id", ""),
                block.value("name", ""),
                block.contains("input") ? block["input"] : nlohmann::json::object()));
        }
    }

    if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
        parsed_response.finish_reason = body["stop_reason"].get<std::string>();
    }
    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        if (usage.contains("input_tokens") && usage["input_tokens"].is_number_integer()) {
            parsed_response.usage["prompt_tokens"] = usage["input_tokens"].get<int>();
        }
        if (usage.contains("output_tokens") && usage["output_tokens"].is_number_integer()) {
            parsed_response.usage["completion_tokens"] = usage["output_tokens"].get<int>();
        }
        if (parsed_response.usage.count("prompt_tokens") && parsed_response.usage.count("completion_tokens")) {
            parsed_response.usage["total_tokens"] =
                parsed_response.usage["prompt_tokens"] + parsed_response.usage["completion_tokens"];
        }
    }
    return parsed_response;
}

std::string DescribeHttpError(int status, const std::string& body) {
    std::string description = "HTTP " + std::to_string(status);
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("error") || !json["error"].is_object()) {
        return description;
    }
    const auto& error = json["error"];
    const auto type = error.value("type", "");
    const auto message = error.value("message", "");
    if (!type.empty()) {
        description += " " + type;
    }
    if (!message.empty()) {
        description += ": " + message;
    }
    return description;
}

AnthropicProvider::AnthropicProvider(std::string api_key,
                                     std::string api_base,
                                     std::string default_model,
                                     int timeout_s,
                                     clerk::utils::Logger* logger)
    : api_key_(std::move(api_key))
    , api_base_(std::move(api_base))
    , default_model_(std::move(default_model))
    , timeout_s_(timeout_s)
    , logger_(logger) {}

LLMResponse AnthropicProvider::Chat(
    const std::string& system_prompt,
    const std::vector<Message>& messages,
    const std::vector<ToolDefinition>& tools,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const auto chosen_model = model.empty() ? default_model_ : model;
        const auto payload = BuildMessagesPayload(
            system_prompt, messages, tools, chosen_model, max_tokens, temperature);

        const auto parsed = ParseUrl(api_base_.empty() ? kDefaultApiBase : api_base_);
        const std::string endpoint = parsed.base_path + "/messages";

        std::string scheme_host_port = parsed.https ? "https://" : "http://";
        scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(timeout_s_);
        client->set_read_timeout(timeout_s_);
        client->set_write_timeout(timeout_s_);

        if (logger_) {
            logger_->Log({clerk::utils::LogLevel::kDebug,
                          "POST " + scheme_host_port + endpoint,
                          {{"model", chosen_model},
                           {"api_key", MaskKey(api_key_)},
                           {"messages", std::to_string(messages.size())}}});
        }

        httplib::Headers headers{
            {"x-api-key", api_key_},
            {"anthropic-version", kAnthropicVersion}
        };

        const auto body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        auto response = client->Post(endpoint, headers, body, "application/json");
        if (!response) {
            return LLMResponse::Failure(
                "request to model service failed (" + httplib::to_string(response.error()) + ")");
        }
        if (response->status >= 400) {
            if (logger_) {
                logger_->Error("HTTP " + std::to_string(response->status) + " body=" + response->body);
            }
            return LLMResponse::Failure(DescribeHttpError(response->status, response->body));
        }

        const auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded()) {
            return LLMResponse::Failure("invalid response from model service");
        }
        return ParseMessagesResponse(json);
    } catch (const std::exception& ex) {
        return LLMResponse::Failure(std::string("model service call failed: ") + ex.what());
    }
}

}  // namespace clerk::providers
