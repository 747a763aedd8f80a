#include "agent/tools/tool_registry.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "agent/tools/filesystem.hpp"
#include "nlohmann/json.hpp"

namespace clerk::agent::tools {
namespace {

std::vector<std::string> RequiredParams(const Tool& tool) {
    std::vector<std::string> required;
    const auto schema = nlohmann::json::parse(tool.ParametersJson(), nullptr, false);
    if (schema.is_discarded() || !schema.is_object() ||
        !schema.contains("required") || !schema["required"].is_array()) {
        return required;
    }
    for (const auto& item : schema["required"]) {
        if (item.is_string()) {
            required.push_back(item.get<std::string>());
        }
    }
    return required;
}

}  // namespace

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("cannot register a null tool");
    }
    auto name = tool->Name();
    if (index_.find(name) != index_.end()) {
        throw std::invalid_argument("tool already registered: " + name);
    }
    index_.emplace(std::move(name), tools_.size());
    tools_.push_back(std::move(tool));
}

Tool* ToolRegistry::Get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return tools_[it->second].get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return index_.find(name) != index_.end();
}

std::vector<clerk::providers::ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<clerk::providers::ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& tool : tools_) {
        clerk::providers::ToolDefinition def{};
        def.name = tool->Name();
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    return defs;
}

ToolOutcome ToolRegistry::Execute(const std::string& name, const ToolParams& params) {
    auto* tool = Get(name);
    if (!tool) {
        return ToolError{ToolErrorKind::kUnknownTool, "Unknown tool: " + name};
    }
    try {
        for (const auto& param : RequiredParams(*tool)) {
            if (params.find(param) == params.end()) {
                return ToolError{
                    ToolErrorKind::kInvalidArguments,
                    "Invalid arguments for " + name + ": missing required parameter '" + param + "'"};
            }
        }
        return tool->Execute(params);
    } catch (const std::exception& ex) {
        return ToolError{ToolErrorKind::kIo, "Error executing " + name + ": " + ex.what()};
    }
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool->Name());
    }
    return names;
}

ToolRegistry BuildDefaultToolRegistry() {
    ToolRegistry registry;
    registry.Register(std::make_unique<ReadFileTool>());
    registry.Register(std::make_unique<ListFilesTool>());
    registry.Register(std::make_unique<EditFileTool>());
    return registry;
}

}  // namespace clerk::agent::tools
