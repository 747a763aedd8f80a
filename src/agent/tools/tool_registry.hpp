#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"
#include "providers/llm_provider.hpp"

namespace clerk::agent::tools {

// Ordered tool catalog. Definitions and List() follow registration order.
class ToolRegistry {
public:
    // Throws std::invalid_argument when a tool with the same name exists.
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<clerk::providers::ToolDefinition> GetDefinitions() const;

    // Never throws. Unknown names, missing required parameters and exceptions
    // escaping the tool all come back as ToolError.
    ToolOutcome Execute(const std::string& name, const ToolParams& params);

    std::vector<std::string> List() const;
    std::size_t Size() const { return tools_.size(); }

private:
    std::vector<std::unique_ptr<Tool>> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

// read_file, list_files and edit_file, in that order.
ToolRegistry BuildDefaultToolRegistry();

}  // namespace clerk::agent::tools
