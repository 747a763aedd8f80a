#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace clerk::agent::tools {

class ReadFileTool : public Tool {
public:
    std::string Name() const override { return "read_file"; }
    std::string Description() const override { return "Read the contents of the file at the given path."; }
    std::string ParametersJson() const override;
    ToolOutcome Execute(const ToolParams& params) override;
};

class ListFilesTool : public Tool {
public:
    std::string Name() const override { return "list_files"; }
    std::string Description() const override {
        return "List all files and directories at the given path.";
    }
    std::string ParametersJson() const override;
    ToolOutcome Execute(const ToolParams& params) override;
};

// Replaces every occurrence of old_text when the file exists and old_text is
// non-empty; otherwise writes new_text as the whole file, creating parent
// directories as needed.
class EditFileTool : public Tool {
public:
    std::string Name() const override { return "edit_file"; }
    std::string Description() const override {
        return "Edit a file by replacing old_text with new_text. "
               "Creates the file if it does not exist.";
    }
    std::string ParametersJson() const override;
    ToolOutcome Execute(const ToolParams& params) override;
};

}  // namespace clerk::agent::tools
