#pragma once

#include <string>
#include <unordered_map>
#include <variant>

namespace clerk::agent::tools {

using ToolParams = std::unordered_map<std::string, std::string>;

enum class ToolErrorKind {
    kNotFound,
    kTextNotFound,
    kIo,
    kUnknownTool,
    kInvalidArguments
};

inline const char* ToString(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::kNotFound: return "not_found";
        case ToolErrorKind::kTextNotFound: return "text_not_found";
        case ToolErrorKind::kIo: return "io_error";
        case ToolErrorKind::kUnknownTool: return "unknown_tool";
        case ToolErrorKind::kInvalidArguments: return "invalid_arguments";
    }
    return "unknown";
}

struct ToolOk {
    std::string text;
};

struct ToolError {
    ToolErrorKind kind;
    std::string message;
};

// Outcome of one tool call. The model only ever sees OutcomeText().
using ToolOutcome = std::variant<ToolOk, ToolError>;

inline bool IsError(const ToolOutcome& outcome) {
    return std::holds_alternative<ToolError>(outcome);
}

inline const std::string& OutcomeText(const ToolOutcome& outcome) {
    if (const auto* error = std::get_if<ToolError>(&outcome)) {
        return error->message;
    }
    return std::get<ToolOk>(outcome).text;
}

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual ToolOutcome Execute(const ToolParams& params) = 0;
};

}  // namespace clerk::agent::tools
