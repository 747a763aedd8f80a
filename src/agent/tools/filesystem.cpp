#include "agent/tools/filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "utils/common.hpp"

namespace clerk::agent::tools {
namespace {

std::string GetParam(const ToolParams& params,
                     const std::string& name,
                     const std::string& fallback = {}) {
    auto it = params.find(name);
    if (it == params.end()) {
        return fallback;
    }
    return it->second;
}

std::string LastErrorMessage() {
    if (errno == 0) {
        return "unknown error";
    }
    return std::error_code(errno, std::generic_category()).message();
}

std::string IsDirectoryMessage(const std::string& path) {
    return std::make_error_code(std::errc::is_a_directory).message() + ": " + path;
}

// Reads the whole file as UTF-8 text. Returns false with `error` set when the
// file cannot be opened, read, or is not valid UTF-8.
bool ReadTextFile(const std::string& path, std::string& content, std::string& error) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        error = IsDirectoryMessage(path);
        return false;
    }
    errno = 0;
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = LastErrorMessage() + ": " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "failed to read " + path;
        return false;
    }
    content = buffer.str();
    const auto invalid = clerk::utils::FindInvalidUtf8(content);
    if (invalid != std::string::npos) {
        error = "invalid UTF-8 sequence at byte " + std::to_string(invalid) + " of " + path;
        return false;
    }
    return true;
}

bool WriteTextFile(const std::string& path, const std::string& content, std::string& error) {
    errno = 0;
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = LastErrorMessage() + ": " + path;
        return false;
    }
    file << content;
    file.flush();
    if (!file) {
        error = "failed to write " + path;
        return false;
    }
    return true;
}

}  // namespace

std::string ReadFileTool::ParametersJson() const {
    return R"({"type":"object","properties":{"path":{"type":"string","description":"Path of the file to read"}},"required":["path"]})";
}

ToolOutcome ReadFileTool::Execute(const ToolParams& params) {
    const auto path = GetParam(params, "path");
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return ToolError{ToolErrorKind::kIo, "Error reading file: " + ec.message()};
    }
    if (!exists) {
        return ToolError{ToolErrorKind::kNotFound, "File not found: " + path};
    }

    std::string content;
    std::string error;
    if (!ReadTextFile(path, content, error)) {
        return ToolError{ToolErrorKind::kIo, "Error reading file: " + error};
    }
    return ToolOk{"Contents of file " + path + ":\n" + content};
}

std::string ListFilesTool::ParametersJson() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"Directory to list (defaults to the current directory)"}},"required":[]})json";
}

ToolOutcome ListFilesTool::Execute(const ToolParams& params) {
    const auto path = GetParam(params, "path", ".");
    const std::filesystem::path root(path);
    std::error_code ec;
    const bool exists = std::filesystem::exists(root, ec);
    if (ec) {
        return ToolError{ToolErrorKind::kIo, "Error listing files: " + ec.message()};
    }
    if (!exists) {
        return ToolError{ToolErrorKind::kNotFound, "Path not found: " + path};
    }

    struct Entry {
        std::string name;
        bool is_dir = false;
    };
    std::vector<Entry> entries;
    std::filesystem::directory_iterator it(root, ec);
    if (ec) {
        return ToolError{ToolErrorKind::kIo, "Error listing files: " + ec.message()};
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        entries.push_back({it->path().filename().string(), it->is_directory(type_ec)});
    }
    if (ec) {
        return ToolError{ToolErrorKind::kIo, "Error listing files: " + ec.message()};
    }

    if (entries.empty()) {
        return ToolOk{"Empty directory: " + path};
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.name < b.name;
    });

    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& entry : entries) {
        lines.push_back(entry.is_dir ? "[dir]  " + entry.name + "/" : "[file] " + entry.name);
    }
    return ToolOk{"Contents of " + path + ":\n" + clerk::utils::Join(lines, "\n")};
}

std::string EditFileTool::ParametersJson() const {
    return R"json({"type":"object","properties":{)json"
           R"json("path":{"type":"string","description":"Path of the file to edit"},)json"
           R"json("old_text":{"type":"string","description":"Text to search for and replace (leave empty to create a new file)"},)json"
           R"json("new_text":{"type":"string","description":"Text to replace old_text with"}},)json"
           R"json("required":["path","new_text"]})json";
}

ToolOutcome EditFileTool::Execute(const ToolParams& params) {
    const auto path = GetParam(params, "path");
    const auto old_text = GetParam(params, "old_text");
    const auto new_text = GetParam(params, "new_text");

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return ToolError{ToolErrorKind::kIo, "Error editing file: " + ec.message()};
    }

    std::string error;
    if (exists && !old_text.empty()) {
        std::string content;
        if (!ReadTextFile(path, content, error)) {
            return ToolError{ToolErrorKind::kIo, "Error editing file: " + error};
        }
        if (content.find(old_text) == std::string::npos) {
            return ToolError{ToolErrorKind::kTextNotFound, "Text not found in file: " + old_text};
        }
        clerk::utils::ReplaceAll(content, old_text, new_text);
        if (!WriteTextFile(path, content, error)) {
            return ToolError{ToolErrorKind::kIo, "Error editing file: " + error};
        }
        return ToolOk{"Successfully edited " + path};
    }

    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return ToolError{ToolErrorKind::kIo, "Error editing file: " + ec.message()};
        }
    }
    if (std::filesystem::is_directory(path, ec)) {
        return ToolError{ToolErrorKind::kIo, "Error editing file: " + IsDirectoryMessage(path)};
    }
    if (!WriteTextFile(path, new_text, error)) {
        return ToolError{ToolErrorKind::kIo, "Error editing file: " + error};
    }
    return ToolOk{"Successfully created " + path};
}

}  // namespace clerk::agent::tools
