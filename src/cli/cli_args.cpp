#include "cli/cli_args.hpp"

#include <charconv>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace clerk::cli {
namespace {

bool ParsePositiveInt(const std::string& text, int& value) {
    int parsed = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || parsed <= 0) {
        return false;
    }
    value = parsed;
    return true;
}

CliParseResult Fail(std::string error) {
    CliParseResult result{};
    result.ok = false;
    result.error = std::move(error);
    return result;
}

}  // namespace

CliParseResult ParseCliArgs(int argc, char* argv[]) {
    CliParseResult result{};
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.options.show_help = true;
            continue;
        }

        std::optional<std::string>* target = nullptr;
        std::optional<int>* int_target = nullptr;
        if (arg == "--api-key") {
            target = &result.options.api_key;
        } else if (arg == "--api-base") {
            target = &result.options.api_base;
        } else if (arg == "--model") {
            target = &result.options.model;
        } else if (arg == "--log-file") {
            target = &result.options.log_file;
        } else if (arg == "--config") {
            target = &result.options.config_path;
        } else if (arg == "--max-tokens") {
            int_target = &result.options.max_tokens;
        } else if (arg == "--max-tool-iterations") {
            int_target = &result.options.max_tool_iterations;
        } else {
            return Fail("Unknown argument: " + arg);
        }

        if (i + 1 >= args.size()) {
            return Fail("Missing value for " + arg);
        }
        const auto& value = args[++i];
        if (target) {
            *target = value;
            continue;
        }
        int parsed = 0;
        if (!ParsePositiveInt(value, parsed)) {
            return Fail("Invalid value for " + arg + ": expected a positive integer");
        }
        *int_target = parsed;
    }
    return result;
}

std::string Usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "A conversational coding assistant that can read, list and edit files.\n"
        << "\n"
        << "Options:\n"
        << "  --api-key <key>              Anthropic API key (or set ANTHROPIC_API_KEY)\n"
        << "  --api-base <url>             Messages API base URL\n"
        << "  --model <name>               Model to use\n"
        << "  --max-tokens <n>             Maximum tokens per model reply\n"
        << "  --max-tool-iterations <n>    Maximum tool round trips per turn\n"
        << "  --log-file <path>            Log file (default agent.log)\n"
        << "  --config <path>              Config file (default ~/.clerk/config.json)\n"
        << "  -h, --help                   Show this help\n";
    return oss.str();
}

void ApplyCliOverrides(const CliOptions& options, clerk::config::Config& config) {
    if (options.api_key) {
        config.provider.api_key = *options.api_key;
    }
    if (options.api_base) {
        config.provider.api_base = *options.api_base;
    }
    if (options.model) {
        config.agent.model = *options.model;
    }
    if (options.max_tokens) {
        config.agent.max_tokens = *options.max_tokens;
    }
    if (options.max_tool_iterations) {
        config.agent.max_tool_iterations = *options.max_tool_iterations;
    }
    if (options.log_file) {
        config.logging.file = *options.log_file;
    }
}

}  // namespace clerk::cli
