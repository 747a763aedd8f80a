#include "cli/repl.hpp"

#include <exception>

#include "utils/common.hpp"

namespace clerk::cli {

bool IsExitCommand(const std::string& line) {
    const auto lowered = clerk::utils::ToLower(clerk::utils::Trim(line));
    return lowered == "exit" || lowered == "quit";
}

void PrintBanner(std::ostream& out) {
    out << "clerk" << std::endl;
    out << "================" << std::endl;
    out << "A conversational coding assistant that can read, list and edit files." << std::endl;
    out << "Type 'exit' or 'quit' to end the conversation." << std::endl;
    out << std::endl;
}

int RunRepl(
    clerk::agent::AgentLoop& agent,
    clerk::utils::Logger& logger,
    std::istream& in,
    std::ostream& out,
    const std::function<bool()>& interrupted) {
    const auto stop_requested = [&interrupted]() { return interrupted && interrupted(); };

    while (true) {
        out << "You: " << std::flush;
        std::string line;
        if (!std::getline(in, line) || stop_requested()) {
            out << "\n\nGoodbye!" << std::endl;
            logger.Info("Session ended by interrupt or end of input");
            return 0;
        }

        if (IsExitCommand(line)) {
            out << "Goodbye!" << std::endl;
            logger.Info("Session ended by user");
            return 0;
        }
        const auto input = clerk::utils::Trim(line);
        if (input.empty()) {
            continue;
        }

        out << "\nAssistant: " << std::flush;
        try {
            const auto result = agent.ProcessTurn(input);
            logger.Log({result.status == clerk::agent::TurnStatus::kCompleted
                            ? clerk::utils::LogLevel::kInfo
                            : clerk::utils::LogLevel::kWarn,
                        "Turn finished",
                        {{"status", clerk::agent::ToString(result.status)},
                         {"model_calls", std::to_string(result.model_calls)},
                         {"tool_calls", std::to_string(result.tool_calls)}}});
            out << result.text << std::endl;
            out << std::endl;
        } catch (const std::exception& ex) {
            logger.Error(std::string("Turn failed: ") + ex.what());
            out << "\nError: " << ex.what() << std::endl;
            out << std::endl;
        }

        if (stop_requested()) {
            out << "\nGoodbye!" << std::endl;
            logger.Info("Session ended by interrupt");
            return 0;
        }
    }
}

}  // namespace clerk::cli
